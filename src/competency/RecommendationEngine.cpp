#include "competency/RecommendationEngine.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "competency/SkillText.hpp"

namespace competency {

struct Candidate {
    std::string key;
    std::string display;
    int categories = 0;
};

static bool qualifies(Strength s) {
    return s == Strength::Moderate || s == Strength::Strong;
}

std::vector<std::string> recommend_skills(const std::map<std::string, CategoryScore>& analysis,
                                          const CategoryVocabulary& vocab,
                                          const std::vector<std::string>& candidate_skills,
                                          const RecommendationConfig& cfg) {
    std::unordered_set<std::string> have;
    have.reserve(candidate_skills.size() * 2 + 8);
    for (const auto& s : candidate_skills) have.insert(normalize_skill(s));

    std::vector<Candidate> cands;
    std::unordered_map<std::string, size_t> index;

    // vocabulary order, so the first listing category decides the display spelling
    for (const auto& cat : vocab.categories) {
        auto it = analysis.find(cat.name);
        if (it == analysis.end() || !qualifies(it->second.strength)) continue;

        for (const auto& s : cat.skills) {
            if (have.count(s.key)) continue;

            auto [pos, inserted] = index.emplace(s.key, cands.size());
            if (inserted) cands.push_back(Candidate{s.key, s.display, 0});
            cands[pos->second].categories++;
        }
    }

    std::sort(cands.begin(), cands.end(),
              [](const Candidate& a, const Candidate& b) {
                  if (a.categories != b.categories) return a.categories > b.categories;
                  return a.key < b.key;
              });

    if (cands.size() > cfg.max_recommendations) cands.resize(cfg.max_recommendations);

    std::vector<std::string> out;
    out.reserve(cands.size());
    for (auto& c : cands) out.push_back(std::move(c.display));
    return out;
}

}  // namespace competency
