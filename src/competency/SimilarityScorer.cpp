#include "competency/SimilarityScorer.hpp"

#include <algorithm>

#include "competency/StrengthClassifier.hpp"
#include "competency/VectorMath.hpp"

namespace competency {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

struct SkillSim {
    const std::string* skill;
    double sim;
};

std::vector<CategoryMatch> score_categories(const std::vector<SkillEmbedding>& skills,
                                            const CategoryModel& model,
                                            const ScoringConfig& cfg) {
    const size_t k = (cfg.top_k == 0) ? 1 : cfg.top_k;

    std::vector<CategoryMatch> out;
    out.reserve(model.centroids().size());

    for (const auto& c : model.centroids()) {
        std::vector<SkillSim> sims;
        sims.reserve(skills.size());

        for (const auto& se : skills) {
            if (se.vector.size() != model.dim()) continue;
            sims.push_back(SkillSim{&se.skill, clamp01(cosine(se.vector, c.vector))});
        }

        CategoryMatch m;
        m.category = c.category;

        if (!sims.empty()) {
            const size_t take = std::min(k, sims.size());
            // ties broken by skill so the contributing list is deterministic
            std::partial_sort(sims.begin(), sims.begin() + take, sims.end(),
                              [](const SkillSim& a, const SkillSim& b) {
                                  if (a.sim != b.sim) return a.sim > b.sim;
                                  return *a.skill < *b.skill;
                              });

            double sum = 0.0;
            for (size_t i = 0; i < take; ++i) {
                sum += sims[i].sim;
                if (sims[i].sim > 0.0) m.top_skills.push_back(*sims[i].skill);
            }
            m.score = clamp01(sum / static_cast<double>(take));
        }

        out.push_back(std::move(m));
    }

    return out;
}

std::map<std::string, CategoryScore> analyze_categories(const std::vector<SkillEmbedding>& skills,
                                                        const CategoryModel& model,
                                                        const ScoringConfig& scoring,
                                                        const StrengthThresholds& thresholds) {
    std::map<std::string, CategoryScore> out;
    for (auto& m : score_categories(skills, model, scoring)) {
        CategoryScore cs;
        cs.category = m.category;
        cs.score = m.score;
        cs.strength = classify_strength(m.score, thresholds);
        cs.matched_skills = std::move(m.top_skills);
        out.emplace(m.category, std::move(cs));
    }
    return out;
}

}  // namespace competency
