#include "competency/Ranker.hpp"

#include <algorithm>

namespace competency {

std::vector<RankedCategory> rank_categories(const std::map<std::string, CategoryScore>& analysis) {
    std::vector<RankedCategory> out;
    out.reserve(analysis.size());
    for (const auto& [name, cs] : analysis) {
        out.push_back(RankedCategory{name, cs.score});
    }

    std::sort(out.begin(), out.end(),
              [](const RankedCategory& a, const RankedCategory& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.category < b.category;
              });

    return out;
}

}  // namespace competency
