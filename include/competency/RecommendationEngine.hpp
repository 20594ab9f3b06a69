#pragma once

#include <map>
#include <string>
#include <vector>

#include "competency/Config.hpp"
#include "competency/Models.hpp"

namespace competency {

// Canonical skills of every Moderate or Strong category that the candidate lacks, compared
// on normalized keys. Ordered by how many qualifying categories list the skill (desc), then
// alphabetically, capped at cfg.max_recommendations. Display spelling comes from the first
// category (vocabulary order) that lists the skill. Empty when no category qualifies.
std::vector<std::string> recommend_skills(const std::map<std::string, CategoryScore>& analysis,
                                          const CategoryVocabulary& vocab,
                                          const std::vector<std::string>& candidate_skills,
                                          const RecommendationConfig& cfg = {});

}  // namespace competency
