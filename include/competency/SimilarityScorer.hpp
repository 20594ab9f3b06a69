#pragma once

#include <map>
#include <string>
#include <vector>

#include "competency/CategoryModel.hpp"
#include "competency/Config.hpp"
#include "competency/Models.hpp"

namespace competency {

struct CategoryMatch {
    std::string category;
    double score = 0.0;                 // mean of the top-k clamped similarities, in [0,1]
    std::vector<std::string> top_skills; // skills that contributed, best first
};

// Per-skill cosine against each centroid, negatives clamped to 0, category score = mean of
// the k best (or of all if fewer). Embeddings whose dimension differs from the model are
// ignored. No embeddings: every category scores 0.
std::vector<CategoryMatch> score_categories(const std::vector<SkillEmbedding>& skills,
                                            const CategoryModel& model,
                                            const ScoringConfig& cfg = {});

// score_categories + strength classification, keyed by category name.
std::map<std::string, CategoryScore> analyze_categories(const std::vector<SkillEmbedding>& skills,
                                                        const CategoryModel& model,
                                                        const ScoringConfig& scoring = {},
                                                        const StrengthThresholds& thresholds = {});

}  // namespace competency
