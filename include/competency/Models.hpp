#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace competency {

enum class Strength {
    Weak,
    Moderate,
    Strong
};

struct CanonicalSkill {
    std::string display;  // spelling used for output, e.g. "CI/CD"
    std::string key;      // normalized form used for every comparison
};

struct CategoryDefinition {
    std::string name;
    std::vector<CanonicalSkill> skills;  // de-duplicated on key, config order kept
};

struct CategoryVocabulary {
    std::vector<CategoryDefinition> categories;
};

struct SkillEmbedding {
    std::string skill;          // normalized
    std::vector<float> vector;
};

struct CategoryCentroid {
    std::string category;
    std::vector<float> vector;
};

struct CategoryScore {
    std::string category;
    double score = 0.0;  // [0,1]
    Strength strength = Strength::Weak;
    std::vector<std::string> matched_skills;  // candidate skills behind the score, best first
};

struct RankedCategory {
    std::string category;
    double score = 0.0;
};

struct DroppedSkill {
    std::string skill;
    std::string reason;
};

// Side channel for diagnostics; never affects scores.
struct AnalysisDiagnostics {
    size_t embedded_skills = 0;
    std::vector<DroppedSkill> dropped;
};

struct AnalysisResult {
    std::vector<std::string> skills;                    // normalized, first-seen order
    std::map<std::string, CategoryScore> category_analysis;
    std::vector<RankedCategory> top_categories;         // full ranking, not truncated
    std::vector<std::string> recommended_skills;        // display spelling
    AnalysisDiagnostics diagnostics;
};

const char* strength_str(Strength s);

}  // namespace competency
