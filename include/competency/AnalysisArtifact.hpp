// include/competency/AnalysisArtifact.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "competency/Models.hpp"

namespace competency {

// Response object for one analysis, ready for direct display.
struct AnalysisArtifact {
    AnalysisResult result;
    size_t top_categories_display = 3;  // 0 keeps the full ranking

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// Scores are reported with three decimals, truncated rather than rounded: strength is
// classified on the exact score, and a reported 0.750 must never sit beside "Moderate".
double report_score(double x);

}  // namespace competency
