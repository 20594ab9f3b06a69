#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "competency/Models.hpp"

namespace competency {

// Human-readable profile: category table (ranking order), top categories, recommendations.
std::string render_markdown(const AnalysisResult& r, size_t top_categories_display = 3);

void write_markdown(const std::filesystem::path& out_path, const std::string& md);

}  // namespace competency
