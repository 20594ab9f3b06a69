#include "competency/MarkdownReport.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "competency/AnalysisArtifact.hpp"

namespace competency {

static std::string fmt_score(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", report_score(s));
    return buf;
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string render_markdown(const AnalysisResult& r, size_t top_categories_display) {
    std::string out;

    out += "## Skill profile\n\n";
    out += "Skills analyzed: " + std::to_string(r.skills.size());
    if (!r.diagnostics.dropped.empty()) {
        out += " (" + std::to_string(r.diagnostics.dropped.size()) + " could not be embedded)";
    }
    out += "\n\n";

    out += "| Category | Score | Strength | Matched by |\n";
    out += "|---|---|---|---|\n";
    for (const auto& rc : r.top_categories) {
        auto it = r.category_analysis.find(rc.category);
        if (it == r.category_analysis.end()) continue;
        const CategoryScore& cs = it->second;
        out += "| " + cs.category + " | " + fmt_score(cs.score) + " | " + strength_str(cs.strength) +
               " | " + join(cs.matched_skills, ", ") + " |\n";
    }
    out += "\n";

    const size_t n = (top_categories_display == 0)
        ? r.top_categories.size()
        : std::min(top_categories_display, r.top_categories.size());

    out += "### Top categories\n\n";
    for (size_t i = 0; i < n; ++i) {
        out += std::to_string(i + 1) + ". " + r.top_categories[i].category +
               " (" + fmt_score(r.top_categories[i].score) + ")\n";
    }
    out += "\n";

    out += "### Recommended skills\n\n";
    const bool any_qualifying = std::any_of(r.category_analysis.begin(), r.category_analysis.end(),
                                            [](const auto& kv) { return kv.second.strength != Strength::Weak; });
    if (r.recommended_skills.empty() && any_qualifying) {
        out += "_Every skill of the Moderate and Strong categories is already covered._\n";
    } else if (r.recommended_skills.empty()) {
        out += "_No category reached Moderate; nothing to recommend yet._\n";
    } else {
        for (const auto& s : r.recommended_skills) out += "- " + s + "\n";
    }

    if (!r.diagnostics.dropped.empty()) {
        out += "\n### Skipped skills\n\n";
        for (const auto& d : r.diagnostics.dropped) out += "- " + d.skill + ": " + d.reason + "\n";
    }

    return out;
}

void write_markdown(const std::filesystem::path& out_path, const std::string& md) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << md;
    if (md.empty() || md.back() != '\n') out << "\n";
}

}  // namespace competency
