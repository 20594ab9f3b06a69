#include "competency/AnalysisArtifact.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace competency {

double report_score(double x) {
    return std::floor(x * 1000.0) / 1000.0;
}

static nlohmann::json category_score_to_json(const CategoryScore& cs) {
    return {
        {"score", report_score(cs.score)},
        {"strength", strength_str(cs.strength)},
        {"matched_skills", cs.matched_skills},
    };
}

nlohmann::json AnalysisArtifact::to_json() const {
    const AnalysisResult& r = result;

    nlohmann::json j;
    j["success"] = true;
    j["skills"] = r.skills;

    nlohmann::json cats = nlohmann::json::object();
    for (const auto& [name, cs] : r.category_analysis) {
        cats[name] = category_score_to_json(cs);
    }
    j["category_analysis"] = cats;

    nlohmann::json top = nlohmann::json::array();
    const size_t n = (top_categories_display == 0)
        ? r.top_categories.size()
        : std::min(top_categories_display, r.top_categories.size());
    for (size_t i = 0; i < n; ++i) {
        top.push_back({{"category", r.top_categories[i].category},
                       {"score", report_score(r.top_categories[i].score)}});
    }
    j["top_categories"] = top;

    j["recommended_skills"] = r.recommended_skills;
    j["total_skills_analyzed"] = r.skills.size();

    nlohmann::json dropped = nlohmann::json::array();
    for (const auto& d : r.diagnostics.dropped) {
        dropped.push_back({{"skill", d.skill}, {"reason", d.reason}});
    }
    j["diagnostics"] = {
        {"embedded_skills", r.diagnostics.embedded_skills},
        {"dropped_skills", dropped},
    };

    return j;
}

void AnalysisArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace competency
