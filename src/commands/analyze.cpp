#include "commands/analyze.hpp"
#include "commands/common.hpp"

#include "competency/AnalysisArtifact.hpp"
#include "competency/MarkdownReport.hpp"
#include "competency/SkillAnalyzer.hpp"
#include "emb/ProviderFactory.hpp"
#include "io/JsonIO.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    fs::path p(out_path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) return false;
    out.open(p, std::ios::out | std::ios::trunc);
    return (bool)out;
}

// "Python, Docker,Kubernetes" -> {"Python", " Docker", "Kubernetes"}; normalization trims later
static std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

static std::optional<std::vector<std::string>> read_skills(int argc, char** argv) {
    const std::string input = get_arg(argc, argv, "--input", "");
    if (!input.empty()) return loadSkillRequest(input);

    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--skills") {
            const std::string v = argv[i + 1];
            if (v.find_first_not_of(" \t") == std::string::npos) return std::vector<std::string>{};
            return split_csv(v);
        }
    }
    return std::nullopt;
}

int cmd_analyze(int argc, char** argv) {
    try {
        CommandSettings settings = load_command_settings(argc, argv);

        const std::string format = get_arg(argc, argv, "--format", "json");
        if (format != "json" && format != "markdown") {
            std::cerr << "error: --format must be json or markdown\n";
            return 1;
        }
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const std::string out_path = get_arg(argc, argv, "--out", "");

        auto skills = read_skills(argc, argv);

        auto provider = create_embedding_provider(settings.cfg.provider);
        competency::SkillAnalyzer analyzer(provider, std::move(settings.vocab), settings.cfg);

        // fail on a broken vocabulary or provider before touching the request
        analyzer.model();

        competency::AnalysisArtifact art;
        art.result = analyzer.analyze(skills);
        art.top_categories_display = settings.cfg.top_categories_display;

        art.write_to(outdir / "analysis.json");

        std::ofstream mirror;
        const bool mirrored = open_out(mirror, out_path);
        if (!out_path.empty() && !mirrored) {
            std::cerr << "warning: failed to open --out file: " << out_path << "\n";
        }
        Printer pr{&std::cout, mirrored ? &mirror : nullptr};

        if (format == "markdown") {
            const std::string md = competency::render_markdown(art.result, art.top_categories_display);
            competency::write_markdown(outdir / "analysis.md", md);
            pr << md;
        } else {
            pr << art.to_json().dump(2) << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        return report_error(e);
    }
}
