#include "commands/common.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>

#include "competency/Errors.hpp"
#include "competency/Vocabulary.hpp"
#include "io/JsonIO.hpp"

using competency::ConfigurationError;

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static long long get_arg_int(int argc, char** argv, const std::string& key, long long def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " expects an integer, got \"" + s + "\"");
    }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " expects a number, got \"" + s + "\"");
    }
}

static int get_arg_int32(int argc, char** argv, const std::string& key, int def) {
    long long v = get_arg_int(argc, argv, key, def);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigurationError(key + " is out of range");
    }
    return (int)v;
}

static size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def) {
    long long v = get_arg_int(argc, argv, key, (long long)def);
    if (v < 0) throw ConfigurationError(key + " must be >= 0");
    return (size_t)v;
}

CommandSettings load_command_settings(int argc, char** argv) {
    CommandSettings s;
    auto& cfg = s.cfg;

    const std::string config_path = get_arg(argc, argv, "--config", "");
    if (!config_path.empty()) loadAnalyzerConfig(config_path, cfg);

    cfg.provider.backend         = get_arg(argc, argv, "--provider", cfg.provider.backend);
    cfg.provider.model_path      = get_arg(argc, argv, "--emb_model", cfg.provider.model_path);
    cfg.provider.vocab_path      = get_arg(argc, argv, "--emb_vocab", cfg.provider.vocab_path);
    cfg.provider.ollama_model    = get_arg(argc, argv, "--ollama_model", cfg.provider.ollama_model);
    cfg.provider.ollama_endpoint = get_arg(argc, argv, "--ollama_endpoint", cfg.provider.ollama_endpoint);
    cfg.provider.hash_dim        = get_arg_size(argc, argv, "--hash_dim", cfg.provider.hash_dim);

    cfg.scoring.top_k                       = get_arg_size(argc, argv, "--top_k", cfg.scoring.top_k);
    cfg.thresholds.moderate                 = get_arg_double(argc, argv, "--moderate", cfg.thresholds.moderate);
    cfg.thresholds.strong                   = get_arg_double(argc, argv, "--strong", cfg.thresholds.strong);
    cfg.recommendation.max_recommendations  = get_arg_size(argc, argv, "--max_recommendations", cfg.recommendation.max_recommendations);
    cfg.batch.max_concurrency               = get_arg_size(argc, argv, "--concurrency", cfg.batch.max_concurrency);
    cfg.batch.max_attempts                  = get_arg_int32(argc, argv, "--max_attempts", cfg.batch.max_attempts);
    cfg.batch.request_timeout_ms            = get_arg_int32(argc, argv, "--timeout_ms", cfg.batch.request_timeout_ms);
    cfg.top_categories_display              = get_arg_size(argc, argv, "--top", cfg.top_categories_display);
    cfg.centroid_cache_path                 = get_arg(argc, argv, "--centroid_cache", cfg.centroid_cache_path);

    competency::validate_config(cfg);

    const std::string vocab_path = get_arg(argc, argv, "--vocab", "");
    s.vocab = vocab_path.empty() ? competency::default_vocabulary() : loadVocabulary(vocab_path);

    return s;
}

int report_error(const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";

    if (dynamic_cast<const competency::ConfigurationError*>(&e)) return 2;
    if (dynamic_cast<const competency::ValidationError*>(&e)) return 3;
    if (auto* pe = dynamic_cast<const competency::ProviderError*>(&e)) {
        if (pe->transient()) std::cerr << "(transient: safe to retry)\n";
        return 4;
    }
    if (dynamic_cast<const competency::TimeoutError*>(&e)) {
        std::cerr << "(timed out: safe to retry)\n";
        return 5;
    }
    return 1;
}
