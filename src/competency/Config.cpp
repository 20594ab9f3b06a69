#include "competency/Config.hpp"

#include "competency/Errors.hpp"

namespace competency {

void validate_config(const AnalyzerConfig& cfg) {
    if (cfg.scoring.top_k == 0) {
        throw ConfigurationError("scoring.top_k must be >= 1");
    }

    const auto& t = cfg.thresholds;
    if (!(t.moderate > 0.0 && t.moderate < t.strong && t.strong <= 1.0)) {
        throw ConfigurationError("thresholds must satisfy 0 < moderate < strong <= 1");
    }

    const auto& b = cfg.batch;
    if (b.max_concurrency == 0) throw ConfigurationError("batch.max_concurrency must be >= 1");
    if (b.max_attempts < 1) throw ConfigurationError("batch.max_attempts must be >= 1");
    if (b.initial_backoff_ms < 0 || b.max_backoff_ms < b.initial_backoff_ms) {
        throw ConfigurationError("batch backoff must satisfy 0 <= initial_backoff_ms <= max_backoff_ms");
    }
    if (b.request_timeout_ms < 0) throw ConfigurationError("batch.request_timeout_ms must be >= 0");

    const auto& p = cfg.provider;
    if (p.backend != "onnx" && p.backend != "ollama" && p.backend != "hash") {
        throw ConfigurationError("provider.backend must be one of onnx, ollama, hash (got \"" + p.backend + "\")");
    }
    if (p.max_len < 2) throw ConfigurationError("provider.max_len must be >= 2");
    if (p.call_timeout_ms <= 0) throw ConfigurationError("provider.call_timeout_ms must be > 0");
}

}  // namespace competency
