#pragma once

#include <cstddef>
#include <string>

namespace competency {

struct ScoringConfig {
    size_t top_k = 3;  // category score = mean of the k best per-skill similarities
};

struct StrengthThresholds {
    double moderate = 0.50;  // score >= moderate -> Moderate
    double strong = 0.75;    // score >= strong   -> Strong
};

struct RecommendationConfig {
    size_t max_recommendations = 10;
};

struct EmbedBatchConfig {
    size_t max_concurrency = 4;     // embedding calls in flight per request
    int max_attempts = 3;           // per skill, first call included
    int initial_backoff_ms = 100;   // doubled after every transient failure
    int max_backoff_ms = 2000;
    int request_timeout_ms = 30000; // whole batch; 0 disables the deadline
};

struct ProviderConfig {
    std::string backend = "onnx";   // onnx | ollama | hash
    std::string model_path = "models/emb/model.onnx";
    std::string vocab_path = "models/emb/vocab.txt";
    size_t max_len = 64;
    std::string ollama_model = "all-minilm";
    std::string ollama_endpoint = "http://127.0.0.1:11434/api/embeddings";
    long call_timeout_ms = 10000;
    size_t hash_dim = 256;
};

struct AnalyzerConfig {
    ScoringConfig scoring;
    StrengthThresholds thresholds;
    RecommendationConfig recommendation;
    EmbedBatchConfig batch;
    ProviderConfig provider;

    size_t top_categories_display = 3;  // presentation-side truncation of the ranking
    std::string centroid_cache_path;    // optional
};

// Throws ConfigurationError naming the first invalid field.
void validate_config(const AnalyzerConfig& cfg);

}  // namespace competency
