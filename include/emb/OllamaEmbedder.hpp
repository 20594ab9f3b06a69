#pragma once
#include "emb/EmbeddingProvider.hpp"

#include <string>
#include <vector>

// Remote embedder speaking the Ollama /api/embeddings protocol over libcurl.
class OllamaEmbedder final : public EmbeddingProvider {
public:
    OllamaEmbedder(const std::string& model,
                   const std::string& endpoint = "http://127.0.0.1:11434/api/embeddings",
                   long timeout_ms = 10000);
    ~OllamaEmbedder() override;

    OllamaEmbedder(const OllamaEmbedder&) = delete;
    OllamaEmbedder& operator=(const OllamaEmbedder&) = delete;

    std::vector<float> embed(const std::string& text) const override;
    std::string name() const override;
    std::string cache_key() const override;  // model tag + endpoint

    // Exposed for tests: turns a response body into a vector or throws ProviderError.
    static std::vector<float> parse_response(const std::string& body);

private:
    std::string m_model;
    std::string m_endpoint;
    long m_timeout_ms;
};
