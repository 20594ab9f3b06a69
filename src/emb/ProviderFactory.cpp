#include "emb/ProviderFactory.hpp"

#include "competency/Errors.hpp"
#include "emb/HashingEmbedder.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "emb/OllamaEmbedder.hpp"

std::shared_ptr<const EmbeddingProvider> create_embedding_provider(const competency::ProviderConfig& cfg) {
    if (cfg.backend == "onnx") {
        auto emb = std::make_shared<MiniLmEmbedder>(cfg.max_len);
        if (!emb->init(cfg.model_path, cfg.vocab_path)) {
            throw competency::ConfigurationError("failed to init MiniLmEmbedder (model=" + cfg.model_path +
                                                 ", vocab=" + cfg.vocab_path + ")");
        }
        return emb;
    }
    if (cfg.backend == "ollama") {
        return std::make_shared<OllamaEmbedder>(cfg.ollama_model, cfg.ollama_endpoint, cfg.call_timeout_ms);
    }
    if (cfg.backend == "hash") {
        return std::make_shared<HashingEmbedder>(cfg.hash_dim);
    }
    throw competency::ConfigurationError("unknown embedding backend: " + cfg.backend);
}
