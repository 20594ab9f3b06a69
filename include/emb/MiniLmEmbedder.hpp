#pragma once
#include "emb/EmbeddingProvider.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

// Local sentence-transformer (all-MiniLM-L6-v2 exported to ONNX).
class MiniLmEmbedder final : public EmbeddingProvider {
public:
    explicit MiniLmEmbedder(size_t max_len = 64) : m_max_len(max_len) {}

    bool init(const std::string& model_path, const std::string& vocab_path);

    // L2-normalized mean-pooled embedding
    std::vector<float> embed(const std::string& text) const override;
    std::string name() const override;
    // name + model/vocab file size and mtime, so a model swapped in place invalidates caches
    std::string cache_key() const override;

private:
    WordPieceTokenizer m_tok;
    size_t m_max_len;
    std::string m_model_path;
    std::string m_cache_key;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "skill-profiler"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    size_t m_num_inputs = 3;
    std::string m_out_name;
};
