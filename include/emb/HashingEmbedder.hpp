#pragma once
#include "emb/EmbeddingProvider.hpp"

#include <cstddef>
#include <string>
#include <vector>

// Deterministic, offline embedder: tokens are hashed (FNV-1a) into buckets with a small
// spill into the neighbouring buckets, then L2-normalized. Texts sharing tokens end up close.
class HashingEmbedder final : public EmbeddingProvider {
public:
    explicit HashingEmbedder(size_t dim = 256);

    std::vector<float> embed(const std::string& text) const override;
    std::string name() const override;

    size_t dim() const { return m_dim; }

private:
    size_t m_dim;
};
