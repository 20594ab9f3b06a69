#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "competency/Models.hpp"

namespace competency {

// 64-bit FNV-1a over the provider cache key, its output dimension and the normalized
// vocabulary. Any change to one of them invalidates a stored cache.
uint64_t vocabulary_fingerprint(const CategoryVocabulary& vocab, const std::string& provider_key, size_t dim);

std::string hex_u64(uint64_t x);

// Binary on-disk form of a built category model.
class CentroidCache {
public:
    void set(uint64_t fingerprint, std::vector<CategoryCentroid> centroids, size_t dim);

    bool save(const std::string& path) const;

    // false if the file is missing, truncated, corrupt, or written for another fingerprint
    bool load(const std::string& path, uint64_t expected_fingerprint);

    uint64_t fingerprint() const { return m_fingerprint; }
    size_t dim() const { return m_dim; }
    const std::vector<CategoryCentroid>& centroids() const { return m_centroids; }

private:
    static constexpr uint32_t kMagic = 0x43454e54; // "CENT"
    static constexpr uint32_t kVersion = 2;

    // upper bounds for header fields read back from disk
    static constexpr uint32_t kMaxDim = 1u << 16;
    static constexpr uint32_t kMaxCategories = 1u << 16;
    static constexpr uint32_t kMaxNameLen = 4096;

    uint64_t m_fingerprint = 0;
    size_t m_dim = 0;
    std::vector<CategoryCentroid> m_centroids;
};

}  // namespace competency
