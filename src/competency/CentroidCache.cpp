#include "competency/CentroidCache.hpp"

#include <filesystem>
#include <fstream>

namespace competency {

static void fnv_mix(uint64_t& h, const std::string& s) {
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    // field separator so ("ab","c") and ("a","bc") differ
    h ^= 0x1f;
    h *= 1099511628211ull;
}

uint64_t vocabulary_fingerprint(const CategoryVocabulary& vocab, const std::string& provider_key, size_t dim) {
    uint64_t h = 1469598103934665603ull;
    fnv_mix(h, provider_key);
    fnv_mix(h, std::to_string(dim));
    for (const auto& c : vocab.categories) {
        fnv_mix(h, c.name);
        for (const auto& s : c.skills) fnv_mix(h, s.key);
    }
    return h;
}

std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

void CentroidCache::set(uint64_t fingerprint, std::vector<CategoryCentroid> centroids, size_t dim) {
    m_fingerprint = fingerprint;
    m_centroids = std::move(centroids);
    m_dim = dim;
}

bool CentroidCache::save(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) return false;

    uint32_t magic = kMagic, version = kVersion;
    uint64_t fp = m_fingerprint;
    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_centroids.size();
    out.write((const char*)&magic, sizeof(magic));
    out.write((const char*)&version, sizeof(version));
    out.write((const char*)&fp, sizeof(fp));
    out.write((const char*)&dim, sizeof(dim));
    out.write((const char*)&n, sizeof(n));

    for (const auto& c : m_centroids) {
        uint32_t len = (uint32_t)c.category.size();
        out.write((const char*)&len, sizeof(len));
        out.write(c.category.data(), len);
        out.write((const char*)c.vector.data(), (std::streamsize)(sizeof(float) * m_dim));
    }

    return (bool)out;
}

bool CentroidCache::load(const std::string& path, uint64_t expected_fingerprint) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) return false;
    const std::streamoff file_size = in.tellg();
    in.seekg(0);

    uint32_t magic = 0, version = 0, dim = 0, n = 0;
    uint64_t fp = 0;
    in.read((char*)&magic, sizeof(magic));
    in.read((char*)&version, sizeof(version));
    in.read((char*)&fp, sizeof(fp));
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || magic != kMagic || version != kVersion) return false;
    if (fp != expected_fingerprint) return false;
    if (dim == 0 || dim > kMaxDim || n > kMaxCategories) return false;

    // every entry needs at least its length field and its vector
    const std::streamoff header = (std::streamoff)in.tellg();
    const std::streamoff min_entry = (std::streamoff)(sizeof(uint32_t) + sizeof(float) * (size_t)dim);
    if (file_size < header || (file_size - header) / min_entry < (std::streamoff)n) return false;

    std::vector<CategoryCentroid> cents;
    cents.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read((char*)&len, sizeof(len));
        if (!in || len > kMaxNameLen) return false;

        CategoryCentroid c;
        c.category.assign(len, '\0');
        in.read(c.category.data(), len);
        c.vector.resize(dim);
        in.read((char*)c.vector.data(), (std::streamsize)(sizeof(float) * dim));
        if (!in) return false;

        cents.push_back(std::move(c));
    }

    m_fingerprint = fp;
    m_dim = dim;
    m_centroids = std::move(cents);
    return true;
}

}  // namespace competency
