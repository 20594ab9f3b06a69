#include "emb/HashingEmbedder.hpp"

#include <cctype>
#include <cstdint>
#include <map>

#include "competency/Errors.hpp"
#include "competency/VectorMath.hpp"

static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

// letters/digits and the symbols that carry meaning in skill names (c++, c#, node.js, ci/cd)
static std::vector<std::string> hash_tokens(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char ch : text) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));
        bool keep = std::isalnum(c) || c == '+' || c == '#' || c == '.' || c == '/';
        if (keep) {
            cur.push_back(static_cast<char>(c));
        } else if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

HashingEmbedder::HashingEmbedder(size_t dim) : m_dim(dim) {
    if (m_dim < 3) {
        throw competency::ConfigurationError("HashingEmbedder: dim must be >= 3");
    }
}

std::string HashingEmbedder::name() const {
    return "hash-" + std::to_string(m_dim);
}

std::vector<float> HashingEmbedder::embed(const std::string& text) const {
    auto tokens = hash_tokens(text);
    if (tokens.empty()) {
        throw competency::ProviderError("HashingEmbedder: no tokens in \"" + text + "\"", false);
    }

    std::map<std::string, int> counts;
    for (const auto& t : tokens) counts[t]++;

    std::vector<float> v(m_dim, 0.0f);
    for (const auto& [tok, n] : counts) {
        size_t idx = (size_t)(fnv1a64(tok) % m_dim);
        size_t prev = (idx + m_dim - 1) % m_dim;
        size_t next = (idx + 1) % m_dim;
        v[idx] += (float)n;
        v[prev] += (float)n * 0.3f;
        v[next] += (float)n * 0.3f;
    }

    competency::l2_normalize(v);
    return v;
}
