#pragma once
#include <string>
#include <vector>

// Maps one normalized skill string to a fixed-dimension vector.
// embed() may be called from several threads at once and throws
// competency::ProviderError when it cannot produce a vector.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const std::string& text) const = 0;

    // Human-readable identifier for logs and reports.
    virtual std::string name() const = 0;

    // Identity of the weights behind embed(); part of the centroid cache fingerprint.
    // Must change whenever the same text could embed differently.
    virtual std::string cache_key() const { return name(); }
};
