#include "competency/VectorMath.hpp"

#include <cmath>

namespace competency {

double cosine(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    return cosine(a.data(), b.data(), a.size());
}

std::vector<float> mean_vector(const std::vector<std::vector<float>>& vecs) {
    if (vecs.empty()) return {};

    const size_t dim = vecs.front().size();
    std::vector<double> acc(dim, 0.0);
    for (const auto& v : vecs) {
        for (size_t j = 0; j < dim; ++j) acc[j] += v[j];
    }

    const double inv = 1.0 / static_cast<double>(vecs.size());
    std::vector<float> out(dim);
    for (size_t j = 0; j < dim; ++j) out[j] = static_cast<float>(acc[j] * inv);
    return out;
}

void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

}  // namespace competency
