#pragma once
#include <cstddef>
#include <vector>

namespace competency {

// Cosine of two equal-length vectors. 0 if either has zero norm.
double cosine(const float* a, const float* b, size_t dim);
double cosine(const std::vector<float>& a, const std::vector<float>& b);

// Element-wise mean. All inputs must share one dimension (checked by caller).
std::vector<float> mean_vector(const std::vector<std::vector<float>>& vecs);

void l2_normalize(std::vector<float>& v);

}  // namespace competency
