#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "competency/Models.hpp"

namespace competency {

class SkillEmbedder;

// One centroid per category, in vocabulary order. Immutable once built.
class CategoryModel {
public:
    // Embeds every canonical skill and averages per category. Throws ConfigurationError if
    // any canonical skill cannot be embedded: a model with holes in it cannot score.
    static CategoryModel build(const CategoryVocabulary& vocab, const SkillEmbedder& embedder);

    // Reuses a centroid cache written for this vocabulary, provider cache key and the
    // provider's current output dimension (measured on one canonical skill) if one exists
    // and matches, otherwise builds and (best effort) writes the cache.
    static CategoryModel load_or_build(const CategoryVocabulary& vocab,
                                       const SkillEmbedder& embedder,
                                       const std::string& cache_path);

    // Validates that centroids cover the vocabulary one-to-one with a single dimension.
    CategoryModel(CategoryVocabulary vocab, std::vector<CategoryCentroid> centroids);

    const CategoryVocabulary& vocabulary() const { return m_vocab; }
    const std::vector<CategoryCentroid>& centroids() const { return m_centroids; }
    size_t dim() const { return m_dim; }

private:
    CategoryVocabulary m_vocab;
    std::vector<CategoryCentroid> m_centroids;
    size_t m_dim = 0;
};

// Lazily built, process-wide category model. The first get() runs the builder; concurrent
// callers block until it finishes. After that, get() is a lock-free read. A failed build
// propagates its exception and leaves the holder empty so a later call may try again.
class SharedCategoryModel {
public:
    using Builder = std::function<CategoryModel()>;

    explicit SharedCategoryModel(Builder builder);

    const CategoryModel& get();
    bool ready() const { return m_ready.load(std::memory_order_acquire) != nullptr; }

private:
    Builder m_builder;
    std::mutex m_build_mu;
    std::unique_ptr<const CategoryModel> m_model;
    std::atomic<const CategoryModel*> m_ready{nullptr};
};

}  // namespace competency
