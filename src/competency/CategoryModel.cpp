#include "competency/CategoryModel.hpp"

#include <iostream>
#include <unordered_map>

#include "competency/CentroidCache.hpp"
#include "competency/Errors.hpp"
#include "competency/SkillEmbedder.hpp"
#include "competency/VectorMath.hpp"

namespace competency {

CategoryModel::CategoryModel(CategoryVocabulary vocab, std::vector<CategoryCentroid> centroids)
    : m_vocab(std::move(vocab)), m_centroids(std::move(centroids)) {
    if (m_vocab.categories.empty()) {
        throw ConfigurationError("CategoryModel: vocabulary has no categories");
    }
    if (m_centroids.size() != m_vocab.categories.size()) {
        throw ConfigurationError("CategoryModel: " + std::to_string(m_centroids.size()) +
                                 " centroids for " + std::to_string(m_vocab.categories.size()) + " categories");
    }

    for (size_t i = 0; i < m_centroids.size(); ++i) {
        const auto& c = m_centroids[i];
        if (c.category != m_vocab.categories[i].name) {
            throw ConfigurationError("CategoryModel: centroid \"" + c.category +
                                     "\" does not match category \"" + m_vocab.categories[i].name + "\"");
        }
        if (c.vector.empty()) {
            throw ConfigurationError("CategoryModel: empty centroid for " + c.category);
        }
        if (m_dim == 0) m_dim = c.vector.size();
        if (c.vector.size() != m_dim) {
            throw ConfigurationError("CategoryModel: inconsistent centroid dim for " + c.category);
        }
    }
}

CategoryModel CategoryModel::build(const CategoryVocabulary& vocab, const SkillEmbedder& embedder) {
    if (vocab.categories.empty()) {
        throw ConfigurationError("CategoryModel: vocabulary has no categories");
    }

    // skills shared between categories ("git") are embedded once
    std::vector<std::string> keys;
    std::unordered_map<std::string, size_t> slot;
    for (const auto& c : vocab.categories) {
        if (c.skills.empty()) {
            throw ConfigurationError("CategoryModel: category has no canonical skills: " + c.name);
        }
        for (const auto& s : c.skills) {
            if (slot.emplace(s.key, keys.size()).second) keys.push_back(s.key);
        }
    }

    EmbedOutcome emb;
    try {
        emb = embedder.embed_all(keys);
    } catch (const TimeoutError& e) {
        throw ConfigurationError(std::string("CategoryModel: embedding provider timed out during build: ") + e.what());
    }

    if (!emb.dropped.empty()) {
        const auto& d = emb.dropped.front();
        throw ConfigurationError("CategoryModel: cannot embed canonical skill \"" + d.skill + "\" (" +
                                 d.reason + "); " + std::to_string(emb.dropped.size()) + " of " +
                                 std::to_string(keys.size()) + " skills failed");
    }

    std::unordered_map<std::string, const std::vector<float>*> by_key;
    for (const auto& se : emb.embedded) by_key[se.skill] = &se.vector;

    std::vector<CategoryCentroid> centroids;
    centroids.reserve(vocab.categories.size());
    for (const auto& c : vocab.categories) {
        std::vector<std::vector<float>> members;
        members.reserve(c.skills.size());
        for (const auto& s : c.skills) members.push_back(*by_key.at(s.key));
        centroids.push_back(CategoryCentroid{c.name, mean_vector(members)});
    }

    return CategoryModel(vocab, std::move(centroids));
}

// Output dimension of the provider right now, from one canonical skill; 0 if it cannot
// be determined (the build that follows reports the failure).
static size_t current_dim(const CategoryVocabulary& vocab, const SkillEmbedder& embedder) {
    if (vocab.categories.empty() || vocab.categories.front().skills.empty()) return 0;

    try {
        EmbedOutcome sample = embedder.embed_all({vocab.categories.front().skills.front().key});
        if (sample.embedded.empty()) return 0;
        return sample.embedded.front().vector.size();
    } catch (const TimeoutError&) {
        return 0;
    }
}

CategoryModel CategoryModel::load_or_build(const CategoryVocabulary& vocab,
                                           const SkillEmbedder& embedder,
                                           const std::string& cache_path) {
    if (cache_path.empty()) return build(vocab, embedder);

    const std::string key = embedder.provider().cache_key();
    const size_t dim = current_dim(vocab, embedder);

    if (dim > 0) {
        CentroidCache cached;
        if (cached.load(cache_path, vocabulary_fingerprint(vocab, key, dim)) && cached.dim() == dim) {
            try {
                return CategoryModel(vocab, cached.centroids());
            } catch (const ConfigurationError& e) {
                std::cerr << "CategoryModel: warning: ignoring centroid cache " << cache_path << ": " << e.what() << "\n";
            }
        }
    }

    CategoryModel model = build(vocab, embedder);

    CentroidCache out;
    out.set(vocabulary_fingerprint(vocab, key, model.dim()), model.centroids(), model.dim());
    if (!out.save(cache_path)) {
        std::cerr << "CategoryModel: warning: failed to write centroid cache " << cache_path << "\n";
    }

    return model;
}

SharedCategoryModel::SharedCategoryModel(Builder builder) : m_builder(std::move(builder)) {
    if (!m_builder) throw ConfigurationError("SharedCategoryModel: builder is empty");
}

const CategoryModel& SharedCategoryModel::get() {
    if (const CategoryModel* m = m_ready.load(std::memory_order_acquire)) return *m;

    std::lock_guard<std::mutex> lock(m_build_mu);
    if (const CategoryModel* m = m_ready.load(std::memory_order_acquire)) return *m;

    m_model = std::make_unique<const CategoryModel>(m_builder());
    m_ready.store(m_model.get(), std::memory_order_release);
    return *m_model;
}

}  // namespace competency
