#include "commands/embedVocab.hpp"
#include "commands/common.hpp"

#include "competency/CategoryModel.hpp"
#include "competency/CentroidCache.hpp"
#include "competency/SkillEmbedder.hpp"
#include "emb/ProviderFactory.hpp"

#include <iostream>
#include <string>

int cmd_embed_vocab(int argc, char** argv) {
    try {
        CommandSettings settings = load_command_settings(argc, argv);

        std::string cache = settings.cfg.centroid_cache_path;
        if (cache.empty()) cache = "data/embeddings/centroids.bin";

        auto provider = create_embedding_provider(settings.cfg.provider);
        competency::SkillEmbedder embedder(provider, settings.cfg.batch);

        // --force ignores any existing cache
        competency::CategoryModel model = has_flag(argc, argv, "--force")
            ? competency::CategoryModel::build(settings.vocab, embedder)
            : competency::CategoryModel::load_or_build(settings.vocab, embedder, cache);

        const uint64_t fp = competency::vocabulary_fingerprint(settings.vocab, provider->cache_key(), model.dim());

        competency::CentroidCache out;
        out.set(fp, model.centroids(), model.dim());
        if (!out.save(cache)) {
            std::cerr << "error: failed to save centroids to " << cache << "\n";
            return 1;
        }

        for (const auto& c : model.vocabulary().categories) {
            std::cout << "centroid " << c.name << " (" << c.skills.size() << " skills)\n";
        }
        std::cout << "saved: " << cache << " (n=" << model.centroids().size() << ", dim=" << model.dim()
                  << ", provider=" << provider->name() << ", fingerprint=" << competency::hex_u64(fp) << ")\n";
        return 0;
    } catch (const std::exception& e) {
        return report_error(e);
    }
}
