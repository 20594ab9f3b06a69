#include "competency/SkillAnalyzer.hpp"

#include "competency/Errors.hpp"
#include "competency/Ranker.hpp"
#include "competency/RecommendationEngine.hpp"
#include "competency/SimilarityScorer.hpp"
#include "competency/SkillText.hpp"

namespace competency {

SkillAnalyzer::SkillAnalyzer(std::shared_ptr<const EmbeddingProvider> provider,
                             CategoryVocabulary vocab,
                             AnalyzerConfig cfg)
    : m_cfg(std::move(cfg)),
      m_vocab(std::move(vocab)),
      m_embedder(std::move(provider), m_cfg.batch),
      m_model([this] {
          return CategoryModel::load_or_build(m_vocab, m_embedder, m_cfg.centroid_cache_path);
      }) {
    validate_config(m_cfg);
}

const CategoryModel& SkillAnalyzer::model() {
    return m_model.get();
}

AnalysisResult SkillAnalyzer::analyze(const std::optional<std::vector<std::string>>& raw_skills) {
    if (!raw_skills) {
        throw ValidationError("skills list is required");
    }

    AnalysisResult res;
    res.skills = normalize_skill_list(*raw_skills);

    const CategoryModel& cm = m_model.get();

    EmbedOutcome emb = m_embedder.embed_all(res.skills, cm.dim());

    if (!res.skills.empty() && emb.embedded.empty()) {
        // nothing to score; only a pure outage is worth retrying
        const bool retryable = emb.unreachable == emb.dropped.size();
        throw ProviderError("embedding failed for all " + std::to_string(res.skills.size()) +
                            " skills (" + emb.dropped.front().reason + ")", retryable);
    }

    res.category_analysis = analyze_categories(emb.embedded, cm, m_cfg.scoring, m_cfg.thresholds);
    res.top_categories = rank_categories(res.category_analysis);
    res.recommended_skills = recommend_skills(res.category_analysis, cm.vocabulary(), res.skills,
                                              m_cfg.recommendation);

    res.diagnostics.embedded_skills = emb.embedded.size();
    res.diagnostics.dropped = std::move(emb.dropped);
    return res;
}

}  // namespace competency
