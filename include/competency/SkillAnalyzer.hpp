#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "competency/CategoryModel.hpp"
#include "competency/Config.hpp"
#include "competency/Models.hpp"
#include "competency/SkillEmbedder.hpp"
#include "emb/EmbeddingProvider.hpp"

namespace competency {

// Full pipeline: normalize -> embed -> score -> classify -> rank -> recommend.
// One instance serves any number of concurrent analyze() calls; the category model is
// built on first use and shared read-only afterwards.
class SkillAnalyzer {
public:
    SkillAnalyzer(std::shared_ptr<const EmbeddingProvider> provider,
                  CategoryVocabulary vocab,
                  AnalyzerConfig cfg = {});

    SkillAnalyzer(const SkillAnalyzer&) = delete;
    SkillAnalyzer& operator=(const SkillAnalyzer&) = delete;

    // nullopt (no skill list at all) -> ValidationError.
    // An empty list is valid and yields all-zero scores.
    // Throws ConfigurationError (model build), ProviderError (every skill failed),
    // TimeoutError (request deadline).
    AnalysisResult analyze(const std::optional<std::vector<std::string>>& raw_skills);

    // Forces the category model build; startup code calls this to fail fast.
    const CategoryModel& model();

    const AnalyzerConfig& config() const { return m_cfg; }

private:
    AnalyzerConfig m_cfg;
    CategoryVocabulary m_vocab;
    SkillEmbedder m_embedder;
    SharedCategoryModel m_model;
};

}  // namespace competency
