#pragma once

#include <memory>
#include <string>
#include <vector>

#include "competency/Config.hpp"
#include "competency/Models.hpp"
#include "emb/EmbeddingProvider.hpp"

namespace competency {

struct EmbedOutcome {
    std::vector<SkillEmbedding> embedded;  // successes, in input order
    std::vector<DroppedSkill> dropped;     // failures, in input order
    size_t unreachable = 0;                // dropped after exhausting transient retries
};

// Embeds a batch of distinct skills with at most cfg.max_concurrency calls in flight.
// Transient provider errors are retried with exponential backoff; any other failure drops
// the skill. The call returns once every skill has an outcome (join point) or throws
// TimeoutError when cfg.request_timeout_ms elapses first. On timeout the in-flight calls
// are abandoned: their workers finish on their own and their results are discarded.
class SkillEmbedder {
public:
    SkillEmbedder(std::shared_ptr<const EmbeddingProvider> provider, EmbedBatchConfig cfg);

    // expected_dim == 0 accepts the dimension of the first successful vector
    EmbedOutcome embed_all(const std::vector<std::string>& skills, size_t expected_dim = 0) const;

    const EmbeddingProvider& provider() const { return *m_provider; }

private:
    std::shared_ptr<const EmbeddingProvider> m_provider;
    EmbedBatchConfig m_cfg;
};

}  // namespace competency
