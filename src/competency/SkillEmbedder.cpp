#include "competency/SkillEmbedder.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

#include "competency/Errors.hpp"

namespace competency {

namespace {

struct SlotResult {
    bool ok = false;
    bool unreachable = false;
    std::vector<float> vec;
    std::string error;
};

// Shared between the caller and the workers. Workers keep it alive through a shared_ptr
// so an abandoned batch (timeout) can outlive the call that started it.
struct BatchState {
    std::shared_ptr<const EmbeddingProvider> provider;
    EmbedBatchConfig cfg;
    std::vector<std::string> skills;

    std::atomic<size_t> next{0};
    std::atomic<bool> cancelled{false};

    std::mutex mu;
    std::condition_variable cv;        // signals progress to the caller
    std::condition_variable cancel_cv; // wakes workers sleeping in backoff
    std::vector<SlotResult> results;
    size_t remaining = 0;
};

int backoff_ms(const EmbedBatchConfig& cfg, int attempt) {
    long long d = cfg.initial_backoff_ms;
    for (int i = 1; i < attempt && d < cfg.max_backoff_ms; ++i) d *= 2;
    return (int)std::min<long long>(d, cfg.max_backoff_ms);
}

bool all_finite(const std::vector<float>& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

SlotResult embed_one(BatchState& st, const std::string& skill) {
    SlotResult r;

    for (int attempt = 1; attempt <= st.cfg.max_attempts; ++attempt) {
        if (st.cancelled.load()) {
            r.error = "cancelled";
            return r;
        }

        try {
            std::vector<float> v = st.provider->embed(skill);
            if (v.empty()) {
                r.error = "provider returned an empty vector";
            } else if (!all_finite(v)) {
                r.error = "provider returned non-finite values";
            } else {
                r.ok = true;
                r.vec = std::move(v);
            }
            return r;
        } catch (const ProviderError& e) {
            r.error = e.what();
            r.unreachable = e.transient();
            if (!e.transient()) return r;
        } catch (const std::exception& e) {
            r.error = e.what();
            r.unreachable = false;
            return r;
        }

        if (attempt < st.cfg.max_attempts) {
            std::unique_lock<std::mutex> lock(st.mu);
            st.cancel_cv.wait_for(lock, std::chrono::milliseconds(backoff_ms(st.cfg, attempt)),
                                  [&] { return st.cancelled.load(); });
        }
    }

    return r;
}

void worker_loop(std::shared_ptr<BatchState> st) {
    while (!st->cancelled.load()) {
        const size_t i = st->next.fetch_add(1);
        if (i >= st->skills.size()) break;

        SlotResult r = embed_one(*st, st->skills[i]);

        {
            std::lock_guard<std::mutex> lock(st->mu);
            st->results[i] = std::move(r);
            --st->remaining;
        }
        st->cv.notify_all();
    }
}

}  // namespace

SkillEmbedder::SkillEmbedder(std::shared_ptr<const EmbeddingProvider> provider, EmbedBatchConfig cfg)
    : m_provider(std::move(provider)), m_cfg(cfg) {
    if (!m_provider) throw ConfigurationError("SkillEmbedder: provider is null");
    if (m_cfg.max_concurrency == 0) m_cfg.max_concurrency = 1;
    if (m_cfg.max_attempts < 1) m_cfg.max_attempts = 1;
}

EmbedOutcome SkillEmbedder::embed_all(const std::vector<std::string>& skills, size_t expected_dim) const {
    EmbedOutcome out;
    if (skills.empty()) return out;

    auto st = std::make_shared<BatchState>();
    st->provider = m_provider;
    st->cfg = m_cfg;
    st->skills = skills;
    st->results.resize(skills.size());
    st->remaining = skills.size();

    const size_t n_workers = std::min(m_cfg.max_concurrency, skills.size());
    std::vector<std::thread> workers;
    workers.reserve(n_workers);

    auto abandon = [&]() {
        st->cancelled.store(true);
        {
            // taken so a worker between its predicate check and wait cannot miss the notify
            std::lock_guard<std::mutex> lock(st->mu);
        }
        st->cancel_cv.notify_all();
    };

    try {
        for (size_t w = 0; w < n_workers; ++w) workers.emplace_back(worker_loop, st);
    } catch (const std::system_error&) {
        abandon();
        for (auto& t : workers) t.join();
        throw;
    }

    const bool has_deadline = m_cfg.request_timeout_ms > 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_cfg.request_timeout_ms);

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(st->mu);
        auto all_done = [&] { return st->remaining == 0; };
        if (has_deadline) finished = st->cv.wait_until(lock, deadline, all_done);
        else { st->cv.wait(lock, all_done); finished = true; }
    }

    if (!finished) {
        abandon();
        for (auto& t : workers) t.detach();
        throw TimeoutError("embedding " + std::to_string(skills.size()) + " skills exceeded " +
                           std::to_string(m_cfg.request_timeout_ms) + " ms");
    }

    for (auto& t : workers) t.join();

    size_t dim = expected_dim;
    for (size_t i = 0; i < skills.size(); ++i) {
        SlotResult& r = st->results[i];

        if (r.ok && dim == 0) dim = r.vec.size();
        if (r.ok && r.vec.size() != dim) {
            r.ok = false;
            r.error = "dimension " + std::to_string(r.vec.size()) + " != " + std::to_string(dim);
        }

        if (r.ok) {
            out.embedded.push_back(SkillEmbedding{skills[i], std::move(r.vec)});
            continue;
        }

        if (r.unreachable) ++out.unreachable;
        std::cerr << "SkillEmbedder: warning: dropped skill \"" << skills[i] << "\": " << r.error << "\n";
        out.dropped.push_back(DroppedSkill{skills[i], r.error});
    }

    return out;
}

}  // namespace competency
