#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <thread>

#include "competency/Errors.hpp"
#include "competency/SkillAnalyzer.hpp"
#include "competency/SkillText.hpp"
#include "competency/Vocabulary.hpp"
#include "emb/HashingEmbedder.hpp"
#include "utils/fake_providers.hpp"

using namespace competency;
using namespace test_utils;
using Catch::Approx;

static AnalyzerConfig fast_config() {
    AnalyzerConfig cfg;
    cfg.batch.initial_backoff_ms = 1;
    cfg.batch.max_backoff_ms = 2;
    return cfg;
}

static std::shared_ptr<TableEmbedder> table_provider() {
    return std::make_shared<TableEmbedder>(devops_backend_table());
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

TEST_CASE("DevOps-heavy candidate gets DevOps first and the missing DevOps skills", "[analyzer][scenario]")
{
    SkillAnalyzer analyzer(table_provider(), devops_backend_vocab(), fast_config());

    auto r = analyzer.analyze(std::vector<std::string>{"Python", "Docker", "Kubernetes"});

    REQUIRE(r.skills == std::vector<std::string>{"python", "docker", "kubernetes"});

    const auto& devops = r.category_analysis.at("DevOps");
    REQUIRE(devops.score == Approx(0.739).margin(0.005));
    REQUIRE(devops.strength == Strength::Moderate);

    const auto& backend = r.category_analysis.at("Backend");
    REQUIRE(backend.score == Approx(0.439).margin(0.005));
    REQUIRE(backend.strength == Strength::Weak);

    REQUIRE(r.top_categories.size() == 2);
    REQUIRE(r.top_categories[0].category == "DevOps");
    REQUIRE(r.top_categories[1].category == "Backend");

    REQUIRE(r.recommended_skills == std::vector<std::string>{"CI/CD", "Terraform"});
    REQUIRE_FALSE(contains(r.recommended_skills, "Docker"));
    REQUIRE_FALSE(contains(r.recommended_skills, "Kubernetes"));

    REQUIRE(r.diagnostics.embedded_skills == 3);
    REQUIRE(r.diagnostics.dropped.empty());
}

TEST_CASE("An empty skill list is valid and scores zero everywhere", "[analyzer][scenario]")
{
    auto table = table_provider();
    SkillAnalyzer analyzer(table, devops_backend_vocab(), fast_config());

    SECTION("empty list") {
        auto r = analyzer.analyze(std::vector<std::string>{});

        REQUIRE(r.skills.empty());
        REQUIRE(r.category_analysis.size() == 2);
        for (const auto& [name, cs] : r.category_analysis) {
            REQUIRE(cs.score == 0.0);
            REQUIRE(cs.strength == Strength::Weak);
        }
        REQUIRE(r.top_categories.size() == 2);
        REQUIRE(r.top_categories[0].category == "Backend");
        REQUIRE(r.recommended_skills.empty());
    }
    SECTION("only blank entries") {
        auto r = analyzer.analyze(std::vector<std::string>{"", "   "});

        REQUIRE(r.skills.empty());
        REQUIRE(r.recommended_skills.empty());
    }
}

TEST_CASE("A missing skill list is a validation error", "[analyzer]")
{
    auto table = table_provider();
    SkillAnalyzer analyzer(table, devops_backend_vocab(), fast_config());

    REQUIRE_THROWS_AS(analyzer.analyze(std::nullopt), ValidationError);
}

TEST_CASE("Duplicate spellings of a skill count once", "[analyzer]")
{
    SkillAnalyzer analyzer(table_provider(), devops_backend_vocab(), fast_config());

    auto once = analyzer.analyze(std::vector<std::string>{"Docker"});
    auto twice = analyzer.analyze(std::vector<std::string>{"Docker", " docker ", "DOCKER"});

    REQUIRE(twice.skills == std::vector<std::string>{"docker"});
    REQUIRE(twice.category_analysis.at("DevOps").score == once.category_analysis.at("DevOps").score);
}

TEST_CASE("Skills the provider cannot embed are skipped, not fatal", "[analyzer]")
{
    SkillAnalyzer analyzer(table_provider(), devops_backend_vocab(), fast_config());

    auto r = analyzer.analyze(std::vector<std::string>{"Docker", "COBOL"});

    REQUIRE(r.skills.size() == 2);
    REQUIRE(r.diagnostics.embedded_skills == 1);
    REQUIRE(r.diagnostics.dropped.size() == 1);
    REQUIRE(r.diagnostics.dropped[0].skill == "cobol");
    REQUIRE(r.category_analysis.at("DevOps").score > 0.9);
}

TEST_CASE("When every skill fails the request fails with a provider error", "[analyzer]")
{
    auto table = table_provider();
    // vocabulary skills embed fine; "rust" is always unreachable
    auto flaky = std::make_shared<FlakyEmbedder>(table, std::map<std::string, int>{{"rust", 1000}});
    SkillAnalyzer analyzer(flaky, devops_backend_vocab(), fast_config());

    SECTION("outage is retryable") {
        try {
            analyzer.analyze(std::vector<std::string>{"Rust"});
            FAIL("expected ProviderError");
        } catch (const ProviderError& e) {
            REQUIRE(e.transient());
        }
        REQUIRE(flaky->attempts("rust") == 3);
    }
    SECTION("unusable output is not") {
        try {
            analyzer.analyze(std::vector<std::string>{"COBOL"});
            FAIL("expected ProviderError");
        } catch (const ProviderError& e) {
            REQUIRE_FALSE(e.transient());
        }
    }
}

TEST_CASE("A request that outlives its deadline throws TimeoutError", "[analyzer][timeout]")
{
    auto table = table_provider();
    // vocabulary skills answer at once; "rust" hangs past the deadline
    auto slow = std::make_shared<SlowEmbedder>(table, std::chrono::milliseconds(400), std::set<std::string>{"rust"});
    auto cfg = fast_config();
    cfg.batch.request_timeout_ms = 50;
    SkillAnalyzer analyzer(slow, devops_backend_vocab(), cfg);

    REQUIRE(analyzer.model().dim() == 4);
    REQUIRE_THROWS_AS(analyzer.analyze(std::vector<std::string>{"Rust", "Docker"}), TimeoutError);

    // the model is untouched and later requests still work
    auto r = analyzer.analyze(std::vector<std::string>{"Docker"});
    REQUIRE(r.category_analysis.at("DevOps").score > 0.9);
}

TEST_CASE("Model build failure surfaces as a configuration error", "[analyzer]")
{
    auto vocab = build_vocabulary({{"Legacy", {"COBOL"}}});
    SkillAnalyzer analyzer(table_provider(), vocab, fast_config());

    REQUIRE_THROWS_AS(analyzer.model(), ConfigurationError);
    REQUIRE_THROWS_AS(analyzer.analyze(std::vector<std::string>{"Docker"}), ConfigurationError);
}

TEST_CASE("Invalid settings are rejected at construction", "[analyzer]")
{
    auto cfg = fast_config();
    cfg.thresholds.moderate = 0.8;
    cfg.thresholds.strong = 0.7;

    REQUIRE_THROWS_AS(SkillAnalyzer(table_provider(), devops_backend_vocab(), cfg), ConfigurationError);
}

TEST_CASE("Concurrent requests share one model and agree", "[analyzer][concurrency]")
{
    auto table = table_provider();
    SkillAnalyzer analyzer(table, devops_backend_vocab(), fast_config());

    std::vector<AnalysisResult> results(6);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = analyzer.analyze(std::vector<std::string>{"Python", "Docker", "Kubernetes"});
        });
    }
    for (auto& t : threads) t.join();

    // 7 vocabulary skills once, then 3 candidate skills per request
    REQUIRE(table->calls() == 7 + 3 * 6);
    for (const auto& r : results) {
        REQUIRE(r.recommended_skills == results[0].recommended_skills);
        REQUIRE(r.category_analysis.at("DevOps").score == results[0].category_analysis.at("DevOps").score);
    }
}

TEST_CASE("Analysis invariants hold on the built-in vocabulary", "[analyzer][properties]")
{
    auto provider = std::make_shared<HashingEmbedder>(128);
    SkillAnalyzer analyzer(provider, default_vocabulary(), fast_config());

    const std::vector<std::vector<std::string>> inputs = {
        {"Docker", "Kubernetes", "AWS", "Terraform"},
        {"React", "TypeScript", "CSS", "Node.js"},
        {"Python", "Pandas", "Machine Learning", "SQL"},
        {"Cooking", "Gardening"},
        {"C++", "Rust", "Go", "Linux", "Git"},
    };

    for (const auto& in : inputs) {
        auto r = analyzer.analyze(in);

        REQUIRE(r.category_analysis.size() == default_vocabulary().categories.size());
        for (const auto& [name, cs] : r.category_analysis) {
            REQUIRE(cs.score >= 0.0);
            REQUIRE(cs.score <= 1.0);
        }

        REQUIRE(r.top_categories.size() == r.category_analysis.size());
        for (size_t i = 1; i < r.top_categories.size(); ++i) {
            const auto& a = r.top_categories[i - 1];
            const auto& b = r.top_categories[i];
            REQUIRE((a.score > b.score || (a.score == b.score && a.category < b.category)));
        }

        for (const auto& rec : r.recommended_skills) {
            REQUIRE_FALSE(contains(r.skills, normalize_skill(rec)));
        }
        REQUIRE(r.recommended_skills.size() <= analyzer.config().recommendation.max_recommendations);

        bool any_qualifying = false;
        for (const auto& [name, cs] : r.category_analysis) {
            if (cs.strength != Strength::Weak) any_qualifying = true;
        }
        if (!any_qualifying) REQUIRE(r.recommended_skills.empty());

        auto again = analyzer.analyze(in);
        REQUIRE(again.recommended_skills == r.recommended_skills);
        for (size_t i = 0; i < r.top_categories.size(); ++i) {
            REQUIRE(again.top_categories[i].category == r.top_categories[i].category);
        }
    }
}
