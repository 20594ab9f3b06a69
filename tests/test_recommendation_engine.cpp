#include <catch2/catch_test_macros.hpp>

#include "competency/RecommendationEngine.hpp"
#include "competency/Vocabulary.hpp"

using namespace competency;

static std::map<std::string, CategoryScore> with_strengths(
    const std::vector<std::pair<std::string, Strength>>& in) {
    std::map<std::string, CategoryScore> out;
    for (const auto& [name, s] : in) {
        CategoryScore cs;
        cs.category = name;
        cs.strength = s;
        out[name] = cs;
    }
    return out;
}

static CategoryVocabulary web_vocab() {
    return build_vocabulary({
        {"Frontend", {"React", "TypeScript", "CSS", "Git"}},
        {"Backend", {"Node.js", "PostgreSQL", "Git", "TypeScript"}},
        {"Mobile", {"Swift", "Kotlin"}},
    });
}

TEST_CASE("Skills shared by several qualifying categories come first", "[recommend]")
{
    auto a = with_strengths({{"Frontend", Strength::Moderate},
                             {"Backend", Strength::Strong},
                             {"Mobile", Strength::Weak}});

    auto r = recommend_skills(a, web_vocab(), {"react"});

    std::vector<std::string> expected = {"Git", "TypeScript", "CSS", "Node.js", "PostgreSQL"};
    REQUIRE(r == expected);
}

TEST_CASE("Weak categories contribute nothing", "[recommend]")
{
    auto a = with_strengths({{"Frontend", Strength::Weak},
                             {"Backend", Strength::Weak},
                             {"Mobile", Strength::Weak}});

    REQUIRE(recommend_skills(a, web_vocab(), {"React"}).empty());
}

TEST_CASE("Candidate skills are excluded case-insensitively", "[recommend]")
{
    auto a = with_strengths({{"Frontend", Strength::Strong},
                             {"Backend", Strength::Weak},
                             {"Mobile", Strength::Weak}});

    auto r = recommend_skills(a, web_vocab(), {"  REACT ", "typescript", "Git"});

    REQUIRE(r == std::vector<std::string>{"CSS"});
}

TEST_CASE("Nothing to recommend when the candidate has it all", "[recommend]")
{
    auto a = with_strengths({{"Mobile", Strength::Moderate}});

    REQUIRE(recommend_skills(a, web_vocab(), {"Swift", "Kotlin"}).empty());
}

TEST_CASE("Recommendations are capped", "[recommend]")
{
    auto a = with_strengths({{"Frontend", Strength::Strong},
                             {"Backend", Strength::Strong},
                             {"Mobile", Strength::Strong}});
    RecommendationConfig cfg;
    cfg.max_recommendations = 2;

    auto r = recommend_skills(a, web_vocab(), {}, cfg);

    REQUIRE(r == std::vector<std::string>{"Git", "TypeScript"});
}
