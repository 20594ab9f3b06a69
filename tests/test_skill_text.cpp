#include <catch2/catch_test_macros.hpp>

#include "competency/SkillText.hpp"

using competency::normalize_skill;
using competency::normalize_skill_list;

TEST_CASE("normalize_skill trims, lowercases and collapses whitespace", "[skill_text]")
{
    REQUIRE(normalize_skill("  Python ") == "python");
    REQUIRE(normalize_skill("Machine\t  Learning") == "machine learning");
    REQUIRE(normalize_skill("CI/CD") == "ci/cd");
    REQUIRE(normalize_skill("C++") == "c++");
    REQUIRE(normalize_skill(" \t\n ").empty());
}

TEST_CASE("normalize_skill_list drops empties and duplicates, keeps first-seen order", "[skill_text]")
{
    auto out = normalize_skill_list({"Docker", "", "python", "  docker", "PYTHON", "Kubernetes", "   "});

    REQUIRE(out.size() == 3);
    REQUIRE(out[0] == "docker");
    REQUIRE(out[1] == "python");
    REQUIRE(out[2] == "kubernetes");
}
