#include <catch2/catch_test_macros.hpp>

#include "competency/Ranker.hpp"

using competency::CategoryScore;
using competency::rank_categories;

static CategoryScore cs(const std::string& name, double score) {
    CategoryScore s;
    s.category = name;
    s.score = score;
    return s;
}

TEST_CASE("Ranker orders by score descending", "[ranker]")
{
    std::map<std::string, CategoryScore> a = {
        {"Backend", cs("Backend", 0.41)},
        {"DevOps", cs("DevOps", 0.80)},
        {"Frontend", cs("Frontend", 0.10)},
    };

    auto r = rank_categories(a);

    REQUIRE(r.size() == 3);
    REQUIRE(r[0].category == "DevOps");
    REQUIRE(r[1].category == "Backend");
    REQUIRE(r[2].category == "Frontend");
}

TEST_CASE("Ranker breaks score ties alphabetically", "[ranker][tie-break]")
{
    std::map<std::string, CategoryScore> a = {
        {"Data", cs("Data", 0.62)},
        {"Cloud", cs("Cloud", 0.62)},
        {"AI", cs("AI", 0.30)},
    };

    auto r = rank_categories(a);

    REQUIRE(r[0].category == "Cloud");
    REQUIRE(r[1].category == "Data");
    REQUIRE(r[2].category == "AI");
}

TEST_CASE("Ranker returns every category", "[ranker]")
{
    std::map<std::string, CategoryScore> a;
    for (int i = 0; i < 12; ++i) {
        std::string n = "C" + std::to_string(i);
        a[n] = cs(n, 0.0);
    }

    auto r = rank_categories(a);

    REQUIRE(r.size() == 12);
    for (size_t i = 1; i < r.size(); ++i) REQUIRE(r[i - 1].category < r[i].category);
}
