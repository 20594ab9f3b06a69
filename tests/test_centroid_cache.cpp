#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "competency/CategoryModel.hpp"
#include "competency/CentroidCache.hpp"
#include "competency/SkillEmbedder.hpp"
#include "competency/Vocabulary.hpp"
#include "utils/fake_providers.hpp"

using namespace competency;
using namespace test_utils;

namespace fs = std::filesystem;

static fs::path fresh_cache_path(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "skillprof_cache_test";
    fs::path p = dir / name;
    std::error_code ec;
    fs::remove(p, ec);
    return p;
}

// Same skills, one extra trailing component: what a different model at the same path yields.
static std::map<std::string, std::vector<float>> widened_table() {
    auto t = devops_backend_table();
    for (auto& [skill, v] : t) v.push_back(0.5f);
    return t;
}

TEST_CASE("Fingerprint tracks vocabulary, provider and dimension", "[centroid_cache]")
{
    auto v = devops_backend_vocab();
    const uint64_t base = vocabulary_fingerprint(v, "table", 4);

    REQUIRE(vocabulary_fingerprint(v, "table", 4) == base);
    REQUIRE(vocabulary_fingerprint(v, "hash-256", 4) != base);
    REQUIRE(vocabulary_fingerprint(v, "table", 5) != base);

    auto edited = build_vocabulary({
        {"DevOps", {"Docker", "Kubernetes", "Terraform"}},
        {"Backend", {"Python", "Django", "SQL"}},
    });
    REQUIRE(vocabulary_fingerprint(edited, "table", 4) != base);

    // display-only changes keep the same keys
    auto respelled = build_vocabulary({
        {"DevOps", {"docker", "KUBERNETES", "terraform", "ci/cd"}},
        {"Backend", {"python", "django", "sql"}},
    });
    REQUIRE(vocabulary_fingerprint(respelled, "table", 4) == base);

    REQUIRE(hex_u64(0x1f) == "000000000000001f");
}

TEST_CASE("Cache file is written and read back", "[centroid_cache]")
{
    fs::path p = fresh_cache_path("roundtrip.bin");

    CentroidCache out;
    out.set(42, {CategoryCentroid{"A", {1.0f, 2.0f}}, CategoryCentroid{"B", {3.0f, 4.0f}}}, 2);
    REQUIRE(out.save(p.string()));

    CentroidCache in;
    REQUIRE(in.load(p.string(), 42));
    REQUIRE(in.dim() == 2);
    REQUIRE(in.centroids().size() == 2);
    REQUIRE(in.centroids()[1].category == "B");
    REQUIRE(in.centroids()[1].vector == std::vector<float>{3.0f, 4.0f});

    CentroidCache stale;
    REQUIRE_FALSE(stale.load(p.string(), 43));
    REQUIRE_FALSE(stale.load((p.parent_path() / "absent.bin").string(), 42));
}

// Overwrites the 32-bit header field at `offset` (magic, version, fingerprint, dim, count).
static void patch_u32(const fs::path& p, std::streamoff offset, uint32_t value) {
    std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
    REQUIRE(f);
    f.seekp(offset);
    f.write((const char*)&value, sizeof(value));
}

TEST_CASE("Corrupt cache files are rejected, not trusted", "[centroid_cache]")
{
    fs::path p = fresh_cache_path("corrupt.bin");

    CentroidCache out;
    out.set(7, {CategoryCentroid{"A", {1.0f, 0.0f}}}, 2);
    REQUIRE(out.save(p.string()));

    CentroidCache in;

    SECTION("huge category count") {
        patch_u32(p, 20, 0xFFFFFFFFu);
        REQUIRE_FALSE(in.load(p.string(), 7));
    }
    SECTION("huge dimension") {
        patch_u32(p, 16, 0xFFFFFFFFu);
        REQUIRE_FALSE(in.load(p.string(), 7));
    }
    SECTION("huge name length") {
        patch_u32(p, 24, 0xFFFFFFFFu);
        REQUIRE_FALSE(in.load(p.string(), 7));
    }
    SECTION("truncated body") {
        fs::resize_file(p, fs::file_size(p) - 4);
        REQUIRE_FALSE(in.load(p.string(), 7));
    }
}

TEST_CASE("load_or_build reuses a matching cache", "[centroid_cache][category_model]")
{
    fs::path p = fresh_cache_path("model.bin");
    auto vocab = devops_backend_vocab();

    auto first = std::make_shared<TableEmbedder>(devops_backend_table());
    auto built = CategoryModel::load_or_build(vocab, SkillEmbedder(first, {}), p.string());
    REQUIRE(fs::exists(p));

    // one call checks the provider's current dimension, nothing is rebuilt
    auto second = std::make_shared<TableEmbedder>(devops_backend_table());
    auto loaded = CategoryModel::load_or_build(vocab, SkillEmbedder(second, {}), p.string());
    REQUIRE(second->calls() == 1);

    REQUIRE(loaded.dim() == built.dim());
    for (size_t i = 0; i < built.centroids().size(); ++i) {
        REQUIRE(loaded.centroids()[i].category == built.centroids()[i].category);
        REQUIRE(loaded.centroids()[i].vector == built.centroids()[i].vector);
    }

    SECTION("a different vocabulary rebuilds") {
        auto other = build_vocabulary({{"DevOps", {"Docker", "Terraform"}}});
        auto third = std::make_shared<TableEmbedder>(devops_backend_table());
        auto rebuilt = CategoryModel::load_or_build(other, SkillEmbedder(third, {}), p.string());
        REQUIRE(third->calls() == 1 + 2);
        REQUIRE(rebuilt.centroids().size() == 1);
    }
}

TEST_CASE("A provider whose output changed shape under the same name rebuilds", "[centroid_cache][category_model]")
{
    fs::path p = fresh_cache_path("swapped_model.bin");
    auto vocab = devops_backend_vocab();

    auto old_model = std::make_shared<TableEmbedder>(devops_backend_table());
    REQUIRE(CategoryModel::load_or_build(vocab, SkillEmbedder(old_model, {}), p.string()).dim() == 4);

    auto new_model = std::make_shared<TableEmbedder>(widened_table());
    REQUIRE(new_model->name() == old_model->name());

    auto model = CategoryModel::load_or_build(vocab, SkillEmbedder(new_model, {}), p.string());
    REQUIRE(model.dim() == 5);
    REQUIRE(new_model->calls() == 1 + 7);

    // and the rewritten cache now serves the new shape
    auto again = std::make_shared<TableEmbedder>(widened_table());
    REQUIRE(CategoryModel::load_or_build(vocab, SkillEmbedder(again, {}), p.string()).dim() == 5);
    REQUIRE(again->calls() == 1);
}

TEST_CASE("A corrupt cache with a matching fingerprint is rebuilt", "[centroid_cache][category_model]")
{
    fs::path p = fresh_cache_path("corrupt_model.bin");
    auto vocab = devops_backend_vocab();

    auto first = std::make_shared<TableEmbedder>(devops_backend_table());
    CategoryModel::load_or_build(vocab, SkillEmbedder(first, {}), p.string());
    patch_u32(p, 20, 0xFFFFFFFFu);

    auto second = std::make_shared<TableEmbedder>(devops_backend_table());
    auto model = CategoryModel::load_or_build(vocab, SkillEmbedder(second, {}), p.string());

    REQUIRE(model.centroids().size() == 2);
    REQUIRE(second->calls() == 1 + 7);
}
