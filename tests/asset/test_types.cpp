/// @file test_types.cpp
/// @brief Tests for hoard_asset core types

#include <catch2/catch_test_macros.hpp>
#include <hoard/asset/types.hpp>
#include <string>
#include <unordered_set>

using namespace hoard_asset;

// =============================================================================
// Enum Tests
// =============================================================================

TEST_CASE("LoadState: names are correct", "[asset][types]") {
    REQUIRE(std::string(load_state_name(LoadState::Empty)) == "Empty");
    REQUIRE(std::string(load_state_name(LoadState::Loading)) == "Loading");
    REQUIRE(std::string(load_state_name(LoadState::Loaded)) == "Loaded");
    REQUIRE(std::string(load_state_name(LoadState::Failed)) == "Failed");
    REQUIRE(std::string(load_state_name(LoadState::Unloaded)) == "Unloaded");
}

TEST_CASE("LoadPriority: ordered from most to least urgent", "[asset][types]") {
    REQUIRE(LoadPriority::Immediate < LoadPriority::High);
    REQUIRE(LoadPriority::High < LoadPriority::Normal);
    REQUIRE(LoadPriority::Normal < LoadPriority::Low);
    REQUIRE(LoadPriority::Low < LoadPriority::Streaming);
}

TEST_CASE("LoadPriority: parse is case-insensitive", "[asset][types]") {
    REQUIRE(parse_load_priority("HIGH") == LoadPriority::High);
    REQUIRE(parse_load_priority("streaming") == LoadPriority::Streaming);
    REQUIRE_FALSE(parse_load_priority("urgent").has_value());
    REQUIRE(std::string(load_priority_name(LoadPriority::Low)) == "low");
}

TEST_CASE("CachePolicy: names round-trip", "[asset][types]") {
    for (auto policy : {CachePolicy::LRU, CachePolicy::Manual, CachePolicy::Aggressive}) {
        REQUIRE(parse_cache_policy(cache_policy_name(policy)) == policy);
    }
    REQUIRE(parse_cache_policy("Aggressive") == CachePolicy::Aggressive);
    REQUIRE_FALSE(parse_cache_policy("fifo").has_value());
}

// =============================================================================
// AssetId Tests
// =============================================================================

TEST_CASE("AssetId: default is invalid", "[asset][types]") {
    AssetId id;
    REQUIRE_FALSE(id.is_valid());
    REQUIRE(id == AssetId::invalid());
}

TEST_CASE("AssetId: comparison", "[asset][types]") {
    AssetId a{1};
    AssetId b{2};
    REQUIRE(a.is_valid());
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(a.raw() == 1);
}

// =============================================================================
// AssetPath Tests
// =============================================================================

TEST_CASE("AssetPath: normalization", "[asset][types]") {
    SECTION("backslashes") {
        AssetPath path("textures\\ui\\button.png");
        REQUIRE(path.str() == "textures/ui/button.png");
    }

    SECTION("leading ./ and trailing slash") {
        REQUIRE(AssetPath("./models/crate.mesh").str() == "models/crate.mesh");
        REQUIRE(AssetPath("levels/").str() == "levels");
    }

    SECTION("empty") {
        REQUIRE(AssetPath("").empty());
        REQUIRE(AssetPath().empty());
    }
}

TEST_CASE("AssetPath: identity is case-insensitive", "[asset][types]") {
    AssetPath lower("data/a.txt");
    AssetPath upper("Data/A.TXT");

    REQUIRE(lower == upper);
    REQUIRE(lower.key() == upper.key());
    REQUIRE(upper.str() == "Data/A.TXT");

    std::unordered_set<AssetPath> set;
    set.insert(lower);
    REQUIRE(set.count(upper) == 1);
}

TEST_CASE("AssetPath: components", "[asset][types]") {
    AssetPath path("textures/player.Diffuse.PNG");
    REQUIRE(path.extension() == ".png");
    REQUIRE(path.filename() == "player.Diffuse.PNG");
    REQUIRE(path.directory() == "textures");
    REQUIRE(path.stem() == "player.Diffuse");

    REQUIRE(AssetPath("README").extension().empty());
    REQUIRE(AssetPath("trailing.").extension().empty());
    REQUIRE(AssetPath("file.txt").directory().empty());
}

// =============================================================================
// CacheStats Tests
// =============================================================================

TEST_CASE("CacheStats: ratios", "[asset][types]") {
    CacheStats stats;
    REQUIRE(stats.hit_ratio() == 0.0);
    REQUIRE(stats.utilization_ratio() == 0.0);

    stats.cache_hits = 3;
    stats.cache_misses = 1;
    REQUIRE(stats.hit_ratio() == 0.75);

    stats.total_size_bytes = 256;
    stats.max_size_bytes = 1024;
    REQUIRE(stats.utilization_ratio() == 0.25);

    stats.max_size_bytes = 0;
    REQUIRE(stats.utilization_ratio() == 0.0);
}

// =============================================================================
// AssetError Tests
// =============================================================================

TEST_CASE("AssetError: factories map to error codes", "[asset][types]") {
    using hoard_core::ErrorCode;

    auto not_found = AssetError::file_not_found("a.txt");
    REQUIRE(not_found.code() == ErrorCode::NotFound);
    REQUIRE(*not_found.get_context("path") == "a.txt");

    REQUIRE(AssetError::unsupported_format("a.xyz", "Mesh").code() == ErrorCode::NotSupported);
    REQUIRE(AssetError::invalid_data("x").code() == ErrorCode::InvalidData);
    REQUIRE(AssetError::invalid_argument("x").code() == ErrorCode::InvalidArgument);
    REQUIRE(AssetError::disposed("AssetManager").code() == ErrorCode::Disposed);
    REQUIRE(AssetError::cancelled("a.txt").code() == ErrorCode::Cancelled);

    auto parse = AssetError::parse_error("a.txt", hoard_core::Error("bad header"));
    REQUIRE(parse.code() == ErrorCode::ParseError);
    REQUIRE(parse.cause() != nullptr);
    REQUIRE(parse.cause()->message() == "bad header");
}
