/// @file test_eviction.cpp
/// @brief Tests for cache policies and LRU trimming

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

using namespace hoard_asset;
using hoard_test::TempDir;
using hoard_test::TrackedAsset;
using hoard_test::TrackedLoader;

// =============================================================================
// Aggressive
// =============================================================================

TEST_CASE("Aggressive: last release disposes the value", "[asset][eviction]") {
    TempDir dir;
    dir.write("x.trk", "payload");

    AssetManager manager(dir.config(CachePolicy::Aggressive));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    auto first = manager.load<TrackedAsset>("x.trk").unwrap();
    auto second = manager.load<TrackedAsset>("x.trk").unwrap();
    REQUIRE(loader->calls == 1);
    REQUIRE(manager.ref_count("x.trk") == 2);

    first.release();
    REQUIRE(*loader->disposals == 0);
    REQUIRE(manager.is_loaded("x.trk"));
    REQUIRE(second->content == "payload");

    second.release();
    REQUIRE(*loader->disposals == 1);
    REQUIRE_FALSE(manager.is_loaded("x.trk"));
    REQUIRE(manager.state_of("x.trk") == LoadState::Unloaded);
    REQUIRE(manager.get_cache_stats().total_size_bytes == 0);

    // Extra releases change nothing
    second.release();
    first.release();
    REQUIRE(*loader->disposals == 1);
}

TEST_CASE("Aggressive: bytes asset leaves the cache", "[asset][eviction]") {
    TempDir dir;
    dir.write("x.bin", std::string("\x01\x02\x03", 3));

    AssetManager manager(dir.config(CachePolicy::Aggressive));
    REQUIRE(manager.register_builtin_loaders().is_ok());

    auto first = manager.load<BytesAsset>("x.bin").unwrap();
    auto second = manager.load<BytesAsset>("x.bin").unwrap();
    REQUIRE(first.get() == second.get());

    first.release();
    REQUIRE(manager.is_loaded("x.bin"));
    REQUIRE(second->data.size() == 3);

    second.release();
    REQUIRE_FALSE(manager.is_loaded("x.bin"));
}

TEST_CASE("Aggressive: reload after disposal reads the file again", "[asset][eviction]") {
    TempDir dir;
    dir.write("x.trk", "one");

    AssetManager manager(dir.config(CachePolicy::Aggressive));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    manager.load<TrackedAsset>("x.trk").unwrap().release();
    dir.write("x.trk", "two");
    auto again = manager.load<TrackedAsset>("x.trk").unwrap();

    REQUIRE(again->content == "two");
    REQUIRE(loader->calls == 2);
}

// =============================================================================
// Manual
// =============================================================================

TEST_CASE("Manual: only unload removes entries", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");
    dir.write("b.trk", "bbbb");

    AssetManager manager(dir.config(CachePolicy::Manual).with_max_cache_bytes(1));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    manager.load<TrackedAsset>("a.trk").unwrap().release();
    manager.load<TrackedAsset>("b.trk").unwrap().release();

    REQUIRE(manager.is_loaded("a.trk"));
    REQUIRE(manager.is_loaded("b.trk"));
    REQUIRE(manager.ref_count("a.trk") == 0);

    REQUIRE(manager.trim_cache(0) == 0);
    REQUIRE(manager.trim_cache(-5) == 0);
    REQUIRE(manager.is_loaded("a.trk"));
    REQUIRE(manager.is_loaded("b.trk"));
    REQUIRE(*loader->disposals == 0);

    REQUIRE(manager.unload("a.trk").is_ok());
    REQUIRE_FALSE(manager.is_loaded("a.trk"));
    REQUIRE(*loader->disposals == 1);
}

// =============================================================================
// LRU
// =============================================================================

TEST_CASE("LRU: released entries stay cached", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");

    AssetManager manager(dir.config(CachePolicy::LRU));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    manager.load<TrackedAsset>("a.trk").unwrap().release();
    REQUIRE(manager.is_loaded("a.trk"));
    REQUIRE(*loader->disposals == 0);

    auto again = manager.load<TrackedAsset>("a.trk").unwrap();
    REQUIRE(loader->calls == 1);
    REQUIRE(again->content == "aaaa");
}

TEST_CASE("LRU: trim evicts oldest first", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");
    dir.write("b.trk", "bbbb");
    dir.write("c.trk", "cccc");

    AssetManager manager(dir.config(CachePolicy::LRU));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    manager.load<TrackedAsset>("a.trk").unwrap().release();
    manager.load<TrackedAsset>("b.trk").unwrap().release();
    manager.load<TrackedAsset>("c.trk").unwrap().release();

    // Touch a so it becomes the most recently used
    manager.load<TrackedAsset>("a.trk").unwrap().release();
    REQUIRE(manager.get_cache_stats().total_size_bytes == 12);

    REQUIRE(manager.trim_cache(8) == 4);
    REQUIRE_FALSE(manager.is_loaded("b.trk"));
    REQUIRE(manager.is_loaded("c.trk"));
    REQUIRE(manager.is_loaded("a.trk"));

    REQUIRE(manager.trim_cache(4) == 4);
    REQUIRE_FALSE(manager.is_loaded("c.trk"));
    REQUIRE(manager.is_loaded("a.trk"));

    REQUIRE(manager.trim_cache(0) == 4);
    REQUIRE_FALSE(manager.is_loaded("a.trk"));
    REQUIRE(*loader->disposals == 3);
    REQUIRE(manager.state_of("a.trk") == LoadState::Unloaded);
}

TEST_CASE("LRU: acquire counts as an access", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");
    dir.write("b.trk", "bbbb");

    AssetManager manager(dir.config(CachePolicy::LRU));
    REQUIRE(manager.register_loader(std::make_shared<TrackedLoader>()).is_ok());

    auto a = manager.load<TrackedAsset>("a.trk").unwrap();
    manager.load<TrackedAsset>("b.trk").unwrap().release();
    a.acquire().unwrap().release();
    a.release();

    REQUIRE(manager.trim_cache(4) == 4);
    REQUIRE_FALSE(manager.is_loaded("b.trk"));
    REQUIRE(manager.is_loaded("a.trk"));
}

TEST_CASE("LRU: referenced entries are never evicted", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");
    dir.write("b.trk", "bbbb");

    AssetManager manager(dir.config(CachePolicy::LRU));
    REQUIRE(manager.register_loader(std::make_shared<TrackedLoader>()).is_ok());

    auto held = manager.load<TrackedAsset>("a.trk").unwrap();
    manager.load<TrackedAsset>("b.trk").unwrap().release();

    REQUIRE(manager.trim_cache(0) == 4);
    REQUIRE(manager.is_loaded("a.trk"));
    REQUIRE_FALSE(manager.is_loaded("b.trk"));
    REQUIRE(held->content == "aaaa");
    REQUIRE(manager.get_cache_stats().total_size_bytes == 4);
}

TEST_CASE("LRU: storing past the budget trims automatically", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");
    dir.write("b.trk", "bbbb");
    dir.write("c.trk", "cccc");

    AssetManager manager(dir.config(CachePolicy::LRU).with_max_cache_bytes(10));
    auto loader = std::make_shared<TrackedLoader>();
    REQUIRE(manager.register_loader(loader).is_ok());

    manager.load<TrackedAsset>("a.trk").unwrap().release();
    manager.load<TrackedAsset>("b.trk").unwrap().release();
    auto c = manager.load<TrackedAsset>("c.trk").unwrap();

    REQUIRE_FALSE(manager.is_loaded("a.trk"));
    REQUIRE(manager.is_loaded("b.trk"));
    REQUIRE(manager.is_loaded("c.trk"));
    REQUIRE(*loader->disposals == 1);

    auto stats = manager.get_cache_stats();
    REQUIRE(stats.total_size_bytes == 8);
    REQUIRE(stats.max_size_bytes == 10);
    REQUIRE(stats.utilization_ratio() == 0.8);
}

TEST_CASE("LRU: trim below current size is a no-op", "[asset][eviction]") {
    TempDir dir;
    dir.write("a.trk", "aaaa");

    AssetManager manager(dir.config(CachePolicy::LRU));
    REQUIRE(manager.register_loader(std::make_shared<TrackedLoader>()).is_ok());
    manager.load<TrackedAsset>("a.trk").unwrap().release();

    REQUIRE(manager.trim_cache(4) == 0);
    REQUIRE(manager.trim_cache(100) == 0);
    REQUIRE(manager.is_loaded("a.trk"));
}
