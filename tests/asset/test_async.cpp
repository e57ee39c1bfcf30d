/// @file test_async.cpp
/// @brief Tests for asynchronous loading, single-flight and cancellation

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

using namespace hoard_asset;
using hoard_core::ErrorCode;
using hoard_core::Result;
using hoard_test::CountingTextLoader;
using hoard_test::Gate;
using hoard_test::TempDir;

namespace {

/// Records the order in which paths reach the loader; `block.txt` waits on the gate
class OrderLoader : public AssetLoader<TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".txt"};
    }

    [[nodiscard]] LoadResult<TextAsset> load(std::istream& stream, const AssetLoadContext& ctx) override {
        if (ctx.path().str() == "block.txt") {
            gate->wait();
        }
        {
            std::lock_guard lock(mutex);
            order.push_back(ctx.path().str());
        }
        auto asset = std::make_unique<TextAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const TextAsset& asset) const override {
        return static_cast<std::int64_t>(asset.content.size());
    }

    std::shared_ptr<Gate> gate = std::make_shared<Gate>();
    std::mutex mutex;
    std::vector<std::string> order;
};

/// Tracks how many loader calls run at once; every call waits on the gate
class PeakLoader : public AssetLoader<TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".txt"};
    }

    [[nodiscard]] LoadResult<TextAsset> load(std::istream& stream, const AssetLoadContext& /*ctx*/) override {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        gate->wait();
        --active;
        auto asset = std::make_unique<TextAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const TextAsset& asset) const override {
        return static_cast<std::int64_t>(asset.content.size());
    }

    std::shared_ptr<Gate> gate = std::make_shared<Gate>();
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
};

struct AsyncFixture {
    TempDir dir;
    std::shared_ptr<CountingTextLoader> loader = std::make_shared<CountingTextLoader>();
    std::unique_ptr<AssetManager> manager;

    explicit AsyncFixture(CachePolicy policy = CachePolicy::LRU) {
        dir.write("a.txt", "async");
        loader->gate = std::make_shared<Gate>();
        manager = std::make_unique<AssetManager>(dir.config(policy).with_max_concurrent_loads(2));
        REQUIRE(manager->register_loader(loader).is_ok());
    }

    ~AsyncFixture() {
        loader->gate->open();
        manager->dispose();
    }
};

} // namespace

// =============================================================================
// Basic async
// =============================================================================

TEST_CASE("LoadAsync: delivers the handle", "[asset][async]") {
    AsyncFixture fx;
    fx.loader->gate->open();

    auto result = fx.manager->load_async<TextAsset>("a.txt").get();
    REQUIRE(result.is_ok());
    REQUIRE(result.value()->content == "async");

    // Cached now; served without another loader call
    auto hit = fx.manager->load_async<TextAsset>("a.txt").get();
    REQUIRE(hit.is_ok());
    REQUIRE(fx.loader->calls == 1);
    REQUIRE(fx.manager->ref_count("a.txt") == 2);
}

TEST_CASE("LoadAsync: errors are delivered through the future", "[asset][async]") {
    AsyncFixture fx;
    auto result = fx.manager->load_async<TextAsset>("missing.txt").get();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::NotFound);

    auto unsupported = fx.manager->load_async<BytesAsset>("a.txt").get();
    REQUIRE(unsupported.is_err());
    REQUIRE(unsupported.error().code() == ErrorCode::NotSupported);
}

TEST_CASE("LoadAsync: state is Loading while in flight", "[asset][async]") {
    AsyncFixture fx;
    auto future = fx.manager->load_async<TextAsset>("a.txt");
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    REQUIRE(fx.manager->state_of("a.txt") == LoadState::Loading);
    REQUIRE_FALSE(fx.manager->is_loaded("a.txt"));
    REQUIRE(fx.manager->get_cache_stats().pending_assets == 1);

    fx.loader->gate->open();
    REQUIRE(future.get().is_ok());
    REQUIRE(fx.manager->state_of("a.txt") == LoadState::Loaded);
}

// =============================================================================
// Single-flight
// =============================================================================

TEST_CASE("LoadAsync: parallel requests share one loader call", "[asset][async]") {
    AsyncFixture fx;
    constexpr int k_requests = 8;

    std::vector<std::future<Result<AssetHandle<TextAsset>>>> futures;
    for (int i = 0; i < k_requests; ++i) {
        futures.push_back(fx.manager->load_async<TextAsset>(i % 2 == 0 ? "a.txt" : "A.TXT"));
    }
    REQUIRE(fx.loader->gate->wait_for_waiters(1));
    fx.loader->gate->open();

    std::vector<AssetHandle<TextAsset>> handles;
    for (auto& future : futures) {
        auto result = future.get();
        REQUIRE(result.is_ok());
        handles.push_back(std::move(result).value());
    }

    REQUIRE(fx.loader->calls == 1);
    REQUIRE(fx.manager->ref_count("a.txt") == k_requests);
    REQUIRE(fx.manager->get_cache_stats().cache_misses == 1);
    REQUIRE(fx.manager->get_cache_stats().joined_loads == k_requests - 1);
    for (const auto& handle : handles) {
        REQUIRE(handle.id() == handles.front().id());
        REQUIRE(handle.get() == handles.front().get());
    }
}

TEST_CASE("Load: sync request joins an in-flight async load", "[asset][async]") {
    AsyncFixture fx;
    auto future = fx.manager->load_async<TextAsset>("a.txt");
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    auto sync = std::async(std::launch::async, [&fx] {
        return fx.manager->load<TextAsset>("a.txt");
    });
    REQUIRE(hoard_test::eventually([&] { return fx.manager->get_cache_stats().joined_loads == 1; }));
    fx.loader->gate->open();

    auto sync_result = sync.get();
    auto async_result = future.get();
    REQUIRE(sync_result.is_ok());
    REQUIRE(async_result.is_ok());
    REQUIRE(fx.loader->calls == 1);

    auto stats = fx.manager->get_cache_stats();
    REQUIRE(stats.cache_misses == 1);
    REQUIRE(stats.cache_hits == 0);
    REQUIRE(sync_result.value().id() == async_result.value().id());
}

TEST_CASE("LoadAsync: joining with another type fails fast", "[asset][async]") {
    AsyncFixture fx;
    REQUIRE(fx.manager->register_loader(std::make_shared<hoard_test::OtherLoader>()).is_ok());

    auto text = fx.manager->load_async<TextAsset>("a.txt");
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    auto other = fx.manager->load_async<hoard_test::OtherAsset>("a.txt").get();
    REQUIRE(other.is_err());
    REQUIRE(other.error().code() == ErrorCode::NotSupported);

    fx.loader->gate->open();
    REQUIRE(text.get().is_ok());
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_CASE("LoadAsync: cancelling one waiter leaves the others", "[asset][async]") {
    AsyncFixture fx;
    std::stop_source cancel;

    auto cancelled = fx.manager->load_async<TextAsset>("a.txt", std::nullopt, cancel.get_token());
    auto kept = fx.manager->load_async<TextAsset>("a.txt");
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    cancel.request_stop();
    auto cancelled_result = cancelled.get();
    REQUIRE(cancelled_result.is_err());
    REQUIRE(cancelled_result.error().code() == ErrorCode::Cancelled);

    fx.loader->gate->open();
    auto kept_result = kept.get();
    REQUIRE(kept_result.is_ok());
    REQUIRE(kept_result.value()->content == "async");
    REQUIRE(fx.loader->calls == 1);
    REQUIRE(fx.manager->ref_count("a.txt") == 1);
}

TEST_CASE("LoadAsync: last cancel aborts the load", "[asset][async]") {
    AsyncFixture fx;
    std::stop_source first;
    std::stop_source second;

    auto f1 = fx.manager->load_async<TextAsset>("a.txt", std::nullopt, first.get_token());
    auto f2 = fx.manager->load_async<TextAsset>("a.txt", std::nullopt, second.get_token());
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    first.request_stop();
    second.request_stop();

    REQUIRE(f1.get().error().code() == ErrorCode::Cancelled);
    REQUIRE(f2.get().error().code() == ErrorCode::Cancelled);

    // The gated loader observes the abort and returns without a value
    REQUIRE(hoard_test::eventually([&] { return fx.manager->state_of("a.txt") != LoadState::Loading; }));
    REQUIRE_FALSE(fx.manager->is_loaded("a.txt"));
    REQUIRE(fx.manager->state_of("a.txt") == LoadState::Empty);
    REQUIRE(fx.manager->get_cache_stats().failed_assets == 0);
    REQUIRE(fx.loader->calls == 1);
}

TEST_CASE("LoadAsync: already cancelled token never reaches the loader", "[asset][async]") {
    AsyncFixture fx;
    std::stop_source cancel;
    cancel.request_stop();

    auto result = fx.manager->load_async<TextAsset>("a.txt", std::nullopt, cancel.get_token()).get();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::Cancelled);

    REQUIRE(hoard_test::eventually([&] { return fx.manager->state_of("a.txt") != LoadState::Loading; }));
    REQUIRE(fx.loader->calls == 0);
}

TEST_CASE("LoadAsync: request after an abort still loads", "[asset][async]") {
    AsyncFixture fx;
    std::stop_source cancel;

    auto aborted = fx.manager->load_async<TextAsset>("a.txt", std::nullopt, cancel.get_token());
    REQUIRE(fx.loader->gate->wait_for_waiters(1));
    cancel.request_stop();
    REQUIRE(aborted.get().error().code() == ErrorCode::Cancelled);

    // Joins the aborting load (which restarts) or starts a fresh one
    auto late = fx.manager->load_async<TextAsset>("a.txt");
    fx.loader->gate->open();

    auto result = late.get();
    REQUIRE(result.is_ok());
    REQUIRE(result.value()->content == "async");
    REQUIRE(fx.loader->calls == 2);
}

TEST_CASE("LoadAsync: dispose cancels in-flight loads", "[asset][async]") {
    AsyncFixture fx;
    auto future = fx.manager->load_async<TextAsset>("a.txt");
    REQUIRE(fx.loader->gate->wait_for_waiters(1));

    fx.manager->dispose();
    auto result = future.get();
    REQUIRE(result.is_err());
    REQUIRE(result.error().code() == ErrorCode::Cancelled);
    REQUIRE_FALSE(fx.manager->is_loaded("a.txt"));
}

// =============================================================================
// Priority
// =============================================================================

TEST_CASE("LoadAsync: loader calls never exceed max_concurrent_loads", "[asset][async]") {
    TempDir dir;
    constexpr int k_paths = 6;
    for (int i = 0; i < k_paths; ++i) {
        dir.write("p" + std::to_string(i) + ".txt", "part");
    }

    auto loader = std::make_shared<PeakLoader>();
    AssetManager manager(dir.config().with_max_concurrent_loads(2));
    REQUIRE(manager.register_loader(loader).is_ok());

    std::vector<std::future<Result<AssetHandle<TextAsset>>>> futures;
    for (int i = 0; i < k_paths; ++i) {
        futures.push_back(manager.load_async<TextAsset>("p" + std::to_string(i) + ".txt"));
    }

    REQUIRE(loader->gate->wait_for_waiters(2));
    REQUIRE_FALSE(loader->gate->wait_for_waiters(3, std::chrono::milliseconds(100)));
    REQUIRE(manager.get_cache_stats().pending_assets == k_paths);
    loader->gate->open();

    for (auto& future : futures) {
        REQUIRE(future.get().is_ok());
    }
    REQUIRE(loader->peak == 2);
    manager.dispose();
}

TEST_CASE("LoadAsync: queued loads run by priority", "[asset][async]") {
    TempDir dir;
    for (const char* name : {"block.txt", "low.txt", "normal.txt", "high.txt", "now.txt"}) {
        dir.write(name, name);
    }

    auto loader = std::make_shared<OrderLoader>();
    AssetManager manager(dir.config().with_max_concurrent_loads(1));
    REQUIRE(manager.register_loader(loader).is_ok());

    auto block = manager.load_async<TextAsset>("block.txt");
    REQUIRE(loader->gate->wait_for_waiters(1));

    auto low = manager.load_async<TextAsset>("low.txt", LoadPriority::Low);
    auto normal = manager.load_async<TextAsset>("normal.txt");
    auto high = manager.load_async<TextAsset>("high.txt", LoadPriority::High);
    auto now = manager.load_async<TextAsset>("now.txt", LoadPriority::Immediate);

    loader->gate->open();
    REQUIRE(block.get().is_ok());
    REQUIRE(low.get().is_ok());
    REQUIRE(normal.get().is_ok());
    REQUIRE(high.get().is_ok());
    REQUIRE(now.get().is_ok());

    std::lock_guard lock(loader->mutex);
    REQUIRE(loader->order == std::vector<std::string>{
        "block.txt", "now.txt", "high.txt", "normal.txt", "low.txt"});
}
