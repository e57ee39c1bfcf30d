#pragma once

/// @file test_support.hpp
/// @brief Temporary directories and instrumented loaders for hoard_asset tests

#include <hoard/asset/asset.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <memory>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

namespace hoard_test {

// =============================================================================
// TempDir
// =============================================================================

/// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<std::uint64_t> s_counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
            ("hoard_test_" + std::to_string(stamp) + "_" + std::to_string(++s_counter));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    [[nodiscard]] std::string str() const { return m_path.string(); }

    /// Write `content` to a file relative to the directory
    void write(const std::string& relative, const std::string& content) const {
        auto file = m_path / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void remove(const std::string& relative) const {
        std::error_code ec;
        std::filesystem::remove(m_path / relative, ec);
    }

    /// Manager config rooted here
    [[nodiscard]] hoard_asset::AssetManagerConfig config(
        hoard_asset::CachePolicy policy = hoard_asset::CachePolicy::LRU) const
    {
        auto config = hoard_asset::AssetManagerConfig::defaults();
        config.with_root_path(str()).with_cache_policy(policy);
        return config;
    }

private:
    std::filesystem::path m_path;
};

// =============================================================================
// Gate
// =============================================================================

/// Holds loader calls until opened
class Gate {
public:
    void open() {
        {
            std::lock_guard lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    /// Block until opened. Returns false if `token` fired first.
    bool wait(std::stop_token token = {}) {
        std::unique_lock lock(m_mutex);
        ++m_waiting;
        m_cv.notify_all();
        m_cv.wait(lock, token, [this] { return m_open; });
        return m_open;
    }

    /// Block until `count` callers are parked in wait()
    bool wait_for_waiters(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this, count] { return m_waiting >= count; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable_any m_cv;
    bool m_open = false;
    int m_waiting = 0;
};

// =============================================================================
// Test Assets
// =============================================================================

/// Asset whose destruction is counted
struct TrackedAsset {
    std::string content;
    std::shared_ptr<std::atomic<int>> disposals;

    ~TrackedAsset() {
        if (disposals) {
            ++*disposals;
        }
    }
};

/// Second asset type sharing the `.txt` extension
struct OtherAsset {
    std::string content;
};

// =============================================================================
// Test Loaders
// =============================================================================

/// TextAsset loader for `.txt` that counts calls and can be held by a gate
class CountingTextLoader : public hoard_asset::AssetLoader<hoard_asset::TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".txt"};
    }

    [[nodiscard]] hoard_asset::LoadResult<hoard_asset::TextAsset> load(
        std::istream& stream, const hoard_asset::AssetLoadContext& /*ctx*/) override
    {
        ++calls;
        if (gate) {
            gate->wait();
        }
        auto asset = std::make_unique<hoard_asset::TextAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] hoard_asset::LoadResult<hoard_asset::TextAsset> load_async(
        std::istream& stream, const hoard_asset::AssetLoadContext& ctx, std::stop_token token) override
    {
        ++calls;
        if (gate && !gate->wait(token)) {
            return hoard_core::Err<std::unique_ptr<hoard_asset::TextAsset>>(
                hoard_asset::AssetError::cancelled(ctx.path().str()));
        }
        auto asset = std::make_unique<hoard_asset::TextAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const hoard_asset::TextAsset& asset) const override {
        return static_cast<std::int64_t>(asset.content.size());
    }

    [[nodiscard]] std::string type_name() const override {
        return "TextAsset";
    }

    std::atomic<int> calls{0};
    std::shared_ptr<Gate> gate;
};

/// `.trk` loader producing TrackedAsset with a shared disposal counter.
/// Size is the content length unless `fixed_size` is set.
class TrackedLoader : public hoard_asset::AssetLoader<TrackedAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".trk"};
    }

    [[nodiscard]] hoard_asset::LoadResult<TrackedAsset> load(
        std::istream& stream, const hoard_asset::AssetLoadContext& /*ctx*/) override
    {
        ++calls;
        auto asset = std::make_unique<TrackedAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        asset->disposals = disposals;
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const TrackedAsset& asset) const override {
        return fixed_size > 0 ? fixed_size : static_cast<std::int64_t>(asset.content.size());
    }

    [[nodiscard]] std::string type_name() const override {
        return "TrackedAsset";
    }

    std::atomic<int> calls{0};
    std::int64_t fixed_size = 0;
    std::shared_ptr<std::atomic<int>> disposals = std::make_shared<std::atomic<int>>(0);
};

/// `.txt` loader for OtherAsset
class OtherLoader : public hoard_asset::AssetLoader<OtherAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".txt"};
    }

    [[nodiscard]] hoard_asset::LoadResult<OtherAsset> load(
        std::istream& stream, const hoard_asset::AssetLoadContext& /*ctx*/) override
    {
        auto asset = std::make_unique<OtherAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const OtherAsset& asset) const override {
        return static_cast<std::int64_t>(asset.content.size());
    }
};

/// `.bad` loader that throws, or returns an error when `throw_exception` is false.
/// `throw_int` throws a value outside the std::exception hierarchy.
class BrokenLoader : public hoard_asset::AssetLoader<hoard_asset::TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".bad"};
    }

    [[nodiscard]] hoard_asset::LoadResult<hoard_asset::TextAsset> load(
        std::istream& /*stream*/, const hoard_asset::AssetLoadContext& /*ctx*/) override
    {
        ++calls;
        if (throw_int) {
            throw 42;
        }
        if (throw_exception) {
            throw std::runtime_error("corrupt header");
        }
        return hoard_core::Err<std::unique_ptr<hoard_asset::TextAsset>>(
            hoard_core::Error(hoard_core::ErrorCode::InvalidData, "corrupt header"));
    }

    [[nodiscard]] std::int64_t estimate_size(const hoard_asset::TextAsset& /*asset*/) const override {
        return 0;
    }

    std::atomic<int> calls{0};
    bool throw_exception = true;
    bool throw_int = false;
};

/// Poll `predicate` until it holds or the timeout elapses
template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace hoard_test
