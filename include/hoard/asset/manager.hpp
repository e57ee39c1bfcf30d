#pragma once

/// @file manager.hpp
/// @brief AssetManager: the asset cache

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "loader.hpp"
#include "handle.hpp"
#include "task_pool.hpp"
#include "manifest.hpp"
#include <hoard/core/error.hpp>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace hoard_asset {

namespace detail {
struct LoadWaiter;
struct PendingLoad;
} // namespace detail

/// Fired after a successful reload, with the reloaded path
using AssetReloadedCallback = std::function<void(const std::string& path)>;

// =============================================================================
// AssetManager
// =============================================================================

/// Central asset cache.
///
/// Loads go through registered loaders and are deduplicated per path: while
/// a load for a path is in flight, every further request for that path joins
/// it. Cached values are reference counted by handles; what happens to an
/// entry whose count reaches zero depends on the configured CachePolicy.
/// Asynchronous loads run on an internal pool of `max_concurrent_loads`
/// workers. Synchronous loads run on the calling thread.
class AssetManager {
public:
    explicit AssetManager(AssetManagerConfig config = AssetManagerConfig::defaults());

    /// Disposes the manager
    ~AssetManager();

    AssetManager(const AssetManager&) = delete;
    AssetManager& operator=(const AssetManager&) = delete;

    // =========================================================================
    // Loader Registration
    // =========================================================================

    template<typename T>
    hoard_core::Result<void> register_loader(std::shared_ptr<AssetLoader<T>> loader) {
        if (is_disposed()) {
            return hoard_core::Err(AssetError::disposed("AssetManager"));
        }
        return m_loaders.register_loader<T>(std::move(loader));
    }

    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetLoader<T>, Derived>>>
    hoard_core::Result<void> register_loader(std::shared_ptr<Derived> loader) {
        return register_loader<T>(std::shared_ptr<AssetLoader<T>>(std::move(loader)));
    }

    /// Register TextLoader (.txt) and BytesLoader (.bin)
    hoard_core::Result<void> register_builtin_loaders();

    [[nodiscard]] LoaderRegistry& loaders() noexcept { return m_loaders; }
    [[nodiscard]] const LoaderRegistry& loaders() const noexcept { return m_loaders; }

    [[nodiscard]] const AssetManagerConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Loading
    // =========================================================================

    /// Load on the calling thread
    template<typename T>
    [[nodiscard]] hoard_core::Result<AssetHandle<T>> load(
        const std::string& path,
        std::optional<LoadPriority> priority = std::nullopt)
    {
        auto entry = load_entry_sync(AssetPath(path), std::type_index(typeid(T)),
                                     priority.value_or(m_config.default_priority));
        if (!entry) {
            return hoard_core::Err<AssetHandle<T>>(entry.error());
        }
        return hoard_core::Ok(AssetHandle<T>(std::move(entry).value()));
    }

    /// Load on the worker pool. Concurrent requests for one path share a
    /// single loader invocation.
    template<typename T>
    [[nodiscard]] std::future<hoard_core::Result<AssetHandle<T>>> load_async(
        const std::string& path,
        std::optional<LoadPriority> priority = std::nullopt,
        std::stop_token token = {})
    {
        auto promise = std::make_shared<std::promise<hoard_core::Result<AssetHandle<T>>>>();
        auto future = promise->get_future();
        load_entry_async(AssetPath(path), std::type_index(typeid(T)),
            priority.value_or(m_config.default_priority), std::move(token),
            [promise](hoard_core::Result<detail::EntryPtr> result) {
                if (!result) {
                    promise->set_value(hoard_core::Err<AssetHandle<T>>(result.error()));
                } else {
                    promise->set_value(hoard_core::Ok(AssetHandle<T>(std::move(result).value())));
                }
            });
        return future;
    }

    /// Asynchronous load for a type only known at runtime
    [[nodiscard]] std::future<hoard_core::Result<UntypedHandle>> load_untyped_async(
        const std::string& path,
        std::type_index type,
        std::optional<LoadPriority> priority = std::nullopt,
        std::stop_token token = {});

    /// Load `dependency_path`; on success record that `parent_path` depends on it
    template<typename T>
    [[nodiscard]] hoard_core::Result<AssetHandle<T>> load_dependency(
        const std::string& parent_path,
        const std::string& dependency_path)
    {
        auto handle = load<T>(dependency_path);
        if (handle) {
            record_dependency(AssetPath(parent_path), AssetPath(dependency_path));
        }
        return handle;
    }

    template<typename T>
    [[nodiscard]] std::future<hoard_core::Result<AssetHandle<T>>> load_dependency_async(
        const std::string& parent_path,
        const std::string& dependency_path,
        std::stop_token token = {})
    {
        auto promise = std::make_shared<std::promise<hoard_core::Result<AssetHandle<T>>>>();
        auto future = promise->get_future();
        AssetPath parent(parent_path);
        AssetPath dependency(dependency_path);
        load_entry_async(dependency, std::type_index(typeid(T)), m_config.default_priority, std::move(token),
            [this, promise, parent, dependency](hoard_core::Result<detail::EntryPtr> result) {
                if (!result) {
                    promise->set_value(hoard_core::Err<AssetHandle<T>>(result.error()));
                    return;
                }
                record_dependency(parent, dependency);
                promise->set_value(hoard_core::Ok(AssetHandle<T>(std::move(result).value())));
            });
        return future;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// True iff a Loaded entry exists for the path
    [[nodiscard]] bool is_loaded(const std::string& path) const;

    /// Loaded, Loading, or the last terminal state (Failed/Unloaded/Empty)
    [[nodiscard]] LoadState state_of(const std::string& path) const;

    /// Reference count of the cached entry (0 if absent)
    [[nodiscard]] std::int64_t ref_count(const std::string& path) const;

    /// Paths recorded as dependencies of `parent_path`
    [[nodiscard]] std::vector<std::string> dependencies_of(const std::string& parent_path) const;

    /// Paths that recorded `path` as a dependency
    [[nodiscard]] std::vector<std::string> dependents_of(const std::string& path) const;

    [[nodiscard]] CacheStats get_cache_stats() const;

    /// Describe every cached entry
    [[nodiscard]] AssetManifest export_manifest() const;

    // =========================================================================
    // Cache Control
    // =========================================================================

    /// Remove and dispose the entry regardless of policy. No-op if absent.
    hoard_core::Result<void> unload(const std::string& path);

    /// Remove and dispose every entry
    hoard_core::Result<void> unload_all();

    /// Re-run the loader for a cached asset and swap the value in place.
    /// Failures keep the previous value and go to OnLoadError only.
    std::future<void> reload_async(const std::string& path);

    /// Under LRU, evict zero-reference entries oldest first until the cache
    /// holds at most `target_bytes`. Returns bytes freed.
    std::int64_t trim_cache(std::int64_t target_bytes);

    // =========================================================================
    // Events
    // =========================================================================

    ListenerId on_asset_reloaded(AssetReloadedCallback callback);

    bool remove_listener(ListenerId id);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Cancel or finish in-flight loads, then dispose every cached value.
    /// Later operations fail with Disposed. Idempotent.
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed.load(); }

    /// Absolute or root-relative location of an asset file
    [[nodiscard]] std::filesystem::path resolve(const AssetPath& path) const;

private:
    friend void detail::release_entry(const detail::EntryPtr& entry);
    friend hoard_core::Result<void> detail::acquire_entry(const detail::EntryPtr& entry);

    using PendingPtr = std::shared_ptr<detail::PendingLoad>;
    using Deliver = std::function<void(hoard_core::Result<detail::EntryPtr>)>;

    struct Admission;

    hoard_core::Result<detail::EntryPtr> load_entry_sync(
        const AssetPath& path, std::type_index type, LoadPriority priority);

    void load_entry_async(
        const AssetPath& path, std::type_index type, LoadPriority priority,
        std::stop_token token, Deliver deliver);

    Admission admit(const AssetPath& path, std::type_index type, LoadPriority priority, Deliver deliver);
    hoard_core::Result<detail::EntryPtr> take_hit(const detail::EntryPtr& entry, std::type_index type);
    void watch_cancellation(
        const PendingPtr& pending, const std::shared_ptr<detail::LoadWaiter>& waiter,
        const AssetPath& path, std::stop_token token);
    void submit_load(const PendingPtr& pending);
    void run_load(const PendingPtr& pending, LoadMode mode);
    hoard_core::Result<ErasedAsset> guarded_invoke(
        const AssetPath& path, std::type_index type, std::stop_token token, LoadMode mode);
    hoard_core::Result<ErasedAsset> invoke_loader(
        const AssetPath& path, std::type_index type, std::stop_token token, LoadMode mode);
    void complete_load(const PendingPtr& pending, hoard_core::Result<ErasedAsset> result);

    void release_entry(const detail::EntryPtr& entry);
    hoard_core::Result<void> acquire_entry(const detail::EntryPtr& entry);

    void run_reload(const detail::EntryPtr& entry);
    void record_dependency(const AssetPath& parent, const AssetPath& dependency);
    void forget_dependencies(const AssetPath& parent);
    void report_load_error(const AssetPath& path, const hoard_core::Error& error);
    std::string type_name_for(std::type_index type) const;
    std::uint64_t next_access_tick() noexcept { return ++m_access_clock; }

    /// Detach an entry from the cache. Caller holds the table lock and the
    /// entry lock and erases the table slot itself.
    ErasedValue detach_locked(const detail::EntryPtr& entry);
    std::size_t drop_all_entries();

    AssetManagerConfig m_config;
    LoaderRegistry m_loaders;

    mutable std::shared_mutex m_table_mutex;
    std::unordered_map<std::string, detail::EntryPtr> m_entries;
    std::unordered_map<std::string, PendingPtr> m_pending;
    std::unordered_map<std::string, LoadState> m_last_state;

    std::atomic<std::int64_t> m_total_size{0};
    std::atomic<std::uint64_t> m_cache_hits{0};
    std::atomic<std::uint64_t> m_cache_misses{0};
    std::atomic<std::uint64_t> m_joined_loads{0};
    std::atomic<std::uint64_t> m_failed_loads{0};
    std::atomic<std::uint64_t> m_access_clock{0};
    std::atomic<std::uint64_t> m_next_id{1};

    mutable std::mutex m_deps_mutex;
    std::map<AssetPath, std::set<AssetPath>> m_dependencies;

    mutable std::mutex m_listener_mutex;
    std::map<std::uint64_t, AssetReloadedCallback> m_reload_listeners;
    std::uint64_t m_next_listener_id = 1;

    std::mutex m_sync_mutex;
    std::condition_variable m_sync_idle;
    std::size_t m_active_sync = 0;

    std::atomic<bool> m_disposed{false};
    std::stop_source m_dispose_source;
    std::unique_ptr<AsyncTaskPool> m_pool;
};

} // namespace hoard_asset
