#pragma once

/// @file reload.hpp
/// @brief Hot reload: file changes to AssetManager::reload_async

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "watcher.hpp"
#include <hoard/core/error.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hoard_asset {

// =============================================================================
// ReloadManager
// =============================================================================

/// Watches the asset root and reloads cached assets whose files change.
///
/// Only paths that are loaded at the time of the change are reloaded.
/// Must be destroyed before the AssetManager it watches.
class ReloadManager {
    /// Restricts construction to create()
    struct ConstructKey {
        explicit ConstructKey() = default;
    };

public:
    using ReloadedCallback = std::function<void(const std::string& path)>;

    /// Fails with DirectoryNotFound when the watched root does not exist
    [[nodiscard]] static hoard_core::Result<std::unique_ptr<ReloadManager>> create(
        AssetManager& manager, ReloadConfig config = {});

    ReloadManager(ConstructKey, AssetManager& manager, ReloadConfig config, std::filesystem::path root);

    /// Calls dispose()
    ~ReloadManager();

    ReloadManager(const ReloadManager&) = delete;
    ReloadManager& operator=(const ReloadManager&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_watching() const;

    /// Report a change to `file` (full path or relative to the root).
    /// Returns true if a reload was requested.
    bool notify_changed(const std::string& file);

    /// Fired after each successful reload of a watched asset
    ListenerId on_asset_reloaded(ReloadedCallback callback);

    bool remove_listener(ListenerId id);

    /// Stop watching and drop listeners. Idempotent.
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed.load(); }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    [[nodiscard]] const ReloadConfig& config() const noexcept { return m_config; }

    /// Reloads requested so far
    [[nodiscard]] std::uint64_t reload_count() const noexcept { return m_reload_count.load(); }

private:
    struct Listeners {
        std::mutex mutex;
        std::map<std::uint64_t, ReloadedCallback> callbacks;
        std::uint64_t next_id = 1;
        bool closed = false;
    };

    void handle_change(const AssetChangeEvent& event);
    [[nodiscard]] std::optional<std::string> relative_path(const std::string& file) const;
    [[nodiscard]] bool debounce(const std::string& key);

    AssetManager& m_manager;
    ReloadConfig m_config;
    std::filesystem::path m_root;
    std::unique_ptr<PollingAssetWatcher> m_watcher;

    std::shared_ptr<Listeners> m_listeners;
    ListenerId m_forward_id;

    std::mutex m_debounce_mutex;
    std::map<std::string, std::chrono::steady_clock::time_point> m_last_change;

    std::atomic<std::uint64_t> m_reload_count{0};
    std::atomic<bool> m_disposed{false};
};

/// Create a ReloadManager if the manager's config enables hot reload,
/// otherwise return a null pointer
[[nodiscard]] hoard_core::Result<std::unique_ptr<ReloadManager>> make_reload_manager(
    AssetManager& manager, ReloadConfig config = {});

} // namespace hoard_asset
