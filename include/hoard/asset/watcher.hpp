#pragma once

/// @file watcher.hpp
/// @brief Polling file watcher used by ReloadManager

#include "fwd.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace hoard_asset {

// =============================================================================
// AssetChangeEvent
// =============================================================================

/// Type of file change
enum class FileChangeType : std::uint8_t {
    Created,
    Modified,
    Deleted,
};

[[nodiscard]] inline const char* file_change_type_name(FileChangeType type) {
    switch (type) {
        case FileChangeType::Created: return "Created";
        case FileChangeType::Modified: return "Modified";
        case FileChangeType::Deleted: return "Deleted";
        default: return "Unknown";
    }
}

/// A change to one watched file. `path` is the file's full path.
struct AssetChangeEvent {
    FileChangeType type = FileChangeType::Modified;
    std::string path;
    std::chrono::steady_clock::time_point timestamp = std::chrono::steady_clock::now();

    [[nodiscard]] static AssetChangeEvent created(const std::string& path) {
        return AssetChangeEvent{FileChangeType::Created, path};
    }

    [[nodiscard]] static AssetChangeEvent modified(const std::string& path) {
        return AssetChangeEvent{FileChangeType::Modified, path};
    }

    [[nodiscard]] static AssetChangeEvent deleted(const std::string& path) {
        return AssetChangeEvent{FileChangeType::Deleted, path};
    }
};

// =============================================================================
// FileModificationTracker
// =============================================================================

/// Last known write time per file
class FileModificationTracker {
public:
    /// Record the current write time. Returns true if it is new or changed.
    bool update(const std::string& path);

    [[nodiscard]] bool is_modified(const std::string& path) const;

    void remove(const std::string& path);

    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    std::map<std::string, std::filesystem::file_time_type> m_modification_times;
    mutable std::mutex m_mutex;
};

// =============================================================================
// PollingAssetWatcher
// =============================================================================

using AssetChangeCallback = std::function<void(const AssetChangeEvent&)>;

/// Recursively scans its directories every poll interval and reports
/// created, modified and deleted files.
class PollingAssetWatcher {
public:
    explicit PollingAssetWatcher(std::chrono::milliseconds interval = std::chrono::milliseconds{100});

    ~PollingAssetWatcher();

    PollingAssetWatcher(const PollingAssetWatcher&) = delete;
    PollingAssetWatcher& operator=(const PollingAssetWatcher&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_watching() const { return m_watching.load(); }

    /// Take events collected while no callback was set
    std::vector<AssetChangeEvent> poll();

    /// Scan once on the calling thread
    void check_changes();

    /// Watch a directory; its current files become the baseline
    void add_path(const std::string& path);

    void remove_path(const std::string& path);

    /// Restrict to an extension (".png" or "png"). No filter watches everything.
    void add_extension(const std::string& ext);

    void clear_extensions();

    void set_callback(AssetChangeCallback callback);

    void set_poll_interval(std::chrono::milliseconds interval) { m_poll_interval.store(interval); }

    [[nodiscard]] std::size_t tracked_count() const { return m_tracker.size(); }

private:
    void scan_directory(const std::string& dir);
    [[nodiscard]] bool should_watch(const std::filesystem::path& path) const;

    std::atomic<std::chrono::milliseconds> m_poll_interval;
    std::atomic<bool> m_watching{false};
    std::thread m_thread;
    std::mutex m_wake_mutex;
    std::condition_variable m_wake;

    std::set<std::string> m_watch_paths;
    mutable std::mutex m_paths_mutex;

    std::set<std::string> m_extensions;
    mutable std::mutex m_extensions_mutex;

    std::mutex m_scan_mutex;
    std::set<std::string> m_known_files;
    FileModificationTracker m_tracker;

    std::vector<AssetChangeEvent> m_events;
    mutable std::mutex m_events_mutex;

    AssetChangeCallback m_callback;
    mutable std::mutex m_callback_mutex;
};

} // namespace hoard_asset
