/// @file watcher.cpp
/// @brief PollingAssetWatcher implementation

#include <hoard/asset/watcher.hpp>
#include <hoard/asset/loader.hpp>
#include <hoard/core/log.hpp>

namespace hoard_asset {

// =============================================================================
// FileModificationTracker
// =============================================================================

bool FileModificationTracker::update(const std::string& path) {
    std::error_code ec;
    auto write_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    std::lock_guard lock(m_mutex);
    auto it = m_modification_times.find(path);
    if (it == m_modification_times.end()) {
        m_modification_times[path] = write_time;
        return true;
    }
    if (it->second != write_time) {
        it->second = write_time;
        return true;
    }
    return false;
}

bool FileModificationTracker::is_modified(const std::string& path) const {
    std::error_code ec;
    auto write_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }

    std::lock_guard lock(m_mutex);
    auto it = m_modification_times.find(path);
    if (it == m_modification_times.end()) {
        return true;
    }
    return it->second != write_time;
}

void FileModificationTracker::remove(const std::string& path) {
    std::lock_guard lock(m_mutex);
    m_modification_times.erase(path);
}

void FileModificationTracker::clear() {
    std::lock_guard lock(m_mutex);
    m_modification_times.clear();
}

std::size_t FileModificationTracker::size() const {
    std::lock_guard lock(m_mutex);
    return m_modification_times.size();
}

// =============================================================================
// PollingAssetWatcher
// =============================================================================

PollingAssetWatcher::PollingAssetWatcher(std::chrono::milliseconds interval)
    : m_poll_interval(interval) {}

PollingAssetWatcher::~PollingAssetWatcher() {
    stop();
}

void PollingAssetWatcher::start() {
    if (m_watching.exchange(true)) {
        return;
    }

    m_thread = std::thread([this]() {
        while (m_watching.load()) {
            check_changes();
            std::unique_lock lock(m_wake_mutex);
            m_wake.wait_for(lock, m_poll_interval.load(), [this] { return !m_watching.load(); });
        }
    });
    hoard_core::reload_logger()->debug("File watcher started ({} ms)", m_poll_interval.load().count());
}

void PollingAssetWatcher::stop() {
    {
        std::lock_guard lock(m_wake_mutex);
        m_watching.store(false);
    }
    m_wake.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

std::vector<AssetChangeEvent> PollingAssetWatcher::poll() {
    std::lock_guard lock(m_events_mutex);
    std::vector<AssetChangeEvent> events;
    std::swap(events, m_events);
    return events;
}

void PollingAssetWatcher::add_path(const std::string& path) {
    {
        std::lock_guard lock(m_paths_mutex);
        m_watch_paths.insert(path);
    }
    scan_directory(path);
}

void PollingAssetWatcher::remove_path(const std::string& path) {
    std::lock_guard lock(m_paths_mutex);
    m_watch_paths.erase(path);
}

void PollingAssetWatcher::add_extension(const std::string& ext) {
    std::string normalized = normalize_extension(ext);
    if (normalized.empty()) {
        return;
    }
    std::lock_guard lock(m_extensions_mutex);
    m_extensions.insert(std::move(normalized));
}

void PollingAssetWatcher::clear_extensions() {
    std::lock_guard lock(m_extensions_mutex);
    m_extensions.clear();
}

void PollingAssetWatcher::set_callback(AssetChangeCallback callback) {
    std::lock_guard lock(m_callback_mutex);
    m_callback = std::move(callback);
}

void PollingAssetWatcher::scan_directory(const std::string& dir) {
    std::lock_guard scan_lock(m_scan_mutex);
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec) || !should_watch(it->path())) {
            continue;
        }
        std::string path = it->path().string();
        m_tracker.update(path);
        m_known_files.insert(path);
    }
    if (ec) {
        hoard_core::reload_logger()->warn("Scanning '{}' failed: {}", dir, ec.message());
    }
}

void PollingAssetWatcher::check_changes() {
    std::set<std::string> paths;
    {
        std::lock_guard lock(m_paths_mutex);
        paths = m_watch_paths;
    }

    std::vector<AssetChangeEvent> new_events;
    {
        std::lock_guard scan_lock(m_scan_mutex);
        std::set<std::string> current_files;

        for (const auto& dir : paths) {
            std::error_code ec;
            for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
                 !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
                std::error_code type_ec;
                if (!it->is_regular_file(type_ec) || !should_watch(it->path())) {
                    continue;
                }

                std::string path = it->path().string();
                current_files.insert(path);

                if (m_known_files.find(path) == m_known_files.end()) {
                    new_events.push_back(AssetChangeEvent::created(path));
                    m_tracker.update(path);
                } else if (m_tracker.is_modified(path)) {
                    new_events.push_back(AssetChangeEvent::modified(path));
                    m_tracker.update(path);
                }
            }
            if (ec) {
                // Missing root: its known files are reported as deleted below
                hoard_core::reload_logger()->trace("Scanning '{}' stopped: {}", dir, ec.message());
            }
        }

        for (const auto& path : m_known_files) {
            if (current_files.find(path) == current_files.end()) {
                new_events.push_back(AssetChangeEvent::deleted(path));
                m_tracker.remove(path);
            }
        }

        m_known_files = std::move(current_files);
    }

    if (new_events.empty()) {
        return;
    }

    AssetChangeCallback callback;
    {
        std::lock_guard lock(m_callback_mutex);
        callback = m_callback;
    }
    if (!callback) {
        std::lock_guard lock(m_events_mutex);
        m_events.insert(m_events.end(), new_events.begin(), new_events.end());
        return;
    }
    for (const auto& event : new_events) {
        callback(event);
    }
}

bool PollingAssetWatcher::should_watch(const std::filesystem::path& path) const {
    std::lock_guard lock(m_extensions_mutex);
    if (m_extensions.empty()) {
        return true;
    }
    std::string ext = normalize_extension(path.extension().string());
    return !ext.empty() && m_extensions.count(ext) > 0;
}

} // namespace hoard_asset
