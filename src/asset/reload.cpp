/// @file reload.cpp
/// @brief ReloadManager implementation

#include <hoard/asset/reload.hpp>
#include <hoard/asset/manager.hpp>
#include <hoard/core/log.hpp>
#include <vector>

namespace hoard_asset {

// =============================================================================
// Construction
// =============================================================================

hoard_core::Result<std::unique_ptr<ReloadManager>> ReloadManager::create(
    AssetManager& manager, ReloadConfig config)
{
    if (manager.is_disposed()) {
        return hoard_core::Err<std::unique_ptr<ReloadManager>>(AssetError::disposed("AssetManager"));
    }

    std::string root = config.root_path.empty() ? manager.config().root_path : config.root_path;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        hoard_core::reload_logger()->warn("Cannot watch '{}': directory not found", root);
        return hoard_core::Err<std::unique_ptr<ReloadManager>>(
            hoard_core::HotReloadError::directory_not_found(root));
    }

    auto absolute = std::filesystem::absolute(root, ec);
    if (ec) {
        return hoard_core::Err<std::unique_ptr<ReloadManager>>(
            hoard_core::HotReloadError::watch_error(root + ": " + ec.message()));
    }

    auto reload = std::make_unique<ReloadManager>(
        ConstructKey{}, manager, std::move(config), absolute.lexically_normal());
    if (reload->m_config.start_watching) {
        reload->start();
    }
    return hoard_core::Ok(std::move(reload));
}

ReloadManager::ReloadManager(ConstructKey, AssetManager& manager, ReloadConfig config, std::filesystem::path root)
    : m_manager(manager)
    , m_config(std::move(config))
    , m_root(std::move(root))
    , m_watcher(std::make_unique<PollingAssetWatcher>(m_config.poll_interval))
    , m_listeners(std::make_shared<Listeners>())
{
    for (const auto& ext : m_config.extensions) {
        m_watcher->add_extension(ext);
    }
    m_watcher->add_path(m_root.string());
    m_watcher->set_callback([this](const AssetChangeEvent& event) { handle_change(event); });

    std::weak_ptr<Listeners> weak = m_listeners;
    m_forward_id = m_manager.on_asset_reloaded([weak](const std::string& path) {
        auto listeners = weak.lock();
        if (!listeners) {
            return;
        }
        std::vector<ReloadedCallback> callbacks;
        {
            std::lock_guard lock(listeners->mutex);
            if (listeners->closed) {
                return;
            }
            for (const auto& [id, callback] : listeners->callbacks) {
                callbacks.push_back(callback);
            }
        }
        for (const auto& callback : callbacks) {
            callback(path);
        }
    });

    hoard_core::reload_logger()->info("Hot reload watching '{}' ({} files)",
        m_root.string(), m_watcher->tracked_count());
}

ReloadManager::~ReloadManager() {
    dispose();
}

// =============================================================================
// Watching
// =============================================================================

void ReloadManager::start() {
    if (m_disposed) {
        return;
    }
    m_watcher->start();
}

void ReloadManager::stop() {
    m_watcher->stop();
}

bool ReloadManager::is_watching() const {
    return !m_disposed && m_watcher->is_watching();
}

bool ReloadManager::notify_changed(const std::string& file) {
    if (m_disposed) {
        return false;
    }

    auto relative = relative_path(file);
    if (!relative) {
        hoard_core::reload_logger()->debug("Ignoring change outside the asset root: {}", file);
        return false;
    }
    if (!m_manager.is_loaded(*relative)) {
        return false;
    }
    if (!debounce(AssetPath(*relative).key())) {
        hoard_core::reload_logger()->trace("Debounced change to '{}'", *relative);
        return false;
    }

    hoard_core::reload_logger()->info("Reloading '{}'", *relative);
    ++m_reload_count;
    // Failures are reported through the manager's OnLoadError
    m_manager.reload_async(*relative);
    return true;
}

void ReloadManager::handle_change(const AssetChangeEvent& event) {
    switch (event.type) {
        case FileChangeType::Created:
        case FileChangeType::Modified:
            notify_changed(event.path);
            break;
        case FileChangeType::Deleted:
            hoard_core::reload_logger()->debug("Watched file deleted: {}", event.path);
            break;
    }
}

std::optional<std::string> ReloadManager::relative_path(const std::string& file) const {
    std::filesystem::path path(file);
    if (path.empty()) {
        return std::nullopt;
    }
    if (!path.is_absolute()) {
        return AssetPath(path.generic_string()).str();
    }

    auto relative = path.lexically_normal().lexically_relative(m_root);
    if (relative.empty() || *relative.begin() == "..") {
        return std::nullopt;
    }
    return relative.generic_string();
}

bool ReloadManager::debounce(const std::string& key) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(m_debounce_mutex);
    auto it = m_last_change.find(key);
    if (it != m_last_change.end() && now - it->second < m_config.debounce_time) {
        return false;
    }
    m_last_change[key] = now;
    return true;
}

// =============================================================================
// Events
// =============================================================================

ListenerId ReloadManager::on_asset_reloaded(ReloadedCallback callback) {
    std::lock_guard lock(m_listeners->mutex);
    ListenerId id{m_listeners->next_id++};
    m_listeners->callbacks.emplace(id.id, std::move(callback));
    return id;
}

bool ReloadManager::remove_listener(ListenerId id) {
    std::lock_guard lock(m_listeners->mutex);
    return m_listeners->callbacks.erase(id.id) > 0;
}

// =============================================================================
// Lifecycle
// =============================================================================

void ReloadManager::dispose() {
    if (m_disposed.exchange(true)) {
        return;
    }

    m_watcher->stop();
    m_manager.remove_listener(m_forward_id);
    {
        std::lock_guard lock(m_listeners->mutex);
        m_listeners->closed = true;
        m_listeners->callbacks.clear();
    }
    hoard_core::reload_logger()->debug("Hot reload for '{}' disposed", m_root.string());
}

// =============================================================================
// Factory
// =============================================================================

hoard_core::Result<std::unique_ptr<ReloadManager>> make_reload_manager(
    AssetManager& manager, ReloadConfig config)
{
    if (!manager.config().enable_hot_reload) {
        return hoard_core::Ok(std::unique_ptr<ReloadManager>());
    }
    return ReloadManager::create(manager, std::move(config));
}

} // namespace hoard_asset
