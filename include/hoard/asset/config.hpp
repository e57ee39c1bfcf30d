#pragma once

/// @file config.hpp
/// @brief Configuration values for the asset cache

#include "types.hpp"
#include <hoard/core/error.hpp>
#include <nlohmann/json.hpp>
#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace hoard_asset {

/// Called for every failed load or reload (never for cancellations)
using LoadErrorCallback = std::function<void(const std::string& path, const hoard_core::Error& error)>;

// =============================================================================
// ServiceProvider
// =============================================================================

/// Read-only registry of host services made available to loaders
class ServiceProvider {
public:
    /// Register or replace a service
    template<typename S>
    void insert(std::shared_ptr<S> service) {
        m_services[std::type_index(typeid(S))] = std::move(service);
    }

    /// Get a service, or nullptr if not registered
    template<typename S>
    [[nodiscard]] std::shared_ptr<S> get() const {
        auto it = m_services.find(std::type_index(typeid(S)));
        if (it == m_services.end()) {
            return nullptr;
        }
        const auto* ptr = std::any_cast<std::shared_ptr<S>>(&it->second);
        return ptr != nullptr ? *ptr : nullptr;
    }

    template<typename S>
    [[nodiscard]] bool contains() const {
        return m_services.count(std::type_index(typeid(S))) > 0;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_services.size(); }

private:
    std::unordered_map<std::type_index, std::any> m_services;
};

// =============================================================================
// AssetManagerConfig
// =============================================================================

/// Configuration for AssetManager
struct AssetManagerConfig {
    std::string root_path = "Assets";
    CachePolicy cache_policy = CachePolicy::LRU;
    std::int64_t max_cache_bytes = 512LL * 1024 * 1024;
    std::size_t max_concurrent_loads = 4;
    bool enable_hot_reload = false;
    LoadPriority default_priority = LoadPriority::Normal;
    LoadErrorCallback on_load_error;
    std::shared_ptr<const ServiceProvider> services;

    AssetManagerConfig() = default;

    /// Standard preset
    [[nodiscard]] static AssetManagerConfig defaults() {
        return AssetManagerConfig{};
    }

    /// Development preset: hot reload on, values dropped as soon as unused
    [[nodiscard]] static AssetManagerConfig development() {
        AssetManagerConfig config;
        config.enable_hot_reload = true;
        config.cache_policy = CachePolicy::Aggressive;
        return config;
    }

    /// Builder pattern
    AssetManagerConfig& with_root_path(const std::string& path) {
        root_path = path;
        return *this;
    }

    AssetManagerConfig& with_cache_policy(CachePolicy policy) {
        cache_policy = policy;
        return *this;
    }

    AssetManagerConfig& with_max_cache_bytes(std::int64_t bytes) {
        max_cache_bytes = bytes;
        return *this;
    }

    AssetManagerConfig& with_max_concurrent_loads(std::size_t max) {
        max_concurrent_loads = max;
        return *this;
    }

    AssetManagerConfig& with_hot_reload(bool enable) {
        enable_hot_reload = enable;
        return *this;
    }

    AssetManagerConfig& with_default_priority(LoadPriority priority) {
        default_priority = priority;
        return *this;
    }

    AssetManagerConfig& with_load_error_callback(LoadErrorCallback callback) {
        on_load_error = std::move(callback);
        return *this;
    }

    AssetManagerConfig& with_services(std::shared_ptr<const ServiceProvider> provider) {
        services = std::move(provider);
        return *this;
    }

    /// Read settings from JSON; absent keys keep their default
    [[nodiscard]] static hoard_core::Result<AssetManagerConfig> from_json(const nlohmann::json& j);

    /// Serialize settings (callbacks and services are not serialized)
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Load configuration from a JSON file
[[nodiscard]] hoard_core::Result<AssetManagerConfig> load_config_file(const std::string& path);

// =============================================================================
// ReloadConfig
// =============================================================================

/// Configuration for ReloadManager
struct ReloadConfig {
    std::string root_path;  // Empty means the manager's root
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds debounce_time{50};
    std::vector<std::string> extensions;  // Empty means every file
    bool start_watching = true;

    ReloadConfig() = default;

    ReloadConfig& with_root_path(const std::string& path) {
        root_path = path;
        return *this;
    }

    ReloadConfig& with_poll_interval(std::chrono::milliseconds interval) {
        poll_interval = interval;
        return *this;
    }

    ReloadConfig& with_debounce_time(std::chrono::milliseconds time) {
        debounce_time = time;
        return *this;
    }

    ReloadConfig& with_extension(const std::string& ext) {
        extensions.push_back(ext);
        return *this;
    }

    ReloadConfig& with_start_watching(bool start) {
        start_watching = start;
        return *this;
    }
};

} // namespace hoard_asset
