/// @file config.cpp
/// @brief JSON configuration parsing for hoard_asset

#include <hoard/asset/config.hpp>
#include <hoard/core/log.hpp>
#include <fstream>

namespace hoard_asset {

namespace {

hoard_core::Result<AssetManagerConfig> config_error(const std::string& reason) {
    return hoard_core::Err<AssetManagerConfig>(AssetError::invalid_data("asset config: " + reason));
}

} // anonymous namespace

hoard_core::Result<AssetManagerConfig> AssetManagerConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return config_error("document must be an object");
    }

    AssetManagerConfig config = defaults();

    if (j.contains("root_path")) {
        if (!j["root_path"].is_string()) {
            return config_error("'root_path' must be a string");
        }
        config.root_path = j["root_path"].get<std::string>();
    }

    if (j.contains("cache_policy")) {
        if (!j["cache_policy"].is_string()) {
            return config_error("'cache_policy' must be a string");
        }
        auto policy = parse_cache_policy(j["cache_policy"].get<std::string>());
        if (!policy) {
            return config_error("unknown cache_policy '" + j["cache_policy"].get<std::string>() + "'");
        }
        config.cache_policy = *policy;
    }

    if (j.contains("max_cache_bytes")) {
        if (!j["max_cache_bytes"].is_number_integer()) {
            return config_error("'max_cache_bytes' must be an integer");
        }
        config.max_cache_bytes = j["max_cache_bytes"].get<std::int64_t>();
        if (config.max_cache_bytes < 0) {
            return config_error("'max_cache_bytes' must not be negative");
        }
    }

    if (j.contains("max_concurrent_loads")) {
        if (!j["max_concurrent_loads"].is_number_integer() || j["max_concurrent_loads"].get<std::int64_t>() < 1) {
            return config_error("'max_concurrent_loads' must be a positive integer");
        }
        config.max_concurrent_loads = j["max_concurrent_loads"].get<std::size_t>();
    }

    if (j.contains("enable_hot_reload")) {
        if (!j["enable_hot_reload"].is_boolean()) {
            return config_error("'enable_hot_reload' must be a boolean");
        }
        config.enable_hot_reload = j["enable_hot_reload"].get<bool>();
    }

    if (j.contains("default_priority")) {
        if (!j["default_priority"].is_string()) {
            return config_error("'default_priority' must be a string");
        }
        auto priority = parse_load_priority(j["default_priority"].get<std::string>());
        if (!priority) {
            return config_error("unknown default_priority '" + j["default_priority"].get<std::string>() + "'");
        }
        config.default_priority = *priority;
    }

    return hoard_core::Ok(std::move(config));
}

nlohmann::json AssetManagerConfig::to_json() const {
    nlohmann::json j;
    j["root_path"] = root_path;
    j["cache_policy"] = cache_policy_name(cache_policy);
    j["max_cache_bytes"] = max_cache_bytes;
    j["max_concurrent_loads"] = max_concurrent_loads;
    j["enable_hot_reload"] = enable_hot_reload;
    j["default_priority"] = load_priority_name(default_priority);
    return j;
}

hoard_core::Result<AssetManagerConfig> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return hoard_core::Err<AssetManagerConfig>(AssetError::file_not_found(path));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        HOARD_LOG_WARN("Failed to parse asset config '{}': {}", path, e.what());
        return config_error(std::string("parse error: ") + e.what());
    }

    return AssetManagerConfig::from_json(j);
}

} // namespace hoard_asset
