/// @file manifest.cpp
/// @brief AssetManifest JSON persistence

#include <hoard/asset/manifest.hpp>
#include <hoard/core/log.hpp>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hoard_asset {

namespace {

hoard_core::Error manifest_error(const std::string& reason) {
    return AssetError::invalid_data("manifest: " + reason);
}

std::chrono::system_clock::time_point truncate_to_seconds(std::chrono::system_clock::time_point when) {
    return std::chrono::time_point_cast<std::chrono::seconds>(when);
}

} // anonymous namespace

// =============================================================================
// Timestamps
// =============================================================================

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

hoard_core::Result<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail() || ss.get() != 'Z') {
        return hoard_core::Err<std::chrono::system_clock::time_point>(
            manifest_error("bad timestamp '" + text + "'"));
    }
#ifdef _WIN32
    std::time_t t = _mkgmtime(&utc);
#else
    std::time_t t = timegm(&utc);
#endif
    return hoard_core::Ok(std::chrono::system_clock::from_time_t(t));
}

// =============================================================================
// AssetInfo
// =============================================================================

hoard_core::Result<AssetInfo> AssetInfo::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return hoard_core::Err<AssetInfo>(manifest_error("asset entry must be an object"));
    }
    if (!j.contains("path") || !j["path"].is_string()) {
        return hoard_core::Err<AssetInfo>(manifest_error("asset entry is missing 'path'"));
    }

    AssetInfo info;
    info.path = j["path"].get<std::string>();

    if (j.contains("type")) {
        if (!j["type"].is_string()) {
            return hoard_core::Err<AssetInfo>(manifest_error("'type' of '" + info.path + "' must be a string"));
        }
        info.type = j["type"].get<std::string>();
    }

    if (j.contains("size")) {
        if (!j["size"].is_number_integer()) {
            return hoard_core::Err<AssetInfo>(manifest_error("'size' of '" + info.path + "' must be an integer"));
        }
        info.size = j["size"].get<std::int64_t>();
    }

    if (j.contains("hash") && !j["hash"].is_null()) {
        if (!j["hash"].is_string()) {
            return hoard_core::Err<AssetInfo>(manifest_error("'hash' of '" + info.path + "' must be a string"));
        }
        info.hash = j["hash"].get<std::string>();
    }

    if (j.contains("dependencies") && !j["dependencies"].is_null()) {
        const auto& deps = j["dependencies"];
        if (!deps.is_array()) {
            return hoard_core::Err<AssetInfo>(
                manifest_error("'dependencies' of '" + info.path + "' must be an array"));
        }
        std::vector<std::string> paths;
        paths.reserve(deps.size());
        for (const auto& dep : deps) {
            if (!dep.is_string()) {
                return hoard_core::Err<AssetInfo>(
                    manifest_error("dependency of '" + info.path + "' must be a string"));
            }
            paths.push_back(dep.get<std::string>());
        }
        info.dependencies = std::move(paths);
    }

    return hoard_core::Ok(std::move(info));
}

nlohmann::json AssetInfo::to_json() const {
    nlohmann::json j;
    j["path"] = path;
    j["type"] = type;
    j["size"] = size;
    if (hash) {
        j["hash"] = *hash;
    }
    if (dependencies) {
        j["dependencies"] = *dependencies;
    }
    return j;
}

// =============================================================================
// AssetManifest
// =============================================================================

AssetManifest::AssetManifest()
    : m_generated(truncate_to_seconds(std::chrono::system_clock::now())) {}

void AssetManifest::set_generated(TimePoint when) {
    m_generated = truncate_to_seconds(when);
}

void AssetManifest::add(AssetInfo info) {
    std::string key = AssetPath(info.path).key();
    auto it = m_index.find(key);
    if (it != m_index.end()) {
        m_assets[it->second] = std::move(info);
        return;
    }
    m_index.emplace(std::move(key), m_assets.size());
    m_assets.push_back(std::move(info));
}

bool AssetManifest::remove(const std::string& path) {
    auto it = m_index.find(AssetPath(path).key());
    if (it == m_index.end()) {
        return false;
    }
    m_assets.erase(m_assets.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}

bool AssetManifest::exists(const std::string& path) const {
    return m_index.count(AssetPath(path).key()) > 0;
}

std::optional<AssetInfo> AssetManifest::get_info(const std::string& path) const {
    auto it = m_index.find(AssetPath(path).key());
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return m_assets[it->second];
}

void AssetManifest::rebuild_index() {
    m_index.clear();
    for (std::size_t i = 0; i < m_assets.size(); ++i) {
        m_index[AssetPath(m_assets[i].path).key()] = i;
    }
}

nlohmann::json AssetManifest::to_json() const {
    nlohmann::json assets = nlohmann::json::array();
    for (const auto& info : m_assets) {
        assets.push_back(info.to_json());
    }

    nlohmann::json j;
    j["version"] = m_version;
    j["generated"] = format_timestamp(m_generated);
    j["assets"] = std::move(assets);
    return j;
}

std::string AssetManifest::to_json_string(int indent) const {
    return to_json().dump(indent);
}

hoard_core::Result<AssetManifest> AssetManifest::from_json(const nlohmann::json& j) {
    if (j.is_null()) {
        return hoard_core::Err<AssetManifest>(manifest_error("document is null"));
    }
    if (!j.is_object()) {
        return hoard_core::Err<AssetManifest>(manifest_error("document must be an object"));
    }

    AssetManifest manifest;

    if (j.contains("version")) {
        if (!j["version"].is_number_integer()) {
            return hoard_core::Err<AssetManifest>(manifest_error("'version' must be an integer"));
        }
        manifest.m_version = j["version"].get<int>();
    }

    if (j.contains("generated")) {
        if (!j["generated"].is_string()) {
            return hoard_core::Err<AssetManifest>(manifest_error("'generated' must be a string"));
        }
        auto when = parse_timestamp(j["generated"].get<std::string>());
        if (!when) {
            return hoard_core::Err<AssetManifest>(when.error());
        }
        manifest.m_generated = *when;
    }

    if (j.contains("assets")) {
        if (!j["assets"].is_array()) {
            return hoard_core::Err<AssetManifest>(manifest_error("'assets' must be an array"));
        }
        for (const auto& entry : j["assets"]) {
            auto info = AssetInfo::from_json(entry);
            if (!info) {
                return hoard_core::Err<AssetManifest>(info.error());
            }
            manifest.add(std::move(info).value());
        }
    }

    return hoard_core::Ok(std::move(manifest));
}

hoard_core::Result<AssetManifest> AssetManifest::from_json_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return hoard_core::Err<AssetManifest>(manifest_error(std::string("parse error: ") + e.what()));
    }
    return from_json(j);
}

hoard_core::Result<void> AssetManifest::save(const std::string& file_path) const {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file) {
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::IOError,
            "Failed to open manifest for writing: " + file_path));
    }
    file << to_json_string();
    if (!file) {
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::IOError,
            "Failed to write manifest: " + file_path));
    }
    hoard_core::asset_logger()->debug("Saved manifest with {} asset(s) to '{}'", m_assets.size(), file_path);
    return hoard_core::Ok();
}

hoard_core::Result<AssetManifest> AssetManifest::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file) {
        return hoard_core::Err<AssetManifest>(AssetError::file_not_found(file_path));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto manifest = from_json_string(buffer.str());
    if (!manifest) {
        HOARD_LOG_WARN("Failed to load manifest '{}': {}", file_path, manifest.error().message());
    }
    return manifest;
}

} // namespace hoard_asset
