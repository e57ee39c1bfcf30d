#pragma once

/// @file manifest.hpp
/// @brief Persisted JSON index of known assets

#include "fwd.hpp"
#include "types.hpp"
#include <hoard/core/error.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoard_asset {

// =============================================================================
// AssetInfo
// =============================================================================

/// Manifest record for one asset
struct AssetInfo {
    std::string path;
    std::string type;
    std::int64_t size = 0;
    std::optional<std::string> hash;
    std::optional<std::vector<std::string>> dependencies;

    bool operator==(const AssetInfo&) const = default;

    [[nodiscard]] static hoard_core::Result<AssetInfo> from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;
};

// =============================================================================
// AssetManifest
// =============================================================================

/// Ordered set of AssetInfo keyed by case-insensitive path.
///
/// JSON layout:
/// @code
/// { "version": 1, "generated": "2024-05-01T12:00:00Z",
///   "assets": [ { "path": "a.txt", "type": "TextAsset", "size": 5,
///                 "hash": "...", "dependencies": ["b.txt"] } ] }
/// @endcode
class AssetManifest {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static constexpr int k_current_version = 1;

    /// Empty manifest generated now
    AssetManifest();

    [[nodiscard]] int version() const noexcept { return m_version; }
    void set_version(int version) noexcept { m_version = version; }

    /// Generation time, whole seconds
    [[nodiscard]] TimePoint generated() const noexcept { return m_generated; }
    void set_generated(TimePoint when);

    /// Add or replace the record for `info.path`
    void add(AssetInfo info);

    /// Remove the record for a path. Returns false if absent.
    bool remove(const std::string& path);

    [[nodiscard]] bool exists(const std::string& path) const;

    [[nodiscard]] std::optional<AssetInfo> get_info(const std::string& path) const;

    [[nodiscard]] const std::vector<AssetInfo>& assets() const noexcept { return m_assets; }

    [[nodiscard]] std::size_t size() const noexcept { return m_assets.size(); }

    // Serialization

    [[nodiscard]] nlohmann::json to_json() const;

    [[nodiscard]] std::string to_json_string(int indent = 2) const;

    /// Fails with InvalidData for null documents or assets without a path
    [[nodiscard]] static hoard_core::Result<AssetManifest> from_json(const nlohmann::json& j);

    /// Fails with InvalidData for malformed JSON as well
    [[nodiscard]] static hoard_core::Result<AssetManifest> from_json_string(const std::string& text);

    hoard_core::Result<void> save(const std::string& file_path) const;

    [[nodiscard]] static hoard_core::Result<AssetManifest> load(const std::string& file_path);

private:
    void rebuild_index();

    int m_version = k_current_version;
    TimePoint m_generated;
    std::vector<AssetInfo> m_assets;
    std::unordered_map<std::string, std::size_t> m_index;
};

/// Format as `YYYY-MM-DDTHH:MM:SSZ` (UTC)
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point when);

/// Parse `YYYY-MM-DDTHH:MM:SSZ` (UTC)
[[nodiscard]] hoard_core::Result<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

} // namespace hoard_asset
