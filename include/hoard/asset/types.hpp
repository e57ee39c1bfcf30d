#pragma once

/// @file types.hpp
/// @brief Core types for hoard_asset module

#include "fwd.hpp"
#include <hoard/core/error.hpp>
#include <hoard/core/hash.hpp>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace hoard_asset {

// =============================================================================
// LoadState
// =============================================================================

/// Cache entry state
enum class LoadState : std::uint8_t {
    Empty,     // No entry exists for the path
    Loading,   // A loader invocation is in flight
    Loaded,    // Value is cached
    Failed,    // Last load failed (not retained)
    Unloaded,  // Entry was evicted or unloaded
};

/// Get load state name
[[nodiscard]] inline const char* load_state_name(LoadState state) {
    switch (state) {
        case LoadState::Empty: return "Empty";
        case LoadState::Loading: return "Loading";
        case LoadState::Loaded: return "Loaded";
        case LoadState::Failed: return "Failed";
        case LoadState::Unloaded: return "Unloaded";
        default: return "Unknown";
    }
}

// =============================================================================
// LoadPriority
// =============================================================================

/// Scheduling priority (lower value runs first)
enum class LoadPriority : std::uint8_t {
    Immediate = 0,
    High,
    Normal,
    Low,
    Streaming,
};

[[nodiscard]] inline const char* load_priority_name(LoadPriority priority) {
    switch (priority) {
        case LoadPriority::Immediate: return "immediate";
        case LoadPriority::High: return "high";
        case LoadPriority::Normal: return "normal";
        case LoadPriority::Low: return "low";
        case LoadPriority::Streaming: return "streaming";
        default: return "unknown";
    }
}

/// Parse priority name (case-insensitive)
[[nodiscard]] inline std::optional<LoadPriority> parse_load_priority(const std::string& name) {
    std::string lower = hoard_core::detail::to_lower_ascii(name);
    if (lower == "immediate") return LoadPriority::Immediate;
    if (lower == "high") return LoadPriority::High;
    if (lower == "normal") return LoadPriority::Normal;
    if (lower == "low") return LoadPriority::Low;
    if (lower == "streaming") return LoadPriority::Streaming;
    return std::nullopt;
}

// =============================================================================
// CachePolicy
// =============================================================================

/// What happens to an entry once its reference count drops to zero
enum class CachePolicy : std::uint8_t {
    LRU,         // Stays cached, evictable oldest-first
    Manual,      // Stays cached until explicitly unloaded
    Aggressive,  // Disposed immediately
};

[[nodiscard]] inline const char* cache_policy_name(CachePolicy policy) {
    switch (policy) {
        case CachePolicy::LRU: return "lru";
        case CachePolicy::Manual: return "manual";
        case CachePolicy::Aggressive: return "aggressive";
        default: return "unknown";
    }
}

/// Parse policy name (case-insensitive)
[[nodiscard]] inline std::optional<CachePolicy> parse_cache_policy(const std::string& name) {
    std::string lower = hoard_core::detail::to_lower_ascii(name);
    if (lower == "lru") return CachePolicy::LRU;
    if (lower == "manual") return CachePolicy::Manual;
    if (lower == "aggressive") return CachePolicy::Aggressive;
    return std::nullopt;
}

// =============================================================================
// AssetId
// =============================================================================

/// Unique identifier for a cache entry
struct AssetId {
    std::uint64_t id = 0;

    constexpr AssetId() noexcept = default;

    explicit constexpr AssetId(std::uint64_t raw) noexcept : id(raw) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return id != 0;
    }

    [[nodiscard]] constexpr std::uint64_t raw() const noexcept {
        return id;
    }

    constexpr bool operator==(const AssetId&) const noexcept = default;
    constexpr auto operator<=>(const AssetId&) const noexcept = default;

    [[nodiscard]] static constexpr AssetId invalid() noexcept {
        return AssetId{0};
    }
};

// =============================================================================
// ListenerId
// =============================================================================

/// Identifier returned when subscribing to a notification
struct ListenerId {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr bool operator==(const ListenerId&) const noexcept = default;
};

// =============================================================================
// AssetPath
// =============================================================================

/// Asset path relative to the manager root.
/// Keeps the caller's spelling for file access; identity is case-insensitive.
struct AssetPath {
    std::string path;
    std::string lowered;
    std::uint64_t hash = 0;

    AssetPath() : hash(hoard_core::detail::fnv1a_hash(std::string())) {}

    explicit AssetPath(std::string p)
        : path(normalize(std::move(p)))
        , lowered(hoard_core::detail::to_lower_ascii(path))
        , hash(hoard_core::detail::fnv1a_hash(lowered)) {}

    explicit AssetPath(const char* p)
        : AssetPath(std::string(p != nullptr ? p : "")) {}

    /// Path as given (normalized separators)
    [[nodiscard]] const std::string& str() const noexcept { return path; }

    /// Case-insensitive identity key
    [[nodiscard]] const std::string& key() const noexcept { return lowered; }

    [[nodiscard]] bool empty() const noexcept { return path.empty(); }

    /// Lowercase extension with leading dot, or "" if none
    [[nodiscard]] std::string extension() const {
        std::string fname = filename();
        auto pos = fname.rfind('.');
        if (pos == std::string::npos || pos + 1 == fname.size()) return "";
        return hoard_core::detail::to_lower_ascii(fname.substr(pos));
    }

    [[nodiscard]] std::string filename() const {
        auto pos = path.rfind('/');
        if (pos == std::string::npos) return path;
        return path.substr(pos + 1);
    }

    [[nodiscard]] std::string directory() const {
        auto pos = path.rfind('/');
        if (pos == std::string::npos) return "";
        return path.substr(0, pos);
    }

    [[nodiscard]] std::string stem() const {
        std::string fname = filename();
        auto pos = fname.rfind('.');
        if (pos == std::string::npos) return fname;
        return fname.substr(0, pos);
    }

    bool operator==(const AssetPath& other) const noexcept {
        return hash == other.hash && lowered == other.lowered;
    }

    bool operator<(const AssetPath& other) const noexcept {
        return lowered < other.lowered;
    }

private:
    static std::string normalize(std::string p) {
        for (char& c : p) {
            if (c == '\\') c = '/';
        }
        while (p.size() >= 2 && p[0] == '.' && p[1] == '/') {
            p.erase(0, 2);
        }
        while (!p.empty() && p.back() == '/') {
            p.pop_back();
        }
        return p;
    }
};

// =============================================================================
// CacheStats
// =============================================================================

/// Snapshot of cache counters
struct CacheStats {
    std::size_t total_assets = 0;
    std::size_t loaded_assets = 0;
    std::size_t pending_assets = 0;
    std::size_t failed_assets = 0;
    std::int64_t total_size_bytes = 0;
    std::int64_t max_size_bytes = 0;
    std::uint64_t cache_hits = 0;
    std::uint64_t cache_misses = 0;
    /// Requests that joined an in-flight load; neither hits nor misses
    std::uint64_t joined_loads = 0;

    /// hits / (hits + misses), 0 when nothing was requested
    [[nodiscard]] double hit_ratio() const noexcept {
        std::uint64_t total = cache_hits + cache_misses;
        if (total == 0) return 0.0;
        return static_cast<double>(cache_hits) / static_cast<double>(total);
    }

    /// total / max, 0 when either is 0
    [[nodiscard]] double utilization_ratio() const noexcept {
        if (max_size_bytes <= 0 || total_size_bytes <= 0) return 0.0;
        return static_cast<double>(total_size_bytes) / static_cast<double>(max_size_bytes);
    }
};

// =============================================================================
// AssetError
// =============================================================================

/// Error factories for asset operations
struct AssetError {
    [[nodiscard]] static hoard_core::Error file_not_found(const std::string& path) {
        hoard_core::Error err(hoard_core::LoadError::file_not_found(path));
        err.with_context("path", path);
        return err;
    }

    [[nodiscard]] static hoard_core::Error unsupported_format(const std::string& path, const std::string& type) {
        hoard_core::Error err(hoard_core::LoadError::unsupported_format(path, type));
        err.with_context("path", path).with_context("type", type);
        return err;
    }

    /// Wraps whatever the loader reported as the cause
    [[nodiscard]] static hoard_core::Error parse_error(const std::string& path, hoard_core::Error cause) {
        hoard_core::Error err(hoard_core::LoadError::parse_failure(path, cause.message()));
        err.with_context("path", path).with_cause(std::move(cause));
        return err;
    }

    [[nodiscard]] static hoard_core::Error cancelled(const std::string& path) {
        hoard_core::Error err(hoard_core::LoadError::cancelled(path));
        err.with_context("path", path);
        return err;
    }

    [[nodiscard]] static hoard_core::Error invalid_data(const std::string& reason) {
        return hoard_core::Error(hoard_core::ErrorCode::InvalidData, "Invalid data: " + reason);
    }

    [[nodiscard]] static hoard_core::Error invalid_argument(const std::string& reason) {
        return hoard_core::Error(hoard_core::ErrorCode::InvalidArgument, "Invalid argument: " + reason);
    }

    [[nodiscard]] static hoard_core::Error disposed(const std::string& what) {
        return hoard_core::Error(hoard_core::ErrorCode::Disposed, what + " has been disposed");
    }
};

} // namespace hoard_asset

template<>
struct std::hash<hoard_asset::AssetId> {
    std::size_t operator()(const hoard_asset::AssetId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.id);
    }
};

template<>
struct std::hash<hoard_asset::AssetPath> {
    std::size_t operator()(const hoard_asset::AssetPath& path) const noexcept {
        return static_cast<std::size_t>(path.hash);
    }
};
