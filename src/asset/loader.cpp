/// @file loader.cpp
/// @brief LoaderRegistry implementation and loader utilities

#include <hoard/asset/loader.hpp>
#include <hoard/core/log.hpp>
#include <atomic>
#include <mutex>
#include <set>
#include <sstream>

namespace hoard_asset {

// =============================================================================
// Loader Utilities
// =============================================================================

std::string normalize_extension(const std::string& ext) {
    if (ext.empty()) {
        return {};
    }
    std::string result = hoard_core::detail::to_lower_ascii(ext);
    if (result.front() != '.') {
        result.insert(result.begin(), '.');
    }
    return result;
}

// =============================================================================
// LoaderRegistry
// =============================================================================

hoard_core::Result<void> LoaderRegistry::register_erased(std::shared_ptr<ErasedLoader> loader) {
    if (!loader) {
        return hoard_core::Err(AssetError::invalid_argument("loader must not be null"));
    }

    auto extensions = loader->extensions();
    if (extensions.empty()) {
        return hoard_core::Err(AssetError::invalid_argument(
            "loader '" + loader->type_name() + "' declares no extensions"));
    }

    auto type = loader->type_id();

    std::unique_lock lock(m_mutex);
    for (const auto& ext : extensions) {
        std::string normalized = normalize_extension(ext);
        if (normalized.empty() || normalized == ".") {
            continue;
        }
        m_by_extension[normalized][type] = loader;
        hoard_core::asset_logger()->debug("Registered loader {} for '{}'", loader->type_name(), normalized);
    }
    m_by_type[type] = loader;

    return hoard_core::Ok();
}

std::shared_ptr<ErasedLoader> LoaderRegistry::find(const std::string& extension, std::type_index type) const {
    std::string normalized = normalize_extension(extension);
    if (normalized.empty()) {
        return nullptr;
    }

    std::shared_lock lock(m_mutex);
    auto it = m_by_extension.find(normalized);
    if (it == m_by_extension.end()) {
        return nullptr;
    }
    auto type_it = it->second.find(type);
    return type_it != it->second.end() ? type_it->second : nullptr;
}

std::shared_ptr<ErasedLoader> LoaderRegistry::find_by_type(std::type_index type) const {
    std::shared_lock lock(m_mutex);
    auto it = m_by_type.find(type);
    return it != m_by_type.end() ? it->second : nullptr;
}

bool LoaderRegistry::has_loader(const std::string& extension) const {
    std::string normalized = normalize_extension(extension);
    if (normalized.empty()) {
        return false;
    }

    std::shared_lock lock(m_mutex);
    auto it = m_by_extension.find(normalized);
    return it != m_by_extension.end() && !it->second.empty();
}

std::vector<std::string> LoaderRegistry::supported_extensions() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> exts;
    exts.reserve(m_by_extension.size());
    for (const auto& [ext, loaders] : m_by_extension) {
        if (!loaders.empty()) {
            exts.push_back(ext);
        }
    }
    return exts;
}

std::optional<LoadDelegate> LoaderRegistry::get_load_delegate(std::type_index type) const {
    auto loader = find_by_type(type);
    if (!loader) {
        return std::nullopt;
    }

    return LoadDelegate(
        [loader](std::istream& stream, const AssetLoadContext& ctx, std::stop_token token) {
            return loader->load_erased(stream, ctx, std::move(token), LoadMode::Async);
        });
}

std::size_t LoaderRegistry::loader_count() const {
    std::shared_lock lock(m_mutex);
    std::set<const ErasedLoader*> distinct;
    for (const auto& [ext, loaders] : m_by_extension) {
        for (const auto& [type, loader] : loaders) {
            distinct.insert(loader.get());
        }
    }
    return distinct.size();
}

void LoaderRegistry::clear() {
    std::unique_lock lock(m_mutex);
    m_by_extension.clear();
    m_by_type.clear();
}

// =============================================================================
// Loader Statistics
// =============================================================================

namespace debug {

namespace {

struct LoaderStats {
    std::atomic<std::uint64_t> loads_attempted{0};
    std::atomic<std::uint64_t> loads_succeeded{0};
    std::atomic<std::uint64_t> loads_failed{0};
    std::atomic<std::int64_t> bytes_loaded{0};
};

LoaderStats s_loader_stats;

} // anonymous namespace

void record_loader_operation(bool success, std::int64_t bytes) {
    s_loader_stats.loads_attempted.fetch_add(1, std::memory_order_relaxed);
    if (success) {
        s_loader_stats.loads_succeeded.fetch_add(1, std::memory_order_relaxed);
        s_loader_stats.bytes_loaded.fetch_add(bytes, std::memory_order_relaxed);
    } else {
        s_loader_stats.loads_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

std::string format_loader_statistics() {
    std::ostringstream oss;
    oss << "Loader Statistics:\n"
        << "  Attempted: " << s_loader_stats.loads_attempted.load() << "\n"
        << "  Succeeded: " << s_loader_stats.loads_succeeded.load() << "\n"
        << "  Failed: " << s_loader_stats.loads_failed.load() << "\n"
        << "  Bytes loaded: " << s_loader_stats.bytes_loaded.load() << "\n";
    return oss.str();
}

void reset_loader_statistics() {
    s_loader_stats.loads_attempted.store(0);
    s_loader_stats.loads_succeeded.store(0);
    s_loader_stats.loads_failed.store(0);
    s_loader_stats.bytes_loaded.store(0);
}

} // namespace debug

} // namespace hoard_asset
