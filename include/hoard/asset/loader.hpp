#pragma once

/// @file loader.hpp
/// @brief Loader contract and registry for hoard_asset

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include <hoard/core/error.hpp>
#include <cstdint>
#include <functional>
#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace hoard_asset {

// =============================================================================
// AssetLoadContext
// =============================================================================

/// Context passed to every loader call
class AssetLoadContext {
public:
    AssetLoadContext(
        const AssetPath& path,
        AssetManager* manager,
        std::shared_ptr<const ServiceProvider> services)
        : m_path(path)
        , m_manager(manager)
        , m_services(std::move(services)) {}

    /// Path being loaded (relative to the manager root)
    [[nodiscard]] const AssetPath& path() const noexcept { return m_path; }

    /// Owning manager, for dependency loads. May be null outside a manager.
    [[nodiscard]] AssetManager* manager() const noexcept { return m_manager; }

    /// Host services (may be null)
    [[nodiscard]] const ServiceProvider* services() const noexcept { return m_services.get(); }

    [[nodiscard]] std::string extension() const { return m_path.extension(); }

private:
    const AssetPath& m_path;
    AssetManager* m_manager;
    std::shared_ptr<const ServiceProvider> m_services;
};

// =============================================================================
// LoadResult<T>
// =============================================================================

/// Result of loading an asset
template<typename T>
using LoadResult = hoard_core::Result<std::unique_ptr<T>>;

// =============================================================================
// AssetLoader<T>
// =============================================================================

/// Interface for loading specific asset types
template<typename T>
class AssetLoader {
public:
    using asset_type = T;

    virtual ~AssetLoader() = default;

    /// Claimed extensions (lowercase, dot-prefixed)
    [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

    /// Decode an asset from the stream
    [[nodiscard]] virtual LoadResult<T> load(std::istream& stream, const AssetLoadContext& ctx) = 0;

    /// Asynchronous variant; runs on a pool worker. Loaders that can stop early
    /// should poll the token and return AssetError::cancelled.
    [[nodiscard]] virtual LoadResult<T> load_async(
        std::istream& stream, const AssetLoadContext& ctx, std::stop_token /*token*/) {
        return load(stream, ctx);
    }

    /// Approximate memory footprint of a loaded value
    [[nodiscard]] virtual std::int64_t estimate_size(const T& asset) const = 0;

    [[nodiscard]] std::type_index type_id() const {
        return std::type_index(typeid(T));
    }

    [[nodiscard]] virtual std::string type_name() const {
        return typeid(T).name();
    }
};

// =============================================================================
// ErasedAsset
// =============================================================================

/// Owning pointer to a value of unknown type
using ErasedValue = std::unique_ptr<void, void (*)(void*)>;

/// Loaded value with its size, type erased
struct ErasedAsset {
    ErasedValue value{nullptr, [](void*) {}};
    std::int64_t size_bytes = 0;
};

/// Which loader entry point to call
enum class LoadMode : std::uint8_t {
    Sync,
    Async,
};

// =============================================================================
// ErasedLoader
// =============================================================================

/// Type-erased loader interface
class ErasedLoader {
public:
    virtual ~ErasedLoader() = default;

    [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

    [[nodiscard]] virtual std::type_index type_id() const = 0;

    [[nodiscard]] virtual std::string type_name() const = 0;

    /// Load and box the value
    [[nodiscard]] virtual hoard_core::Result<ErasedAsset> load_erased(
        std::istream& stream,
        const AssetLoadContext& ctx,
        std::stop_token token,
        LoadMode mode) = 0;
};

/// Wrapper to create ErasedLoader from AssetLoader<T>
template<typename T>
class TypedErasedLoader : public ErasedLoader {
public:
    explicit TypedErasedLoader(std::shared_ptr<AssetLoader<T>> loader)
        : m_loader(std::move(loader)) {}

    [[nodiscard]] std::vector<std::string> extensions() const override {
        return m_loader->extensions();
    }

    [[nodiscard]] std::type_index type_id() const override {
        return m_loader->type_id();
    }

    [[nodiscard]] std::string type_name() const override {
        return m_loader->type_name();
    }

    [[nodiscard]] hoard_core::Result<ErasedAsset> load_erased(
        std::istream& stream,
        const AssetLoadContext& ctx,
        std::stop_token token,
        LoadMode mode) override
    {
        auto result = mode == LoadMode::Async
            ? m_loader->load_async(stream, ctx, std::move(token))
            : m_loader->load(stream, ctx);
        if (!result) {
            return hoard_core::Err<ErasedAsset>(result.error());
        }
        std::unique_ptr<T> asset = std::move(result).value();
        if (!asset) {
            return hoard_core::Err<ErasedAsset>(
                hoard_core::Error(hoard_core::ErrorCode::InvalidData, "Loader returned no value"));
        }

        ErasedAsset erased;
        erased.size_bytes = m_loader->estimate_size(*asset);
        erased.value = ErasedValue(asset.release(), &TypedErasedLoader::delete_asset);
        return hoard_core::Ok(std::move(erased));
    }

    [[nodiscard]] const std::shared_ptr<AssetLoader<T>>& typed() const noexcept {
        return m_loader;
    }

    static void delete_asset(void* asset) {
        delete static_cast<T*>(asset);
    }

private:
    std::shared_ptr<AssetLoader<T>> m_loader;
};

/// Runtime-typed load entry point
using LoadDelegate = std::function<hoard_core::Result<ErasedAsset>(
    std::istream&, const AssetLoadContext&, std::stop_token)>;

// =============================================================================
// LoaderRegistry
// =============================================================================

/// Maps (extension, result type) to loaders. Thread-safe.
class LoaderRegistry {
public:
    LoaderRegistry() = default;

    LoaderRegistry(const LoaderRegistry&) = delete;
    LoaderRegistry& operator=(const LoaderRegistry&) = delete;

    /// Register typed loader. Replaces any loader already bound to the same
    /// (extension, type) pair.
    template<typename T>
    hoard_core::Result<void> register_loader(std::shared_ptr<AssetLoader<T>> loader) {
        if (!loader) {
            return hoard_core::Err(AssetError::invalid_argument("loader must not be null"));
        }
        return register_erased(std::make_shared<TypedErasedLoader<T>>(std::move(loader)));
    }

    /// Register derived loader type (asset type taken from Derived::asset_type)
    template<typename Derived,
             typename T = typename Derived::asset_type,
             typename = std::enable_if_t<std::is_base_of_v<AssetLoader<T>, Derived>>>
    hoard_core::Result<void> register_loader(std::shared_ptr<Derived> loader) {
        return register_loader<T>(std::shared_ptr<AssetLoader<T>>(std::move(loader)));
    }

    /// Register an already erased loader
    hoard_core::Result<void> register_erased(std::shared_ptr<ErasedLoader> loader);

    /// Loader bound to (extension, T), or nullptr
    template<typename T>
    [[nodiscard]] std::shared_ptr<AssetLoader<T>> get_loader(const std::string& extension) const {
        auto erased = std::dynamic_pointer_cast<TypedErasedLoader<T>>(
            find(extension, std::type_index(typeid(T))));
        return erased ? erased->typed() : nullptr;
    }

    /// Most recently registered loader for T, or nullptr
    template<typename T>
    [[nodiscard]] std::shared_ptr<AssetLoader<T>> get_loader() const {
        auto erased = std::dynamic_pointer_cast<TypedErasedLoader<T>>(
            find_by_type(std::type_index(typeid(T))));
        return erased ? erased->typed() : nullptr;
    }

    /// Erased loader bound to (extension, type), or nullptr
    [[nodiscard]] std::shared_ptr<ErasedLoader> find(const std::string& extension, std::type_index type) const;

    /// Most recently registered erased loader for a type, or nullptr
    [[nodiscard]] std::shared_ptr<ErasedLoader> find_by_type(std::type_index type) const;

    /// Check if any loader claims the extension (dot optional, case-insensitive)
    [[nodiscard]] bool has_loader(const std::string& extension) const;

    /// All registered extensions across all types
    [[nodiscard]] std::vector<std::string> supported_extensions() const;

    /// Type-erased entry point for a runtime type, or nullopt
    [[nodiscard]] std::optional<LoadDelegate> get_load_delegate(std::type_index type) const;

    /// Number of distinct loader objects currently bound
    [[nodiscard]] std::size_t loader_count() const;

    void clear();

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::map<std::type_index, std::shared_ptr<ErasedLoader>>> m_by_extension;
    std::map<std::type_index, std::shared_ptr<ErasedLoader>> m_by_type;
};

// =============================================================================
// Built-in Loaders
// =============================================================================

/// Raw bytes asset
struct BytesAsset {
    std::vector<std::uint8_t> data;
};

/// Loads `.bin` files verbatim
class BytesLoader : public AssetLoader<BytesAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".bin"};
    }

    [[nodiscard]] LoadResult<BytesAsset> load(std::istream& stream, const AssetLoadContext& /*ctx*/) override {
        auto asset = std::make_unique<BytesAsset>();
        asset->data.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const BytesAsset& asset) const override {
        return static_cast<std::int64_t>(asset.data.size());
    }

    [[nodiscard]] std::string type_name() const override {
        return "BytesAsset";
    }
};

/// Text asset
struct TextAsset {
    std::string content;
};

/// Loads `.txt` files as text
class TextLoader : public AssetLoader<TextAsset> {
public:
    [[nodiscard]] std::vector<std::string> extensions() const override {
        return {".txt"};
    }

    [[nodiscard]] LoadResult<TextAsset> load(std::istream& stream, const AssetLoadContext& /*ctx*/) override {
        auto asset = std::make_unique<TextAsset>();
        asset->content.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        return hoard_core::Ok(std::move(asset));
    }

    [[nodiscard]] std::int64_t estimate_size(const TextAsset& asset) const override {
        return static_cast<std::int64_t>(asset.content.size());
    }

    [[nodiscard]] std::string type_name() const override {
        return "TextAsset";
    }
};

// =============================================================================
// Loader Utilities (Implemented in loader.cpp)
// =============================================================================

/// Normalize extension (lowercase, leading dot). Empty stays empty.
std::string normalize_extension(const std::string& ext);

namespace debug {

/// Record a loader invocation
void record_loader_operation(bool success, std::int64_t bytes = 0);

/// Format loader statistics
std::string format_loader_statistics();

/// Reset loader statistics
void reset_loader_statistics();

} // namespace debug

} // namespace hoard_asset
