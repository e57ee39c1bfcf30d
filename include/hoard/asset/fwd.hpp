#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hoard_asset module

#include <cstdint>

namespace hoard_asset {

// Types
enum class LoadState : std::uint8_t;
enum class LoadPriority : std::uint8_t;
enum class CachePolicy : std::uint8_t;
struct AssetId;
struct AssetPath;
struct CacheStats;
struct ListenerId;

// Configuration
struct AssetManagerConfig;
struct ReloadConfig;
class ServiceProvider;

// Loaders
class AssetLoadContext;
template<typename T> class AssetLoader;
class ErasedLoader;
template<typename T> class TypedErasedLoader;
class LoaderRegistry;
struct TextAsset;
struct BytesAsset;
class TextLoader;
class BytesLoader;

// Handles
template<typename T> class AssetHandle;
class UntypedHandle;

// Manager
class AssetManager;
class AsyncTaskPool;

// Streaming
class StreamingManager;

// Hot reload
class PollingAssetWatcher;
class ReloadManager;

// Manifest
struct AssetInfo;
class AssetManifest;

namespace detail {
struct CacheEntry;
} // namespace detail

} // namespace hoard_asset
