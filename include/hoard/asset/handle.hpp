#pragma once

/// @file handle.hpp
/// @brief Reference-counted asset handles

#include "fwd.hpp"
#include "types.hpp"
#include "loader.hpp"
#include <hoard/core/error.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <utility>

namespace hoard_asset {

namespace detail {

// =============================================================================
// CacheEntry
// =============================================================================

/// One cached value. Owned by AssetManager; handles share it so they can
/// observe reloads. All mutable fields are guarded by `mutex`.
struct CacheEntry {
    AssetId id;
    AssetPath path;
    std::type_index type{typeid(void)};
    std::string type_name;

    mutable std::mutex mutex;
    ErasedValue value{nullptr, [](void*) {}};
    std::int64_t size_bytes = 0;
    std::int64_t ref_count = 0;
    std::uint64_t last_access = 0;
    std::uint32_t generation = 1;
    LoadState state = LoadState::Loaded;
    AssetManager* owner = nullptr;  // Null once the entry left the cache

    /// Serializes reloads of this entry
    std::mutex reload_mutex;
};

using EntryPtr = std::shared_ptr<CacheEntry>;

/// Drop one reference on behalf of a handle. No-op if the entry left the cache.
void release_entry(const EntryPtr& entry);

/// Add one reference for a new handle
[[nodiscard]] hoard_core::Result<void> acquire_entry(const EntryPtr& entry);

// =============================================================================
// HandleBase
// =============================================================================

/// Shared implementation of typed and untyped handles
class HandleBase {
public:
    HandleBase() = default;

    HandleBase(const HandleBase&) = delete;
    HandleBase& operator=(const HandleBase&) = delete;

    HandleBase(HandleBase&& other) noexcept
        : m_entry(std::move(other.m_entry))
        , m_id(other.m_id)
        , m_path(std::move(other.m_path))
        , m_released(other.m_released)
    {
        other.m_released = true;
    }

    HandleBase& operator=(HandleBase&& other) noexcept {
        if (this != &other) {
            release();
            m_entry = std::move(other.m_entry);
            m_id = other.m_id;
            m_path = std::move(other.m_path);
            m_released = other.m_released;
            other.m_released = true;
        }
        return *this;
    }

    ~HandleBase() { release(); }

    /// Give back this handle's reference. Returns true only for the call
    /// that actually released it.
    bool release() noexcept {
        if (m_released) {
            return false;
        }
        m_released = true;
        if (m_entry) {
            release_entry(m_entry);
            m_entry.reset();
        }
        return true;
    }

    [[nodiscard]] bool is_released() const noexcept { return m_released; }

    /// Same for every handle of one entry
    [[nodiscard]] AssetId id() const noexcept { return m_id; }

    [[nodiscard]] const AssetPath& path() const noexcept { return m_path; }

    /// True while the entry is cached and holds a value
    [[nodiscard]] bool is_loaded() const {
        if (!m_entry) return false;
        std::lock_guard lock(m_entry->mutex);
        return m_entry->state == LoadState::Loaded && m_entry->value != nullptr;
    }

    /// Current reference count of the entry
    [[nodiscard]] std::int64_t use_count() const {
        if (!m_entry) return 0;
        std::lock_guard lock(m_entry->mutex);
        return m_entry->ref_count;
    }

    /// Incremented by every successful reload
    [[nodiscard]] std::uint32_t generation() const {
        if (!m_entry) return 0;
        std::lock_guard lock(m_entry->mutex);
        return m_entry->generation;
    }

    [[nodiscard]] bool is_valid() const noexcept { return !m_released && m_entry != nullptr; }

    explicit operator bool() const noexcept { return is_valid(); }

protected:
    explicit HandleBase(EntryPtr entry)
        : m_entry(std::move(entry))
        , m_id(m_entry->id)
        , m_path(m_entry->path)
        , m_released(false) {}

    [[nodiscard]] void* raw_value(std::type_index type) const {
        if (!m_entry) return nullptr;
        std::lock_guard lock(m_entry->mutex);
        if (m_entry->type != type || m_entry->state != LoadState::Loaded) {
            return nullptr;
        }
        return m_entry->value.get();
    }

    [[nodiscard]] hoard_core::Result<EntryPtr> acquire_raw() const {
        if (m_released) {
            return hoard_core::Err<EntryPtr>(hoard_core::HandleError::released());
        }
        if (!m_entry) {
            return hoard_core::Err<EntryPtr>(hoard_core::HandleError::null());
        }
        auto result = acquire_entry(m_entry);
        if (!result) {
            return hoard_core::Err<EntryPtr>(result.error());
        }
        return hoard_core::Ok(m_entry);
    }

    [[nodiscard]] const EntryPtr& entry() const noexcept { return m_entry; }

private:
    EntryPtr m_entry;
    AssetId m_id;
    AssetPath m_path;
    bool m_released = true;
};

} // namespace detail

// =============================================================================
// AssetHandle<T>
// =============================================================================

/// Owns one reference on a cached asset. Move-only; the destructor releases.
template<typename T>
class AssetHandle : public detail::HandleBase {
public:
    AssetHandle() = default;

    AssetHandle(AssetHandle&&) noexcept = default;
    AssetHandle& operator=(AssetHandle&&) noexcept = default;

    /// Current value, or nullptr once released/unloaded. The pointer stays
    /// valid until the next reload of this asset or the last release.
    [[nodiscard]] T* get() const {
        return static_cast<T*>(raw_value(std::type_index(typeid(T))));
    }

    [[nodiscard]] T* operator->() const { return get(); }

    [[nodiscard]] T& operator*() const { return *get(); }

    /// New handle on the same entry (+1 reference)
    [[nodiscard]] hoard_core::Result<AssetHandle<T>> acquire() const {
        auto entry = acquire_raw();
        if (!entry) {
            return hoard_core::Err<AssetHandle<T>>(entry.error());
        }
        return hoard_core::Ok(AssetHandle<T>(std::move(entry).value()));
    }

private:
    friend class AssetManager;
    friend class UntypedHandle;

    explicit AssetHandle(detail::EntryPtr entry) : HandleBase(std::move(entry)) {}
};

// =============================================================================
// UntypedHandle
// =============================================================================

/// Handle whose value type is only known at runtime
class UntypedHandle : public detail::HandleBase {
public:
    UntypedHandle() = default;

    UntypedHandle(UntypedHandle&&) noexcept = default;
    UntypedHandle& operator=(UntypedHandle&&) noexcept = default;

    /// Runtime type of the value
    [[nodiscard]] std::type_index type() const noexcept {
        return entry() ? entry()->type : std::type_index(typeid(void));
    }

    template<typename T>
    [[nodiscard]] bool is_type() const noexcept {
        return type() == std::type_index(typeid(T));
    }

    /// Value as T, or nullptr if released or of another type
    template<typename T>
    [[nodiscard]] T* get_as() const {
        return static_cast<T*>(raw_value(std::type_index(typeid(T))));
    }

    /// New typed handle on the same entry (+1 reference)
    template<typename T>
    [[nodiscard]] hoard_core::Result<AssetHandle<T>> acquire_as() const {
        if (!is_released() && entry() && !is_type<T>()) {
            return hoard_core::Err<AssetHandle<T>>(hoard_core::Error(
                hoard_core::ErrorCode::InvalidArgument,
                "Asset '" + path().str() + "' is not of the requested type"));
        }
        auto acquired = acquire_raw();
        if (!acquired) {
            return hoard_core::Err<AssetHandle<T>>(acquired.error());
        }
        return hoard_core::Ok(AssetHandle<T>(std::move(acquired).value()));
    }

    /// New untyped handle on the same entry (+1 reference)
    [[nodiscard]] hoard_core::Result<UntypedHandle> acquire() const {
        auto acquired = acquire_raw();
        if (!acquired) {
            return hoard_core::Err<UntypedHandle>(acquired.error());
        }
        return hoard_core::Ok(UntypedHandle(std::move(acquired).value()));
    }

private:
    friend class AssetManager;

    explicit UntypedHandle(detail::EntryPtr entry) : HandleBase(std::move(entry)) {}
};

} // namespace hoard_asset
