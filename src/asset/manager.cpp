/// @file manager.cpp
/// @brief AssetManager implementation
///
/// Lock order: table (m_table_mutex) -> pending load -> cache entry.
/// Loader calls, value disposal and user callbacks run with no lock held.

#include <hoard/asset/manager.hpp>
#include <hoard/core/log.hpp>
#include <algorithm>
#include <fstream>

namespace hoard_asset {

using hoard_core::Err;
using hoard_core::Error;
using hoard_core::ErrorCode;
using hoard_core::Ok;
using hoard_core::Result;

namespace detail {

// =============================================================================
// Single-flight bookkeeping
// =============================================================================

/// One caller waiting for an in-flight load
struct LoadWaiter {
    explicit LoadWaiter(std::function<void(Result<EntryPtr>)> fn)
        : deliver(std::move(fn)) {}

    std::function<void(Result<EntryPtr>)> deliver;
    std::atomic<bool> settled{false};

    /// Deliver once; later calls are ignored
    bool settle(Result<EntryPtr> result) {
        if (settled.exchange(true)) {
            return false;
        }
        deliver(std::move(result));
        return true;
    }
};

using CancelRegistration = std::stop_callback<std::function<void()>>;

/// An in-flight load shared by every waiter for one path
struct PendingLoad {
    PendingLoad(AssetPath p, std::type_index t, LoadPriority pr)
        : path(std::move(p)), type(t), priority(pr) {}

    AssetPath path;
    std::type_index type;
    LoadPriority priority;

    std::mutex mutex;
    std::stop_source stop_source;
    std::vector<std::shared_ptr<LoadWaiter>> waiters;
    std::vector<std::unique_ptr<CancelRegistration>> registrations;
    bool completed = false;
    std::uint32_t attempts = 1;
};

// =============================================================================
// Handle entry points
// =============================================================================

void release_entry(const EntryPtr& entry) {
    AssetManager* owner = nullptr;
    {
        std::lock_guard lock(entry->mutex);
        owner = entry->owner;
    }
    if (owner == nullptr) {
        return;
    }
    owner->release_entry(entry);
}

Result<void> acquire_entry(const EntryPtr& entry) {
    AssetManager* owner = nullptr;
    {
        std::lock_guard lock(entry->mutex);
        owner = entry->owner;
    }
    if (owner == nullptr) {
        return Err(hoard_core::HandleError::stale());
    }
    return owner->acquire_entry(entry);
}

} // namespace detail

namespace {

void no_delete(void*) {}

ErasedValue empty_value() {
    return ErasedValue(nullptr, &no_delete);
}

} // anonymous namespace

struct AssetManager::Admission {
    std::optional<Result<detail::EntryPtr>> immediate;
    std::shared_ptr<detail::LoadWaiter> waiter;
    PendingPtr pending;
    bool owner = false;
};

// =============================================================================
// Construction
// =============================================================================

AssetManager::AssetManager(AssetManagerConfig config)
    : m_config(std::move(config))
{
    if (m_config.max_concurrent_loads == 0) {
        m_config.max_concurrent_loads = 1;
    }
    m_pool = std::make_unique<AsyncTaskPool>(m_config.max_concurrent_loads);

    hoard_core::asset_logger()->debug("AssetManager created (root '{}', policy {}, {} load workers)",
        m_config.root_path, cache_policy_name(m_config.cache_policy), m_config.max_concurrent_loads);
}

AssetManager::~AssetManager() {
    dispose();
}

Result<void> AssetManager::register_builtin_loaders() {
    auto text = register_loader(std::make_shared<TextLoader>());
    if (!text) {
        return text;
    }
    return register_loader(std::make_shared<BytesLoader>());
}

std::filesystem::path AssetManager::resolve(const AssetPath& path) const {
    return std::filesystem::path(m_config.root_path) / path.str();
}

std::string AssetManager::type_name_for(std::type_index type) const {
    if (auto loader = m_loaders.find_by_type(type)) {
        return loader->type_name();
    }
    return type.name();
}

// =============================================================================
// Loading
// =============================================================================

Result<detail::EntryPtr> AssetManager::load_entry_sync(
    const AssetPath& path, std::type_index type, LoadPriority priority)
{
    {
        std::lock_guard lock(m_sync_mutex);
        if (m_disposed) {
            return Err<detail::EntryPtr>(AssetError::disposed("AssetManager"));
        }
        ++m_active_sync;
    }

    struct SyncScope {
        AssetManager& self;
        ~SyncScope() {
            {
                std::lock_guard lock(self.m_sync_mutex);
                --self.m_active_sync;
            }
            self.m_sync_idle.notify_all();
        }
    } scope{*this};

    if (path.empty()) {
        return Err<detail::EntryPtr>(AssetError::invalid_argument("asset path must not be empty"));
    }

    auto promise = std::make_shared<std::promise<Result<detail::EntryPtr>>>();
    auto future = promise->get_future();

    Admission admission = admit(path, type, priority,
        [promise](Result<detail::EntryPtr> result) {
            promise->set_value(std::move(result));
        });

    if (admission.immediate) {
        return std::move(*admission.immediate);
    }
    if (admission.owner) {
        run_load(admission.pending, LoadMode::Sync);
    }
    return future.get();
}

void AssetManager::load_entry_async(
    const AssetPath& path, std::type_index type, LoadPriority priority,
    std::stop_token token, Deliver deliver)
{
    if (m_disposed) {
        deliver(Err<detail::EntryPtr>(AssetError::disposed("AssetManager")));
        return;
    }
    if (path.empty()) {
        deliver(Err<detail::EntryPtr>(AssetError::invalid_argument("asset path must not be empty")));
        return;
    }

    Admission admission = admit(path, type, priority, std::move(deliver));
    if (admission.immediate) {
        admission.waiter->settle(std::move(*admission.immediate));
        return;
    }

    watch_cancellation(admission.pending, admission.waiter, path, std::move(token));

    if (admission.owner) {
        submit_load(admission.pending);
    }
}

std::future<Result<UntypedHandle>> AssetManager::load_untyped_async(
    const std::string& path,
    std::type_index type,
    std::optional<LoadPriority> priority,
    std::stop_token token)
{
    auto promise = std::make_shared<std::promise<Result<UntypedHandle>>>();
    auto future = promise->get_future();
    load_entry_async(AssetPath(path), type, priority.value_or(m_config.default_priority), std::move(token),
        [promise](Result<detail::EntryPtr> result) {
            if (!result) {
                promise->set_value(Err<UntypedHandle>(result.error()));
            } else {
                promise->set_value(Ok(UntypedHandle(std::move(result).value())));
            }
        });
    return future;
}

AssetManager::Admission AssetManager::admit(
    const AssetPath& path, std::type_index type, LoadPriority priority, Deliver deliver)
{
    Admission admission;
    admission.waiter = std::make_shared<detail::LoadWaiter>(std::move(deliver));

    {
        std::shared_lock lock(m_table_mutex);
        auto it = m_entries.find(path.key());
        if (it != m_entries.end()) {
            admission.immediate = take_hit(it->second, type);
            return admission;
        }
    }

    std::unique_lock lock(m_table_mutex);

    // Another caller may have stored it in between
    auto it = m_entries.find(path.key());
    if (it != m_entries.end()) {
        admission.immediate = take_hit(it->second, type);
        return admission;
    }

    auto pending_it = m_pending.find(path.key());
    if (pending_it != m_pending.end()) {
        const PendingPtr& pending = pending_it->second;
        if (pending->type != type) {
            admission.immediate = Err<detail::EntryPtr>(
                AssetError::unsupported_format(path.str(), type_name_for(type)));
            return admission;
        }
        std::lock_guard pending_lock(pending->mutex);
        pending->waiters.push_back(admission.waiter);
        admission.pending = pending;
        ++m_joined_loads;
        return admission;
    }

    ++m_cache_misses;

    auto pending = std::make_shared<detail::PendingLoad>(path, type, priority);
    pending->waiters.push_back(admission.waiter);
    m_pending.emplace(path.key(), pending);
    admission.pending = std::move(pending);
    admission.owner = true;

    hoard_core::asset_logger()->debug("Cache miss for '{}'", path.str());
    return admission;
}

Result<detail::EntryPtr> AssetManager::take_hit(const detail::EntryPtr& entry, std::type_index type) {
    std::lock_guard lock(entry->mutex);
    if (entry->type != type) {
        return Err<detail::EntryPtr>(AssetError::unsupported_format(entry->path.str(), type_name_for(type)));
    }
    ++entry->ref_count;
    entry->last_access = next_access_tick();
    ++m_cache_hits;
    return Ok(entry);
}

void AssetManager::watch_cancellation(
    const PendingPtr& pending, const std::shared_ptr<detail::LoadWaiter>& waiter,
    const AssetPath& path, std::stop_token token)
{
    if (!token.stop_possible()) {
        return;
    }

    std::weak_ptr<detail::PendingLoad> weak_pending = pending;
    std::weak_ptr<detail::LoadWaiter> weak_waiter = waiter;

    // Runs on the cancelling thread (or right here if already cancelled)
    std::function<void()> on_cancel = [weak_pending, weak_waiter, path]() {
        auto cancelled_waiter = weak_waiter.lock();
        if (!cancelled_waiter ||
            !cancelled_waiter->settle(Err<detail::EntryPtr>(AssetError::cancelled(path.str())))) {
            return;
        }

        auto shared = weak_pending.lock();
        if (!shared) {
            return;
        }

        std::optional<std::stop_source> abort;
        {
            std::lock_guard lock(shared->mutex);
            if (shared->completed) {
                return;
            }
            bool all_settled = std::all_of(shared->waiters.begin(), shared->waiters.end(),
                [](const std::shared_ptr<detail::LoadWaiter>& w) { return w->settled.load(); });
            if (all_settled) {
                abort = shared->stop_source;
            }
        }

        if (abort) {
            hoard_core::asset_logger()->debug("Every waiter cancelled, aborting load of '{}'", path.str());
            abort->request_stop();
        }
    };

    auto registration = std::make_unique<detail::CancelRegistration>(std::move(token), std::move(on_cancel));

    std::unique_ptr<detail::CancelRegistration> discard;
    {
        std::lock_guard lock(pending->mutex);
        if (pending->completed) {
            discard = std::move(registration);
        } else {
            pending->registrations.push_back(std::move(registration));
        }
    }
}

void AssetManager::submit_load(const PendingPtr& pending) {
    bool queued = m_pool->submit([this, pending] {
        run_load(pending, LoadMode::Async);
    }, pending->priority);

    if (!queued) {
        complete_load(pending, Err<ErasedAsset>(AssetError::disposed("AssetManager")));
    }
}

void AssetManager::run_load(const PendingPtr& pending, LoadMode mode) {
    std::stop_token token;
    {
        std::lock_guard lock(pending->mutex);
        token = pending->stop_source.get_token();
    }

    if (token.stop_requested() || m_disposed) {
        complete_load(pending, Err<ErasedAsset>(AssetError::cancelled(pending->path.str())));
        return;
    }

    complete_load(pending, guarded_invoke(pending->path, pending->type, token, mode));
}

Result<ErasedAsset> AssetManager::guarded_invoke(
    const AssetPath& path, std::type_index type, std::stop_token token, LoadMode mode)
{
    // The pending load must always complete, or its waiters hang
    try {
        return invoke_loader(path, type, std::move(token), mode);
    } catch (const std::exception& e) {
        Error error = hoard_core::error_from_exception(e, ErrorCode::IOError);
        error.with_context("path", path.str());
        return Err<ErasedAsset>(std::move(error));
    }
}

Result<ErasedAsset> AssetManager::invoke_loader(
    const AssetPath& path, std::type_index type, std::stop_token token, LoadMode mode)
{
    auto file = resolve(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return Err<ErasedAsset>(AssetError::file_not_found(path.str()));
    }

    auto loader = m_loaders.find(path.extension(), type);
    if (!loader) {
        return Err<ErasedAsset>(AssetError::unsupported_format(path.str(), type_name_for(type)));
    }

    std::ifstream stream(file, std::ios::binary);
    if (!stream) {
        Error error(ErrorCode::IOError, "Failed to open asset file: " + file.string());
        error.with_context("path", path.str());
        return Err<ErasedAsset>(std::move(error));
    }

    AssetLoadContext ctx(path, this, m_config.services);

    try {
        auto result = loader->load_erased(stream, ctx, token, mode);
        if (result) {
            return result;
        }
        if (result.error().code() == ErrorCode::Cancelled || token.stop_requested()) {
            return Err<ErasedAsset>(AssetError::cancelled(path.str()));
        }
        return Err<ErasedAsset>(AssetError::parse_error(path.str(), result.error()));
    } catch (const std::exception& e) {
        return Err<ErasedAsset>(AssetError::parse_error(
            path.str(), hoard_core::error_from_exception(e, ErrorCode::Unknown)));
    } catch (...) {
        return Err<ErasedAsset>(AssetError::parse_error(
            path.str(), Error(ErrorCode::Unknown, "unknown exception")));
    }
}

void AssetManager::complete_load(const PendingPtr& pending, Result<ErasedAsset> result) {
    const AssetPath& path = pending->path;
    const bool cancelled = !result && result.error().code() == ErrorCode::Cancelled;

    std::vector<std::shared_ptr<detail::LoadWaiter>> to_deliver;
    std::vector<std::unique_ptr<detail::CancelRegistration>> registrations;
    detail::EntryPtr entry;
    ErasedValue dropped = empty_value();
    bool restart = false;

    {
        std::unique_lock table_lock(m_table_mutex);
        std::lock_guard pending_lock(pending->mutex);

        // Callers that joined while the load was being aborted still want it
        if (cancelled && !m_disposed) {
            restart = std::any_of(pending->waiters.begin(), pending->waiters.end(),
                [](const std::shared_ptr<detail::LoadWaiter>& w) { return !w->settled.load(); });
        }

        if (restart) {
            pending->stop_source = std::stop_source();
            ++pending->attempts;
        } else {
            auto it = m_pending.find(path.key());
            if (it != m_pending.end() && it->second == pending) {
                m_pending.erase(it);
            }
            pending->completed = true;
            registrations = std::move(pending->registrations);
            auto waiters = std::move(pending->waiters);

            if (result) {
                ErasedAsset& asset = result.value();
                entry = std::make_shared<detail::CacheEntry>();
                entry->id = AssetId(m_next_id++);
                entry->path = path;
                entry->type = pending->type;
                entry->type_name = type_name_for(pending->type);
                entry->value = std::move(asset.value);
                entry->size_bytes = asset.size_bytes;
                entry->last_access = next_access_tick();
                entry->state = LoadState::Loaded;
                entry->owner = this;

                for (auto& waiter : waiters) {
                    if (!waiter->settled.exchange(true)) {
                        ++entry->ref_count;
                        to_deliver.push_back(waiter);
                    }
                }

                if (entry->ref_count == 0 && m_config.cache_policy == CachePolicy::Aggressive) {
                    dropped = std::move(entry->value);
                    entry->owner = nullptr;
                    entry->state = LoadState::Unloaded;
                    m_last_state[path.key()] = LoadState::Unloaded;
                } else {
                    m_entries[path.key()] = entry;
                    m_total_size += entry->size_bytes;
                    m_last_state.erase(path.key());
                }
            } else {
                for (auto& waiter : waiters) {
                    if (!waiter->settled.exchange(true)) {
                        to_deliver.push_back(waiter);
                    }
                }
                if (!cancelled) {
                    ++m_failed_loads;
                    m_last_state[path.key()] = LoadState::Failed;
                }
            }
        }
    }

    if (restart) {
        hoard_core::asset_logger()->debug("Restarting aborted load of '{}' (attempt {})",
            path.str(), pending->attempts);
        submit_load(pending);
        return;
    }

    // May wait for a cancel callback running on another thread
    registrations.clear();
    dropped.reset();

    if (result) {
        debug::record_loader_operation(true, entry->size_bytes);
        hoard_core::asset_logger()->debug("Loaded '{}' ({} bytes, {} waiter(s))",
            path.str(), entry->size_bytes, to_deliver.size());

        if (m_config.cache_policy == CachePolicy::LRU && m_total_size.load() > m_config.max_cache_bytes) {
            trim_cache(m_config.max_cache_bytes);
        }

        for (auto& waiter : to_deliver) {
            waiter->deliver(Ok(entry));
        }
        return;
    }

    const Error& error = result.error();
    if (cancelled) {
        hoard_core::asset_logger()->debug("Load of '{}' cancelled", path.str());
    } else {
        debug::record_loader_operation(false);
        hoard_core::debug::record_error(error);
        hoard_core::log_error(spdlog::level::warn, "hoard_asset", "Failed to load '" + path.str() + "'", error);
        forget_dependencies(path);
        if (error.code() != ErrorCode::Disposed) {
            report_load_error(path, error);
        }
    }

    for (auto& waiter : to_deliver) {
        waiter->deliver(Err<detail::EntryPtr>(error));
    }
}

void AssetManager::report_load_error(const AssetPath& path, const Error& error) {
    if (!m_config.on_load_error) {
        return;
    }
    try {
        m_config.on_load_error(path.str(), error);
    } catch (const std::exception& e) {
        hoard_core::asset_logger()->error("OnLoadError callback threw for '{}': {}", path.str(), e.what());
    } catch (...) {
        hoard_core::asset_logger()->error("OnLoadError callback threw for '{}': unknown exception", path.str());
    }
}

// =============================================================================
// Reference Counting
// =============================================================================

void AssetManager::release_entry(const detail::EntryPtr& entry) {
    if (m_config.cache_policy != CachePolicy::Aggressive) {
        std::lock_guard lock(entry->mutex);
        if (entry->owner != this) {
            return;
        }
        if (entry->ref_count <= 0) {
            hoard_core::asset_logger()->warn("Reference count underflow for '{}'", entry->path.str());
            return;
        }
        --entry->ref_count;
        return;
    }

    ErasedValue dropped = empty_value();
    AssetPath path;
    {
        std::unique_lock table_lock(m_table_mutex);
        std::lock_guard lock(entry->mutex);
        if (entry->owner != this) {
            return;
        }
        if (entry->ref_count <= 0) {
            hoard_core::asset_logger()->warn("Reference count underflow for '{}'", entry->path.str());
            return;
        }
        if (--entry->ref_count > 0) {
            return;
        }

        path = entry->path;
        auto it = m_entries.find(path.key());
        if (it != m_entries.end() && it->second == entry) {
            m_entries.erase(it);
        }
        dropped = detach_locked(entry);
    }

    dropped.reset();
    forget_dependencies(path);
    hoard_core::asset_logger()->debug("Disposed '{}' (last reference released)", path.str());
}

Result<void> AssetManager::acquire_entry(const detail::EntryPtr& entry) {
    std::lock_guard lock(entry->mutex);
    if (entry->owner != this || entry->state != LoadState::Loaded) {
        return Err(hoard_core::HandleError::stale());
    }
    ++entry->ref_count;
    entry->last_access = next_access_tick();
    return Ok();
}

ErasedValue AssetManager::detach_locked(const detail::EntryPtr& entry) {
    entry->owner = nullptr;
    entry->state = LoadState::Unloaded;
    m_total_size -= entry->size_bytes;
    m_last_state[entry->path.key()] = LoadState::Unloaded;
    return std::move(entry->value);
}

// =============================================================================
// Queries
// =============================================================================

bool AssetManager::is_loaded(const std::string& path) const {
    AssetPath asset_path(path);
    std::shared_lock lock(m_table_mutex);
    return m_entries.find(asset_path.key()) != m_entries.end();
}

LoadState AssetManager::state_of(const std::string& path) const {
    AssetPath asset_path(path);
    std::shared_lock lock(m_table_mutex);
    if (m_entries.find(asset_path.key()) != m_entries.end()) {
        return LoadState::Loaded;
    }
    if (m_pending.find(asset_path.key()) != m_pending.end()) {
        return LoadState::Loading;
    }
    auto it = m_last_state.find(asset_path.key());
    return it != m_last_state.end() ? it->second : LoadState::Empty;
}

std::int64_t AssetManager::ref_count(const std::string& path) const {
    AssetPath asset_path(path);
    std::shared_lock lock(m_table_mutex);
    auto it = m_entries.find(asset_path.key());
    if (it == m_entries.end()) {
        return 0;
    }
    std::lock_guard entry_lock(it->second->mutex);
    return it->second->ref_count;
}

CacheStats AssetManager::get_cache_stats() const {
    CacheStats stats;
    {
        std::shared_lock lock(m_table_mutex);
        stats.loaded_assets = m_entries.size();
        stats.pending_assets = m_pending.size();
    }
    stats.total_assets = stats.loaded_assets + stats.pending_assets;
    stats.failed_assets = static_cast<std::size_t>(m_failed_loads.load());
    stats.total_size_bytes = m_total_size.load();
    stats.max_size_bytes = m_config.max_cache_bytes;
    stats.cache_hits = m_cache_hits.load();
    stats.cache_misses = m_cache_misses.load();
    stats.joined_loads = m_joined_loads.load();
    return stats;
}

AssetManifest AssetManager::export_manifest() const {
    std::vector<AssetInfo> infos;
    {
        std::shared_lock lock(m_table_mutex);
        infos.reserve(m_entries.size());
        for (const auto& [key, entry] : m_entries) {
            std::lock_guard entry_lock(entry->mutex);
            AssetInfo info;
            info.path = entry->path.str();
            info.type = entry->type_name;
            info.size = entry->size_bytes;
            infos.push_back(std::move(info));
        }
    }

    std::sort(infos.begin(), infos.end(),
        [](const AssetInfo& a, const AssetInfo& b) { return a.path < b.path; });

    AssetManifest manifest;
    for (auto& info : infos) {
        auto deps = dependencies_of(info.path);
        if (!deps.empty()) {
            info.dependencies = std::move(deps);
        }
        manifest.add(std::move(info));
    }
    return manifest;
}

// =============================================================================
// Dependencies
// =============================================================================

void AssetManager::record_dependency(const AssetPath& parent, const AssetPath& dependency) {
    if (m_disposed || parent.empty() || dependency.empty()) {
        return;
    }
    std::lock_guard lock(m_deps_mutex);
    m_dependencies[parent].insert(dependency);
}

void AssetManager::forget_dependencies(const AssetPath& parent) {
    std::lock_guard lock(m_deps_mutex);
    m_dependencies.erase(parent);
}

std::vector<std::string> AssetManager::dependencies_of(const std::string& parent_path) const {
    std::vector<std::string> result;
    std::lock_guard lock(m_deps_mutex);
    auto it = m_dependencies.find(AssetPath(parent_path));
    if (it != m_dependencies.end()) {
        for (const auto& dep : it->second) {
            result.push_back(dep.str());
        }
    }
    return result;
}

std::vector<std::string> AssetManager::dependents_of(const std::string& path) const {
    AssetPath target(path);
    std::vector<std::string> result;
    std::lock_guard lock(m_deps_mutex);
    for (const auto& [parent, deps] : m_dependencies) {
        if (deps.count(target) > 0) {
            result.push_back(parent.str());
        }
    }
    return result;
}

// =============================================================================
// Cache Control
// =============================================================================

Result<void> AssetManager::unload(const std::string& path) {
    if (m_disposed) {
        return Err(AssetError::disposed("AssetManager"));
    }

    AssetPath asset_path(path);
    ErasedValue dropped = empty_value();
    bool removed = false;
    {
        std::unique_lock lock(m_table_mutex);
        auto it = m_entries.find(asset_path.key());
        if (it != m_entries.end()) {
            detail::EntryPtr entry = it->second;
            m_entries.erase(it);
            std::lock_guard entry_lock(entry->mutex);
            dropped = detach_locked(entry);
            removed = true;
        }
    }

    if (removed) {
        dropped.reset();
        forget_dependencies(asset_path);
        hoard_core::asset_logger()->debug("Unloaded '{}'", asset_path.str());
    }
    return Ok();
}

Result<void> AssetManager::unload_all() {
    if (m_disposed) {
        return Err(AssetError::disposed("AssetManager"));
    }
    std::size_t count = drop_all_entries();
    hoard_core::asset_logger()->debug("Unloaded all assets ({})", count);
    return Ok();
}

std::size_t AssetManager::drop_all_entries() {
    std::vector<ErasedValue> dropped;
    {
        std::unique_lock lock(m_table_mutex);
        dropped.reserve(m_entries.size());
        for (auto& [key, entry] : m_entries) {
            std::lock_guard entry_lock(entry->mutex);
            dropped.push_back(detach_locked(entry));
        }
        m_entries.clear();
    }
    {
        std::lock_guard lock(m_deps_mutex);
        m_dependencies.clear();
    }
    std::size_t count = dropped.size();
    dropped.clear();
    return count;
}

std::int64_t AssetManager::trim_cache(std::int64_t target_bytes) {
    if (m_disposed || m_config.cache_policy != CachePolicy::LRU) {
        return 0;
    }
    target_bytes = std::max<std::int64_t>(target_bytes, 0);

    std::vector<ErasedValue> dropped;
    std::vector<AssetPath> evicted;
    std::int64_t freed = 0;
    {
        std::unique_lock lock(m_table_mutex);
        if (m_total_size.load() <= target_bytes) {
            return 0;
        }

        std::vector<std::pair<std::uint64_t, detail::EntryPtr>> candidates;
        for (const auto& [key, entry] : m_entries) {
            std::lock_guard entry_lock(entry->mutex);
            if (entry->ref_count == 0) {
                candidates.emplace_back(entry->last_access, entry);
            }
        }
        std::sort(candidates.begin(), candidates.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        for (auto& [access, entry] : candidates) {
            if (m_total_size.load() <= target_bytes) {
                break;
            }
            std::lock_guard entry_lock(entry->mutex);
            if (entry->ref_count != 0) {
                continue;
            }
            freed += entry->size_bytes;
            evicted.push_back(entry->path);
            m_entries.erase(entry->path.key());
            dropped.push_back(detach_locked(entry));
        }
    }

    dropped.clear();
    for (const auto& path : evicted) {
        forget_dependencies(path);
        hoard_core::asset_logger()->debug("Evicted '{}'", path.str());
    }
    if (!evicted.empty()) {
        hoard_core::log_structured(spdlog::level::debug, "hoard_asset", "Trimmed cache", {
            {"target_bytes", std::to_string(target_bytes)},
            {"evicted", std::to_string(evicted.size())},
            {"freed_bytes", std::to_string(freed)},
        });
    }
    return freed;
}

// =============================================================================
// Reload
// =============================================================================

std::future<void> AssetManager::reload_async(const std::string& path) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    AssetPath asset_path(path);
    detail::EntryPtr entry;
    if (!m_disposed && !asset_path.empty()) {
        std::shared_lock lock(m_table_mutex);
        auto it = m_entries.find(asset_path.key());
        if (it != m_entries.end()) {
            entry = it->second;
        }
    }

    if (!entry) {
        promise->set_value();
        return future;
    }

    bool queued = m_pool->submit([this, entry, promise] {
        run_reload(entry);
        promise->set_value();
    }, LoadPriority::High);

    if (!queued) {
        promise->set_value();
    }
    return future;
}

void AssetManager::run_reload(const detail::EntryPtr& entry) {
    std::lock_guard reload_lock(entry->reload_mutex);

    AssetPath path;
    std::type_index type{typeid(void)};
    {
        std::lock_guard lock(entry->mutex);
        if (entry->owner != this || entry->state != LoadState::Loaded) {
            return;
        }
        path = entry->path;
        type = entry->type;
    }
    if (m_disposed) {
        return;
    }

    auto result = guarded_invoke(path, type, m_dispose_source.get_token(), LoadMode::Async);
    if (!result) {
        const Error& error = result.error();
        if (error.code() == ErrorCode::Cancelled) {
            hoard_core::asset_logger()->debug("Reload of '{}' cancelled", path.str());
            return;
        }
        hoard_core::debug::record_error(error);
        hoard_core::log_error(spdlog::level::warn, "hot_reload",
            "Reload of '" + path.str() + "' failed, keeping previous value", error);
        report_load_error(path, error);
        return;
    }

    ErasedValue previous = empty_value();
    std::uint32_t generation = 0;
    bool swapped = false;
    {
        std::lock_guard lock(entry->mutex);
        if (entry->owner == this && entry->state == LoadState::Loaded) {
            ErasedAsset& fresh = result.value();
            previous = std::move(entry->value);
            entry->value = std::move(fresh.value);
            m_total_size += fresh.size_bytes - entry->size_bytes;
            entry->size_bytes = fresh.size_bytes;
            generation = ++entry->generation;
            swapped = true;
        }
    }
    previous.reset();

    if (!swapped) {
        hoard_core::reload_logger()->debug("'{}' left the cache during reload", path.str());
        return;
    }

    hoard_core::reload_logger()->info("Reloaded '{}' (generation {})", path.str(), generation);

    std::vector<AssetReloadedCallback> listeners;
    {
        std::lock_guard lock(m_listener_mutex);
        for (const auto& [id, callback] : m_reload_listeners) {
            listeners.push_back(callback);
        }
    }
    for (const auto& listener : listeners) {
        try {
            listener(path.str());
        } catch (const std::exception& e) {
            hoard_core::reload_logger()->error("Reload listener threw for '{}': {}", path.str(), e.what());
        } catch (...) {
            hoard_core::reload_logger()->error("Reload listener threw for '{}': unknown exception", path.str());
        }
    }

    if (m_config.cache_policy == CachePolicy::LRU && m_total_size.load() > m_config.max_cache_bytes) {
        trim_cache(m_config.max_cache_bytes);
    }
}

// =============================================================================
// Events
// =============================================================================

ListenerId AssetManager::on_asset_reloaded(AssetReloadedCallback callback) {
    std::lock_guard lock(m_listener_mutex);
    ListenerId id{m_next_listener_id++};
    m_reload_listeners.emplace(id.id, std::move(callback));
    return id;
}

bool AssetManager::remove_listener(ListenerId id) {
    std::lock_guard lock(m_listener_mutex);
    return m_reload_listeners.erase(id.id) > 0;
}

// =============================================================================
// Lifecycle
// =============================================================================

void AssetManager::dispose() {
    HOARD_LOG_SCOPE("AssetManager::dispose", "hoard_asset");
    {
        std::lock_guard lock(m_sync_mutex);
        if (m_disposed.exchange(true)) {
            return;
        }
    }

    hoard_core::asset_logger()->debug("Disposing AssetManager");

    std::vector<std::stop_source> in_flight;
    {
        std::shared_lock lock(m_table_mutex);
        for (const auto& [key, pending] : m_pending) {
            std::lock_guard pending_lock(pending->mutex);
            in_flight.push_back(pending->stop_source);
        }
    }
    for (auto& source : in_flight) {
        source.request_stop();
    }
    m_dispose_source.request_stop();

    // Queued loads drain as Cancelled; running ones finish
    m_pool->shutdown();

    {
        std::unique_lock lock(m_sync_mutex);
        m_sync_idle.wait(lock, [this] { return m_active_sync == 0; });
    }

    std::size_t count = drop_all_entries();

    {
        std::lock_guard lock(m_listener_mutex);
        m_reload_listeners.clear();
    }

    hoard_core::asset_logger()->debug("AssetManager disposed ({} cached assets released)", count);
}

} // namespace hoard_asset
