#pragma once

/// @file streaming.hpp
/// @brief Background bulk preloading on top of AssetManager

#include "fwd.hpp"
#include "types.hpp"
#include "handle.hpp"
#include <hoard/core/error.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <typeindex>
#include <vector>

namespace hoard_asset {

using AssetStreamedCallback = std::function<void(const std::string& path)>;
using StreamingErrorCallback = std::function<void(const std::string& path, const hoard_core::Error& error)>;
using StreamingCompleteCallback = std::function<void()>;

// =============================================================================
// StreamingManager
// =============================================================================

/// Queue of assets to preload in the background.
///
/// Workers call AssetManager::load_untyped_async with LoadPriority::Streaming.
/// Every streamed asset keeps one handle here until release_streamed() or
/// dispose(). Failures are reported per item and never stop the batch.
class StreamingManager {
public:
    explicit StreamingManager(AssetManager& manager);

    /// Calls dispose()
    ~StreamingManager();

    StreamingManager(const StreamingManager&) = delete;
    StreamingManager& operator=(const StreamingManager&) = delete;

    // =========================================================================
    // Queueing
    // =========================================================================

    /// Queue a path unless it is already loaded
    template<typename T>
    hoard_core::Result<void> queue(const std::string& path) {
        return queue_untyped(path, std::type_index(typeid(T)));
    }

    /// Queue several paths. Returns how many were queued (loaded ones are skipped).
    template<typename T>
    hoard_core::Result<std::size_t> queue_many(const std::vector<std::string>& paths) {
        return queue_many_untyped(paths, std::type_index(typeid(T)));
    }

    hoard_core::Result<void> queue_untyped(const std::string& path, std::type_index type);

    hoard_core::Result<std::size_t> queue_many_untyped(
        const std::vector<std::string>& paths, std::type_index type);

    // =========================================================================
    // Control
    // =========================================================================

    /// Start draining with at most `max_concurrent` loads at once.
    /// No-op while already streaming or with an empty queue.
    void start(std::size_t max_concurrent = 2);

    /// Cancel in-flight loads, drop queued items and join workers. Idempotent.
    void stop();

    /// Empty the queue and reset progress
    void clear();

    /// stop() + clear() + release_streamed(). Idempotent.
    void dispose();

    /// Release the handles of streamed assets
    void release_streamed();

    // =========================================================================
    // State
    // =========================================================================

    /// 1.0 when idle, otherwise completed / queued for this session
    [[nodiscard]] float progress() const;

    [[nodiscard]] bool is_streaming() const;

    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] std::size_t streamed_count() const;

    [[nodiscard]] bool is_disposed() const;

    /// Block until the session is over and its complete callback has run.
    /// Returns false if `token` fired first.
    bool wait_for_completion(std::stop_token token = {});

    /// Same as wait_for_completion, giving up after `timeout`
    bool wait_for_completion_for(std::chrono::milliseconds timeout);

    // =========================================================================
    // Events
    // =========================================================================

    void set_on_asset_streamed(AssetStreamedCallback callback);
    void set_on_streaming_error(StreamingErrorCallback callback);
    void set_on_streaming_complete(StreamingCompleteCallback callback);

private:
    struct QueuedAsset {
        std::string path;
        std::type_index type;
    };

    void worker_thread(std::stop_token token);
    [[nodiscard]] bool idle_locked() const { return m_queue.empty() && m_active == 0; }
    [[nodiscard]] float progress_locked() const;
    [[nodiscard]] bool finished_locked() const;

    AssetManager& m_manager;

    mutable std::mutex m_mutex;
    std::condition_variable_any m_work_cv;
    std::condition_variable_any m_idle_cv;
    std::deque<QueuedAsset> m_queue;
    std::size_t m_active = 0;
    std::size_t m_total = 0;
    std::size_t m_completed = 0;
    bool m_streaming = false;
    bool m_completing = false;  // Complete callback running
    bool m_disposed = false;
    std::vector<UntypedHandle> m_streamed;

    std::stop_source m_stop_source;
    std::vector<std::thread> m_workers;
    std::mutex m_control_mutex;

    mutable std::mutex m_callback_mutex;
    AssetStreamedCallback m_on_streamed;
    StreamingErrorCallback m_on_error;
    StreamingCompleteCallback m_on_complete;
};

} // namespace hoard_asset
