/// @file streaming.cpp
/// @brief StreamingManager implementation

#include <hoard/asset/streaming.hpp>
#include <hoard/asset/manager.hpp>
#include <hoard/core/log.hpp>
#include <algorithm>

namespace hoard_asset {

StreamingManager::StreamingManager(AssetManager& manager)
    : m_manager(manager) {}

StreamingManager::~StreamingManager() {
    dispose();
}

// =============================================================================
// Queueing
// =============================================================================

hoard_core::Result<void> StreamingManager::queue_untyped(const std::string& path, std::type_index type) {
    if (is_disposed()) {
        return hoard_core::Err(AssetError::disposed("StreamingManager"));
    }
    if (AssetPath(path).empty()) {
        return hoard_core::Err(AssetError::invalid_argument("streaming path must not be empty"));
    }
    if (m_manager.is_loaded(path)) {
        return hoard_core::Ok();
    }

    {
        std::lock_guard lock(m_mutex);
        if (m_disposed) {
            return hoard_core::Err(AssetError::disposed("StreamingManager"));
        }
        m_queue.push_back(QueuedAsset{path, type});
        ++m_total;
    }
    m_work_cv.notify_one();
    return hoard_core::Ok();
}

hoard_core::Result<std::size_t> StreamingManager::queue_many_untyped(
    const std::vector<std::string>& paths, std::type_index type)
{
    for (const auto& path : paths) {
        if (AssetPath(path).empty()) {
            return hoard_core::Err<std::size_t>(AssetError::invalid_argument("streaming path must not be empty"));
        }
    }

    std::size_t queued = 0;
    for (const auto& path : paths) {
        bool loaded = m_manager.is_loaded(path);
        auto result = queue_untyped(path, type);
        if (!result) {
            return hoard_core::Err<std::size_t>(result.error());
        }
        if (!loaded) {
            ++queued;
        }
    }
    return hoard_core::Ok(queued);
}

// =============================================================================
// Control
// =============================================================================

void StreamingManager::start(std::size_t max_concurrent) {
    std::lock_guard control(m_control_mutex);
    {
        std::lock_guard lock(m_mutex);
        if (m_disposed || m_streaming) {
            return;
        }
    }

    // Workers of a finished session exit on their own
    for (auto& worker : m_workers) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    m_workers.clear();

    std::stop_token token;
    {
        std::lock_guard lock(m_mutex);
        if (m_queue.empty()) {
            hoard_core::streaming_logger()->debug("Streaming start ignored: queue is empty");
            return;
        }
        m_streaming = true;
        m_stop_source = std::stop_source();
        token = m_stop_source.get_token();
        hoard_core::streaming_logger()->info("Streaming {} asset(s) with {} worker(s)",
            m_queue.size(), std::max<std::size_t>(max_concurrent, 1));
    }

    std::size_t count = std::max<std::size_t>(max_concurrent, 1);
    for (std::size_t i = 0; i < count; ++i) {
        m_workers.emplace_back(&StreamingManager::worker_thread, this, token);
    }
}

void StreamingManager::stop() {
    std::lock_guard control(m_control_mutex);
    {
        std::lock_guard lock(m_mutex);
        m_stop_source.request_stop();
        m_queue.clear();
    }
    m_work_cv.notify_all();

    for (auto& worker : m_workers) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    m_workers.clear();

    bool was_streaming = false;
    {
        std::lock_guard lock(m_mutex);
        was_streaming = m_streaming;
        m_streaming = false;
        m_total = 0;
        m_completed = 0;
    }
    m_idle_cv.notify_all();

    if (was_streaming) {
        hoard_core::streaming_logger()->info("Streaming stopped");
    }
}

void StreamingManager::clear() {
    {
        std::lock_guard lock(m_mutex);
        m_queue.clear();
        m_total = 0;
        m_completed = 0;
    }
    m_work_cv.notify_all();
    m_idle_cv.notify_all();
}

void StreamingManager::dispose() {
    {
        std::lock_guard lock(m_mutex);
        if (m_disposed) {
            return;
        }
    }
    stop();
    clear();
    release_streamed();
    {
        std::lock_guard lock(m_mutex);
        m_disposed = true;
    }
}

void StreamingManager::release_streamed() {
    std::vector<UntypedHandle> handles;
    {
        std::lock_guard lock(m_mutex);
        handles.swap(m_streamed);
    }
    handles.clear();
}

// =============================================================================
// Worker
// =============================================================================

void StreamingManager::worker_thread(std::stop_token token) {
    while (true) {
        QueuedAsset item{{}, std::type_index(typeid(void))};
        {
            std::unique_lock lock(m_mutex);
            m_work_cv.wait(lock, token, [this] {
                return !m_streaming || !m_queue.empty() || m_active == 0;
            });
            if (token.stop_requested() || !m_streaming) {
                return;
            }
            if (m_queue.empty()) {
                // Drained: the first worker to notice closes the session
                m_streaming = false;
                m_completing = true;
                m_total = 0;
                m_completed = 0;
                lock.unlock();

                m_work_cv.notify_all();
                hoard_core::streaming_logger()->info("Streaming complete");
                StreamingCompleteCallback on_complete;
                {
                    std::lock_guard cb_lock(m_callback_mutex);
                    on_complete = m_on_complete;
                }
                if (on_complete) {
                    on_complete();
                }

                lock.lock();
                m_completing = false;
                lock.unlock();
                m_idle_cv.notify_all();
                return;
            }
            item = std::move(m_queue.front());
            m_queue.pop_front();
            ++m_active;
        }

        auto result = m_manager.load_untyped_async(item.path, item.type, LoadPriority::Streaming, token).get();

        if (result) {
            {
                std::lock_guard lock(m_mutex);
                m_streamed.push_back(std::move(result).value());
                ++m_completed;
            }
            AssetStreamedCallback on_streamed;
            {
                std::lock_guard cb_lock(m_callback_mutex);
                on_streamed = m_on_streamed;
            }
            if (on_streamed) {
                on_streamed(item.path);
            }
        } else if (result.error().code() == hoard_core::ErrorCode::Cancelled) {
            std::lock_guard lock(m_mutex);
            ++m_completed;
        } else {
            hoard_core::streaming_logger()->warn("Streaming '{}' failed: {}",
                item.path, result.error().message());
            {
                std::lock_guard lock(m_mutex);
                ++m_completed;
            }
            StreamingErrorCallback on_error;
            {
                std::lock_guard cb_lock(m_callback_mutex);
                on_error = m_on_error;
            }
            if (on_error) {
                on_error(item.path, result.error());
            }
        }

        {
            std::lock_guard lock(m_mutex);
            --m_active;
        }
        m_work_cv.notify_all();
        m_idle_cv.notify_all();
    }
}

// =============================================================================
// State
// =============================================================================

float StreamingManager::progress_locked() const {
    if (idle_locked() && !m_streaming) {
        return 1.0f;
    }
    if (m_total == 0) {
        return 0.0f;
    }
    float ratio = static_cast<float>(m_completed) / static_cast<float>(m_total);
    return std::min(ratio, 1.0f);
}

float StreamingManager::progress() const {
    std::lock_guard lock(m_mutex);
    return progress_locked();
}

bool StreamingManager::is_streaming() const {
    std::lock_guard lock(m_mutex);
    return m_streaming;
}

std::size_t StreamingManager::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_queue.size();
}

std::size_t StreamingManager::streamed_count() const {
    std::lock_guard lock(m_mutex);
    return m_streamed.size();
}

bool StreamingManager::is_disposed() const {
    std::lock_guard lock(m_mutex);
    return m_disposed;
}

bool StreamingManager::finished_locked() const {
    return !m_streaming && !m_completing && progress_locked() >= 1.0f;
}

bool StreamingManager::wait_for_completion(std::stop_token token) {
    std::unique_lock lock(m_mutex);
    return m_idle_cv.wait(lock, token, [this] { return finished_locked(); });
}

bool StreamingManager::wait_for_completion_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(m_mutex);
    return m_idle_cv.wait_for(lock, timeout, [this] { return finished_locked(); });
}

// =============================================================================
// Events
// =============================================================================

void StreamingManager::set_on_asset_streamed(AssetStreamedCallback callback) {
    std::lock_guard lock(m_callback_mutex);
    m_on_streamed = std::move(callback);
}

void StreamingManager::set_on_streaming_error(StreamingErrorCallback callback) {
    std::lock_guard lock(m_callback_mutex);
    m_on_error = std::move(callback);
}

void StreamingManager::set_on_streaming_complete(StreamingCompleteCallback callback) {
    std::lock_guard lock(m_callback_mutex);
    m_on_complete = std::move(callback);
}

} // namespace hoard_asset
