#pragma once

/// @file task_pool.hpp
/// @brief Bounded worker pool with priority scheduling

#include "types.hpp"
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace hoard_asset {

// =============================================================================
// AsyncTaskPool
// =============================================================================

/// Fixed-size thread pool. Queued tasks run highest priority first, FIFO
/// within one priority.
class AsyncTaskPool {
public:
    using Task = std::function<void()>;

    /// Create pool with the given number of workers (at least one)
    explicit AsyncTaskPool(std::size_t num_threads = 4);

    /// Runs remaining queued tasks, then joins the workers
    ~AsyncTaskPool();

    AsyncTaskPool(const AsyncTaskPool&) = delete;
    AsyncTaskPool& operator=(const AsyncTaskPool&) = delete;

    /// Queue a task. Returns false once the pool is shutting down.
    bool submit(Task task, LoadPriority priority = LoadPriority::Normal);

    /// Number of tasks queued or running
    [[nodiscard]] std::size_t pending_count() const;

    /// Number of worker threads
    [[nodiscard]] std::size_t thread_count() const noexcept { return m_threads.size(); }

    /// Block until nothing is queued or running
    void wait_all();

    /// Stop accepting work, drain the queue and join workers. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_shutdown() const noexcept { return m_stop.load(); }

private:
    static constexpr std::size_t k_priority_levels = 5;

    void worker_thread();

    std::vector<std::thread> m_threads;
    std::array<std::deque<Task>, k_priority_levels> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    std::atomic<bool> m_stop{false};
    std::size_t m_pending = 0;
    std::once_flag m_join_once;
};

} // namespace hoard_asset
