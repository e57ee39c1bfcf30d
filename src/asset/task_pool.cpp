/// @file task_pool.cpp
/// @brief AsyncTaskPool implementation

#include <hoard/asset/task_pool.hpp>
#include <hoard/core/log.hpp>
#include <algorithm>

namespace hoard_asset {

AsyncTaskPool::AsyncTaskPool(std::size_t num_threads) {
    num_threads = std::max<std::size_t>(num_threads, 1);
    m_threads.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&AsyncTaskPool::worker_thread, this);
    }
}

AsyncTaskPool::~AsyncTaskPool() {
    shutdown();
}

bool AsyncTaskPool::submit(Task task, LoadPriority priority) {
    {
        std::lock_guard lock(m_mutex);
        if (m_stop) {
            return false;
        }
        auto level = std::min<std::size_t>(static_cast<std::size_t>(priority), k_priority_levels - 1);
        m_tasks[level].push_back(std::move(task));
        ++m_pending;
    }
    m_condition.notify_one();
    return true;
}

std::size_t AsyncTaskPool::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_pending;
}

void AsyncTaskPool::wait_all() {
    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

void AsyncTaskPool::shutdown() {
    std::call_once(m_join_once, [this] {
        {
            std::lock_guard lock(m_mutex);
            m_stop = true;
        }
        m_condition.notify_all();

        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    });
}

void AsyncTaskPool::worker_thread() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            auto has_work = [this] {
                return std::any_of(m_tasks.begin(), m_tasks.end(),
                    [](const std::deque<Task>& q) { return !q.empty(); });
            };
            m_condition.wait(lock, [this, &has_work] {
                return m_stop || has_work();
            });

            if (m_stop && !has_work()) {
                return;
            }

            for (auto& queue : m_tasks) {
                if (!queue.empty()) {
                    task = std::move(queue.front());
                    queue.pop_front();
                    break;
                }
            }
        }

        try {
            task();
        } catch (const std::exception& e) {
            hoard_core::asset_logger()->error("Task pool task threw: {}", e.what());
        } catch (...) {
            hoard_core::asset_logger()->error("Task pool task threw an unknown exception");
        }

        {
            std::lock_guard lock(m_mutex);
            --m_pending;
        }
        m_done_condition.notify_all();
    }
}

} // namespace hoard_asset
