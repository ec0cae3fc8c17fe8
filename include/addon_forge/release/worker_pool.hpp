#pragma once

/// @file worker_pool.hpp
/// @brief Bounded thread pool used to run per-addon units of work

#include "fwd.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace forge_release {

/// Fixed-size thread pool
///
/// Tasks have no ordering guarantees. wait_all() returns once every submitted
/// task has finished; the destructor drains remaining tasks before joining.
class WorkerPool {
public:
    using Task = std::function<void()>;

    /// Create pool with @p num_threads workers (0 selects the hardware concurrency)
    explicit WorkerPool(std::size_t num_threads = 0);

    /// Destructor - waits for all tasks to complete
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a task for execution
    void submit(Task task);

    /// Get number of submitted tasks that have not finished
    [[nodiscard]] std::size_t pending_count() const;

    /// Get number of worker threads
    [[nodiscard]] std::size_t thread_count() const noexcept { return m_threads.size(); }

    /// Wait for all tasks to complete
    void wait_all();

    /// Resolve a requested job count (0 -> hardware concurrency, at least 1)
    [[nodiscard]] static std::size_t resolve_thread_count(std::size_t requested) noexcept;

private:
    void worker_thread();

    std::vector<std::thread> m_threads;
    std::deque<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    bool m_stop = false;
    std::size_t m_pending = 0;
};

} // namespace forge_release
