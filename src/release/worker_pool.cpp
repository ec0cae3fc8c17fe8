/// @file worker_pool.cpp
/// @brief WorkerPool implementation

#include <addon_forge/release/worker_pool.hpp>
#include <addon_forge/core/log.hpp>

#include <algorithm>
#include <exception>

namespace forge_release {

std::size_t WorkerPool::resolve_thread_count(std::size_t requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

WorkerPool::WorkerPool(std::size_t num_threads) {
    num_threads = resolve_thread_count(num_threads);
    m_threads.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&WorkerPool::worker_thread, this);
    }
}

WorkerPool::~WorkerPool() {
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
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push_back(std::move(task));
        ++m_pending;
    }
    m_condition.notify_one();
}

std::size_t WorkerPool::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_pending;
}

void WorkerPool::wait_all() {
    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

void WorkerPool::worker_thread() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] {
                return m_stop || !m_tasks.empty();
            });

            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            forge_core::release_logger()->error("Worker task threw: {}", e.what());
        } catch (...) {
            forge_core::release_logger()->error("Worker task threw a non-standard exception");
        }

        {
            std::lock_guard lock(m_mutex);
            --m_pending;
        }
        m_done_condition.notify_all();
    }
}

} // namespace forge_release
