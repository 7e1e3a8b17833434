// Copyright (c) 2026 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_VLEPROJECT_MICROCOSM_2026_THREAD_HPP
#define ORG_VLEPROJECT_MICROCOSM_2026_THREAD_HPP

#include <microcosm/macros.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mcm {

//! A task must not throw: errors are reported through the result slots the
//! task writes into.
using task = std::function<void(void)>;

class task_list;
class worker;
class task_pool;

/**
 * A batch oriented task list. Tasks are added while the list accepts them,
 * @c submit() starts the execution of the batch and @c wait_completion()
 * blocks the producer until every task of the batch is done.
 */
class task_list
{
public:
    task_list() noexcept { m_pending.reserve(64); }

    //! Append a task to the next batch. The allocation of the task may
    //! throw.
    template<typename Fn>
    void add(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping || m_phase != phase::accepting)
            return;
        m_pending.emplace_back(std::forward<Fn>(fn));
        m_tasks_submitted += 1;
    }

    void submit() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping || m_phase != phase::accepting)
                return;
            m_batch_size = static_cast<u32>(m_pending.size());
            m_next_index = 0;
            m_completed  = 0;
            m_phase = (m_batch_size == 0) ? phase::accepting : phase::executing;
        }
        m_worker_cv.notify_all();
    }

    //! Wait for a task of the current batch. Returns false when the list
    //! is shutting down.
    bool pop(task& out) noexcept
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_worker_cv.wait(lock, [&] {
            return m_stopping ||
                   (m_phase == phase::executing && m_next_index < m_batch_size);
        });

        if (m_stopping)
            return false;

        out = std::move(m_pending[m_next_index++]);
        return true;
    }

    void notify_done() noexcept
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_phase != phase::executing)
            return;
        ++m_completed;
        m_tasks_completed += 1;
        if (m_completed >= m_batch_size) {
            m_phase = phase::accepting;
            m_pending.clear();
            m_producer_cv.notify_all();
        }
    }

    void wait_completion() noexcept
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_producer_cv.wait(lock, [&] {
            return m_stopping || m_phase == phase::accepting;
        });
    }

    void shutdown() noexcept
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
            m_phase    = phase::shutting_down;
        }
        m_worker_cv.notify_all();
        m_producer_cv.notify_all();
    }

    bool stopping() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stopping;
    }

    u64 tasks_submitted() const noexcept { return m_tasks_submitted; }
    u64 tasks_completed() const noexcept { return m_tasks_completed; }

private:
    enum class phase : u8 { accepting, executing, shutting_down };

    std::vector<task> m_pending;

    u64 m_tasks_submitted{ 0 };
    u64 m_tasks_completed{ 0 };
    u32 m_batch_size{ 0 };
    u32 m_next_index{ 0 };
    u32 m_completed{ 0 };

    mutable std::mutex      m_mutex;
    std::condition_variable m_worker_cv;   // for workers (batch available)
    std::condition_variable m_producer_cv; // for producers (batch done)

    phase m_phase{ phase::accepting };
    bool  m_stopping{ false };
};

class worker
{
public:
    explicit worker(task_list& list) noexcept
      : m_list(&list)
    {}

    worker(worker&& other) noexcept
      : m_list(other.m_list)
      , m_thread(std::move(other.m_thread))
      , m_tasks_completed(other.m_tasks_completed)
      , m_execution_time(other.m_execution_time)
    {}

    void start() noexcept
    {
        m_thread = std::thread([this] {
            task t;
            while (m_list->pop(t)) {
                const auto start = std::chrono::steady_clock::now();
                t();
                m_execution_time +=
                  (std::chrono::steady_clock::now() - start).count();
                m_tasks_completed += 1;
                m_list->notify_done();
            }
        });
    }

    void join() noexcept
    {
        if (m_thread.joinable())
            m_thread.join();
    }

    u64 tasks_completed() const noexcept { return m_tasks_completed; }

    std::chrono::nanoseconds::rep execution_time() const noexcept
    {
        return m_execution_time;
    }

private:
    task_list*  m_list;
    std::thread m_thread;

    u64                           m_tasks_completed{ 0 };
    std::chrono::nanoseconds::rep m_execution_time{ 0 };
};

/**
 * A bounded pool of workers sharing one @c task_list. The pool is started
 * by the constructor and joined by the destructor.
 *
 * @code
 * task_pool pool(4);
 * for (auto& slot : slots)
 *     pool.list().add([&slot] { slot.run(); });
 * pool.run();
 * @endcode
 */
class task_pool
{
public:
    explicit task_pool(unsigned worker_count)
    {
        const auto n = std::clamp(
          worker_count, 1u, std::max(1u, std::thread::hardware_concurrency()));

        m_workers.reserve(n);
        for (unsigned i = 0; i < n; ++i)
            m_workers.emplace_back(m_list);

        for (auto& w : m_workers)
            w.start();
    }

    ~task_pool() noexcept
    {
        m_list.shutdown();
        for (auto& w : m_workers)
            w.join();
    }

    task_pool(const task_pool&)            = delete;
    task_pool& operator=(const task_pool&) = delete;

    task_list& list() noexcept { return m_list; }

    //! Submit the pending tasks and wait until all are done.
    void run() noexcept
    {
        m_list.submit();
        m_list.wait_completion();
    }

    sz size() const noexcept { return m_workers.size(); }

    u64 tasks_completed() const noexcept { return m_list.tasks_completed(); }

private:
    task_list           m_list;
    std::vector<worker> m_workers;
};

} // namespace mcm

#endif
