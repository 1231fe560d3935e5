/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool used to drive concurrent generation workloads.
 *
 * @details
 * The `WorkerPool` runs many producers against one shared `Generator` so that
 * contention on the generator lock can be exercised from the `mid64 stress`
 * command and from the concurrency tests. Producers submit tasks with `enqueue()`
 * and wait for all of them with `drain()`.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mid64::infra {

/**
 * @class WorkerPool
 * @brief A thread-safe worker pool with a completion barrier.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `drain()` sleeps until the queue is empty and no worker is busy.
 */
class WorkerPool {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (as `hardware_concurrency()` may report)
     * is raised to one.
     */
    explicit WorkerPool(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Finishes every queued task, then joins the workers.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @throws std::runtime_error if the pool is shutting down.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Blocks until every task enqueued so far has finished running.
     */
    void drain();

    /// @brief Number of worker threads owned by the pool.
    size_t size() const { return workers_.size(); }

    /**
     * @brief Number of tasks that exited with an exception since construction.
     *
     * A failed task is logged and its worker keeps serving the queue; callers that
     * need every task to succeed check this after `drain()`.
     */
    size_t failed_tasks() const { return failed_.load(std::memory_order_relaxed); }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_`, `active_` and `stop_`.
    std::mutex mutex_;

    /// @brief Signals workers that a task arrived or shutdown began.
    std::condition_variable work_available_;

    /// @brief Signals `drain()` waiters that the pool went idle.
    std::condition_variable idle_;

    /// @brief Tasks currently executing outside the lock.
    size_t active_ = 0;

    std::atomic<size_t> failed_{0};

    bool stop_ = false;
};

} // namespace mid64::infra
