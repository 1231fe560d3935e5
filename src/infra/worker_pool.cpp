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
 * @file worker_pool.cpp
 * @brief Implementation of the producer-consumer worker pool.
 */

#include "mid64/infra/worker_pool.hpp"

#include "mid64/infra/logger.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace mid64::infra {

WorkerPool::WorkerPool(size_t threads)
{
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool()
{
    {
        // No new tasks are accepted past this point.
        std::unique_lock<std::mutex> lock(mutex_);
        stop_ = true;
    }

    work_available_.notify_all();

    // Blocks until every worker has emptied the queue and returned.
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * Workers exit only once `stop_` is set AND the queue is empty, so tasks queued
 * before destruction still run.
 */
void WorkerPool::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            // Counted as active before the lock drops, so drain() cannot see an idle pool
            // while this task is still pending.
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }
        // --- End Critical Section ---

        // Runs outside the lock so other workers can pick up tasks.
        try {
            if (task) {
                task();
            }
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            Logger::log(LogLevel::ERROR, "WorkerPool: task failed: " + std::string(e.what()));
        }

        // --- Critical Section: Completion ---
        {
            std::unique_lock<std::mutex> lock(mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_.notify_all();
            }
        }
        // --- End Critical Section ---
    }
}

void WorkerPool::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("WorkerPool: enqueue on a stopped pool");
        }
        tasks_.emplace(std::move(task));
    }

    // notify_one: a single task needs a single worker.
    work_available_.notify_one();
}

void WorkerPool::drain()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

} // namespace mid64::infra
