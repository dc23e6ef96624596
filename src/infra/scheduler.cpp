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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Workers block on a condition variable, pop tasks under the queue mutex and run
 * them outside it. A counter of running tasks lets callers wait for the pool to
 * drain without tearing it down.
 */

#include "kid/infra/scheduler.hpp"

#include "kid/infra/logger.hpp"

#include <exception>
#include <string>
#include <utility>

namespace kid::infra {

Scheduler::Scheduler(std::size_t threads) : active_(0), failed_(0), stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker thread event loop.
 *
 * Exits only once the scheduler is stopping AND the queue is empty, so tasks
 * submitted before destruction always run.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                failed_.fetch_add(1);
                Logger::log(LogLevel::ERROR, "Scheduler: task failed: " + std::string(e.what()));
            }
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    // notify_one() avoids waking the whole pool for a single task.
    condition_.notify_one();
}

void Scheduler::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
}

} // namespace kid::infra
