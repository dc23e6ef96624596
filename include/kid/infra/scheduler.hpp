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
 * @file scheduler.hpp
 * @brief Fixed-size worker pool.
 *
 * @details
 * This header defines the `Scheduler` class, a producer-consumer thread pool.
 * The uniqueness checker and the concurrency tests use it to drive many
 * concurrent callers against one `IdGenerator`.
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

namespace kid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Completion:** `wait_idle()` blocks until the queue is empty and no task is running.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (e.g. when
     * `std::thread::hardware_concurrency()` cannot detect the core count) falls
     * back to a single worker.
     */
    explicit Scheduler(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue, then joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @code
     * scheduler.enqueue([&gen, &out] {
     *     for (auto& id : out) id = gen.generate();
     * });
     * @endcode
     */
    void enqueue(std::function<void()> task);

    /// @brief Blocks until every task enqueued so far has finished.
    void wait_idle();

    /// @brief Number of tasks that have exited with an exception so far.
    std::size_t failed() const { return failed_.load(); }

    /// @brief Number of worker threads.
    std::size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers for new tasks or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_;

    /// @brief Tasks currently executing.
    std::size_t active_;

    std::atomic<std::size_t> failed_;

    std::atomic<bool> stop_;
};

} // namespace kid::infra
