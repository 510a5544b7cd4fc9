/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool with a blocking fan-out.
 *
 * The pool size is the in-flight bound of a poll cycle: at most that many
 * device exchanges run at once.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kasad {
namespace core {

/**
 * @class WorkerPool
 * @brief Persistent workers draining a task queue.
 *
 * Usage:
 * @code
 * WorkerPool pool(8);
 * std::vector<std::function<void()>> tasks;
 * for (size_t i = 0; i < records.size(); ++i) {
 *     tasks.push_back([&, i] { outcomes[i] = client.poll(records[i]); });
 * }
 * pool.runAll(std::move(tasks));   // returns when every task has run
 * @endcode
 */
class KASAD_CORE_API WorkerPool {
public:
    explicit WorkerPool(size_t threads);

    /**
     * @brief Destructor - lets queued tasks finish and joins the workers.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue one task. Ignored once the pool is shutting down.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Run every task on the pool and wait for all of them.
     *
     * Tasks must not throw; an exception escaping a task is logged and
     * counted as finished.
     */
    void runAll(std::vector<std::function<void()>> tasks);

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};

    void workerLoop();
};

}  // namespace core
}  // namespace kasad
