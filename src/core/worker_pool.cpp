/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/core/worker_pool.hpp"
#include "kasad/utils/logger.hpp"

#include <exception>
#include <memory>

namespace kasad {
namespace core {

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        stop_.store(true);
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_.load()) {
            return;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::runAll(std::vector<std::function<void()>> tasks) {
    if (tasks.empty()) {
        return;
    }

    struct Latch {
        std::mutex mutex;
        std::condition_variable done;
        size_t remaining;
    };
    auto latch = std::make_shared<Latch>();
    latch->remaining = tasks.size();

    for (auto& task : tasks) {
        enqueue([latch, work = std::move(task)]() {
            try {
                work();
            } catch (const std::exception& e) {
                LOG_ERROR("WorkerPool", "Task failed: {}", e.what());
            } catch (...) {
                LOG_ERROR("WorkerPool", "Task failed with a non-standard exception");
            }
            std::lock_guard<std::mutex> lock(latch->mutex);
            if (--latch->remaining == 0) {
                latch->done.notify_all();
            }
        });
    }

    std::unique_lock<std::mutex> lock(latch->mutex);
    latch->done.wait(lock, [&latch] { return latch->remaining == 0; });
}

void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] { return stop_.load() || !tasks_.empty(); });
            if (stop_.load() && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

}  // namespace core
}  // namespace kasad
