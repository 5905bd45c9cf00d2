/**
 * @file worker_pool.cpp
 * @brief modelrt - Worker Pool Implementation
 */

#include "worker_pool.h"

#include <algorithm>

#include "mrt/core/mrt_logger.h"

namespace mrt {

// =============================================================================
// WORKER POOL
// =============================================================================

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) {
        threads = default_size();
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    MRT_LOG_DEBUG("WorkerPool", "Started %zu workers", threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

size_t WorkerPool::default_size() {
    size_t hw = std::thread::hardware_concurrency();
    return std::min<size_t>(8, std::max<size_t>(2, hw));
}

bool WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

bool WorkerPool::is_worker_thread() const {
    auto self = std::this_thread::get_id();
    for (const auto& worker : workers_) {
        if (worker.get_id() == self) {
            return true;
        }
    }
    return false;
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

// =============================================================================
// SERIAL QUEUE
// =============================================================================

bool SerialQueue::post(std::function<void()> task) {
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        if (!running_) {
            running_ = true;
            start = true;
        }
    }
    if (!start) {
        return true;
    }

    auto self = shared_from_this();
    if (!pool_.post([self] { self->drain_one(); })) {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.pop_back();
        running_ = false;
        return false;
    }
    return true;
}

void SerialQueue::hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
}

void SerialQueue::resume(std::function<void()> continuation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
        if (continuation) {
            tasks_.push_front(std::move(continuation));
        }
        if (in_task_) {
            // The holding task has not returned yet; drain_one moves on
            return;
        }
        if (tasks_.empty()) {
            running_ = false;
            return;
        }
    }
    schedule();
}

size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SerialQueue::schedule() {
    auto self = shared_from_this();
    if (!pool_.post([self] { self->drain_one(); })) {
        // Pool is draining for shutdown: run the rest inline
        self->drain_one();
    }
}

void SerialQueue::drain_one() {
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task = std::move(tasks_.front());
        tasks_.pop_front();
        in_task_ = true;
    }

    task();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_task_ = false;
        if (held_) {
            return;
        }
        if (tasks_.empty()) {
            running_ = false;
            return;
        }
    }
    schedule();
}

}  // namespace mrt
