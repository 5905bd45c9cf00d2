/**
 * @file worker_pool.h
 * @brief modelrt - Worker Pool
 *
 * Bounded pool of worker threads on which every backend-crossing operation
 * runs (download transfers, backend steps). SerialQueue runs its tasks one at
 * a time, in submission order, on top of the pool; it serializes requests
 * against the same loaded model without pinning a thread to it.
 */

#ifndef MRT_WORKER_POOL_H
#define MRT_WORKER_POOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mrt {

class WorkerPool {
   public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown() has begun
    bool post(std::function<void()> task);

    // Runs every queued task, then joins the workers
    void shutdown();

    size_t size() const { return workers_.size(); }

    // True when called from one of this pool's threads
    bool is_worker_thread() const;

    static size_t default_size();

   private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

class SerialQueue : public std::enable_shared_from_this<SerialQueue> {
   public:
    explicit SerialQueue(WorkerPool& pool) : pool_(pool) {}

    // Returns false when the pool no longer accepts work
    bool post(std::function<void()> task);

    /**
     * @brief Keep the queue occupied after the running task returns
     *
     * Only valid from inside a task. Later tasks wait until resume(), but no
     * worker thread is held meanwhile.
     */
    void hold();

    // Ends a hold; continuation (if any) runs before the other queued tasks
    void resume(std::function<void()> continuation);

    size_t pending() const;

   private:
    void drain_one();
    void schedule();

    WorkerPool& pool_;
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> tasks_;
    bool running_ = false;
    bool in_task_ = false;
    bool held_ = false;
};

}  // namespace mrt

#endif  // MRT_WORKER_POOL_H
