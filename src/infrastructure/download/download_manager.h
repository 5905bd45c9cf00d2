/**
 * @file download_manager.h
 * @brief modelrt - Download Manager (internal)
 *
 * One DownloadTask per model id transfers the artifact on the worker pool.
 * Every caller of fetch() gets its own DownloadSubscription; subscriptions of
 * the same id share the task. Each subscription buffers at most `capacity`
 * progress events: when its consumer lags, the oldest byte-progress events
 * are dropped (the sequence gap shows it). The terminal result is never
 * dropped.
 */

#ifndef MRT_DOWNLOAD_MANAGER_H
#define MRT_DOWNLOAD_MANAGER_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/progress_event.h"
#include "core/worker_pool.h"
#include "infrastructure/download/http_transport.h"
#include "infrastructure/model_management/model_registry.h"
#include "infrastructure/model_management/model_store.h"
#include "mrt/core/mrt_error.h"
#include "mrt/infrastructure/download/mrt_download.h"

namespace mrt {

class DownloadTask;

class DownloadSubscription {
   public:
    DownloadSubscription(std::string model_id, size_t capacity);

    const std::string& model_id() const { return model_id_; }

    // MRT_SUCCESS with an event or *out_finished, MRT_ERROR_TIMEOUT otherwise
    mrt_result_t next(int32_t timeout_ms, ProgressEvent* out, bool* out_finished);

    // MRT_SUCCESS once finished, MRT_ERROR_TIMEOUT otherwise
    mrt_result_t wait(int32_t timeout_ms);

    // The fetch's result; MRT_ERROR_INVALID_STATE while running
    mrt_result_t result(ModelArtifact* out) const;

    mrt_download_state_t state() const;
    std::string error_message() const;
    uint64_t dropped_events() const;

    // Cancels the shared transfer and waits for it to stop
    mrt_result_t cancel();

    // Detaches from the task; the transfer continues for other subscribers
    void release();

   private:
    friend class DownloadTask;
    friend class DownloadManager;

    void push(const ProgressEvent& event);
    void finish(mrt_result_t result, const ModelArtifact& artifact, const std::string& message);

    std::string model_id_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    uint64_t dropped_ = 0;
    bool finished_ = false;
    mrt_result_t result_ = MRT_SUCCESS;
    ModelArtifact artifact_;
    std::string message_;
    std::shared_ptr<DownloadTask> task_;
};

class DownloadTask {
   public:
    DownloadTask(ModelDescriptor descriptor, uint64_t first_sequence);

    const ModelDescriptor& descriptor() const { return descriptor_; }

    void attach(const std::shared_ptr<DownloadSubscription>& subscription);
    void detach(const DownloadSubscription* subscription);

    void request_cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

    // Assigns the next sequence number and fans the event out
    ProgressEvent publish_bytes(int64_t downloaded, int64_t total);

    void finish(mrt_result_t result, const ModelArtifact& artifact, const std::string& message);
    void wait_done();

    uint64_t last_sequence() const { return sequence_.load(); }

   private:
    ModelDescriptor descriptor_;
    std::atomic<uint64_t> sequence_;
    std::atomic<bool> cancelled_{false};

    std::mutex mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
    std::vector<std::shared_ptr<DownloadSubscription>> subscribers_;
};

class DownloadManager {
   public:
    struct Options {
        size_t queue_capacity = 64;
        int64_t persist_interval_bytes = 4 * 1024 * 1024;
    };

    DownloadManager(ModelRegistry& registry, ModelStore& store, WorkerPool& pool,
                    std::shared_ptr<HttpTransport> transport, const EventDispatcher& events,
                    Options options);

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * @brief Start or join the fetch of a model
     *
     * @return MRT_SUCCESS, MRT_ERROR_MODEL_NOT_FOUND, MRT_ERROR_INVALID_STATE
     *         after cancel_all()
     */
    mrt_result_t fetch(const std::string& model_id, std::shared_ptr<DownloadSubscription>* out);

    bool is_active(const std::string& model_id) const;
    size_t active_count() const;

    // Cancels every transfer, waits for them, and refuses new fetches
    void cancel_all();

   private:
    void run_task(const std::shared_ptr<DownloadTask>& task);
    mrt_result_t transfer(DownloadTask& task, ModelArtifact* out_artifact);
    void complete(const std::shared_ptr<DownloadTask>& task, mrt_result_t result,
                  const ModelArtifact& artifact, const std::string& message);

    ModelRegistry& registry_;
    ModelStore& store_;
    WorkerPool& pool_;
    std::shared_ptr<HttpTransport> transport_;
    const EventDispatcher& events_;
    Options options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DownloadTask>> tasks_;
    std::map<std::string, uint64_t> sequences_;
    bool stopped_ = false;
};

}  // namespace mrt

#endif  // MRT_DOWNLOAD_MANAGER_H
