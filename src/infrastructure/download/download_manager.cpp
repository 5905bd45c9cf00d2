/**
 * @file download_manager.cpp
 * @brief modelrt - Download Manager Implementation
 *
 * Transfer flow for one model:
 *   probe -> staging record -> (resume | restart) -> capacity check ->
 *   ranged GET into <id>.part -> SHA-256 -> rename into place
 */

#include "infrastructure/download/download_manager.h"

#include <cerrno>
#include <chrono>
#include <cstdio>

#include "core/runtime_context.h"
#include "infrastructure/download/checksum.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

template <typename Predicate>
bool wait_for(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, int32_t timeout_ms,
              Predicate pred) {
    if (timeout_ms < 0) {
        cv.wait(lock, pred);
        return true;
    }
    return cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), pred);
}

std::string details_or(mrt_result_t rc) {
    const char* details = mrt_error_get_details();
    return (details != nullptr && details[0] != '\0') ? std::string(details)
                                                      : std::string(mrt_error_message(rc));
}

struct FileCloser {
    void operator()(FILE* f) const {
        if (f) fclose(f);
    }
};

using FilePtr = std::unique_ptr<FILE, FileCloser>;

}  // namespace

// =============================================================================
// SUBSCRIPTION
// =============================================================================

DownloadSubscription::DownloadSubscription(std::string model_id, size_t capacity)
    : model_id_(std::move(model_id)), capacity_(capacity == 0 ? 1 : capacity) {}

void DownloadSubscription::push(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(event);
    }
    cv_.notify_all();
}

void DownloadSubscription::finish(mrt_result_t result, const ModelArtifact& artifact,
                                  const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return;
        }
        finished_ = true;
        result_ = result;
        artifact_ = artifact;
        message_ = message;
        task_.reset();
    }
    cv_.notify_all();
}

mrt_result_t DownloadSubscription::next(int32_t timeout_ms, ProgressEvent* out,
                                        bool* out_finished) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = wait_for(cv_, lock, timeout_ms, [this] { return !queue_.empty() || finished_; });
    if (!ready) {
        return MRT_ERROR_TIMEOUT;
    }
    if (!queue_.empty()) {
        *out = std::move(queue_.front());
        queue_.pop_front();
        *out_finished = false;
        return MRT_SUCCESS;
    }
    *out_finished = true;
    return MRT_SUCCESS;
}

mrt_result_t DownloadSubscription::wait(int32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return wait_for(cv_, lock, timeout_ms, [this] { return finished_; }) ? MRT_SUCCESS
                                                                         : MRT_ERROR_TIMEOUT;
}

mrt_result_t DownloadSubscription::result(ModelArtifact* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_) {
        return MRT_ERROR_INVALID_STATE;
    }
    if (out != nullptr && result_ == MRT_SUCCESS) {
        *out = artifact_;
    }
    return result_;
}

mrt_download_state_t DownloadSubscription::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!finished_) {
        return MRT_DOWNLOAD_STATE_RUNNING;
    }
    if (result_ == MRT_SUCCESS) {
        return MRT_DOWNLOAD_STATE_COMPLETED;
    }
    return result_ == MRT_ERROR_CANCELLED ? MRT_DOWNLOAD_STATE_CANCELLED
                                          : MRT_DOWNLOAD_STATE_FAILED;
}

std::string DownloadSubscription::error_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

uint64_t DownloadSubscription::dropped_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

mrt_result_t DownloadSubscription::cancel() {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return MRT_SUCCESS;
        }
        task = task_;
    }
    if (task) {
        task->request_cancel();
        task->wait_done();
    }
    return MRT_SUCCESS;
}

void DownloadSubscription::release() {
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task = std::move(task_);
    }
    if (task) {
        task->detach(this);
    }
}

// =============================================================================
// TASK
// =============================================================================

DownloadTask::DownloadTask(ModelDescriptor descriptor, uint64_t first_sequence)
    : descriptor_(std::move(descriptor)), sequence_(first_sequence) {}

void DownloadTask::attach(const std::shared_ptr<DownloadSubscription>& subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
}

void DownloadTask::detach(const DownloadSubscription* subscription) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->get() == subscription) {
            subscribers_.erase(it);
            return;
        }
    }
}

ProgressEvent DownloadTask::publish_bytes(int64_t downloaded, int64_t total) {
    ProgressEvent event;
    event.kind = MRT_PROGRESS_BYTES;
    event.subject_id = descriptor_.id;
    event.sequence = ++sequence_;
    event.bytes_downloaded = downloaded;
    event.bytes_total = total;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& subscriber : subscribers_) {
        subscriber->push(event);
    }
    return event;
}

void DownloadTask::finish(mrt_result_t result, const ModelArtifact& artifact,
                          const std::string& message) {
    std::vector<std::shared_ptr<DownloadSubscription>> subscribers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers.swap(subscribers_);
    }
    for (const auto& subscriber : subscribers) {
        subscriber->finish(result, artifact, message);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void DownloadTask::wait_done() {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

// =============================================================================
// MANAGER
// =============================================================================

DownloadManager::DownloadManager(ModelRegistry& registry, ModelStore& store, WorkerPool& pool,
                                 std::shared_ptr<HttpTransport> transport,
                                 const EventDispatcher& events, Options options)
    : registry_(registry),
      store_(store),
      pool_(pool),
      transport_(std::move(transport)),
      events_(events),
      options_(options) {}

mrt_result_t DownloadManager::fetch(const std::string& model_id,
                                    std::shared_ptr<DownloadSubscription>* out) {
    ModelDescriptor descriptor;
    if (!registry_.get(model_id, &descriptor)) {
        std::string details = "Model '" + model_id + "' is not registered";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_MODEL_NOT_FOUND;
    }

    auto subscription = std::make_shared<DownloadSubscription>(model_id, options_.queue_capacity);
    std::shared_ptr<DownloadTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return MRT_ERROR_INVALID_STATE;
        }

        auto it = tasks_.find(model_id);
        if (it != tasks_.end()) {
            subscription->task_ = it->second;
            it->second->attach(subscription);
            MRT_LOG_DEBUG("Download", "Attached to running fetch of '%s'", model_id.c_str());
            *out = subscription;
            return MRT_SUCCESS;
        }

        ModelArtifact artifact;
        if (store_.get(model_id, &artifact) && artifact.state == MRT_ARTIFACT_VERIFIED) {
            MRT_LOG_DEBUG("Download", "'%s' is already verified", model_id.c_str());
            subscription->finish(MRT_SUCCESS, artifact, "");
            *out = subscription;
            return MRT_SUCCESS;
        }

        task = std::make_shared<DownloadTask>(descriptor, sequences_[model_id]);
        subscription->task_ = task;
        task->attach(subscription);
        tasks_[model_id] = task;
    }

    if (!pool_.post([this, task] { run_task(task); })) {
        complete(task, MRT_ERROR_INVALID_STATE, ModelArtifact{}, "Worker pool is stopped");
    }
    *out = subscription;
    return MRT_SUCCESS;
}

bool DownloadManager::is_active(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(model_id) != 0;
}

size_t DownloadManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void DownloadManager::cancel_all() {
    std::vector<std::shared_ptr<DownloadTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (const auto& entry : tasks_) {
            tasks.push_back(entry.second);
        }
    }
    for (const auto& task : tasks) {
        task->request_cancel();
    }
    for (const auto& task : tasks) {
        task->wait_done();
    }
}

void DownloadManager::run_task(const std::shared_ptr<DownloadTask>& task) {
    const std::string& id = task->descriptor().id;
    MRT_LOG_INFO("Download", "Fetching '%s' from %s", id.c_str(), task->descriptor().url.c_str());
    mrt_error_clear_details();

    ModelArtifact artifact;
    mrt_result_t rc = task->cancelled() ? MRT_ERROR_CANCELLED : transfer(*task, &artifact);

    std::string message;
    if (rc == MRT_SUCCESS) {
        MRT_LOG_INFO("Download", "'%s' verified (%lld bytes)", id.c_str(),
                     static_cast<long long>(artifact.size_on_disk));
    } else {
        message = details_or(rc);
        if (rc == MRT_ERROR_CANCELLED) {
            MRT_LOG_INFO("Download", "'%s' cancelled", id.c_str());
        } else {
            MRT_LOG_ERROR("Download", "'%s' failed: %s (%s)", id.c_str(), mrt_error_message(rc),
                          message.c_str());
        }
    }
    complete(task, rc, artifact, message);
}

void DownloadManager::complete(const std::shared_ptr<DownloadTask>& task, mrt_result_t result,
                               const ModelArtifact& artifact, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.erase(task->descriptor().id);
        sequences_[task->descriptor().id] = task->last_sequence();
    }
    task->finish(result, artifact, message);
}

mrt_result_t DownloadManager::transfer(DownloadTask& task, ModelArtifact* out_artifact) {
    const ModelDescriptor& descriptor = task.descriptor();
    const std::string& id = descriptor.id;

    HttpProbeResult probe;
    mrt_result_t rc = transport_->probe(descriptor.url, &probe);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    int64_t total = probe.content_length > 0 ? probe.content_length : descriptor.download_size;

    ModelArtifact partial;
    rc = store_.begin_partial(descriptor, &partial);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    int64_t offset = partial.downloaded_bytes;

    if (offset > 0 && !probe.accepts_ranges) {
        MRT_LOG_INFO("Download", "Server has no range support, restarting '%s' from zero",
                     id.c_str());
        offset = 0;
    } else if (total > 0 && offset > total) {
        MRT_LOG_WARNING("Download", "Partial '%s' is larger than the artifact, restarting",
                        id.c_str());
        offset = 0;
    }
    if (offset == 0 && partial.downloaded_bytes > 0) {
        rc = store_.reset_partial(id);
        if (rc != MRT_SUCCESS) {
            return rc;
        }
    }
    if (offset > 0) {
        MRT_LOG_INFO("Download", "Resuming '%s' at byte %lld", id.c_str(),
                     static_cast<long long>(offset));
    }

    rc = store_.check_capacity(total > 0 ? total - offset : 0);
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    events_.emit(task.publish_bytes(offset, total));

    int64_t downloaded = offset;
    if (total <= 0 || offset < total) {
        const std::string staging = store_.staging_path(id);
        FilePtr file(fopen(staging.c_str(), offset > 0 ? "ab" : "wb"));
        if (!file) {
            std::string details = "Cannot open " + staging;
            mrt_error_set_details(details.c_str());
            return MRT_ERROR_FILE_IO;
        }

        int64_t last_persist = downloaded;
        int http_status = 0;
        mrt_result_t write_error = MRT_SUCCESS;

        // A lost checkpoint only costs resume progress; the transfer goes on
        auto checkpoint = [&](int64_t bytes, bool persist) {
            mrt_result_t saved = store_.record_progress(id, bytes, persist);
            if (saved != MRT_SUCCESS) {
                MRT_LOG_WARNING("Download", "Cannot checkpoint '%s' at %lld bytes: %s",
                                id.c_str(), static_cast<long long>(bytes),
                                mrt_error_message(saved));
            }
        };

        auto on_status = [&](int status) {
            http_status = status;
            if (status == 206 && downloaded > 0) {
                return true;
            }
            if (status == 200) {
                if (downloaded > 0) {
                    // Range ignored: the body is the whole artifact
                    MRT_LOG_INFO("Download", "Range not honoured for '%s', restarting from zero",
                                 id.c_str());
                    file.reset(fopen(staging.c_str(), "wb"));
                    if (!file) {
                        write_error = MRT_ERROR_FILE_IO;
                        return false;
                    }
                    downloaded = 0;
                    last_persist = 0;
                    checkpoint(0, true);
                }
                return true;
            }
            return false;
        };

        auto on_chunk = [&](const uint8_t* data, size_t size) {
            if (task.cancelled()) {
                return false;
            }
            if (fwrite(data, 1, size, file.get()) != size) {
                write_error = (errno == ENOSPC) ? MRT_ERROR_STORAGE_FULL : MRT_ERROR_FILE_IO;
                mrt_error_set_details(write_error == MRT_ERROR_STORAGE_FULL
                                          ? "No space left while writing the artifact"
                                          : "Write to staging file failed");
                return false;
            }
            downloaded += static_cast<int64_t>(size);
            bool persist = downloaded - last_persist >= options_.persist_interval_bytes;
            if (persist) {
                fflush(file.get());
                last_persist = downloaded;
            }
            checkpoint(downloaded, persist);
            events_.emit(task.publish_bytes(downloaded, total));
            return true;
        };

        rc = transport_->get(descriptor.url, offset, on_status, on_chunk);

        if (file && fflush(file.get()) != 0 && write_error == MRT_SUCCESS) {
            write_error = (errno == ENOSPC) ? MRT_ERROR_STORAGE_FULL : MRT_ERROR_FILE_IO;
        }
        file.reset();
        checkpoint(downloaded, true);

        if (write_error != MRT_SUCCESS) {
            return write_error;
        }
        if (task.cancelled()) {
            return MRT_ERROR_CANCELLED;
        }
        if (rc != MRT_SUCCESS) {
            return MRT_ERROR_NETWORK;
        }
        if (http_status < 200 || http_status >= 300) {
            std::string details = "HTTP status " + std::to_string(http_status);
            mrt_error_set_details(details.c_str());
            return MRT_ERROR_NETWORK;
        }
        if (total > 0 && downloaded < total) {
            std::string details = "Connection closed after " + std::to_string(downloaded) +
                                  " of " + std::to_string(total) + " bytes";
            mrt_error_set_details(details.c_str());
            return MRT_ERROR_NETWORK;
        }
    }

    std::string actual;
    rc = sha256_file(store_.staging_path(id), &actual);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    if (!checksum_matches(descriptor.checksum, actual)) {
        std::string details = "Checksum mismatch for '" + id + "': expected " +
                              descriptor.checksum + ", got " + actual;
        store_.discard(id);
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_INTEGRITY;
    }

    return store_.mark_verified(descriptor, out_artifact);
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

struct mrt_download {
    std::shared_ptr<mrt::DownloadSubscription> subscription;
    mrt::ProgressEvent last_event;
    std::string message;
};

extern "C" {

mrt_result_t mrt_download_start(const char* model_id, mrt_download_handle_t* out_handle) {
    if (model_id == nullptr || out_handle == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    std::shared_ptr<mrt::DownloadSubscription> subscription;
    mrt_result_t rc = ctx->downloads().fetch(model_id, &subscription);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    auto* handle = new mrt_download();
    handle->subscription = std::move(subscription);
    *out_handle = handle;
    return MRT_SUCCESS;
}

mrt_result_t mrt_download_next(mrt_download_handle_t handle, int32_t timeout_ms,
                               mrt_progress_event_t* out_event, mrt_bool_t* out_finished) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (out_event == nullptr || out_finished == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    bool finished = false;
    mrt::ProgressEvent event;
    mrt_result_t rc = handle->subscription->next(timeout_ms, &event, &finished);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    *out_finished = finished ? MRT_TRUE : MRT_FALSE;
    if (!finished) {
        handle->last_event = std::move(event);
        mrt::to_c_event(handle->last_event, out_event);
    }
    return MRT_SUCCESS;
}

mrt_result_t mrt_download_wait(mrt_download_handle_t handle, int32_t timeout_ms) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->subscription->wait(timeout_ms);
}

mrt_result_t mrt_download_result(mrt_download_handle_t handle,
                                 mrt_model_artifact_t* out_artifact) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    mrt::ModelArtifact artifact;
    mrt_result_t rc = handle->subscription->result(&artifact);
    if (rc == MRT_SUCCESS && out_artifact != nullptr) {
        mrt::artifact_to_c(artifact, out_artifact);
    }
    return rc;
}

mrt_download_state_t mrt_download_get_state(mrt_download_handle_t handle) {
    if (handle == nullptr) {
        return MRT_DOWNLOAD_STATE_FAILED;
    }
    return handle->subscription->state();
}

const char* mrt_download_get_error_message(mrt_download_handle_t handle) {
    if (handle == nullptr) {
        return "";
    }
    handle->message = handle->subscription->error_message();
    return handle->message.c_str();
}

mrt_result_t mrt_download_cancel(mrt_download_handle_t handle) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->subscription->cancel();
}

void mrt_download_release(mrt_download_handle_t handle) {
    if (handle == nullptr) {
        return;
    }
    handle->subscription->release();
    delete handle;
}

mrt_result_t mrt_download_model(const char* model_id, mrt_model_artifact_t* out_artifact) {
    mrt_download_handle_t handle = nullptr;
    mrt_result_t rc = mrt_download_start(model_id, &handle);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    handle->subscription->wait(MRT_WAIT_FOREVER);
    rc = mrt_download_result(handle, out_artifact);
    if (rc != MRT_SUCCESS) {
        std::string message = handle->subscription->error_message();
        mrt_error_set_details(message.c_str());
    }
    mrt_download_release(handle);
    return rc;
}

}  // extern "C"
