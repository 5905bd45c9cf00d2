/**
 * @file session_manager.h
 * @brief modelrt - Session Manager (internal)
 *
 * A Session drives one backend request on its model's SerialQueue:
 *
 *   Idle --start--> Running --+--> Completed
 *                             +--> Failed     (backend error, partial output kept)
 *                             +--> Cancelled  (cancel() or timeout)
 *
 * The model reference is taken by start() and released by the transition to
 * the terminal state, before that state becomes observable.
 *
 * A streaming session whose consumer falls behind parks: it keeps its place on
 * the model's queue but returns its worker thread, and next() resumes it once
 * a chunk slot is free.
 */

#ifndef MRT_SESSION_MANAGER_H
#define MRT_SESSION_MANAGER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/progress_event.h"
#include "infrastructure/memory/admission_controller.h"
#include "mrt/core/mrt_error.h"
#include "mrt/features/session/mrt_session.h"

namespace mrt {

struct SessionRequest {
    std::string text;
    std::string system_prompt;
    std::vector<float> audio;
    int32_t sample_rate_hz = 0;
    int32_t max_tokens = 0;
    float temperature = 0.7f;
    int32_t timeout_ms = 0;
    bool streaming = false;
};

class Session;

struct SessionObserver {
    // Runner thread, once per produced chunk
    std::function<void(const ProgressEvent&)> on_chunk;
    // Thread that ended the session, after the terminal state is visible
    std::function<void(const std::shared_ptr<Session>&)> on_complete;
};

class Session : public std::enable_shared_from_this<Session> {
   public:
    Session(std::string id, mrt_session_kind_t kind, std::shared_ptr<LoadedModel> model,
            AdmissionController& admission, const EventDispatcher& events,
            size_t stream_capacity);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    mrt_session_kind_t kind() const { return kind_; }
    const std::string& model_id() const { return model_->id(); }

    // Must be called before start()
    void set_observer(SessionObserver observer);

    /**
     * @brief Validate the request and queue it on the model
     *
     * A rejected request leaves the session Idle.
     */
    mrt_result_t start(SessionRequest request);

    mrt_result_t next(int32_t timeout_ms, ProgressEvent* out, bool* out_finished);
    mrt_result_t wait(int32_t timeout_ms);

    // Returns once the session is terminal and its model reference released
    mrt_result_t cancel(const std::string& reason = "Session cancelled");

    bool runs_on(const LoadedModel& model) const { return model_.get() == &model; }

    mrt_session_state_t state() const;
    std::string text() const;
    std::vector<float> audio() const;
    int32_t sample_rate_hz() const { return sample_rate_hz_; }

    // Terminal result code and message
    mrt_result_t error(std::string* out_message) const;

   private:
    enum class Delivery { kPublished, kParked, kStopped };

    mrt_result_t validate(const SessionRequest& request) const;
    void run();
    bool stop_if_requested();
    bool record(const mrt_backend_output_t& output, ProgressEvent* out);
    Delivery publish(ProgressEvent event, bool eof);
    void abandon_parked(std::unique_lock<std::mutex>& lock, mrt_result_t result,
                        const std::string& message);
    void finish(mrt_session_state_t state, mrt_result_t result, const std::string& message);

    const std::string id_;
    const mrt_session_kind_t kind_;
    const std::shared_ptr<LoadedModel> model_;
    AdmissionController& admission_;
    const EventDispatcher& events_;
    const size_t capacity_;
    int32_t sample_rate_hz_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    mrt_session_state_t state_ = MRT_SESSION_STATE_IDLE;
    SessionRequest request_;
    SessionObserver observer_;
    bool holds_ref_ = false;
    bool stepping_ = false;
    bool begun_ = false;
    bool cancel_requested_ = false;
    std::string cancel_reason_;
    bool finished_reported_ = false;
    bool has_deadline_ = false;
    std::chrono::steady_clock::time_point deadline_;
    std::thread::id runner_;

    std::deque<ProgressEvent> queue_;
    // Chunk produced while queue_ was full; the runner is parked until it fits
    bool parked_ = false;
    bool has_pending_ = false;
    bool pending_eof_ = false;
    ProgressEvent pending_;
    uint64_t sequence_ = 0;
    std::string text_;
    std::vector<float> audio_;
    mrt_result_t result_ = MRT_SUCCESS;
    std::string message_;
};

class SessionManager {
   public:
    SessionManager(AdmissionController& admission, const EventDispatcher& events,
                   size_t stream_capacity);

    /**
     * @return MRT_SUCCESS, MRT_ERROR_MODEL_NOT_LOADED, MRT_ERROR_NOT_SUPPORTED
     *         when the model's backend serves another kind of session,
     *         MRT_ERROR_INVALID_STATE after cancel_all()
     */
    mrt_result_t create(mrt_session_kind_t kind, const std::string& model_id,
                        std::shared_ptr<Session>* out);

    // Returns the number of sessions that were cancelled
    size_t cancel_for_model(const std::string& model_id);

    // Cancels the sessions bound to this instance; it is leaving memory
    size_t cancel_dependents(const LoadedModel& model);

    // Cancels every live session and refuses new ones
    void cancel_all();

    size_t live_count() const;

   private:
    std::vector<std::shared_ptr<Session>> live_sessions(const std::string& model_id);

    AdmissionController& admission_;
    const EventDispatcher& events_;
    const size_t stream_capacity_;

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<Session>> sessions_;
    uint64_t next_id_ = 0;
    bool stopped_ = false;
};

mrt_capability_kind_t capability_for_session(mrt_session_kind_t kind);

}  // namespace mrt

#endif  // MRT_SESSION_MANAGER_H
