/**
 * @file session_manager.cpp
 * @brief modelrt - Session Manager Implementation
 */

#include "features/session/session_manager.h"

#include <iterator>

#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

bool is_terminal(mrt_session_state_t state) {
    return state == MRT_SESSION_STATE_COMPLETED || state == MRT_SESSION_STATE_FAILED ||
           state == MRT_SESSION_STATE_CANCELLED;
}

const char* kind_name(mrt_session_kind_t kind) {
    switch (kind) {
        case MRT_SESSION_GENERATION:
            return "generation";
        case MRT_SESSION_TRANSCRIPTION:
            return "transcription";
        case MRT_SESSION_SYNTHESIS:
            return "synthesis";
        default:
            return "unknown";
    }
}

}  // namespace

mrt_capability_kind_t capability_for_session(mrt_session_kind_t kind) {
    switch (kind) {
        case MRT_SESSION_TRANSCRIPTION:
            return MRT_CAPABILITY_TRANSCRIPTION;
        case MRT_SESSION_SYNTHESIS:
            return MRT_CAPABILITY_SYNTHESIS;
        case MRT_SESSION_GENERATION:
        default:
            return MRT_CAPABILITY_TEXT_GENERATION;
    }
}

// =============================================================================
// SESSION
// =============================================================================

Session::Session(std::string id, mrt_session_kind_t kind, std::shared_ptr<LoadedModel> model,
                 AdmissionController& admission, const EventDispatcher& events,
                 size_t stream_capacity)
    : id_(std::move(id)),
      kind_(kind),
      model_(std::move(model)),
      admission_(admission),
      events_(events),
      capacity_(stream_capacity == 0 ? 1 : stream_capacity) {
    const auto& caps = model_->backend->capabilities;
    if (caps.kind == MRT_CAPABILITY_SYNTHESIS) {
        sample_rate_hz_ = caps.params.synthesis.sample_rate_hz;
    } else if (caps.kind == MRT_CAPABILITY_TRANSCRIPTION) {
        sample_rate_hz_ = caps.params.transcription.sample_rate_hz;
    }
}

void Session::set_observer(SessionObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

mrt_result_t Session::validate(const SessionRequest& request) const {
    switch (kind_) {
        case MRT_SESSION_GENERATION:
        case MRT_SESSION_SYNTHESIS:
            if (request.text.empty()) {
                mrt_error_set_details("Input text is empty");
                return MRT_ERROR_INVALID_ARGUMENT;
            }
            return MRT_SUCCESS;
        case MRT_SESSION_TRANSCRIPTION: {
            if (request.audio.empty()) {
                mrt_error_set_details("Audio buffer is empty");
                return MRT_ERROR_AUDIO_FORMAT;
            }
            if (request.sample_rate_hz <= 0) {
                mrt_error_set_details("Sample rate must be positive");
                return MRT_ERROR_AUDIO_FORMAT;
            }
            if (sample_rate_hz_ > 0 && request.sample_rate_hz != sample_rate_hz_) {
                std::string details = "Backend expects " + std::to_string(sample_rate_hz_) +
                                      " Hz audio, got " + std::to_string(request.sample_rate_hz) +
                                      " Hz";
                mrt_error_set_details(details.c_str());
                return MRT_ERROR_AUDIO_FORMAT;
            }
            return MRT_SUCCESS;
        }
        default:
            return MRT_ERROR_NOT_SUPPORTED;
    }
}

mrt_result_t Session::start(SessionRequest request) {
    mrt_result_t rc = validate(request);
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MRT_SESSION_STATE_IDLE) {
            mrt_error_set_details("Session already started");
            return MRT_ERROR_INVALID_STATE;
        }
        rc = admission_.acquire(model_);
        if (rc != MRT_SUCCESS) {
            return rc;
        }
        holds_ref_ = true;
        state_ = MRT_SESSION_STATE_RUNNING;
        if (request.timeout_ms > 0) {
            has_deadline_ = true;
            deadline_ = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(request.timeout_ms);
        }
        request_ = std::move(request);
    }

    MRT_LOG_DEBUG("Session", "%s started on '%s'", id_.c_str(), model_id().c_str());

    auto self = shared_from_this();
    if (!model_->queue->post([self] { self->run(); })) {
        finish(MRT_SESSION_STATE_FAILED, MRT_ERROR_INVALID_STATE, "Runtime is shutting down");
        return MRT_ERROR_INVALID_STATE;
    }
    return MRT_SUCCESS;
}

bool Session::stop_if_requested() {
    mrt_result_t stop = MRT_SUCCESS;
    std::string message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            stop = MRT_ERROR_CANCELLED;
            message = cancel_reason_;
        } else if (has_deadline_ && std::chrono::steady_clock::now() >= deadline_) {
            stop = MRT_ERROR_TIMEOUT;
            message = "Session timed out";
        }
    }
    if (stop == MRT_SUCCESS) {
        return false;
    }
    finish(MRT_SESSION_STATE_CANCELLED, stop, message);
    return true;
}

void Session::run() {
    mrt_backend_input_t input{};
    bool first = false;
    bool resumed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MRT_SESSION_STATE_RUNNING) {
            // Cancelled while queued
            return;
        }
        stepping_ = true;
        runner_ = std::this_thread::get_id();
        resumed = has_pending_;

        if (!begun_) {
            begun_ = true;
            first = true;
            input.max_tokens = request_.max_tokens;
            input.temperature = request_.temperature;
            if (kind_ == MRT_SESSION_TRANSCRIPTION) {
                input.audio = request_.audio.data();
                input.audio_samples = request_.audio.size();
                input.sample_rate_hz = request_.sample_rate_hz;
            } else {
                input.text = request_.text.c_str();
                input.system_prompt =
                    request_.system_prompt.empty() ? nullptr : request_.system_prompt.c_str();
            }
        }
    }

    if (resumed) {
        if (stop_if_requested()) {
            return;
        }
        ProgressEvent event;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            event = std::move(pending_);
            eof = pending_eof_;
            has_pending_ = false;
        }
        Delivery delivery = publish(std::move(event), eof);
        if (delivery == Delivery::kParked) {
            return;
        }
        if (delivery == Delivery::kPublished && eof) {
            finish(MRT_SESSION_STATE_COMPLETED, MRT_SUCCESS, "");
            return;
        }
    }

    const BackendEntry& backend = *model_->backend;
    for (;;) {
        if (stop_if_requested()) {
            return;
        }

        mrt_backend_output_t output{};
        mrt_error_clear_details();
        mrt_result_t rc =
            backend.ops.step(model_->handle, first ? &input : nullptr, &output, backend.user_data);
        first = false;

        if (rc != MRT_SUCCESS) {
            if (stop_if_requested()) {
                return;
            }
            const char* details = mrt_error_get_details();
            std::string message = (details != nullptr && details[0] != '\0')
                                      ? std::string(details)
                                      : std::string(mrt_error_message(rc));
            MRT_LOG_ERROR("Session", "%s: backend '%s' failed: %s", id_.c_str(),
                          backend.name.c_str(), message.c_str());
            finish(MRT_SESSION_STATE_FAILED, rc, message);
            return;
        }

        bool eof = output.eof == MRT_TRUE;
        ProgressEvent event;
        if (record(output, &event)) {
            Delivery delivery = publish(std::move(event), eof);
            if (delivery == Delivery::kParked) {
                return;
            }
            if (delivery == Delivery::kStopped) {
                continue;
            }
        }
        if (eof) {
            finish(MRT_SESSION_STATE_COMPLETED, MRT_SUCCESS, "");
            return;
        }
    }
}

bool Session::record(const mrt_backend_output_t& output, ProgressEvent* out) {
    bool has_text = output.text != nullptr && output.text_length > 0;
    bool has_audio = output.audio != nullptr && output.audio_samples > 0;
    if (!has_text && !has_audio) {
        return false;
    }

    ProgressEvent event;
    event.subject_id = id_;
    if (has_audio) {
        event.kind = MRT_PROGRESS_AUDIO_CHUNK;
        event.audio.assign(output.audio, output.audio + output.audio_samples);
        event.sample_rate_hz = sample_rate_hz_;
    } else {
        event.kind = MRT_PROGRESS_TOKEN;
    }
    if (has_text) {
        event.text.assign(output.text, output.text_length);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    text_.append(event.text);
    audio_.insert(audio_.end(), event.audio.begin(), event.audio.end());
    event.sequence = ++sequence_;
    *out = std::move(event);
    return true;
}

Session::Delivery Session::publish(ProgressEvent event, bool eof) {
    std::function<void(const ProgressEvent&)> on_chunk;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            return Delivery::kStopped;
        }
        if (request_.streaming) {
            if (queue_.size() >= capacity_) {
                pending_ = std::move(event);
                pending_eof_ = eof;
                has_pending_ = true;
                parked_ = true;
                runner_ = std::thread::id();
                model_->queue->hold();
                lock.unlock();
                cv_.notify_all();
                return Delivery::kParked;
            }
            queue_.push_back(event);
        }
        on_chunk = observer_.on_chunk;
    }
    cv_.notify_all();

    events_.emit(event);
    if (on_chunk) {
        on_chunk(event);
    }
    return Delivery::kPublished;
}

void Session::abandon_parked(std::unique_lock<std::mutex>& lock, mrt_result_t result,
                             const std::string& message) {
    parked_ = false;
    has_pending_ = false;
    pending_ = ProgressEvent{};
    lock.unlock();

    // No step is in flight, so there is nothing to interrupt in the backend
    finish(MRT_SESSION_STATE_CANCELLED, result, message);
    model_->queue->resume(nullptr);
}

void Session::finish(mrt_session_state_t state, mrt_result_t result, const std::string& message) {
    std::function<void(const std::shared_ptr<Session>&)> on_complete;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        state_ = state;
        result_ = result;
        message_ = message;
        stepping_ = false;
        if (holds_ref_) {
            admission_.release(model_);
            holds_ref_ = false;
        }
        on_complete = std::move(observer_.on_complete);
        observer_ = SessionObserver{};
    }
    cv_.notify_all();

    MRT_LOG_DEBUG("Session", "%s %s (%d)", id_.c_str(), mrt_session_state_name(state), result);
    if (on_complete) {
        on_complete(shared_from_this());
    }
}

mrt_result_t Session::next(int32_t timeout_ms, ProgressEvent* out, bool* out_finished) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == MRT_SESSION_STATE_IDLE) {
        mrt_error_set_details("Session not started");
        return MRT_ERROR_INVALID_STATE;
    }
    if (finished_reported_) {
        mrt_error_set_details("Session already delivered its final chunk");
        return MRT_ERROR_INVALID_STATE;
    }

    auto ready = [this] { return !queue_.empty() || is_terminal(state_); };
    if (timeout_ms < 0) {
        cv_.wait(lock, ready);
    } else if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) {
        return MRT_ERROR_TIMEOUT;
    }

    if (!queue_.empty()) {
        *out = std::move(queue_.front());
        queue_.pop_front();
        *out_finished = false;
        bool resume = parked_;
        parked_ = false;
        lock.unlock();
        cv_.notify_all();
        if (resume) {
            auto self = shared_from_this();
            model_->queue->resume([self] { self->run(); });
        }
        return MRT_SUCCESS;
    }
    finished_reported_ = true;
    *out_finished = true;
    return MRT_SUCCESS;
}

mrt_result_t Session::wait(int32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == MRT_SESSION_STATE_IDLE) {
        mrt_error_set_details("Session not started");
        return MRT_ERROR_INVALID_STATE;
    }

    const bool bounded = timeout_ms >= 0;
    const auto limit =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(bounded ? timeout_ms : 0);
    for (;;) {
        if (is_terminal(state_)) {
            return result_;
        }
        auto now = std::chrono::steady_clock::now();
        // A parked runner cannot see its deadline pass; the waiter enforces it
        bool parked_deadline = parked_ && has_deadline_;
        if (parked_deadline && now >= deadline_) {
            abandon_parked(lock, MRT_ERROR_TIMEOUT, "Session timed out");
            lock.lock();
            continue;
        }
        if (bounded && now >= limit) {
            return MRT_ERROR_TIMEOUT;
        }
        if (parked_deadline && (!bounded || deadline_ < limit)) {
            cv_.wait_until(lock, deadline_);
        } else if (bounded) {
            cv_.wait_until(lock, limit);
        } else {
            cv_.wait(lock);
        }
    }
}

mrt_result_t Session::cancel(const std::string& reason) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (is_terminal(state_)) {
        return MRT_SUCCESS;
    }
    cancel_requested_ = true;
    cancel_reason_ = reason;

    if (parked_) {
        abandon_parked(lock, MRT_ERROR_CANCELLED, reason);
        return MRT_SUCCESS;
    }
    if (!stepping_) {
        // Idle, or queued behind another request on the model
        lock.unlock();
        cv_.notify_all();
        finish(MRT_SESSION_STATE_CANCELLED, MRT_ERROR_CANCELLED, reason);
        return MRT_SUCCESS;
    }

    // Still under the lock: the reference keeps the backend handle alive
    const BackendEntry& backend = *model_->backend;
    if (holds_ref_ && backend.ops.cancel != nullptr) {
        backend.ops.cancel(model_->handle, backend.user_data);
    }
    bool on_runner = runner_ == std::this_thread::get_id();
    lock.unlock();
    cv_.notify_all();
    if (on_runner) {
        return MRT_SUCCESS;
    }

    lock.lock();
    cv_.wait(lock, [this] { return is_terminal(state_); });
    return MRT_SUCCESS;
}

mrt_session_state_t Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Session::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

std::vector<float> Session::audio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return audio_;
}

mrt_result_t Session::error(std::string* out_message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_message != nullptr) {
        *out_message = message_;
    }
    return result_;
}

// =============================================================================
// SESSION MANAGER
// =============================================================================

SessionManager::SessionManager(AdmissionController& admission, const EventDispatcher& events,
                               size_t stream_capacity)
    : admission_(admission), events_(events), stream_capacity_(stream_capacity) {}

mrt_result_t SessionManager::create(mrt_session_kind_t kind, const std::string& model_id,
                                    std::shared_ptr<Session>* out) {
    auto model = admission_.find(model_id);
    if (!model) {
        std::string details = "Model '" + model_id + "' is not loaded";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_MODEL_NOT_LOADED;
    }
    if (model->kind() != capability_for_session(kind)) {
        std::string details = "Backend '" + model->backend->name + "' of '" + model_id +
                              "' does not serve " + kind_name(kind) + " sessions";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_NOT_SUPPORTED;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return MRT_ERROR_INVALID_STATE;
    }
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        it = it->second.expired() ? sessions_.erase(it) : std::next(it);
    }
    std::string id = "session-" + std::to_string(++next_id_);
    auto session =
        std::make_shared<Session>(id, kind, std::move(model), admission_, events_, stream_capacity_);
    sessions_[id] = session;
    *out = session;
    return MRT_SUCCESS;
}

std::vector<std::shared_ptr<Session>> SessionManager::live_sessions(const std::string& model_id) {
    std::vector<std::shared_ptr<Session>> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : sessions_) {
        auto session = entry.second.lock();
        if (session && (model_id.empty() || session->model_id() == model_id)) {
            result.push_back(std::move(session));
        }
    }
    return result;
}

size_t SessionManager::cancel_for_model(const std::string& model_id) {
    size_t cancelled = 0;
    for (const auto& session : live_sessions(model_id)) {
        mrt_session_state_t state = session->state();
        if (state == MRT_SESSION_STATE_IDLE || state == MRT_SESSION_STATE_RUNNING) {
            session->cancel();
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        MRT_LOG_INFO("Session", "Cancelled %zu session(s) on '%s'", cancelled, model_id.c_str());
    }
    return cancelled;
}

size_t SessionManager::cancel_dependents(const LoadedModel& model) {
    const std::string reason = "Model '" + model.id() + "' was unloaded";
    size_t cancelled = 0;
    for (const auto& session : live_sessions(model.id())) {
        // A session created on a later instance with the same id is unaffected
        if (!session->runs_on(model)) {
            continue;
        }
        mrt_session_state_t state = session->state();
        if (state == MRT_SESSION_STATE_IDLE || state == MRT_SESSION_STATE_RUNNING) {
            session->cancel(reason);
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        MRT_LOG_INFO("Session", "Cancelled %zu session(s) bound to unloaded '%s'", cancelled,
                     model.id().c_str());
    }
    return cancelled;
}

void SessionManager::cancel_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    for (const auto& session : live_sessions("")) {
        session->cancel();
    }
}

size_t SessionManager::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : sessions_) {
        if (!entry.second.expired()) {
            ++count;
        }
    }
    return count;
}

}  // namespace mrt
