/**
 * @file voice_pipeline.cpp
 * @brief modelrt - Voice Pipeline Coordinator Implementation
 */

#include "features/voice_pipeline/voice_pipeline.h"

#include <cctype>
#include <chrono>
#include <cstring>

#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

bool is_terminal(mrt_voice_pipeline_state_t state) {
    return state == MRT_VOICE_PIPELINE_COMPLETED || state == MRT_VOICE_PIPELINE_FAILED ||
           state == MRT_VOICE_PIPELINE_CANCELLED;
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string last_details(mrt_result_t rc) {
    const char* details = mrt_error_get_details();
    return (details != nullptr && details[0] != '\0') ? std::string(details)
                                                      : std::string(mrt_error_message(rc));
}

mrt_voice_pipeline_event_t make_event(mrt_voice_pipeline_event_type_t type,
                                      mrt_voice_pipeline_state_t state) {
    mrt_voice_pipeline_event_t event{};
    event.type = type;
    event.state = state;
    event.error_code = MRT_SUCCESS;
    return event;
}

}  // namespace

// =============================================================================
// RUN
// =============================================================================

VoicePipeline::VoicePipeline(std::string id, SessionManager& sessions, VoicePipelineConfig config,
                             mrt_voice_pipeline_event_fn callback, void* user_data)
    : id_(std::move(id)),
      sessions_(sessions),
      config_(std::move(config)),
      callback_(callback),
      user_data_(user_data) {}

mrt_result_t VoicePipeline::start(std::vector<float> audio, int32_t sample_rate_hz) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MRT_VOICE_PIPELINE_IDLE) {
            mrt_error_set_details("Voice pipeline run already started");
            return MRT_ERROR_INVALID_STATE;
        }
        state_ = MRT_VOICE_PIPELINE_TRANSCRIBING;
    }
    MRT_LOG_INFO("VoicePipeline", "%s: processing voice turn", id_.c_str());
    emit_state(MRT_VOICE_PIPELINE_TRANSCRIBING);

    SessionRequest request;
    request.audio = std::move(audio);
    request.sample_rate_hz = sample_rate_hz;
    request.timeout_ms = config_.stage_timeout_ms;

    mrt_result_t rc = begin_stage(MRT_VOICE_PIPELINE_TRANSCRIBING, std::move(request));
    if (rc != MRT_SUCCESS) {
        if (rc == MRT_ERROR_CANCELLED) {
            mark_cancelled();
        } else {
            fail(MRT_VOICE_PIPELINE_TRANSCRIBING, rc, last_details(rc));
        }
        return rc;
    }
    return MRT_SUCCESS;
}

mrt_result_t VoicePipeline::begin_stage(mrt_voice_pipeline_state_t stage, SessionRequest request) {
    mrt_session_kind_t kind = MRT_SESSION_TRANSCRIPTION;
    const std::string* model_id = &config_.stt_model_id;
    if (stage == MRT_VOICE_PIPELINE_GENERATING) {
        kind = MRT_SESSION_GENERATION;
        model_id = &config_.llm_model_id;
    } else if (stage == MRT_VOICE_PIPELINE_SYNTHESIZING) {
        kind = MRT_SESSION_SYNTHESIS;
        model_id = &config_.tts_model_id;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            return MRT_ERROR_CANCELLED;
        }
    }

    std::shared_ptr<Session> session;
    mrt_result_t rc = sessions_.create(kind, *model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    std::weak_ptr<VoicePipeline> weak = shared_from_this();
    SessionObserver observer;
    observer.on_chunk = [weak, stage](const ProgressEvent& event) {
        if (auto self = weak.lock()) {
            self->on_chunk(stage, event);
        }
    };
    observer.on_complete = [weak, stage](const std::shared_ptr<Session>& finished) {
        if (auto self = weak.lock()) {
            self->on_stage_complete(stage, finished);
        }
    };
    session->set_observer(std::move(observer));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_) {
            return MRT_ERROR_CANCELLED;
        }
        active_ = session;
    }

    MRT_LOG_DEBUG("VoicePipeline", "%s: %s with '%s' (%s)", id_.c_str(),
                  mrt_voice_pipeline_state_name(stage), model_id->c_str(),
                  session->id().c_str());

    rc = session->start(std::move(request));
    if (rc != MRT_SUCCESS) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == session) {
            active_.reset();
        }
        return cancel_requested_ ? MRT_ERROR_CANCELLED : rc;
    }
    return MRT_SUCCESS;
}

bool VoicePipeline::advance(mrt_voice_pipeline_state_t from, mrt_voice_pipeline_state_t to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancel_requested_ || state_ != from) {
            return false;
        }
        state_ = to;
    }
    emit_state(to);
    return true;
}

void VoicePipeline::on_chunk(mrt_voice_pipeline_state_t stage, const ProgressEvent& event) {
    if (stage == MRT_VOICE_PIPELINE_GENERATING && !event.text.empty()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            response_.append(event.text);
        }
        auto ev = make_event(MRT_VOICE_EVENT_RESPONSE_DELTA, stage);
        ev.text = event.text.c_str();
        ev.text_length = event.text.size();
        emit(ev);
    } else if (stage == MRT_VOICE_PIPELINE_SYNTHESIZING && !event.audio.empty()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            audio_.insert(audio_.end(), event.audio.begin(), event.audio.end());
            sample_rate_hz_ = event.sample_rate_hz;
        }
        auto ev = make_event(MRT_VOICE_EVENT_AUDIO_CHUNK, stage);
        ev.audio = event.audio.data();
        ev.audio_samples = event.audio.size();
        ev.sample_rate_hz = event.sample_rate_hz;
        emit(ev);
    }
}

void VoicePipeline::on_stage_complete(mrt_voice_pipeline_state_t stage,
                                      const std::shared_ptr<Session>& session) {
    bool cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == session) {
            active_.reset();
        }
        cancelled = cancel_requested_;
    }

    std::string message;
    mrt_result_t rc = session->error(&message);
    mrt_session_state_t session_state = session->state();

    if (cancelled || (session_state == MRT_SESSION_STATE_CANCELLED && rc == MRT_ERROR_CANCELLED)) {
        mark_cancelled();
        return;
    }
    if (session_state != MRT_SESSION_STATE_COMPLETED) {
        fail(stage, rc, message);
        return;
    }

    if (stage == MRT_VOICE_PIPELINE_TRANSCRIBING) {
        std::string text = session->text();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transcription_ = text;
        }
        auto ev = make_event(MRT_VOICE_EVENT_TRANSCRIPTION, stage);
        ev.text = text.c_str();
        ev.text_length = text.size();
        emit(ev);

        if (is_blank(text)) {
            MRT_LOG_WARNING("VoicePipeline", "%s: empty transcription, nothing to answer",
                            id_.c_str());
            fail(stage, MRT_ERROR_EMPTY_TRANSCRIPTION, "Transcription is empty");
            return;
        }
        MRT_LOG_INFO("VoicePipeline", "%s: transcription completed", id_.c_str());

        if (!advance(stage, MRT_VOICE_PIPELINE_GENERATING)) {
            mark_cancelled();
            return;
        }
        SessionRequest request;
        request.text = text;
        request.system_prompt = config_.system_prompt;
        request.max_tokens = config_.max_tokens;
        request.temperature = config_.temperature;
        request.timeout_ms = config_.stage_timeout_ms;
        rc = begin_stage(MRT_VOICE_PIPELINE_GENERATING, std::move(request));
        if (rc == MRT_ERROR_CANCELLED) {
            mark_cancelled();
        } else if (rc != MRT_SUCCESS) {
            fail(MRT_VOICE_PIPELINE_GENERATING, rc, last_details(rc));
        }
        return;
    }

    if (stage == MRT_VOICE_PIPELINE_GENERATING) {
        std::string text = session->text();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            response_ = text;
        }
        auto ev = make_event(MRT_VOICE_EVENT_RESPONSE, stage);
        ev.text = text.c_str();
        ev.text_length = text.size();
        emit(ev);
        MRT_LOG_INFO("VoicePipeline", "%s: response generated", id_.c_str());

        if (!advance(stage, MRT_VOICE_PIPELINE_SYNTHESIZING)) {
            mark_cancelled();
            return;
        }
        SessionRequest request;
        request.text = text;
        request.timeout_ms = config_.stage_timeout_ms;
        rc = begin_stage(MRT_VOICE_PIPELINE_SYNTHESIZING, std::move(request));
        if (rc == MRT_ERROR_CANCELLED) {
            mark_cancelled();
        } else if (rc != MRT_SUCCESS) {
            fail(MRT_VOICE_PIPELINE_SYNTHESIZING, rc, last_details(rc));
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sample_rate_hz_ == 0) {
            sample_rate_hz_ = session->sample_rate_hz();
        }
    }
    complete();
}

void VoicePipeline::complete() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        state_ = MRT_VOICE_PIPELINE_COMPLETED;
        result_ = MRT_SUCCESS;
    }
    cv_.notify_all();
    MRT_LOG_INFO("VoicePipeline", "%s: voice turn completed", id_.c_str());
    emit_state(MRT_VOICE_PIPELINE_COMPLETED);
    emit(make_event(MRT_VOICE_EVENT_COMPLETED, MRT_VOICE_PIPELINE_COMPLETED));
}

void VoicePipeline::fail(mrt_voice_pipeline_state_t stage, mrt_result_t code,
                         const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        state_ = MRT_VOICE_PIPELINE_FAILED;
        failed_stage_ = stage;
        result_ = code;
        message_ = message.empty() ? mrt_error_message(code) : message;
    }
    cv_.notify_all();
    MRT_LOG_ERROR("VoicePipeline", "%s: %s stage failed: %s", id_.c_str(),
                  mrt_voice_pipeline_state_name(stage), message.c_str());
    emit_state(MRT_VOICE_PIPELINE_FAILED);

    auto ev = make_event(MRT_VOICE_EVENT_FAILED, stage);
    ev.error_code = code;
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        text = message_;
    }
    ev.error_message = text.c_str();
    emit(ev);
}

void VoicePipeline::mark_cancelled() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        state_ = MRT_VOICE_PIPELINE_CANCELLED;
        result_ = MRT_ERROR_CANCELLED;
        message_ = "Voice pipeline cancelled";
    }
    cv_.notify_all();
    MRT_LOG_INFO("VoicePipeline", "%s: cancelled", id_.c_str());
    emit_state(MRT_VOICE_PIPELINE_CANCELLED);
    emit(make_event(MRT_VOICE_EVENT_CANCELLED, MRT_VOICE_PIPELINE_CANCELLED));
}

mrt_result_t VoicePipeline::cancel() {
    std::shared_ptr<Session> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return MRT_SUCCESS;
        }
        cancel_requested_ = true;
        active = active_;
    }
    if (active) {
        active->cancel();
    }
    mark_cancelled();
    return MRT_SUCCESS;
}

mrt_result_t VoicePipeline::wait(int32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == MRT_VOICE_PIPELINE_IDLE) {
        mrt_error_set_details("Voice pipeline run not started");
        return MRT_ERROR_INVALID_STATE;
    }
    auto done = [this] { return is_terminal(state_); };
    if (timeout_ms < 0) {
        cv_.wait(lock, done);
    } else if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), done)) {
        return MRT_ERROR_TIMEOUT;
    }
    return result_;
}

mrt_voice_pipeline_state_t VoicePipeline::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

mrt_voice_pipeline_state_t VoicePipeline::failed_stage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_stage_;
}

std::string VoicePipeline::transcription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcription_;
}

std::string VoicePipeline::response() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return response_;
}

std::vector<float> VoicePipeline::audio() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return audio_;
}

int32_t VoicePipeline::sample_rate_hz() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_rate_hz_;
}

mrt_result_t VoicePipeline::error(std::string* out_message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_message != nullptr) {
        *out_message = message_;
    }
    return result_;
}

void VoicePipeline::emit_state(mrt_voice_pipeline_state_t state) {
    emit(make_event(MRT_VOICE_EVENT_STATE_CHANGED, state));
}

void VoicePipeline::emit(const mrt_voice_pipeline_event_t& event) {
    if (callback_ != nullptr) {
        callback_(&event, user_data_);
    }
}

// =============================================================================
// MANAGER
// =============================================================================

mrt_result_t VoicePipelineManager::create(VoicePipelineConfig config,
                                          mrt_voice_pipeline_event_fn callback, void* user_data,
                                          std::shared_ptr<VoicePipeline>* out) {
    if (config.stt_model_id.empty() || config.llm_model_id.empty() ||
        config.tts_model_id.empty()) {
        mrt_error_set_details("Voice pipeline needs STT, LLM and TTS model ids");
        return MRT_ERROR_INVALID_ARGUMENT;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return MRT_ERROR_INVALID_STATE;
    }
    for (auto it = pipelines_.begin(); it != pipelines_.end();) {
        if (it->second.expired()) {
            it = pipelines_.erase(it);
        } else {
            ++it;
        }
    }
    std::string id = "voice-" + std::to_string(++next_id_);
    auto pipeline =
        std::make_shared<VoicePipeline>(id, sessions_, std::move(config), callback, user_data);
    pipelines_[id] = pipeline;
    *out = pipeline;
    return MRT_SUCCESS;
}

void VoicePipelineManager::cancel_all() {
    std::vector<std::shared_ptr<VoicePipeline>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (const auto& entry : pipelines_) {
            if (auto pipeline = entry.second.lock()) {
                live.push_back(std::move(pipeline));
            }
        }
    }
    for (const auto& pipeline : live) {
        pipeline->cancel();
    }
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

struct mrt_voice_pipeline {
    std::shared_ptr<mrt::VoicePipeline> pipeline;
    std::string message;
};

namespace {

mrt_result_t copy_string(const std::string& text, char** out_text) {
    if (out_text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    *out_text = mrt_strdup(text.c_str());
    return *out_text != nullptr ? MRT_SUCCESS : MRT_ERROR_OUT_OF_MEMORY;
}

}  // namespace

extern "C" {

mrt_result_t mrt_voice_pipeline_create(const mrt_voice_pipeline_config_t* config,
                                       mrt_voice_pipeline_event_fn callback, void* user_data,
                                       mrt_voice_pipeline_handle_t* out_handle) {
    if (config == nullptr || out_handle == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }

    mrt::VoicePipelineConfig cfg;
    cfg.stt_model_id = config->stt_model_id != nullptr ? config->stt_model_id : "";
    cfg.llm_model_id = config->llm_model_id != nullptr ? config->llm_model_id : "";
    cfg.tts_model_id = config->tts_model_id != nullptr ? config->tts_model_id : "";
    cfg.system_prompt = config->system_prompt != nullptr ? config->system_prompt : "";
    cfg.max_tokens = config->max_tokens;
    cfg.temperature = config->temperature;
    cfg.stage_timeout_ms = config->stage_timeout_ms;

    std::shared_ptr<mrt::VoicePipeline> pipeline;
    mrt_result_t rc = ctx->pipelines().create(std::move(cfg), callback, user_data, &pipeline);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    auto* handle = new mrt_voice_pipeline();
    handle->pipeline = std::move(pipeline);
    *out_handle = handle;
    MRT_LOG_DEBUG("VoicePipeline", "%s created", handle->pipeline->id().c_str());
    return MRT_SUCCESS;
}

mrt_result_t mrt_voice_pipeline_start(mrt_voice_pipeline_handle_t handle,
                                      const mrt_audio_buffer_t* audio) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (audio == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::vector<float> samples;
    if (audio->samples != nullptr && audio->sample_count > 0) {
        samples.assign(audio->samples, audio->samples + audio->sample_count);
    }
    return handle->pipeline->start(std::move(samples), audio->sample_rate_hz);
}

mrt_result_t mrt_voice_pipeline_cancel(mrt_voice_pipeline_handle_t handle) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->pipeline->cancel();
}

mrt_result_t mrt_voice_pipeline_wait(mrt_voice_pipeline_handle_t handle, int32_t timeout_ms) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->pipeline->wait(timeout_ms);
}

mrt_voice_pipeline_state_t mrt_voice_pipeline_get_state(mrt_voice_pipeline_handle_t handle) {
    if (handle == nullptr) {
        return MRT_VOICE_PIPELINE_FAILED;
    }
    return handle->pipeline->state();
}

mrt_voice_pipeline_state_t mrt_voice_pipeline_get_failed_stage(
    mrt_voice_pipeline_handle_t handle) {
    if (handle == nullptr) {
        return MRT_VOICE_PIPELINE_IDLE;
    }
    return handle->pipeline->failed_stage();
}

mrt_result_t mrt_voice_pipeline_get_transcription(mrt_voice_pipeline_handle_t handle,
                                                  char** out_text) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return copy_string(handle->pipeline->transcription(), out_text);
}

mrt_result_t mrt_voice_pipeline_get_response(mrt_voice_pipeline_handle_t handle,
                                             char** out_text) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return copy_string(handle->pipeline->response(), out_text);
}

mrt_result_t mrt_voice_pipeline_get_audio(mrt_voice_pipeline_handle_t handle, float** out_samples,
                                          size_t* out_sample_count, int32_t* out_sample_rate_hz) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (out_samples == nullptr || out_sample_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::vector<float> audio = handle->pipeline->audio();
    *out_samples = nullptr;
    *out_sample_count = 0;
    if (out_sample_rate_hz != nullptr) {
        *out_sample_rate_hz = handle->pipeline->sample_rate_hz();
    }
    if (audio.empty()) {
        return MRT_SUCCESS;
    }
    auto* samples = static_cast<float*>(mrt_alloc(sizeof(float) * audio.size()));
    if (samples == nullptr) {
        return MRT_ERROR_OUT_OF_MEMORY;
    }
    std::memcpy(samples, audio.data(), sizeof(float) * audio.size());
    *out_samples = samples;
    *out_sample_count = audio.size();
    return MRT_SUCCESS;
}

mrt_result_t mrt_voice_pipeline_get_error(mrt_voice_pipeline_handle_t handle,
                                          const char** out_message) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    mrt_result_t rc = handle->pipeline->error(&handle->message);
    if (out_message != nullptr) {
        *out_message = handle->message.c_str();
    }
    return rc;
}

void mrt_voice_pipeline_destroy(mrt_voice_pipeline_handle_t handle) {
    if (handle == nullptr) {
        return;
    }
    handle->pipeline->cancel();
    delete handle;
}

const char* mrt_voice_pipeline_state_name(mrt_voice_pipeline_state_t state) {
    switch (state) {
        case MRT_VOICE_PIPELINE_IDLE:
            return "idle";
        case MRT_VOICE_PIPELINE_TRANSCRIBING:
            return "transcribing";
        case MRT_VOICE_PIPELINE_GENERATING:
            return "generating";
        case MRT_VOICE_PIPELINE_SYNTHESIZING:
            return "synthesizing";
        case MRT_VOICE_PIPELINE_COMPLETED:
            return "completed";
        case MRT_VOICE_PIPELINE_FAILED:
            return "failed";
        case MRT_VOICE_PIPELINE_CANCELLED:
            return "cancelled";
        default:
            return "unknown";
    }
}

}  // extern "C"
