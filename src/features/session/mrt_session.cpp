/**
 * @file mrt_session.cpp
 * @brief modelrt - Session Public API
 */

#include <cstring>
#include <string>

#include "core/runtime_context.h"
#include "features/session/session_manager.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"
#include "mrt/features/session/mrt_session.h"

struct mrt_session {
    std::shared_ptr<mrt::Session> session;
    mrt::ProgressEvent last_event;
    std::string message;
};

namespace {

mrt_result_t create_session(mrt_session_kind_t kind, const char* model_id,
                            std::shared_ptr<mrt::Session>* out) {
    if (model_id == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    return ctx->sessions().create(kind, model_id, out);
}

mrt::SessionRequest generation_request(const char* prompt,
                                       const mrt_generation_options_t* options) {
    const mrt_generation_options_t& opts =
        options != nullptr ? *options : MRT_GENERATION_OPTIONS_DEFAULT;
    mrt::SessionRequest request;
    request.text = prompt;
    if (opts.system_prompt != nullptr) {
        request.system_prompt = opts.system_prompt;
    }
    request.max_tokens = opts.max_tokens;
    request.temperature = opts.temperature;
    request.timeout_ms = opts.timeout_ms;
    request.streaming = opts.streaming == MRT_TRUE;
    return request;
}

mrt::SessionRequest transcription_request(const mrt_audio_buffer_t* audio, int32_t timeout_ms) {
    mrt::SessionRequest request;
    if (audio->samples != nullptr && audio->sample_count > 0) {
        request.audio.assign(audio->samples, audio->samples + audio->sample_count);
    }
    request.sample_rate_hz = audio->sample_rate_hz;
    request.timeout_ms = timeout_ms;
    return request;
}

// Waits for a started session and moves its error message onto this thread
mrt_result_t finish_blocking(const std::shared_ptr<mrt::Session>& session) {
    mrt_result_t rc = session->wait(MRT_WAIT_FOREVER);
    if (rc != MRT_SUCCESS) {
        std::string message;
        session->error(&message);
        mrt_error_set_details(message.c_str());
    }
    return rc;
}

char* copy_text(const std::string& text) {
    return mrt_strdup(text.c_str());
}

mrt_result_t copy_audio(const std::vector<float>& audio, float** out_samples,
                        size_t* out_sample_count) {
    *out_samples = nullptr;
    *out_sample_count = 0;
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

mrt_result_t stream_generation(const char* model_id, const char* prompt,
                               const mrt_generation_options_t* options,
                               mrt_token_callback_fn callback, void* user_data) {
    std::shared_ptr<mrt::Session> session;
    mrt_result_t rc = create_session(MRT_SESSION_GENERATION, model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    mrt::SessionRequest request = generation_request(prompt, options);
    request.streaming = true;
    rc = session->start(std::move(request));
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    for (;;) {
        mrt::ProgressEvent event;
        bool finished = false;
        rc = session->next(MRT_WAIT_FOREVER, &event, &finished);
        if (rc != MRT_SUCCESS || finished) {
            break;
        }
        if (callback(event.text.c_str(), event.text.size(), user_data) != MRT_TRUE) {
            session->cancel();
            MRT_LOG_DEBUG("Session", "%s stopped by token callback", session->id().c_str());
            return MRT_ERROR_CANCELLED;
        }
    }
    return finish_blocking(session);
}

}  // namespace

extern "C" {

// =============================================================================
// LIFECYCLE
// =============================================================================

mrt_result_t mrt_session_create(mrt_session_kind_t kind, const char* model_id,
                                mrt_session_handle_t* out_handle) {
    if (out_handle == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::shared_ptr<mrt::Session> session;
    mrt_result_t rc = create_session(kind, model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    auto* handle = new mrt_session();
    handle->session = std::move(session);
    *out_handle = handle;
    return MRT_SUCCESS;
}

mrt_result_t mrt_session_start_generation(mrt_session_handle_t handle, const char* prompt,
                                          const mrt_generation_options_t* options) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (prompt == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (handle->session->kind() != MRT_SESSION_GENERATION) {
        return MRT_ERROR_NOT_SUPPORTED;
    }
    return handle->session->start(generation_request(prompt, options));
}

mrt_result_t mrt_session_start_transcription(mrt_session_handle_t handle,
                                             const mrt_audio_buffer_t* audio, int32_t timeout_ms) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (audio == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (handle->session->kind() != MRT_SESSION_TRANSCRIPTION) {
        return MRT_ERROR_NOT_SUPPORTED;
    }
    return handle->session->start(transcription_request(audio, timeout_ms));
}

mrt_result_t mrt_session_start_synthesis(mrt_session_handle_t handle, const char* text,
                                         mrt_bool_t streaming, int32_t timeout_ms) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (handle->session->kind() != MRT_SESSION_SYNTHESIS) {
        return MRT_ERROR_NOT_SUPPORTED;
    }
    mrt::SessionRequest request;
    request.text = text;
    request.streaming = streaming == MRT_TRUE;
    request.timeout_ms = timeout_ms;
    return handle->session->start(std::move(request));
}

mrt_result_t mrt_session_next(mrt_session_handle_t handle, int32_t timeout_ms,
                              mrt_progress_event_t* out_event, mrt_bool_t* out_finished) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (out_event == nullptr || out_finished == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    mrt::ProgressEvent event;
    bool finished = false;
    mrt_result_t rc = handle->session->next(timeout_ms, &event, &finished);
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

mrt_result_t mrt_session_wait(mrt_session_handle_t handle, int32_t timeout_ms) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->session->wait(timeout_ms);
}

mrt_result_t mrt_session_cancel(mrt_session_handle_t handle) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    return handle->session->cancel();
}

mrt_result_t mrt_session_cancel_for_model(const char* model_id) {
    if (model_id == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    ctx->sessions().cancel_for_model(model_id);
    return MRT_SUCCESS;
}

void mrt_session_destroy(mrt_session_handle_t handle) {
    if (handle == nullptr) {
        return;
    }
    handle->session->cancel();
    delete handle;
}

// =============================================================================
// QUERIES
// =============================================================================

mrt_session_state_t mrt_session_get_state(mrt_session_handle_t handle) {
    if (handle == nullptr) {
        return MRT_SESSION_STATE_FAILED;
    }
    return handle->session->state();
}

const char* mrt_session_get_id(mrt_session_handle_t handle) {
    if (handle == nullptr) {
        return "";
    }
    return handle->session->id().c_str();
}

mrt_result_t mrt_session_get_text(mrt_session_handle_t handle, char** out_text) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (out_text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    *out_text = copy_text(handle->session->text());
    return *out_text != nullptr ? MRT_SUCCESS : MRT_ERROR_OUT_OF_MEMORY;
}

mrt_result_t mrt_session_get_audio(mrt_session_handle_t handle, float** out_samples,
                                   size_t* out_sample_count, int32_t* out_sample_rate_hz) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    if (out_samples == nullptr || out_sample_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    if (out_sample_rate_hz != nullptr) {
        *out_sample_rate_hz = handle->session->sample_rate_hz();
    }
    return copy_audio(handle->session->audio(), out_samples, out_sample_count);
}

mrt_result_t mrt_session_get_error(mrt_session_handle_t handle, const char** out_message) {
    if (handle == nullptr) {
        return MRT_ERROR_INVALID_HANDLE;
    }
    mrt_result_t rc = handle->session->error(&handle->message);
    if (out_message != nullptr) {
        *out_message = handle->message.c_str();
    }
    return rc;
}

const char* mrt_session_state_name(mrt_session_state_t state) {
    switch (state) {
        case MRT_SESSION_STATE_IDLE:
            return "idle";
        case MRT_SESSION_STATE_RUNNING:
            return "running";
        case MRT_SESSION_STATE_CANCELLED:
            return "cancelled";
        case MRT_SESSION_STATE_COMPLETED:
            return "completed";
        case MRT_SESSION_STATE_FAILED:
            return "failed";
        default:
            return "unknown";
    }
}

// =============================================================================
// BLOCKING CONVENIENCE
// =============================================================================

mrt_result_t mrt_generate(const char* model_id, const char* prompt,
                          const mrt_generation_options_t* options, char** out_text) {
    if (prompt == nullptr || out_text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::shared_ptr<mrt::Session> session;
    mrt_result_t rc = create_session(MRT_SESSION_GENERATION, model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    mrt::SessionRequest request = generation_request(prompt, options);
    request.streaming = false;
    rc = session->start(std::move(request));
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    rc = finish_blocking(session);
    if (rc == MRT_SUCCESS) {
        *out_text = copy_text(session->text());
    }
    return rc;
}

mrt_result_t mrt_generate_stream(const char* model_id, const char* prompt,
                                 const mrt_generation_options_t* options,
                                 mrt_token_callback_fn callback, void* user_data) {
    if (prompt == nullptr || callback == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    return stream_generation(model_id, prompt, options, callback, user_data);
}

mrt_result_t mrt_transcribe(const char* model_id, const mrt_audio_buffer_t* audio,
                            char** out_text) {
    if (audio == nullptr || out_text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::shared_ptr<mrt::Session> session;
    mrt_result_t rc = create_session(MRT_SESSION_TRANSCRIPTION, model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    rc = session->start(transcription_request(audio, 0));
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    rc = finish_blocking(session);
    if (rc == MRT_SUCCESS) {
        *out_text = copy_text(session->text());
    }
    return rc;
}

mrt_result_t mrt_synthesize(const char* model_id, const char* text, float** out_samples,
                            size_t* out_sample_count, int32_t* out_sample_rate_hz) {
    if (text == nullptr || out_samples == nullptr || out_sample_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    std::shared_ptr<mrt::Session> session;
    mrt_result_t rc = create_session(MRT_SESSION_SYNTHESIS, model_id, &session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    mrt::SessionRequest request;
    request.text = text;
    rc = session->start(std::move(request));
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    rc = finish_blocking(session);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    if (out_sample_rate_hz != nullptr) {
        *out_sample_rate_hz = session->sample_rate_hz();
    }
    return copy_audio(session->audio(), out_samples, out_sample_count);
}

mrt_result_t mrt_chat(const char* prompt, char** out_text) {
    if (prompt == nullptr || out_text == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto model = ctx->admission().latest(MRT_CAPABILITY_TEXT_GENERATION);
    if (!model) {
        mrt_error_set_details("No text generation model is loaded");
        return MRT_ERROR_MODEL_NOT_LOADED;
    }
    return mrt_generate(model->id().c_str(), prompt, nullptr, out_text);
}

mrt_result_t mrt_chat_stream(const char* prompt, mrt_token_callback_fn callback,
                             void* user_data) {
    if (prompt == nullptr || callback == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto model = ctx->admission().latest(MRT_CAPABILITY_TEXT_GENERATION);
    if (!model) {
        mrt_error_set_details("No text generation model is loaded");
        return MRT_ERROR_MODEL_NOT_LOADED;
    }
    return stream_generation(model->id().c_str(), prompt, nullptr, callback, user_data);
}

}  // extern "C"
