/**
 * @file mrt_session.h
 * @brief modelrt - Inference Sessions
 *
 * A session is one single-use request (generation, transcription or
 * synthesis) bound to a loaded model. It moves Idle -> Running and ends in
 * exactly one of Completed, Cancelled or Failed. While running it holds a
 * reference on its model, which protects the model from eviction.
 *
 * Streaming sessions deliver chunks through mrt_session_next(). The chunk
 * queue is bounded: when the consumer stops pulling, the backend is paused at
 * the next chunk boundary.
 *
 * Cancellation is cooperative: the backend observes it at its next token or
 * audio-chunk boundary. mrt_session_cancel() returns after the session's
 * resources have been released.
 */

#ifndef MRT_SESSION_H
#define MRT_SESSION_H

#include "mrt/core/mrt_events.h"
#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct mrt_session* mrt_session_handle_t;

typedef enum mrt_session_kind {
    MRT_SESSION_GENERATION = 0,
    MRT_SESSION_TRANSCRIPTION = 1,
    MRT_SESSION_SYNTHESIS = 2
} mrt_session_kind_t;

typedef enum mrt_session_state {
    MRT_SESSION_STATE_IDLE = 0,
    MRT_SESSION_STATE_RUNNING = 1,
    MRT_SESSION_STATE_CANCELLED = 2,
    MRT_SESSION_STATE_COMPLETED = 3,
    MRT_SESSION_STATE_FAILED = 4
} mrt_session_state_t;

typedef struct mrt_generation_options {
    int32_t max_tokens;          /**< 0 = backend default */
    float temperature;
    const char* system_prompt;   /**< May be NULL */
    int32_t timeout_ms;          /**< 0 = no timeout */
    mrt_bool_t streaming;        /**< Deliver chunks through mrt_session_next() */
} mrt_generation_options_t;

static const mrt_generation_options_t MRT_GENERATION_OPTIONS_DEFAULT = {
    0,          /* max_tokens */
    0.7f,       /* temperature */
    NULL,       /* system_prompt */
    0,          /* timeout_ms */
    MRT_FALSE   /* streaming */
};

/** Audio buffer: mono PCM float samples. */
typedef struct mrt_audio_buffer {
    const float* samples;
    size_t sample_count;
    int32_t sample_rate_hz;
} mrt_audio_buffer_t;

// =============================================================================
// LIFECYCLE
// =============================================================================

/**
 * @brief Create an idle session bound to a loaded model
 *
 * @return MRT_SUCCESS, MRT_ERROR_MODEL_NOT_LOADED, MRT_ERROR_NOT_SUPPORTED when
 *         the model's backend does not serve this kind of session
 */
MRT_API mrt_result_t mrt_session_create(mrt_session_kind_t kind, const char* model_id,
                                        mrt_session_handle_t* out_handle);

/** Start a generation session. options may be NULL. */
MRT_API mrt_result_t mrt_session_start_generation(mrt_session_handle_t handle, const char* prompt,
                                                  const mrt_generation_options_t* options);

/**
 * @brief Start a transcription session
 *
 * @return MRT_ERROR_AUDIO_FORMAT for an empty buffer or a sample rate the
 *         backend does not accept
 */
MRT_API mrt_result_t mrt_session_start_transcription(mrt_session_handle_t handle,
                                                     const mrt_audio_buffer_t* audio,
                                                     int32_t timeout_ms);

/** Start a synthesis session. streaming delivers audio chunks through mrt_session_next(). */
MRT_API mrt_result_t mrt_session_start_synthesis(mrt_session_handle_t handle, const char* text,
                                                 mrt_bool_t streaming, int32_t timeout_ms);

/**
 * @brief Pull the next chunk of a streaming session
 *
 * After the last chunk, one call sets *out_finished; later calls fail with
 * MRT_ERROR_INVALID_STATE.
 *
 * @return MRT_SUCCESS, MRT_ERROR_TIMEOUT, MRT_ERROR_INVALID_STATE
 */
MRT_API mrt_result_t mrt_session_next(mrt_session_handle_t handle, int32_t timeout_ms,
                                      mrt_progress_event_t* out_event, mrt_bool_t* out_finished);

/**
 * @brief Block until the session reaches a terminal state
 *
 * @return The session's result code once terminal, MRT_ERROR_TIMEOUT otherwise
 */
MRT_API mrt_result_t mrt_session_wait(mrt_session_handle_t handle, int32_t timeout_ms);

/** Cancel the session and wait until its resources are released. */
MRT_API mrt_result_t mrt_session_cancel(mrt_session_handle_t handle);

/** Cancel every session bound to a model (e.g. before unloading it). */
MRT_API mrt_result_t mrt_session_cancel_for_model(const char* model_id);

/** Cancel if running and free the handle. */
MRT_API void mrt_session_destroy(mrt_session_handle_t handle);

// =============================================================================
// QUERIES
// =============================================================================

MRT_API mrt_session_state_t mrt_session_get_state(mrt_session_handle_t handle);

/** Session id. Valid until the handle is destroyed. */
MRT_API const char* mrt_session_get_id(mrt_session_handle_t handle);

/** Accumulated text output (partial if the session failed). Free with mrt_free(). */
MRT_API mrt_result_t mrt_session_get_text(mrt_session_handle_t handle, char** out_text);

/** Accumulated audio output. Free with mrt_free(). */
MRT_API mrt_result_t mrt_session_get_audio(mrt_session_handle_t handle, float** out_samples,
                                           size_t* out_sample_count, int32_t* out_sample_rate_hz);

/** Terminal error (code and backend message) of a failed or cancelled session. */
MRT_API mrt_result_t mrt_session_get_error(mrt_session_handle_t handle, const char** out_message);

MRT_API const char* mrt_session_state_name(mrt_session_state_t state);

// =============================================================================
// BLOCKING CONVENIENCE
// =============================================================================

/** Generate a complete response. *out_text is freed with mrt_free(). */
MRT_API mrt_result_t mrt_generate(const char* model_id, const char* prompt,
                                  const mrt_generation_options_t* options, char** out_text);

/**
 * Token callback for mrt_generate_stream(). Return MRT_FALSE to cancel.
 */
typedef mrt_bool_t (*mrt_token_callback_fn)(const char* token, size_t length, void* user_data);

/**
 * @brief Generate with streaming, invoking callback on the calling thread
 *
 * @return MRT_SUCCESS, MRT_ERROR_CANCELLED when the callback stopped it, or the
 *         session's error
 */
MRT_API mrt_result_t mrt_generate_stream(const char* model_id, const char* prompt,
                                         const mrt_generation_options_t* options,
                                         mrt_token_callback_fn callback, void* user_data);

MRT_API mrt_result_t mrt_transcribe(const char* model_id, const mrt_audio_buffer_t* audio,
                                    char** out_text);

MRT_API mrt_result_t mrt_synthesize(const char* model_id, const char* text, float** out_samples,
                                    size_t* out_sample_count, int32_t* out_sample_rate_hz);

/** Generate with the most recently loaded text generation model. */
MRT_API mrt_result_t mrt_chat(const char* prompt, char** out_text);

/** Streaming variant of mrt_chat(). */
MRT_API mrt_result_t mrt_chat_stream(const char* prompt, mrt_token_callback_fn callback,
                                     void* user_data);

#ifdef __cplusplus
}
#endif

#endif /* MRT_SESSION_H */
