/**
 * @file mrt_voice_pipeline.h
 * @brief modelrt - Voice Pipeline
 *
 * Runs speech-in -> text -> LLM -> speech-out as a state machine:
 *
 *   IDLE -> TRANSCRIBING -> GENERATING -> SYNTHESIZING -> COMPLETED
 *
 * Any state may move to FAILED or CANCELLED. Each stage is a session created
 * only when the previous stage has produced its output, and the output of a
 * stage is the input of the next. Partial results (transcription, response
 * deltas, audio chunks) are reported as soon as they exist, and stay readable
 * after a later stage fails.
 */

#ifndef MRT_VOICE_PIPELINE_H
#define MRT_VOICE_PIPELINE_H

#include "mrt/core/mrt_types.h"
#include "mrt/features/session/mrt_session.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct mrt_voice_pipeline* mrt_voice_pipeline_handle_t;

typedef enum mrt_voice_pipeline_state {
    MRT_VOICE_PIPELINE_IDLE = 0,
    MRT_VOICE_PIPELINE_TRANSCRIBING = 1,
    MRT_VOICE_PIPELINE_GENERATING = 2,
    MRT_VOICE_PIPELINE_SYNTHESIZING = 3,
    MRT_VOICE_PIPELINE_COMPLETED = 4,
    MRT_VOICE_PIPELINE_FAILED = 5,
    MRT_VOICE_PIPELINE_CANCELLED = 6
} mrt_voice_pipeline_state_t;

typedef enum mrt_voice_pipeline_event_type {
    MRT_VOICE_EVENT_STATE_CHANGED = 0,
    MRT_VOICE_EVENT_TRANSCRIPTION = 1,    /**< text: full transcription */
    MRT_VOICE_EVENT_RESPONSE_DELTA = 2,   /**< text: generated chunk */
    MRT_VOICE_EVENT_RESPONSE = 3,         /**< text: full response */
    MRT_VOICE_EVENT_AUDIO_CHUNK = 4,      /**< audio: synthesized chunk */
    MRT_VOICE_EVENT_COMPLETED = 5,
    MRT_VOICE_EVENT_FAILED = 6,           /**< error_code, error_message, state = failed stage */
    MRT_VOICE_EVENT_CANCELLED = 7
} mrt_voice_pipeline_event_type_t;

typedef struct mrt_voice_pipeline_event {
    mrt_voice_pipeline_event_type_t type;
    mrt_voice_pipeline_state_t state;
    const char* text;
    size_t text_length;
    const float* audio;
    size_t audio_samples;
    int32_t sample_rate_hz;
    mrt_result_t error_code;
    const char* error_message;
} mrt_voice_pipeline_event_t;

/** Called on runtime worker threads, in order, for a given run. */
typedef void (*mrt_voice_pipeline_event_fn)(const mrt_voice_pipeline_event_t* event,
                                            void* user_data);

typedef struct mrt_voice_pipeline_config {
    const char* stt_model_id;
    const char* llm_model_id;
    const char* tts_model_id;
    const char* system_prompt;     /**< May be NULL */
    int32_t max_tokens;            /**< 0 = backend default */
    float temperature;
    int32_t stage_timeout_ms;      /**< Per stage, 0 = none */
} mrt_voice_pipeline_config_t;

/**
 * @brief Create a pipeline run
 *
 * @return MRT_SUCCESS or MRT_ERROR_INVALID_ARGUMENT when a model id is missing
 */
MRT_API mrt_result_t mrt_voice_pipeline_create(const mrt_voice_pipeline_config_t* config,
                                               mrt_voice_pipeline_event_fn callback,
                                               void* user_data,
                                               mrt_voice_pipeline_handle_t* out_handle);

/**
 * @brief Start the run on an audio buffer
 *
 * Returns once the transcription stage has been started.
 *
 * @return MRT_SUCCESS, MRT_ERROR_INVALID_STATE if already started, or the
 *         error of the transcription stage's creation (the run is then FAILED)
 */
MRT_API mrt_result_t mrt_voice_pipeline_start(mrt_voice_pipeline_handle_t handle,
                                              const mrt_audio_buffer_t* audio);

/** Cancel the active stage and prevent later stages. Blocks until the stage is released. */
MRT_API mrt_result_t mrt_voice_pipeline_cancel(mrt_voice_pipeline_handle_t handle);

/**
 * @brief Block until the run ends
 *
 * @return The run's result code once terminal, MRT_ERROR_TIMEOUT otherwise
 */
MRT_API mrt_result_t mrt_voice_pipeline_wait(mrt_voice_pipeline_handle_t handle,
                                             int32_t timeout_ms);

MRT_API mrt_voice_pipeline_state_t mrt_voice_pipeline_get_state(mrt_voice_pipeline_handle_t handle);

/** Stage that failed, or IDLE when the run did not fail. */
MRT_API mrt_voice_pipeline_state_t
mrt_voice_pipeline_get_failed_stage(mrt_voice_pipeline_handle_t handle);

/** Transcription so far. Free with mrt_free(). */
MRT_API mrt_result_t mrt_voice_pipeline_get_transcription(mrt_voice_pipeline_handle_t handle,
                                                          char** out_text);

/** Response so far. Free with mrt_free(). */
MRT_API mrt_result_t mrt_voice_pipeline_get_response(mrt_voice_pipeline_handle_t handle,
                                                     char** out_text);

/** Synthesized audio so far. Free with mrt_free(). */
MRT_API mrt_result_t mrt_voice_pipeline_get_audio(mrt_voice_pipeline_handle_t handle,
                                                  float** out_samples, size_t* out_sample_count,
                                                  int32_t* out_sample_rate_hz);

MRT_API mrt_result_t mrt_voice_pipeline_get_error(mrt_voice_pipeline_handle_t handle,
                                                  const char** out_message);

/** Cancel if running and free the handle. */
MRT_API void mrt_voice_pipeline_destroy(mrt_voice_pipeline_handle_t handle);

MRT_API const char* mrt_voice_pipeline_state_name(mrt_voice_pipeline_state_t state);

#ifdef __cplusplus
}
#endif

#endif /* MRT_VOICE_PIPELINE_H */
