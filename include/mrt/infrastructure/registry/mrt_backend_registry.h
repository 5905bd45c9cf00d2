/**
 * @file mrt_backend_registry.h
 * @brief modelrt - Backend Registry
 *
 * Maps a logical engine name (e.g. "llamacpp") to a capability descriptor
 * and the engine's session operations. Registration is explicit and happens
 * once at startup, after mrt_init().
 *
 * Engines are consumed through a uniform session contract:
 *   create_session(model_path, params) -> handle
 *   step(handle, input)                -> output | EOF
 *   cancel(handle)                     (advisory)
 *   destroy(handle)
 */

#ifndef MRT_BACKEND_REGISTRY_H
#define MRT_BACKEND_REGISTRY_H

#include "mrt/core/mrt_types.h"
#include "mrt/infrastructure/model_management/mrt_model_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// CAPABILITIES
// =============================================================================

typedef enum mrt_capability_kind {
    MRT_CAPABILITY_TEXT_GENERATION = 0,
    MRT_CAPABILITY_TRANSCRIPTION = 1,
    MRT_CAPABILITY_SYNTHESIS = 2
} mrt_capability_kind_t;

/**
 * @brief Tagged capability descriptor
 *
 * kind selects the active member of params.
 */
typedef struct mrt_backend_capabilities {
    mrt_capability_kind_t kind;
    uint32_t format_mask;            /**< OR of MRT_FORMAT_BIT(format) */
    mrt_bool_t supports_streaming;
    union {
        struct {
            int32_t max_context;
        } generation;
        struct {
            int32_t sample_rate_hz;  /**< Required input sample rate */
        } transcription;
        struct {
            int32_t sample_rate_hz;  /**< Output sample rate */
        } synthesis;
    } params;
} mrt_backend_capabilities_t;

// =============================================================================
// SESSION CONTRACT
// =============================================================================

typedef struct mrt_backend_session_params {
    const char* model_id;
    int32_t context_length;   /**< 0 = backend default */
    int32_t num_threads;      /**< 0 = backend default */
} mrt_backend_session_params_t;

/**
 * @brief Input of the first step of a request
 *
 * Generation and synthesis use text, transcription uses audio.
 */
typedef struct mrt_backend_input {
    const char* text;
    const char* system_prompt;   /**< Generation only, may be NULL */
    const float* audio;          /**< Mono PCM float samples */
    size_t audio_samples;
    int32_t sample_rate_hz;
    int32_t max_tokens;          /**< Generation only, 0 = backend default */
    float temperature;           /**< Generation only */
} mrt_backend_input_t;

/**
 * @brief Output of one step
 *
 * Buffers are owned by the backend and valid until the next call on the
 * same handle. An empty chunk with eof set is allowed.
 */
typedef struct mrt_backend_output {
    const char* text;
    size_t text_length;
    const float* audio;
    size_t audio_samples;
    mrt_bool_t eof;
} mrt_backend_output_t;

typedef struct mrt_backend_ops {
    /** Instantiate the engine on a model file. */
    mrt_result_t (*create_session)(const char* model_path,
                                   const mrt_backend_session_params_t* params,
                                   void** out_handle, void* user_data);

    /**
     * Advance the current request by one boundary-safe increment (token,
     * audio chunk, transcript segment). A non-NULL input starts a new request
     * and abandons any unfinished one; NULL continues the current request.
     * On failure the backend may describe the error with
     * mrt_error_set_details() on the calling thread.
     */
    mrt_result_t (*step)(void* handle, const mrt_backend_input_t* input,
                         mrt_backend_output_t* out_output, void* user_data);

    /** Ask the current request to stop at its next checkpoint. May be NULL. */
    void (*cancel)(void* handle, void* user_data);

    /** Release everything created by create_session(). */
    void (*destroy)(void* handle, void* user_data);
} mrt_backend_ops_t;

typedef struct mrt_backend_info {
    const char* name;
    mrt_backend_capabilities_t capabilities;
    mrt_backend_ops_t ops;
    void* user_data;
} mrt_backend_info_t;

// =============================================================================
// REGISTRY API
// =============================================================================

/**
 * @brief Register a backend
 *
 * Registering a name again with identical capabilities is a no-op (the first
 * registration's operations stay in effect).
 *
 * @return MRT_SUCCESS, MRT_ERROR_CONFLICTING_REGISTRATION when the name is
 *         registered with different capabilities, MRT_ERROR_NOT_INITIALIZED
 */
MRT_API mrt_result_t mrt_backend_register(const mrt_backend_info_t* backend);

/**
 * @brief Unregister a backend
 *
 * @return MRT_ERROR_INVALID_STATE while a model loaded through it is resident
 */
MRT_API mrt_result_t mrt_backend_unregister(const char* name);

MRT_API mrt_result_t mrt_backend_get_capabilities(const char* name,
                                                  mrt_backend_capabilities_t* out_capabilities);

/** Name of the first registered backend that handles format. Free with mrt_free(). */
MRT_API mrt_result_t mrt_backend_find_for_format(mrt_model_format_t format, char** out_name);

/** Names in registration order. Free with mrt_backend_names_free(). */
MRT_API mrt_result_t mrt_backend_list(char*** out_names, size_t* out_count);

MRT_API void mrt_backend_names_free(char** names, size_t count);

/** Capability kind that serves a model format. */
MRT_API mrt_capability_kind_t mrt_capability_kind_for_format(mrt_model_format_t format);

#ifdef __cplusplus
}
#endif

#endif /* MRT_BACKEND_REGISTRY_H */
