/**
 * @file mrt_events.h
 * @brief modelrt - Progress Events
 *
 * Progress events are produced by downloads (byte progress) and sessions
 * (token and audio chunks). Sequence numbers are strictly increasing per
 * subject; a gap means the consumer missed events, there is no ordering
 * across subjects.
 */

#ifndef MRT_EVENTS_H
#define MRT_EVENTS_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum mrt_progress_kind {
    MRT_PROGRESS_BYTES = 0,        /**< Download byte progress */
    MRT_PROGRESS_TOKEN = 1,        /**< Generated text chunk */
    MRT_PROGRESS_AUDIO_CHUNK = 2   /**< Synthesized audio chunk */
} mrt_progress_kind_t;

/**
 * @brief One progress event
 *
 * Pointer members are borrowed; they stay valid until the next call on the
 * handle that produced the event (or until the listener returns).
 */
typedef struct mrt_progress_event {
    mrt_progress_kind_t kind;
    const char* subject_id;     /**< Download model id or session id */
    uint64_t sequence;          /**< Strictly increasing per subject, starts at 1 */

    int64_t bytes_downloaded;   /**< BYTES */
    int64_t bytes_total;        /**< BYTES, -1 when unknown */

    const char* text;           /**< TOKEN */
    size_t text_length;

    const float* audio;         /**< AUDIO_CHUNK, mono PCM float */
    size_t audio_samples;
    int32_t sample_rate_hz;
} mrt_progress_event_t;

/**
 * Process-wide progress listener. Called on runtime worker threads; it must
 * not block and must not call back into blocking runtime operations.
 */
typedef void (*mrt_progress_listener_fn)(const mrt_progress_event_t* event, void* user_data);

/**
 * @brief Set the progress listener of the running instance (NULL removes it)
 *
 * @return MRT_SUCCESS, or MRT_ERROR_NOT_INITIALIZED
 */
MRT_API mrt_result_t mrt_events_set_listener(mrt_progress_listener_fn listener, void* user_data);

/** Whether a progress listener is set. */
MRT_API mrt_bool_t mrt_events_has_listener(void);

/** Human-readable name of a progress kind. */
MRT_API const char* mrt_progress_kind_name(mrt_progress_kind_t kind);

#ifdef __cplusplus
}
#endif

#endif /* MRT_EVENTS_H */
