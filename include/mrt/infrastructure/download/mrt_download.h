/**
 * @file mrt_download.h
 * @brief modelrt - Download Manager
 *
 * Resumable, checksum-verified model downloads. A fetch yields a stream of
 * BYTES progress events and ends with a verified artifact or an error:
 *
 *   MRT_ERROR_NETWORK         retryable, partial bytes are kept for resume
 *   MRT_ERROR_INTEGRITY       checksum mismatch, artifact discarded
 *   MRT_ERROR_STORAGE_FULL    quota or volume exhausted, no retry
 *   MRT_ERROR_CANCELLED       cancelled, partial bytes are kept for resume
 *
 * At most one transfer runs per model id. Fetching an id that is already
 * downloading attaches a new subscriber to the running transfer.
 *
 * Usage:
 *   mrt_download_handle_t dl;
 *   mrt_download_start("smollm2-360m", &dl);
 *   mrt_progress_event_t ev; mrt_bool_t finished = MRT_FALSE;
 *   while (mrt_download_next(dl, 1000, &ev, &finished) == MRT_SUCCESS && !finished) { ... }
 *   mrt_result_t rc = mrt_download_result(dl, &artifact);
 *   mrt_download_release(dl);
 */

#ifndef MRT_DOWNLOAD_H
#define MRT_DOWNLOAD_H

#include "mrt/core/mrt_events.h"
#include "mrt/core/mrt_types.h"
#include "mrt/infrastructure/model_management/mrt_model_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct mrt_download* mrt_download_handle_t;

typedef enum mrt_download_state {
    MRT_DOWNLOAD_STATE_RUNNING = 0,
    MRT_DOWNLOAD_STATE_COMPLETED = 1,
    MRT_DOWNLOAD_STATE_FAILED = 2,
    MRT_DOWNLOAD_STATE_CANCELLED = 3
} mrt_download_state_t;

/**
 * @brief Fetch a registered model, or attach to its running fetch
 *
 * Returns immediately; the transfer runs on the worker pool.
 *
 * @return MRT_SUCCESS or MRT_ERROR_MODEL_NOT_FOUND for an unknown id
 */
MRT_API mrt_result_t mrt_download_start(const char* model_id, mrt_download_handle_t* out_handle);

/**
 * @brief Pull the next progress event
 *
 * When the fetch has ended and every queued event was delivered,
 * *out_finished is set and no event is written.
 *
 * @return MRT_SUCCESS, or MRT_ERROR_TIMEOUT if nothing arrived in time
 */
MRT_API mrt_result_t mrt_download_next(mrt_download_handle_t handle, int32_t timeout_ms,
                                       mrt_progress_event_t* out_event,
                                       mrt_bool_t* out_finished);

/**
 * @brief Block until the fetch ends
 *
 * @return MRT_SUCCESS when it ended, MRT_ERROR_TIMEOUT otherwise
 */
MRT_API mrt_result_t mrt_download_wait(mrt_download_handle_t handle, int32_t timeout_ms);

/**
 * @brief Outcome of an ended fetch
 *
 * @param out_artifact Filled on success (may be NULL); free with mrt_model_artifact_free()
 * @return The fetch's result code, MRT_ERROR_INVALID_STATE while still running
 */
MRT_API mrt_result_t mrt_download_result(mrt_download_handle_t handle,
                                         mrt_model_artifact_t* out_artifact);

MRT_API mrt_download_state_t mrt_download_get_state(mrt_download_handle_t handle);

/** Detail message of a failed fetch. Valid until the handle is released. */
MRT_API const char* mrt_download_get_error_message(mrt_download_handle_t handle);

/**
 * @brief Cancel the transfer for every subscriber
 *
 * The transfer stops at the next chunk boundary; downloaded bytes are kept.
 * Returns once the transfer has stopped.
 */
MRT_API mrt_result_t mrt_download_cancel(mrt_download_handle_t handle);

/** Detach from the fetch and free the handle. The transfer keeps running. */
MRT_API void mrt_download_release(mrt_download_handle_t handle);

/** Blocking convenience: fetch and wait for the result. */
MRT_API mrt_result_t mrt_download_model(const char* model_id, mrt_model_artifact_t* out_artifact);

#ifdef __cplusplus
}
#endif

#endif /* MRT_DOWNLOAD_H */
