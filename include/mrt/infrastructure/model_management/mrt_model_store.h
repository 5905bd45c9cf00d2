/**
 * @file mrt_model_store.h
 * @brief modelrt - Model Store
 *
 * Tracks on-disk model artifacts, their integrity state and size. The store
 * lives in the configured models directory and keeps its records in a
 * versioned manifest (manifest.json) that survives process restarts.
 */

#ifndef MRT_MODEL_STORE_H
#define MRT_MODEL_STORE_H

#include "mrt/core/mrt_types.h"
#include "mrt/infrastructure/model_management/mrt_model_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Get the artifact record of a model
 *
 * @param out_artifact Filled with owned strings; free with mrt_model_artifact_free()
 * @return MRT_SUCCESS or MRT_ERROR_NOT_FOUND
 */
MRT_API mrt_result_t mrt_store_get(const char* model_id, mrt_model_artifact_t* out_artifact);

/** All artifact records, ordered by id. Free with mrt_model_artifact_list_free(). */
MRT_API mrt_result_t mrt_store_list(mrt_model_artifact_t** out_artifacts, size_t* out_count);

/**
 * @brief Delete a model's files and record
 *
 * @return MRT_SUCCESS, MRT_ERROR_NOT_FOUND, MRT_ERROR_MODEL_IN_USE while the
 *         model is loaded or being downloaded
 */
MRT_API mrt_result_t mrt_store_delete(const char* model_id);

/** Bytes used by all artifacts (complete and partial). */
MRT_API mrt_result_t mrt_store_get_usage(int64_t* out_used_bytes, int64_t* out_quota_bytes);

#ifdef __cplusplus
}
#endif

#endif /* MRT_MODEL_STORE_H */
