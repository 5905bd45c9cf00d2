/**
 * @file mrt_admission.h
 * @brief modelrt - Memory Admission Controller
 *
 * Loads and unloads models under a memory ceiling. When a load does not fit,
 * idle models (no active sessions) are evicted in least-recently-used order.
 * A load either fully succeeds or leaves no trace of the candidate.
 */

#ifndef MRT_ADMISSION_H
#define MRT_ADMISSION_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct mrt_loaded_model_info {
    char* model_id;
    char* backend_name;
    int64_t resident_bytes;
    int64_t last_access_ms;
    int32_t ref_count;
} mrt_loaded_model_info_t;

/**
 * @brief Load a model
 *
 * Loading a model that is already resident refreshes its last-access time.
 *
 * @return MRT_SUCCESS,
 *         MRT_ERROR_MODEL_NOT_FOUND unknown id or no verified artifact,
 *         MRT_ERROR_INSUFFICIENT_MEMORY the model cannot fit even after eviction,
 *         MRT_ERROR_BACKEND no backend for the format, or the backend failed
 */
MRT_API mrt_result_t mrt_model_load(const char* model_id);

/**
 * @brief Unload a model
 *
 * @return MRT_SUCCESS, MRT_ERROR_MODEL_NOT_LOADED, MRT_ERROR_MODEL_IN_USE when
 *         sessions are still bound to it (cancel them first)
 */
MRT_API mrt_result_t mrt_model_unload(const char* model_id);

MRT_API mrt_bool_t mrt_model_is_loaded(const char* model_id);

/** Resident models. Free with mrt_loaded_model_list_free(). */
MRT_API mrt_result_t mrt_model_list_loaded(mrt_loaded_model_info_t** out_models, size_t* out_count);

MRT_API void mrt_loaded_model_list_free(mrt_loaded_model_info_t* models, size_t count);

/** Current resident estimate and the ceiling, in bytes. */
MRT_API mrt_result_t mrt_memory_get_usage(int64_t* out_resident_bytes, int64_t* out_ceiling_bytes);

#ifdef __cplusplus
}
#endif

#endif /* MRT_ADMISSION_H */
