/**
 * @file mrt_model_registry.h
 * @brief modelrt - Model Descriptor Registry
 *
 * In-memory store of model descriptors. Descriptors are immutable once
 * registered. They can be registered one by one or from a JSON catalog:
 *
 *   {
 *     "version": 1,
 *     "models": [
 *       { "id": "smollm2-360m", "name": "SmolLM2 360M", "format": "gguf",
 *         "url": "https://...", "download_size": 400000000,
 *         "memory_required": 500000000, "checksum": "<sha256 hex>",
 *         "checksum_algorithm": "sha256" }
 *     ]
 *   }
 */

#ifndef MRT_MODEL_REGISTRY_H
#define MRT_MODEL_REGISTRY_H

#include "mrt/core/mrt_types.h"
#include "mrt/infrastructure/model_management/mrt_model_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Register a model descriptor
 *
 * @return MRT_SUCCESS (also when an identical descriptor is already registered),
 *         MRT_ERROR_CONFLICTING_REGISTRATION if the id exists with different
 *         fields, MRT_ERROR_INVALID_ARGUMENT for a malformed descriptor,
 *         MRT_ERROR_CHECKSUM_UNSUPPORTED for an unknown checksum algorithm
 */
MRT_API mrt_result_t mrt_model_register(const mrt_model_descriptor_t* descriptor);

/**
 * @brief Get a descriptor by id
 *
 * @param out_descriptor Allocated copy, free with mrt_model_descriptor_free()
 * @return MRT_SUCCESS or MRT_ERROR_MODEL_NOT_FOUND
 */
MRT_API mrt_result_t mrt_model_get(const char* model_id, mrt_model_descriptor_t** out_descriptor);

/** All descriptors, ordered by id. Free with mrt_model_descriptor_list_free(). */
MRT_API mrt_result_t mrt_model_list(mrt_model_descriptor_t*** out_descriptors, size_t* out_count);

MRT_API void mrt_model_descriptor_free(mrt_model_descriptor_t* descriptor);

MRT_API void mrt_model_descriptor_list_free(mrt_model_descriptor_t** descriptors, size_t count);

/**
 * @brief Register every model of a JSON catalog
 *
 * The catalog is validated as a whole before anything is registered.
 *
 * @param json Catalog document
 * @param out_registered Number of descriptors newly registered (may be NULL)
 * @return MRT_SUCCESS, MRT_ERROR_INVALID_ARGUMENT for malformed JSON or entries,
 *         MRT_ERROR_CONFLICTING_REGISTRATION when an entry conflicts
 */
MRT_API mrt_result_t mrt_model_catalog_load_json(const char* json, size_t* out_registered);

#ifdef __cplusplus
}
#endif

#endif /* MRT_MODEL_REGISTRY_H */
