/**
 * @file mrt_core.h
 * @brief modelrt - Core Initialization
 *
 * Process-wide entry point. mrt_init() creates the single runtime instance;
 * every other operation fails with MRT_ERROR_NOT_INITIALIZED before it, and a
 * second mrt_init() without mrt_shutdown() fails with
 * MRT_ERROR_ALREADY_INITIALIZED.
 */

#ifndef MRT_CORE_H
#define MRT_CORE_H

#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_platform_adapter.h"
#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// CONFIGURATION
// =============================================================================

typedef enum mrt_environment {
    MRT_ENV_DEVELOPMENT = 0,
    MRT_ENV_STAGING = 1,
    MRT_ENV_PRODUCTION = 2   /**< Suppresses TRACE and DEBUG logs */
} mrt_environment_t;

typedef struct mrt_config {
    /** Platform callbacks, may be NULL. Copied by mrt_init(). */
    const mrt_platform_adapter_t* platform_adapter;

    mrt_log_level_t log_level;
    const char* log_tag;
    mrt_environment_t environment;

    /** Directory holding model artifacts and the manifest. Required. */
    const char* models_directory;

    /** Absolute memory ceiling. 0 = use memory_ceiling_fraction. */
    int64_t memory_ceiling_bytes;
    /** Fraction of device RAM, in (0, 1]. */
    float memory_ceiling_fraction;

    /** Storage quota for all artifacts. 0 = unlimited. */
    int64_t storage_quota_bytes;

    /** Worker threads. 0 = hardware concurrency clamped to [2, 8]. */
    int32_t worker_threads;

    /** Per-subscriber event queue capacity. 0 = 64. */
    int32_t stream_buffer_chunks;

    /** How often a download checkpoints its byte count into the manifest. 0 = 4 MiB. */
    int64_t download_persist_interval_bytes;

    /** JSON model catalog registered at init. May be NULL. */
    const char* catalog_json;
} mrt_config_t;

/** Fill a config with defaults (models_directory still has to be set). */
MRT_API void mrt_config_init(mrt_config_t* config);

// =============================================================================
// LIFECYCLE
// =============================================================================

/**
 * @brief Initialize the runtime
 *
 * @return MRT_SUCCESS, MRT_ERROR_ALREADY_INITIALIZED, MRT_ERROR_INVALID_CONFIGURATION,
 *         MRT_ERROR_INITIALIZATION_FAILED (models directory or manifest unusable)
 */
MRT_API mrt_result_t mrt_init(const mrt_config_t* config);

/**
 * @brief Tear the runtime down
 *
 * Cancels pipeline runs, sessions and downloads, unloads every model and
 * stops the worker pool. mrt_init() may be called again afterwards.
 */
MRT_API void mrt_shutdown(void);

MRT_API mrt_bool_t mrt_is_initialized(void);

/** Library version string, e.g. "1.0.0". */
MRT_API const char* mrt_get_version(void);

#ifdef __cplusplus
}
#endif

#endif /* MRT_CORE_H */
