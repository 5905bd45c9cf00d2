/**
 * @file mrt_types.h
 * @brief modelrt - Common Types and Definitions
 *
 * Basic types, visibility macros and memory helpers shared by every
 * public header of the runtime orchestration layer.
 */

#ifndef MRT_TYPES_H
#define MRT_TYPES_H

#include <stddef.h>
#include <stdint.h>

// =============================================================================
// API VISIBILITY
// =============================================================================

#if defined(_WIN32)
#if defined(MRT_BUILDING_LIBRARY)
#define MRT_API __declspec(dllexport)
#else
#define MRT_API
#endif
#else
#define MRT_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// BASIC TYPES
// =============================================================================

/** Result code. 0 is success, negative values are errors (see mrt_error.h). */
typedef int32_t mrt_result_t;

/** C-compatible boolean. */
typedef int32_t mrt_bool_t;

#define MRT_TRUE 1
#define MRT_FALSE 0

/** Opaque handle. */
typedef void* mrt_handle_t;

/** Timeout value meaning "wait forever". */
#define MRT_WAIT_FOREVER (-1)

// =============================================================================
// LOG LEVELS
// =============================================================================

typedef enum mrt_log_level {
    MRT_LOG_TRACE = 0,
    MRT_LOG_DEBUG = 1,
    MRT_LOG_INFO = 2,
    MRT_LOG_WARNING = 3,
    MRT_LOG_ERROR = 4,
    MRT_LOG_FATAL = 5
} mrt_log_level_t;

// =============================================================================
// MEMORY HELPERS
// =============================================================================

/**
 * Allocate memory that the caller later releases with mrt_free().
 * Every string or array returned by the API is allocated this way.
 */
MRT_API void* mrt_alloc(size_t size);

/** Release memory returned by the API. NULL is ignored. */
MRT_API void mrt_free(void* ptr);

/** Duplicate a string with mrt_alloc(). Returns NULL for NULL input. */
MRT_API char* mrt_strdup(const char* str);

#ifdef __cplusplus
}
#endif

#endif /* MRT_TYPES_H */
