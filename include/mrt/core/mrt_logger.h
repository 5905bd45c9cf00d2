/**
 * @file mrt_logger.h
 * @brief modelrt - Logging
 *
 * Leveled, category-tagged logging. Messages go to the platform adapter's
 * log callback when one is configured, otherwise to stdout/stderr.
 *
 * Usage:
 *   MRT_LOG_INFO("Download", "Fetching %s", model_id);
 *   MRT_LOG_ERROR("Session", "Backend step failed: %d", rc);
 */

#ifndef MRT_LOGGER_H
#define MRT_LOGGER_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/** Log a preformatted message. */
MRT_API void mrt_log(mrt_log_level_t level, const char* category, const char* message);

/** Log a printf-style message. */
MRT_API void mrt_logf(mrt_log_level_t level, const char* category, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

/** Set the minimum level that is emitted. */
MRT_API void mrt_logger_set_min_level(mrt_log_level_t level);

/** Get the minimum level that is emitted. */
MRT_API mrt_log_level_t mrt_logger_get_min_level(void);

/** Enable or disable the stdout/stderr fallback used when no callback is set. */
MRT_API void mrt_logger_set_stderr_fallback(mrt_bool_t enabled);

#ifdef __cplusplus
}
#endif

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define MRT_LOG_TRACE(category, ...) mrt_logf(MRT_LOG_TRACE, category, __VA_ARGS__)
#define MRT_LOG_DEBUG(category, ...) mrt_logf(MRT_LOG_DEBUG, category, __VA_ARGS__)
#define MRT_LOG_INFO(category, ...) mrt_logf(MRT_LOG_INFO, category, __VA_ARGS__)
#define MRT_LOG_WARNING(category, ...) mrt_logf(MRT_LOG_WARNING, category, __VA_ARGS__)
#define MRT_LOG_ERROR(category, ...) mrt_logf(MRT_LOG_ERROR, category, __VA_ARGS__)
#define MRT_LOG_FATAL(category, ...) mrt_logf(MRT_LOG_FATAL, category, __VA_ARGS__)

#endif /* MRT_LOGGER_H */
