/**
 * @file mrt_error.h
 * @brief modelrt - Error Codes
 *
 * Error codes are negative and grouped in ranges by category:
 *   -100 to -109  Initialization
 *   -110 to -129  Model
 *   -130 to -149  Generation / session execution
 *   -150 to -179  Network
 *   -180 to -219  Storage
 *   -220 to -229  Hardware / memory
 *   -230 to -249  Component state
 *   -250 to -279  Validation
 *   -280 to -299  Audio
 *   -400 to -499  Module / registration
 *   -600 to -699  Backend
 *   -800 to -899  Other
 */

#ifndef MRT_ERROR_H
#define MRT_ERROR_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

#define MRT_SUCCESS ((mrt_result_t)0)

// Initialization (-100 to -109)
#define MRT_ERROR_NOT_INITIALIZED ((mrt_result_t)-100)
#define MRT_ERROR_ALREADY_INITIALIZED ((mrt_result_t)-101)
#define MRT_ERROR_INITIALIZATION_FAILED ((mrt_result_t)-102)
#define MRT_ERROR_INVALID_CONFIGURATION ((mrt_result_t)-103)

// Model (-110 to -129)
#define MRT_ERROR_MODEL_NOT_FOUND ((mrt_result_t)-110)
#define MRT_ERROR_MODEL_NOT_LOADED ((mrt_result_t)-111)
#define MRT_ERROR_MODEL_IN_USE ((mrt_result_t)-112)

// Generation / session execution (-130 to -149)
#define MRT_ERROR_CANCELLED ((mrt_result_t)-130)
#define MRT_ERROR_TIMEOUT ((mrt_result_t)-131)

// Network (-150 to -179)
#define MRT_ERROR_NETWORK ((mrt_result_t)-150)

// Storage (-180 to -219)
#define MRT_ERROR_STORAGE_FULL ((mrt_result_t)-180)
#define MRT_ERROR_FILE_IO ((mrt_result_t)-181)
#define MRT_ERROR_INTEGRITY ((mrt_result_t)-182)
#define MRT_ERROR_MANIFEST_CORRUPT ((mrt_result_t)-183)
#define MRT_ERROR_CHECKSUM_UNSUPPORTED ((mrt_result_t)-184)

// Hardware / memory (-220 to -229)
#define MRT_ERROR_INSUFFICIENT_MEMORY ((mrt_result_t)-220)

// Component state (-230 to -249)
#define MRT_ERROR_INVALID_STATE ((mrt_result_t)-230)
#define MRT_ERROR_SESSION_NOT_FOUND ((mrt_result_t)-231)

// Validation (-250 to -279)
#define MRT_ERROR_INVALID_ARGUMENT ((mrt_result_t)-250)
#define MRT_ERROR_NULL_POINTER ((mrt_result_t)-251)
#define MRT_ERROR_INVALID_HANDLE ((mrt_result_t)-252)
#define MRT_ERROR_NOT_SUPPORTED ((mrt_result_t)-253)

// Audio (-280 to -299)
#define MRT_ERROR_AUDIO_FORMAT ((mrt_result_t)-280)
#define MRT_ERROR_EMPTY_TRANSCRIPTION ((mrt_result_t)-281)

// Module / registration (-400 to -499)
#define MRT_ERROR_CONFLICTING_REGISTRATION ((mrt_result_t)-400)
#define MRT_ERROR_BACKEND_NOT_FOUND ((mrt_result_t)-401)

// Backend (-600 to -699)
#define MRT_ERROR_BACKEND ((mrt_result_t)-600)

// Other (-800 to -899)
#define MRT_ERROR_OUT_OF_MEMORY ((mrt_result_t)-800)
#define MRT_ERROR_NOT_FOUND ((mrt_result_t)-801)
#define MRT_ERROR_INTERNAL ((mrt_result_t)-802)

#define MRT_SUCCEEDED(result) ((result) >= 0)
#define MRT_FAILED(result) ((result) < 0)

/**
 * @brief Get a static, human-readable message for an error code
 *
 * @param error_code The result code
 * @return Message string (never NULL, not owned by the caller)
 */
MRT_API const char* mrt_error_message(mrt_result_t error_code);

/**
 * @brief Set the detail message of the last error on the calling thread
 *
 * Details are thread-local. NULL clears them.
 */
MRT_API void mrt_error_set_details(const char* details);

/**
 * @brief Get the detail message of the last error on the calling thread
 *
 * @return Detail string or NULL. Valid until the next call that sets details
 *         on this thread.
 */
MRT_API const char* mrt_error_get_details(void);

/** Clear the detail message on the calling thread. */
MRT_API void mrt_error_clear_details(void);

#ifdef __cplusplus
}
#endif

#endif /* MRT_ERROR_H */
