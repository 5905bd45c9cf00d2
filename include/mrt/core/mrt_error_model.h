#ifndef MRT_ERROR_MODEL_H
#define MRT_ERROR_MODEL_H

#include "mrt/core/mrt_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Structured error value handed to bindings
 *
 * Wraps an mrt_result_t into (code, message, category) so every binding
 * reports failures the same way.
 */
typedef struct {
    mrt_result_t code;      /**< Numeric error code */
    const char* message;    /**< Human-readable error message */
    const char* category;   /**< Error category (e.g., Model, Network, Validation) */
} mrt_error_model_t;

/**
 * @brief Create structured error model from error code
 */
MRT_API mrt_error_model_t mrt_make_error_model(mrt_result_t code);

/**
 * @brief Get error category string from error code
 */
MRT_API const char* mrt_error_category(mrt_result_t code);

/**
 * @brief Whether a failure of this kind may succeed when the caller retries
 *
 * Only network failures and timeouts are retryable. Integrity, storage,
 * memory and backend failures are not.
 */
MRT_API mrt_bool_t mrt_error_is_retryable(mrt_result_t code);

#ifdef __cplusplus
}
#endif

#endif // MRT_ERROR_MODEL_H
