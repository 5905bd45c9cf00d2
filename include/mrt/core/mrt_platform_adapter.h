/**
 * @file mrt_platform_adapter.h
 * @brief modelrt - Platform Adapter
 *
 * Callbacks a binding supplies so the runtime can reach platform services:
 * logging, clock, memory and storage queries and an optional HTTP transport.
 * Every entry is optional; the runtime falls back to its own implementation
 * (stderr logging, steady clock, OS queries, built-in HTTP client).
 */

#ifndef MRT_PLATFORM_ADAPTER_H
#define MRT_PLATFORM_ADAPTER_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// MEMORY INFO
// =============================================================================

typedef struct mrt_memory_info {
    uint64_t total_bytes;
    uint64_t available_bytes;
} mrt_memory_info_t;

// =============================================================================
// HTTP TRANSPORT
// =============================================================================

/**
 * Called once with the response status before any body bytes.
 * Return MRT_FALSE to abort the transfer.
 */
typedef mrt_bool_t (*mrt_http_status_fn)(int32_t status, void* sink_user_data);

/**
 * Called for each received body chunk, in order.
 * Return MRT_FALSE to stop the transfer at this chunk boundary.
 */
typedef mrt_bool_t (*mrt_http_chunk_fn)(const uint8_t* data, size_t size, void* sink_user_data);

/**
 * HTTP(S) transport with range support.
 *
 * Lack of range support is reported through probe(), it is not an error.
 */
typedef struct mrt_http_transport {
    /**
     * Query the resource size and whether the server honours byte ranges.
     * out_content_length is set to -1 when unknown.
     */
    mrt_result_t (*probe)(const char* url, int64_t* out_content_length,
                          mrt_bool_t* out_accepts_ranges, void* user_data);

    /**
     * GET the resource starting at byte offset (offset 0 means the whole
     * resource). Invokes on_status then on_chunk for every body chunk.
     * Returns MRT_SUCCESS when the response completed or a sink stopped it,
     * MRT_ERROR_NETWORK on a connection failure.
     */
    mrt_result_t (*get)(const char* url, int64_t offset, mrt_http_status_fn on_status,
                        mrt_http_chunk_fn on_chunk, void* sink_user_data, void* user_data);

    void* user_data;
} mrt_http_transport_t;

// =============================================================================
// PLATFORM ADAPTER
// =============================================================================

typedef struct mrt_platform_adapter {
    /** Route a log line to the platform logger. */
    void (*log)(mrt_log_level_t level, const char* category, const char* message,
                void* user_data);

    /** Monotonic milliseconds. */
    int64_t (*now_ms)(void* user_data);

    /** Device memory. */
    mrt_result_t (*get_memory_info)(mrt_memory_info_t* out_info, void* user_data);

    /** Free bytes on the volume holding path. */
    mrt_result_t (*get_free_storage)(const char* path, uint64_t* out_bytes, void* user_data);

    /** Transport for model downloads. NULL uses the built-in HTTP client. */
    const mrt_http_transport_t* http_transport;

    void* user_data;
} mrt_platform_adapter_t;

/**
 * @brief Get the adapter of the running instance
 *
 * @return The adapter passed to mrt_init(), or NULL when not initialized or
 *         none was supplied.
 */
MRT_API const mrt_platform_adapter_t* mrt_get_platform_adapter(void);

#ifdef __cplusplus
}
#endif

#endif /* MRT_PLATFORM_ADAPTER_H */
