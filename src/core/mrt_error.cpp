/**
 * @file mrt_error.cpp
 * @brief modelrt - Error Messages and Thread-Local Details
 */

#include "mrt/core/mrt_error.h"

#include <string>

// =============================================================================
// THREAD-LOCAL STORAGE
// =============================================================================

namespace {

thread_local std::string g_error_details;
thread_local bool g_has_error_details = false;

}  // namespace

extern "C" {

const char* mrt_error_message(mrt_result_t error_code) {
    switch (error_code) {
        case MRT_SUCCESS:
            return "Success";

        // Initialization
        case MRT_ERROR_NOT_INITIALIZED:
            return "Runtime is not initialized";
        case MRT_ERROR_ALREADY_INITIALIZED:
            return "Runtime is already initialized";
        case MRT_ERROR_INITIALIZATION_FAILED:
            return "Initialization failed";
        case MRT_ERROR_INVALID_CONFIGURATION:
            return "Invalid configuration";

        // Model
        case MRT_ERROR_MODEL_NOT_FOUND:
            return "Model not found";
        case MRT_ERROR_MODEL_NOT_LOADED:
            return "Model is not loaded";
        case MRT_ERROR_MODEL_IN_USE:
            return "Model is in use";

        // Execution
        case MRT_ERROR_CANCELLED:
            return "Operation was cancelled";
        case MRT_ERROR_TIMEOUT:
            return "Operation timed out";

        // Network
        case MRT_ERROR_NETWORK:
            return "Network error";

        // Storage
        case MRT_ERROR_STORAGE_FULL:
            return "Insufficient storage";
        case MRT_ERROR_FILE_IO:
            return "File I/O error";
        case MRT_ERROR_INTEGRITY:
            return "Checksum verification failed";
        case MRT_ERROR_MANIFEST_CORRUPT:
            return "Artifact manifest is corrupt";
        case MRT_ERROR_CHECKSUM_UNSUPPORTED:
            return "Unsupported checksum algorithm";

        // Memory
        case MRT_ERROR_INSUFFICIENT_MEMORY:
            return "Insufficient memory";

        // Component state
        case MRT_ERROR_INVALID_STATE:
            return "Invalid state";
        case MRT_ERROR_SESSION_NOT_FOUND:
            return "Session not found";

        // Validation
        case MRT_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case MRT_ERROR_NULL_POINTER:
            return "Null pointer";
        case MRT_ERROR_INVALID_HANDLE:
            return "Invalid handle";
        case MRT_ERROR_NOT_SUPPORTED:
            return "Operation not supported";

        // Audio
        case MRT_ERROR_AUDIO_FORMAT:
            return "Unsupported audio format";
        case MRT_ERROR_EMPTY_TRANSCRIPTION:
            return "Transcription is empty";

        // Registration
        case MRT_ERROR_CONFLICTING_REGISTRATION:
            return "Conflicting registration";
        case MRT_ERROR_BACKEND_NOT_FOUND:
            return "Backend not found";

        // Backend
        case MRT_ERROR_BACKEND:
            return "Backend error";

        // Other
        case MRT_ERROR_OUT_OF_MEMORY:
            return "Out of memory";
        case MRT_ERROR_NOT_FOUND:
            return "Not found";
        case MRT_ERROR_INTERNAL:
            return "Internal error";

        default:
            return "Unknown error";
    }
}

void mrt_error_set_details(const char* details) {
    if (details == nullptr) {
        g_error_details.clear();
        g_has_error_details = false;
        return;
    }
    g_error_details = details;
    g_has_error_details = true;
}

const char* mrt_error_get_details(void) {
    return g_has_error_details ? g_error_details.c_str() : nullptr;
}

void mrt_error_clear_details(void) {
    g_error_details.clear();
    g_has_error_details = false;
}

}  // extern "C"
