/**
 * @file mrt_model_types.h
 * @brief modelrt - Model Types
 *
 * Model descriptors (what a model is) and model artifacts (what is on disk).
 */

#ifndef MRT_MODEL_TYPES_H
#define MRT_MODEL_TYPES_H

#include "mrt/core/mrt_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// ENUMS
// =============================================================================

typedef enum mrt_model_format {
    MRT_MODEL_FORMAT_UNKNOWN = 0,
    MRT_MODEL_FORMAT_GGUF_LLM = 1,      /**< llama.cpp-class language model */
    MRT_MODEL_FORMAT_WHISPER_STT = 2,   /**< Whisper-class speech-to-text */
    MRT_MODEL_FORMAT_PIPER_TTS = 3      /**< Piper-class text-to-speech */
} mrt_model_format_t;

/** Bit for a format in mrt_backend_capabilities_t.format_mask. */
#define MRT_FORMAT_BIT(format) (1u << (uint32_t)(format))

typedef enum mrt_checksum_algorithm {
    MRT_CHECKSUM_SHA256 = 0
} mrt_checksum_algorithm_t;

typedef enum mrt_artifact_state {
    MRT_ARTIFACT_UNVERIFIED = 0,   /**< Partial or not yet checksummed */
    MRT_ARTIFACT_VERIFIED = 1,     /**< Complete, checksum matches */
    MRT_ARTIFACT_CORRUPT = 2       /**< Verified file changed on disk */
} mrt_artifact_state_t;

// =============================================================================
// MODEL DESCRIPTOR
// =============================================================================

/**
 * @brief Immutable description of a model
 *
 * id may contain letters, digits, '.', '_' and '-'. checksum is the hex
 * digest of the complete artifact.
 */
typedef struct mrt_model_descriptor {
    const char* id;
    const char* name;                /**< Display name, optional */
    mrt_model_format_t format;
    int64_t download_size;           /**< Declared artifact size in bytes */
    int64_t memory_required;         /**< Declared resident RAM in bytes */
    const char* url;
    const char* checksum;
    mrt_checksum_algorithm_t checksum_algorithm;
} mrt_model_descriptor_t;

// =============================================================================
// MODEL ARTIFACT
// =============================================================================

/** On-disk record of a model. Strings are owned; free with mrt_model_artifact_free(). */
typedef struct mrt_model_artifact {
    char* id;
    char* local_path;
    int64_t downloaded_bytes;
    int64_t size_on_disk;
    mrt_artifact_state_t state;
} mrt_model_artifact_t;

/** Free the strings of an artifact (not the struct itself). */
MRT_API void mrt_model_artifact_free(mrt_model_artifact_t* artifact);

/** Free an artifact array returned by mrt_store_list(). */
MRT_API void mrt_model_artifact_list_free(mrt_model_artifact_t* artifacts, size_t count);

// =============================================================================
// NAME HELPERS
// =============================================================================

MRT_API const char* mrt_model_format_name(mrt_model_format_t format);

/** Parse "gguf", "whisper" or "piper". Returns MRT_MODEL_FORMAT_UNKNOWN otherwise. */
MRT_API mrt_model_format_t mrt_model_format_from_string(const char* name);

MRT_API const char* mrt_artifact_state_name(mrt_artifact_state_t state);

#ifdef __cplusplus
}
#endif

#endif /* MRT_MODEL_TYPES_H */
