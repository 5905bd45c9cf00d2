/**
 * @file model_types.h
 * @brief modelrt - Model Types (internal)
 */

#ifndef MRT_MODEL_TYPES_INTERNAL_H
#define MRT_MODEL_TYPES_INTERNAL_H

#include <cstdint>
#include <string>

#include "mrt/infrastructure/model_management/mrt_model_types.h"

namespace mrt {

struct ModelDescriptor {
    std::string id;
    std::string name;
    mrt_model_format_t format = MRT_MODEL_FORMAT_UNKNOWN;
    int64_t download_size = 0;
    int64_t memory_required = 0;
    std::string url;
    std::string checksum;  // lowercase hex
    mrt_checksum_algorithm_t checksum_algorithm = MRT_CHECKSUM_SHA256;

    bool operator==(const ModelDescriptor& other) const;
    bool operator!=(const ModelDescriptor& other) const { return !(*this == other); }
};

struct ModelArtifact {
    std::string id;
    std::string local_path;
    int64_t downloaded_bytes = 0;
    int64_t size_on_disk = 0;
    mrt_artifact_state_t state = MRT_ARTIFACT_UNVERIFIED;
};

// Letters, digits, '.', '_' and '-'; not "." or ".."
bool is_valid_model_id(const std::string& id);

std::string to_lower_hex(const std::string& hex);

// Checks every field; sets error details on failure
mrt_result_t validate_descriptor(const ModelDescriptor& descriptor);

ModelDescriptor descriptor_from_c(const mrt_model_descriptor_t& descriptor);

// Deep copy with mrt_alloc'd strings
mrt_model_descriptor_t* descriptor_to_c(const ModelDescriptor& descriptor);

void artifact_to_c(const ModelArtifact& artifact, mrt_model_artifact_t* out);

// File extension of the final artifact for a format (".gguf", ".bin", ".onnx")
const char* artifact_extension(mrt_model_format_t format);

}  // namespace mrt

#endif  // MRT_MODEL_TYPES_INTERNAL_H
