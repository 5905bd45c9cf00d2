/**
 * @file model_types.cpp
 * @brief modelrt - Model Types Implementation
 */

#include "infrastructure/model_management/model_types.h"

#include <cctype>
#include <cstring>

#include "mrt/core/mrt_error.h"

namespace mrt {

bool ModelDescriptor::operator==(const ModelDescriptor& other) const {
    return id == other.id && name == other.name && format == other.format &&
           download_size == other.download_size && memory_required == other.memory_required &&
           url == other.url && checksum == other.checksum &&
           checksum_algorithm == other.checksum_algorithm;
}

bool is_valid_model_id(const std::string& id) {
    if (id.empty() || id.size() > 128 || id == "." || id == "..") {
        return false;
    }
    for (char c : id) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::string to_lower_hex(const std::string& hex) {
    std::string out = hex;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

mrt_result_t validate_descriptor(const ModelDescriptor& descriptor) {
    if (!is_valid_model_id(descriptor.id)) {
        mrt_error_set_details("Model id must be non-empty and use [A-Za-z0-9._-]");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (descriptor.format == MRT_MODEL_FORMAT_UNKNOWN) {
        mrt_error_set_details("Model format is unknown");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (descriptor.download_size < 0 || descriptor.memory_required < 0) {
        mrt_error_set_details("Model sizes must not be negative");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (descriptor.url.empty()) {
        mrt_error_set_details("Model URL is required");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (descriptor.checksum_algorithm != MRT_CHECKSUM_SHA256) {
        mrt_error_set_details("Only sha256 checksums are supported");
        return MRT_ERROR_CHECKSUM_UNSUPPORTED;
    }
    if (descriptor.checksum.size() != 64) {
        mrt_error_set_details("sha256 checksum must be 64 hex characters");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    for (char c : descriptor.checksum) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            mrt_error_set_details("Checksum is not hex");
            return MRT_ERROR_INVALID_ARGUMENT;
        }
    }
    return MRT_SUCCESS;
}

ModelDescriptor descriptor_from_c(const mrt_model_descriptor_t& descriptor) {
    ModelDescriptor out;
    out.id = descriptor.id ? descriptor.id : "";
    out.name = descriptor.name ? descriptor.name : "";
    out.format = descriptor.format;
    out.download_size = descriptor.download_size;
    out.memory_required = descriptor.memory_required;
    out.url = descriptor.url ? descriptor.url : "";
    out.checksum = to_lower_hex(descriptor.checksum ? descriptor.checksum : "");
    out.checksum_algorithm = descriptor.checksum_algorithm;
    return out;
}

mrt_model_descriptor_t* descriptor_to_c(const ModelDescriptor& descriptor) {
    auto* out = static_cast<mrt_model_descriptor_t*>(mrt_alloc(sizeof(mrt_model_descriptor_t)));
    if (out == nullptr) {
        return nullptr;
    }
    memset(out, 0, sizeof(*out));
    out->id = mrt_strdup(descriptor.id.c_str());
    out->name = mrt_strdup(descriptor.name.c_str());
    out->format = descriptor.format;
    out->download_size = descriptor.download_size;
    out->memory_required = descriptor.memory_required;
    out->url = mrt_strdup(descriptor.url.c_str());
    out->checksum = mrt_strdup(descriptor.checksum.c_str());
    out->checksum_algorithm = descriptor.checksum_algorithm;
    return out;
}

void artifact_to_c(const ModelArtifact& artifact, mrt_model_artifact_t* out) {
    out->id = mrt_strdup(artifact.id.c_str());
    out->local_path = mrt_strdup(artifact.local_path.c_str());
    out->downloaded_bytes = artifact.downloaded_bytes;
    out->size_on_disk = artifact.size_on_disk;
    out->state = artifact.state;
}

const char* artifact_extension(mrt_model_format_t format) {
    switch (format) {
        case MRT_MODEL_FORMAT_GGUF_LLM:
            return ".gguf";
        case MRT_MODEL_FORMAT_WHISPER_STT:
            return ".bin";
        case MRT_MODEL_FORMAT_PIPER_TTS:
            return ".onnx";
        default:
            return ".model";
    }
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

void mrt_model_artifact_free(mrt_model_artifact_t* artifact) {
    if (artifact == nullptr) {
        return;
    }
    mrt_free(artifact->id);
    mrt_free(artifact->local_path);
    artifact->id = nullptr;
    artifact->local_path = nullptr;
}

void mrt_model_artifact_list_free(mrt_model_artifact_t* artifacts, size_t count) {
    if (artifacts == nullptr) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        mrt_model_artifact_free(&artifacts[i]);
    }
    mrt_free(artifacts);
}

const char* mrt_model_format_name(mrt_model_format_t format) {
    switch (format) {
        case MRT_MODEL_FORMAT_GGUF_LLM:
            return "gguf";
        case MRT_MODEL_FORMAT_WHISPER_STT:
            return "whisper";
        case MRT_MODEL_FORMAT_PIPER_TTS:
            return "piper";
        default:
            return "unknown";
    }
}

mrt_model_format_t mrt_model_format_from_string(const char* name) {
    if (name == nullptr) {
        return MRT_MODEL_FORMAT_UNKNOWN;
    }
    if (strcmp(name, "gguf") == 0) return MRT_MODEL_FORMAT_GGUF_LLM;
    if (strcmp(name, "whisper") == 0) return MRT_MODEL_FORMAT_WHISPER_STT;
    if (strcmp(name, "piper") == 0) return MRT_MODEL_FORMAT_PIPER_TTS;
    return MRT_MODEL_FORMAT_UNKNOWN;
}

const char* mrt_artifact_state_name(mrt_artifact_state_t state) {
    switch (state) {
        case MRT_ARTIFACT_UNVERIFIED:
            return "unverified";
        case MRT_ARTIFACT_VERIFIED:
            return "verified";
        case MRT_ARTIFACT_CORRUPT:
            return "corrupt";
        default:
            return "unknown";
    }
}

}  // extern "C"
