/**
 * @file backend_registry.cpp
 * @brief modelrt - Backend Registry Implementation
 *
 * Provides:
 * - Idempotent registration of inference engines by name
 * - Conflict detection when a name is re-registered differently
 * - Format-based lookup in registration order
 */

#include "infrastructure/registry/backend_registry.h"

#include <algorithm>
#include <cstring>

#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

bool capabilities_equal(const mrt_backend_capabilities_t& a, const mrt_backend_capabilities_t& b) {
    if (a.kind != b.kind || a.format_mask != b.format_mask ||
        (a.supports_streaming != MRT_FALSE) != (b.supports_streaming != MRT_FALSE)) {
        return false;
    }
    switch (a.kind) {
        case MRT_CAPABILITY_TEXT_GENERATION:
            return a.params.generation.max_context == b.params.generation.max_context;
        case MRT_CAPABILITY_TRANSCRIPTION:
            return a.params.transcription.sample_rate_hz == b.params.transcription.sample_rate_hz;
        case MRT_CAPABILITY_SYNTHESIS:
            return a.params.synthesis.sample_rate_hz == b.params.synthesis.sample_rate_hz;
        default:
            return false;
    }
}

namespace {

mrt_result_t validate_backend(const mrt_backend_info_t& info) {
    if (info.name == nullptr || info.name[0] == '\0') {
        mrt_error_set_details("Backend name is required");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (info.ops.create_session == nullptr || info.ops.step == nullptr ||
        info.ops.destroy == nullptr) {
        mrt_error_set_details("create_session, step and destroy are required");
        return MRT_ERROR_NULL_POINTER;
    }
    const auto& caps = info.capabilities;
    if (caps.kind != MRT_CAPABILITY_TEXT_GENERATION && caps.kind != MRT_CAPABILITY_TRANSCRIPTION &&
        caps.kind != MRT_CAPABILITY_SYNTHESIS) {
        mrt_error_set_details("Unknown capability kind");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    if (caps.format_mask == 0) {
        mrt_error_set_details("Backend declares no model formats");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    const mrt_model_format_t formats[] = {MRT_MODEL_FORMAT_GGUF_LLM, MRT_MODEL_FORMAT_WHISPER_STT,
                                          MRT_MODEL_FORMAT_PIPER_TTS};
    uint32_t known = 0;
    for (auto format : formats) {
        known |= MRT_FORMAT_BIT(format);
        if ((caps.format_mask & MRT_FORMAT_BIT(format)) != 0 &&
            mrt_capability_kind_for_format(format) != caps.kind) {
            mrt_error_set_details("Declared format does not match the capability kind");
            return MRT_ERROR_INVALID_ARGUMENT;
        }
    }
    if ((caps.format_mask & ~known) != 0) {
        mrt_error_set_details("Backend declares an unknown model format");
        return MRT_ERROR_INVALID_ARGUMENT;
    }
    return MRT_SUCCESS;
}

}  // namespace

mrt_result_t BackendRegistry::register_backend(const mrt_backend_info_t& info) {
    mrt_result_t rc = validate_backend(info);
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& existing : backends_) {
        if (existing->name != info.name) {
            continue;
        }
        if (capabilities_equal(existing->capabilities, info.capabilities)) {
            MRT_LOG_DEBUG("BackendRegistry", "Backend '%s' already registered", info.name);
            return MRT_SUCCESS;
        }
        std::string details =
            std::string("Backend '") + info.name + "' is registered with different capabilities";
        mrt_error_set_details(details.c_str());
        MRT_LOG_ERROR("BackendRegistry", "%s", details.c_str());
        return MRT_ERROR_CONFLICTING_REGISTRATION;
    }

    auto entry = std::make_shared<BackendEntry>();
    entry->name = info.name;
    entry->capabilities = info.capabilities;
    entry->ops = info.ops;
    entry->user_data = info.user_data;
    backends_.push_back(std::move(entry));

    MRT_LOG_INFO("BackendRegistry", "Registered backend '%s' (kind=%d, formats=0x%x)", info.name,
                 static_cast<int>(info.capabilities.kind), info.capabilities.format_mask);
    return MRT_SUCCESS;
}

mrt_result_t BackendRegistry::unregister_backend(const std::string& name,
                                                 const InUsePredicate& in_use) {
    // Asked before taking the lock: the admission controller looks backends up
    // under its own lock. Loaded models keep their entry alive regardless.
    if (in_use && in_use(name)) {
        mrt_error_set_details("Unload models served by this backend first");
        return MRT_ERROR_INVALID_STATE;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(backends_.begin(), backends_.end(),
                           [&name](const auto& entry) { return entry->name == name; });
    if (it == backends_.end()) {
        return MRT_ERROR_BACKEND_NOT_FOUND;
    }
    backends_.erase(it);
    MRT_LOG_INFO("BackendRegistry", "Unregistered backend '%s'", name.c_str());
    return MRT_SUCCESS;
}

std::shared_ptr<const BackendEntry> BackendRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : backends_) {
        if (entry->name == name) {
            return entry;
        }
    }
    return nullptr;
}

std::shared_ptr<const BackendEntry> BackendRegistry::find_for_format(
    mrt_model_format_t format) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : backends_) {
        if (entry->supports(format)) {
            return entry;
        }
    }
    return nullptr;
}

std::vector<std::string> BackendRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(backends_.size());
    for (const auto& entry : backends_) {
        out.push_back(entry->name);
    }
    return out;
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

mrt_capability_kind_t mrt_capability_kind_for_format(mrt_model_format_t format) {
    switch (format) {
        case MRT_MODEL_FORMAT_WHISPER_STT:
            return MRT_CAPABILITY_TRANSCRIPTION;
        case MRT_MODEL_FORMAT_PIPER_TTS:
            return MRT_CAPABILITY_SYNTHESIS;
        case MRT_MODEL_FORMAT_GGUF_LLM:
        default:
            return MRT_CAPABILITY_TEXT_GENERATION;
    }
}

mrt_result_t mrt_backend_register(const mrt_backend_info_t* backend) {
    if (backend == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    return ctx->backends().register_backend(*backend);
}

mrt_result_t mrt_backend_unregister(const char* name) {
    if (name == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto& admission = ctx->admission();
    return ctx->backends().unregister_backend(
        name, [&admission](const std::string& backend) { return admission.uses_backend(backend); });
}

mrt_result_t mrt_backend_get_capabilities(const char* name,
                                          mrt_backend_capabilities_t* out_capabilities) {
    if (name == nullptr || out_capabilities == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto entry = ctx->backends().find(name);
    if (!entry) {
        return MRT_ERROR_BACKEND_NOT_FOUND;
    }
    *out_capabilities = entry->capabilities;
    return MRT_SUCCESS;
}

mrt_result_t mrt_backend_find_for_format(mrt_model_format_t format, char** out_name) {
    if (out_name == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto entry = ctx->backends().find_for_format(format);
    if (!entry) {
        return MRT_ERROR_BACKEND_NOT_FOUND;
    }
    *out_name = mrt_strdup(entry->name.c_str());
    return MRT_SUCCESS;
}

mrt_result_t mrt_backend_list(char*** out_names, size_t* out_count) {
    if (out_names == nullptr || out_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto names = ctx->backends().names();
    *out_names = nullptr;
    *out_count = 0;
    if (names.empty()) {
        return MRT_SUCCESS;
    }
    auto** list = static_cast<char**>(mrt_alloc(sizeof(char*) * names.size()));
    if (list == nullptr) {
        return MRT_ERROR_OUT_OF_MEMORY;
    }
    for (size_t i = 0; i < names.size(); ++i) {
        list[i] = mrt_strdup(names[i].c_str());
    }
    *out_names = list;
    *out_count = names.size();
    return MRT_SUCCESS;
}

void mrt_backend_names_free(char** names, size_t count) {
    if (names == nullptr) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        mrt_free(names[i]);
    }
    mrt_free(names);
}

}  // extern "C"
