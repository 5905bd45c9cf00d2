/**
 * @file model_registry.cpp
 * @brief modelrt - Model Descriptor Registry Implementation
 *
 * In-memory descriptor store. A descriptor never changes after it has been
 * registered, so artifacts and loaded models can rely on it.
 */

#include "infrastructure/model_management/model_registry.h"

#include <cstring>

#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"
#include "mrt/infrastructure/model_management/mrt_model_registry.h"

namespace mrt {

mrt_result_t ModelRegistry::check_locked(const ModelDescriptor& descriptor,
                                         bool* out_exists) const {
    mrt_result_t rc = validate_descriptor(descriptor);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    auto it = models_.find(descriptor.id);
    *out_exists = it != models_.end();
    if (*out_exists && it->second != descriptor) {
        std::string details = "Model '" + descriptor.id + "' is already registered differently";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_CONFLICTING_REGISTRATION;
    }
    return MRT_SUCCESS;
}

mrt_result_t ModelRegistry::register_model(const ModelDescriptor& descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool exists = false;
    mrt_result_t rc = check_locked(descriptor, &exists);
    if (rc != MRT_SUCCESS) {
        MRT_LOG_WARNING("ModelRegistry", "Rejected model '%s': %s", descriptor.id.c_str(),
                        mrt_error_message(rc));
        return rc;
    }
    if (exists) {
        return MRT_SUCCESS;
    }

    models_.emplace(descriptor.id, descriptor);
    MRT_LOG_INFO("ModelRegistry", "Registered model '%s' (%s, %lld bytes)",
                 descriptor.id.c_str(), mrt_model_format_name(descriptor.format),
                 static_cast<long long>(descriptor.download_size));
    return MRT_SUCCESS;
}

mrt_result_t ModelRegistry::register_all(const std::vector<ModelDescriptor>& descriptors,
                                         size_t* out_registered) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, const ModelDescriptor*> batch;
    for (const auto& descriptor : descriptors) {
        bool exists = false;
        mrt_result_t rc = check_locked(descriptor, &exists);
        if (rc != MRT_SUCCESS) {
            return rc;
        }
        auto it = batch.find(descriptor.id);
        if (it != batch.end() && *it->second != descriptor) {
            std::string details = "Catalog lists '" + descriptor.id + "' twice with different fields";
            mrt_error_set_details(details.c_str());
            return MRT_ERROR_CONFLICTING_REGISTRATION;
        }
        batch[descriptor.id] = &descriptor;
    }

    size_t added = 0;
    for (const auto& entry : batch) {
        if (models_.emplace(entry.first, *entry.second).second) {
            ++added;
        }
    }
    if (out_registered != nullptr) {
        *out_registered = added;
    }
    MRT_LOG_INFO("ModelRegistry", "Catalog registered %zu new models", added);
    return MRT_SUCCESS;
}

bool ModelRegistry::get(const std::string& id, ModelDescriptor* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = models_.find(id);
    if (it == models_.end()) {
        return false;
    }
    if (out != nullptr) {
        *out = it->second;
    }
    return true;
}

std::vector<ModelDescriptor> ModelRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ModelDescriptor> out;
    out.reserve(models_.size());
    for (const auto& entry : models_) {
        out.push_back(entry.second);
    }
    return out;
}

size_t ModelRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return models_.size();
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

mrt_result_t mrt_model_register(const mrt_model_descriptor_t* descriptor) {
    if (descriptor == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    return ctx->models().register_model(mrt::descriptor_from_c(*descriptor));
}

mrt_result_t mrt_model_get(const char* model_id, mrt_model_descriptor_t** out_descriptor) {
    if (model_id == nullptr || out_descriptor == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    mrt::ModelDescriptor descriptor;
    if (!ctx->models().get(model_id, &descriptor)) {
        return MRT_ERROR_MODEL_NOT_FOUND;
    }
    *out_descriptor = mrt::descriptor_to_c(descriptor);
    return *out_descriptor ? MRT_SUCCESS : MRT_ERROR_OUT_OF_MEMORY;
}

mrt_result_t mrt_model_list(mrt_model_descriptor_t*** out_descriptors, size_t* out_count) {
    if (out_descriptors == nullptr || out_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto models = ctx->models().list();
    *out_count = 0;
    *out_descriptors = nullptr;
    if (models.empty()) {
        return MRT_SUCCESS;
    }
    auto** list = static_cast<mrt_model_descriptor_t**>(
        mrt_alloc(sizeof(mrt_model_descriptor_t*) * models.size()));
    if (list == nullptr) {
        return MRT_ERROR_OUT_OF_MEMORY;
    }
    for (size_t i = 0; i < models.size(); ++i) {
        list[i] = mrt::descriptor_to_c(models[i]);
    }
    *out_descriptors = list;
    *out_count = models.size();
    return MRT_SUCCESS;
}

void mrt_model_descriptor_free(mrt_model_descriptor_t* descriptor) {
    if (descriptor == nullptr) {
        return;
    }
    mrt_free(const_cast<char*>(descriptor->id));
    mrt_free(const_cast<char*>(descriptor->name));
    mrt_free(const_cast<char*>(descriptor->url));
    mrt_free(const_cast<char*>(descriptor->checksum));
    mrt_free(descriptor);
}

void mrt_model_descriptor_list_free(mrt_model_descriptor_t** descriptors, size_t count) {
    if (descriptors == nullptr) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        mrt_model_descriptor_free(descriptors[i]);
    }
    mrt_free(descriptors);
}

mrt_result_t mrt_model_catalog_load_json(const char* json, size_t* out_registered) {
    if (json == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    std::vector<mrt::ModelDescriptor> descriptors;
    mrt_result_t rc = mrt::parse_model_catalog(json, &descriptors);
    if (rc != MRT_SUCCESS) {
        return rc;
    }
    return ctx->models().register_all(descriptors, out_registered);
}

}  // extern "C"
