/**
 * @file admission_controller.cpp
 * @brief modelrt - Memory Admission Controller Implementation
 */

#include "infrastructure/memory/admission_controller.h"

#include <algorithm>

#include "core/runtime_context.h"
#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"
#include "mrt/infrastructure/memory/mrt_admission.h"

namespace mrt {

namespace {

constexpr float kDefaultCeilingFraction = 0.5f;

double to_mb(int64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace

int64_t resolve_memory_ceiling(int64_t ceiling_bytes, float ceiling_fraction,
                               const Platform& platform) {
    if (ceiling_bytes > 0) {
        return ceiling_bytes;
    }
    float fraction = (ceiling_fraction > 0.0f && ceiling_fraction <= 1.0f)
                         ? ceiling_fraction
                         : kDefaultCeilingFraction;
    mrt_memory_info_t info{};
    if (platform.memory_info(&info) != MRT_SUCCESS || info.total_bytes == 0) {
        MRT_LOG_WARNING("Admission", "Device RAM unknown, memory ceiling disabled");
        return INT64_MAX;
    }
    return static_cast<int64_t>(static_cast<double>(info.total_bytes) * fraction);
}

AdmissionController::AdmissionController(ModelRegistry& models, ModelStore& store,
                                         BackendRegistry& backends, WorkerPool& pool,
                                         const Platform& platform, int64_t ceiling_bytes)
    : models_(models),
      store_(store),
      backends_(backends),
      pool_(pool),
      platform_(platform),
      ceiling_bytes_(ceiling_bytes) {}

AdmissionController::~AdmissionController() {
    unload_all();
}

mrt_result_t AdmissionController::load(const std::string& model_id,
                                       std::shared_ptr<LoadedModel>* out) {
    std::lock_guard<std::mutex> load_lock(load_mutex_);

    ModelDescriptor descriptor;
    if (!models_.get(model_id, &descriptor)) {
        std::string details = "Model '" + model_id + "' is not registered";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_MODEL_NOT_FOUND;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loaded_.find(model_id);
        if (it != loaded_.end()) {
            it->second->last_access_ms = platform_.now_ms();
            if (out != nullptr) {
                *out = it->second;
            }
            return MRT_SUCCESS;
        }
    }

    ModelArtifact artifact;
    if (!store_.get(model_id, &artifact) || artifact.state != MRT_ARTIFACT_VERIFIED) {
        std::string details = "Model '" + model_id + "' has no verified artifact";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_MODEL_NOT_FOUND;
    }

    auto backend = backends_.find_for_format(descriptor.format);
    if (!backend) {
        std::string details = std::string("No backend registered for format ") +
                              mrt_model_format_name(descriptor.format);
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_BACKEND;
    }

    const int64_t required = descriptor.memory_required;
    if (required > ceiling_bytes_) {
        std::string details = "Model '" + model_id + "' needs more than the memory ceiling";
        mrt_error_set_details(details.c_str());
        MRT_LOG_WARNING("Admission", "'%s' needs %.1f MB, ceiling is %.1f MB", model_id.c_str(),
                        to_mb(required), to_mb(ceiling_bytes_));
        return MRT_ERROR_INSUFFICIENT_MEMORY;
    }

    std::vector<std::shared_ptr<LoadedModel>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t resident = resident_locked();

        if (resident + required > ceiling_bytes_) {
            std::vector<std::shared_ptr<LoadedModel>> idle;
            for (const auto& entry : loaded_) {
                if (entry.second->ref_count == 0) {
                    idle.push_back(entry.second);
                }
            }
            std::sort(idle.begin(), idle.end(),
                      [](const std::shared_ptr<LoadedModel>& a,
                         const std::shared_ptr<LoadedModel>& b) {
                          if (a->last_access_ms != b->last_access_ms) {
                              return a->last_access_ms < b->last_access_ms;
                          }
                          return a->load_seq < b->load_seq;
                      });

            int64_t projected = resident;
            for (const auto& candidate : idle) {
                if (projected + required <= ceiling_bytes_) {
                    break;
                }
                victims.push_back(candidate);
                projected -= candidate->resident_bytes;
            }
            if (projected + required > ceiling_bytes_) {
                std::string details = "Cannot fit '" + model_id + "': models in use hold " +
                                      std::to_string(resident) + " bytes";
                mrt_error_set_details(details.c_str());
                MRT_LOG_WARNING("Admission",
                                "Rejecting '%s' (%.1f MB): %.1f MB resident, ceiling %.1f MB",
                                model_id.c_str(), to_mb(required), to_mb(resident),
                                to_mb(ceiling_bytes_));
                return MRT_ERROR_INSUFFICIENT_MEMORY;
            }
            for (const auto& victim : victims) {
                loaded_.erase(victim->id());
            }
        }
    }

    for (const auto& victim : victims) {
        MRT_LOG_INFO("Admission", "Evicting '%s' (%.1f MB) for '%s'", victim->id().c_str(),
                     to_mb(victim->resident_bytes), model_id.c_str());
        retire(victim);
    }

    mrt_backend_session_params_t params{};
    params.model_id = descriptor.id.c_str();
    if (backend->capabilities.kind == MRT_CAPABILITY_TEXT_GENERATION) {
        params.context_length = backend->capabilities.params.generation.max_context;
    }

    void* handle = nullptr;
    mrt_error_clear_details();
    mrt_result_t rc = backend->ops.create_session(artifact.local_path.c_str(), &params, &handle,
                                                  backend->user_data);
    if (rc != MRT_SUCCESS || handle == nullptr) {
        const char* details = mrt_error_get_details();
        std::string message = (details != nullptr && details[0] != '\0')
                                  ? std::string(details)
                                  : "Backend '" + backend->name + "' failed to load '" +
                                        model_id + "'";
        mrt_error_set_details(message.c_str());
        MRT_LOG_ERROR("Admission", "%s (%d)", message.c_str(), rc);
        return MRT_ERROR_BACKEND;
    }

    auto model = std::make_shared<LoadedModel>();
    model->descriptor = descriptor;
    model->backend = backend;
    model->handle = handle;
    model->resident_bytes = required;
    model->queue = std::make_shared<SerialQueue>(pool_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        model->load_seq = ++next_load_seq_;
        model->last_access_ms = platform_.now_ms();
        loaded_[model_id] = model;
        MRT_LOG_INFO("Admission", "Loaded '%s' with %s (%.1f / %.1f MB resident)",
                     model_id.c_str(), backend->name.c_str(), to_mb(resident_locked()),
                     to_mb(ceiling_bytes_));
    }
    if (out != nullptr) {
        *out = model;
    }
    return MRT_SUCCESS;
}

mrt_result_t AdmissionController::unload(const std::string& model_id) {
    std::shared_ptr<LoadedModel> model;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = loaded_.find(model_id);
        if (it == loaded_.end()) {
            return MRT_ERROR_MODEL_NOT_LOADED;
        }
        if (it->second->ref_count > 0) {
            std::string details = "Model '" + model_id + "' has " +
                                  std::to_string(it->second->ref_count) +
                                  " active session(s); cancel them first";
            mrt_error_set_details(details.c_str());
            return MRT_ERROR_MODEL_IN_USE;
        }
        model = it->second;
        loaded_.erase(it);
    }
    MRT_LOG_INFO("Admission", "Unloading '%s'", model_id.c_str());
    retire(model);
    return MRT_SUCCESS;
}

void AdmissionController::unload_all() {
    std::map<std::string, std::shared_ptr<LoadedModel>> models;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        models.swap(loaded_);
    }
    for (const auto& entry : models) {
        if (entry.second->ref_count > 0) {
            MRT_LOG_WARNING("Admission", "Destroying '%s' with %d active reference(s)",
                            entry.first.c_str(), entry.second->ref_count);
        }
        destroy(entry.second);
    }
}

void AdmissionController::set_unload_hook(std::function<void(const LoadedModel&)> hook) {
    unload_hook_ = std::move(hook);
}

void AdmissionController::retire(const std::shared_ptr<LoadedModel>& model) {
    if (unload_hook_) {
        unload_hook_(*model);
    }
    destroy(model);
}

void AdmissionController::destroy(const std::shared_ptr<LoadedModel>& model) {
    if (model->handle != nullptr) {
        model->backend->ops.destroy(model->handle, model->backend->user_data);
        model->handle = nullptr;
    }
}

std::shared_ptr<LoadedModel> AdmissionController::find(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(model_id);
    return it == loaded_.end() ? nullptr : it->second;
}

std::shared_ptr<LoadedModel> AdmissionController::latest(mrt_capability_kind_t kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<LoadedModel> best;
    for (const auto& entry : loaded_) {
        if (entry.second->kind() == kind && (!best || entry.second->load_seq > best->load_seq)) {
            best = entry.second;
        }
    }
    return best;
}

mrt_result_t AdmissionController::acquire(const std::shared_ptr<LoadedModel>& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loaded_.find(model->id());
    if (it == loaded_.end() || it->second != model) {
        std::string details = "Model '" + model->id() + "' was unloaded";
        mrt_error_set_details(details.c_str());
        return MRT_ERROR_MODEL_NOT_LOADED;
    }
    ++model->ref_count;
    model->last_access_ms = platform_.now_ms();
    return MRT_SUCCESS;
}

void AdmissionController::release(const std::shared_ptr<LoadedModel>& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model->ref_count > 0) {
        --model->ref_count;
    }
    model->last_access_ms = platform_.now_ms();
}

bool AdmissionController::is_loaded(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_.count(model_id) != 0;
}

bool AdmissionController::uses_backend(const std::string& backend_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : loaded_) {
        if (entry.second->backend->name == backend_name) {
            return true;
        }
    }
    return false;
}

std::vector<LoadedModelInfo> AdmissionController::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LoadedModelInfo> result;
    result.reserve(loaded_.size());
    for (const auto& entry : loaded_) {
        LoadedModelInfo info;
        info.model_id = entry.first;
        info.backend_name = entry.second->backend->name;
        info.resident_bytes = entry.second->resident_bytes;
        info.last_access_ms = entry.second->last_access_ms;
        info.ref_count = entry.second->ref_count;
        result.push_back(std::move(info));
    }
    return result;
}

int64_t AdmissionController::resident_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_locked();
}

int64_t AdmissionController::resident_locked() const {
    int64_t total = 0;
    for (const auto& entry : loaded_) {
        total += entry.second->resident_bytes;
    }
    return total;
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

mrt_result_t mrt_model_load(const char* model_id) {
    if (model_id == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    return ctx->admission().load(model_id);
}

mrt_result_t mrt_model_unload(const char* model_id) {
    if (model_id == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    return ctx->admission().unload(model_id);
}

mrt_bool_t mrt_model_is_loaded(const char* model_id) {
    if (model_id == nullptr) {
        return MRT_FALSE;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_FALSE;
    }
    return ctx->admission().is_loaded(model_id) ? MRT_TRUE : MRT_FALSE;
}

mrt_result_t mrt_model_list_loaded(mrt_loaded_model_info_t** out_models, size_t* out_count) {
    if (out_models == nullptr || out_count == nullptr) {
        return MRT_ERROR_NULL_POINTER;
    }
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    auto models = ctx->admission().list();
    *out_models = nullptr;
    *out_count = 0;
    if (models.empty()) {
        return MRT_SUCCESS;
    }
    auto* list = static_cast<mrt_loaded_model_info_t*>(
        mrt_alloc(sizeof(mrt_loaded_model_info_t) * models.size()));
    if (list == nullptr) {
        return MRT_ERROR_OUT_OF_MEMORY;
    }
    for (size_t i = 0; i < models.size(); ++i) {
        list[i].model_id = mrt_strdup(models[i].model_id.c_str());
        list[i].backend_name = mrt_strdup(models[i].backend_name.c_str());
        list[i].resident_bytes = models[i].resident_bytes;
        list[i].last_access_ms = models[i].last_access_ms;
        list[i].ref_count = models[i].ref_count;
    }
    *out_models = list;
    *out_count = models.size();
    return MRT_SUCCESS;
}

void mrt_loaded_model_list_free(mrt_loaded_model_info_t* models, size_t count) {
    if (models == nullptr) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        mrt_free(models[i].model_id);
        mrt_free(models[i].backend_name);
    }
    mrt_free(models);
}

mrt_result_t mrt_memory_get_usage(int64_t* out_resident_bytes, int64_t* out_ceiling_bytes) {
    auto ctx = mrt::current_context();
    if (!ctx) {
        return MRT_ERROR_NOT_INITIALIZED;
    }
    if (out_resident_bytes != nullptr) {
        *out_resident_bytes = ctx->admission().resident_bytes();
    }
    if (out_ceiling_bytes != nullptr) {
        *out_ceiling_bytes = ctx->admission().ceiling_bytes();
    }
    return MRT_SUCCESS;
}

}  // extern "C"
