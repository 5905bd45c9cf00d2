/**
 * @file admission_controller.h
 * @brief modelrt - Memory Admission Controller (internal)
 *
 * Owns every LoadedModel. Loads are serialized against each other; the
 * eviction plan and reference counts share one lock, so a model can never be
 * evicted between a session's check and its increment.
 */

#ifndef MRT_ADMISSION_CONTROLLER_H
#define MRT_ADMISSION_CONTROLLER_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/platform.h"
#include "core/worker_pool.h"
#include "infrastructure/model_management/model_registry.h"
#include "infrastructure/model_management/model_store.h"
#include "infrastructure/registry/backend_registry.h"

namespace mrt {

struct LoadedModel {
    ModelDescriptor descriptor;
    std::shared_ptr<const BackendEntry> backend;
    void* handle = nullptr;
    int64_t resident_bytes = 0;
    uint64_t load_seq = 0;

    // One backend request at a time per handle, FIFO
    std::shared_ptr<SerialQueue> queue;

    // Guarded by AdmissionController::mutex_
    int64_t last_access_ms = 0;
    int32_t ref_count = 0;

    const std::string& id() const { return descriptor.id; }
    mrt_capability_kind_t kind() const { return backend->capabilities.kind; }
};

struct LoadedModelInfo {
    std::string model_id;
    std::string backend_name;
    int64_t resident_bytes = 0;
    int64_t last_access_ms = 0;
    int32_t ref_count = 0;
};

class AdmissionController {
   public:
    AdmissionController(ModelRegistry& models, ModelStore& store, BackendRegistry& backends,
                        WorkerPool& pool, const Platform& platform, int64_t ceiling_bytes);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    /**
     * @brief Admit and instantiate a model
     *
     * Evicts idle models in LRU order (ties: earlier load first) only when the
     * whole plan makes the candidate fit; otherwise nothing is evicted.
     */
    mrt_result_t load(const std::string& model_id, std::shared_ptr<LoadedModel>* out = nullptr);

    mrt_result_t unload(const std::string& model_id);

    // Destroys every model regardless of reference counts (shutdown)
    void unload_all();

    /**
     * @brief Observe models leaving memory through unload() or eviction
     *
     * Runs before the backend handle is destroyed. Set once, before the first
     * load; unload_all() does not invoke it.
     */
    void set_unload_hook(std::function<void(const LoadedModel&)> hook);

    std::shared_ptr<LoadedModel> find(const std::string& model_id) const;

    // Most recently loaded model of a kind, nullptr if none
    std::shared_ptr<LoadedModel> latest(mrt_capability_kind_t kind) const;

    /**
     * @brief Take a reference on a resident model
     *
     * @return MRT_ERROR_MODEL_NOT_LOADED when model is no longer the resident
     *         instance for its id
     */
    mrt_result_t acquire(const std::shared_ptr<LoadedModel>& model);
    void release(const std::shared_ptr<LoadedModel>& model);

    bool is_loaded(const std::string& model_id) const;
    bool uses_backend(const std::string& backend_name) const;
    std::vector<LoadedModelInfo> list() const;

    int64_t resident_bytes() const;
    int64_t ceiling_bytes() const { return ceiling_bytes_; }

   private:
    void retire(const std::shared_ptr<LoadedModel>& model);
    void destroy(const std::shared_ptr<LoadedModel>& model);
    int64_t resident_locked() const;

    ModelRegistry& models_;
    ModelStore& store_;
    BackendRegistry& backends_;
    WorkerPool& pool_;
    const Platform& platform_;
    const int64_t ceiling_bytes_;
    std::function<void(const LoadedModel&)> unload_hook_;

    std::mutex load_mutex_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<LoadedModel>> loaded_;
    uint64_t next_load_seq_ = 0;
};

// Ceiling from the configured bytes, or a fraction of device RAM
int64_t resolve_memory_ceiling(int64_t ceiling_bytes, float ceiling_fraction,
                               const Platform& platform);

}  // namespace mrt

#endif  // MRT_ADMISSION_CONTROLLER_H
