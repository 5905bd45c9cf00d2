/**
 * @file runtime_context.h
 * @brief modelrt - Runtime Context (internal)
 *
 * The single runtime instance created by mrt_init(). It owns every component
 * and is the only process-wide state; public entry points reach it through
 * current_context(), which returns nullptr before mrt_init() and after
 * mrt_shutdown().
 *
 * Teardown order: pipeline runs -> sessions -> downloads -> worker pool ->
 * loaded models.
 */

#ifndef MRT_RUNTIME_CONTEXT_H
#define MRT_RUNTIME_CONTEXT_H

#include <memory>

#include "core/platform.h"
#include "core/progress_event.h"
#include "core/worker_pool.h"
#include "features/session/session_manager.h"
#include "features/voice_pipeline/voice_pipeline.h"
#include "infrastructure/download/download_manager.h"
#include "infrastructure/memory/admission_controller.h"
#include "infrastructure/model_management/model_registry.h"
#include "infrastructure/model_management/model_store.h"
#include "infrastructure/registry/backend_registry.h"
#include "mrt/core/mrt_core.h"

namespace mrt {

class RuntimeContext {
   public:
    /**
     * @brief Build and start every component from a validated config
     *
     * @return MRT_SUCCESS, MRT_ERROR_INVALID_CONFIGURATION,
     *         MRT_ERROR_INITIALIZATION_FAILED
     */
    static mrt_result_t create(const mrt_config_t& config, std::shared_ptr<RuntimeContext>* out);

    ~RuntimeContext();

    RuntimeContext(const RuntimeContext&) = delete;
    RuntimeContext& operator=(const RuntimeContext&) = delete;

    // Cancels all work and releases every model. Idempotent.
    void shutdown();

    const Platform& platform() const { return platform_; }
    EventDispatcher& events() { return events_; }
    BackendRegistry& backends() { return backends_; }
    ModelRegistry& models() { return models_; }
    ModelStore& store() { return *store_; }
    WorkerPool& workers() { return *workers_; }
    DownloadManager& downloads() { return *downloads_; }
    AdmissionController& admission() { return *admission_; }
    SessionManager& sessions() { return *sessions_; }
    VoicePipelineManager& pipelines() { return *pipelines_; }

    // Constructible through create() only: Key has a private constructor
    class Key {
        friend class RuntimeContext;
        Key() = default;
    };
    RuntimeContext(Key key, const mrt_platform_adapter_t* adapter);

   private:
    Platform platform_;
    EventDispatcher events_;
    BackendRegistry backends_;
    ModelRegistry models_;
    std::unique_ptr<ModelStore> store_;
    std::unique_ptr<WorkerPool> workers_;
    std::unique_ptr<DownloadManager> downloads_;
    std::unique_ptr<AdmissionController> admission_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<VoicePipelineManager> pipelines_;
    bool shut_down_ = false;
};

// The running instance, nullptr when not initialized
std::shared_ptr<RuntimeContext> current_context();

// Installs ctx unless one is running; returns false when one is
bool install_context(std::shared_ptr<RuntimeContext> ctx);

// Detaches and returns the running instance
std::shared_ptr<RuntimeContext> take_context();

}  // namespace mrt

#endif  // MRT_RUNTIME_CONTEXT_H
