/**
 * @file runtime_context.cpp
 * @brief modelrt - Runtime Context Implementation
 */

#include "core/runtime_context.h"

#include <mutex>

#include "mrt/core/mrt_error.h"
#include "mrt/core/mrt_logger.h"

namespace mrt {

namespace {

constexpr size_t kDefaultStreamChunks = 64;
constexpr int64_t kDefaultPersistInterval = 4 * 1024 * 1024;

struct ContextSlot {
    std::mutex mutex;
    std::shared_ptr<RuntimeContext> context;
};

ContextSlot& slot() {
    static ContextSlot instance;
    return instance;
}

}  // namespace

std::shared_ptr<RuntimeContext> current_context() {
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.context;
}

bool install_context(std::shared_ptr<RuntimeContext> ctx) {
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.context) {
        return false;
    }
    s.context = std::move(ctx);
    return true;
}

std::shared_ptr<RuntimeContext> take_context() {
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    return std::move(s.context);
}

RuntimeContext::RuntimeContext(Key /*key*/, const mrt_platform_adapter_t* adapter)
    : platform_(adapter) {}

RuntimeContext::~RuntimeContext() {
    shutdown();
}

mrt_result_t RuntimeContext::create(const mrt_config_t& config,
                                    std::shared_ptr<RuntimeContext>* out) {
    auto ctx = std::make_shared<RuntimeContext>(Key(), config.platform_adapter);

    ctx->store_ = std::make_unique<ModelStore>(config.models_directory,
                                               config.storage_quota_bytes, ctx->platform_);
    mrt_result_t rc = ctx->store_->open();
    if (rc != MRT_SUCCESS) {
        MRT_LOG_ERROR("SDK", "Model store at %s is unusable (%s)", config.models_directory,
                      mrt_error_message(rc));
        return MRT_ERROR_INITIALIZATION_FAILED;
    }

    if (config.catalog_json != nullptr) {
        std::vector<ModelDescriptor> catalog;
        rc = parse_model_catalog(config.catalog_json, &catalog);
        if (rc == MRT_SUCCESS) {
            size_t registered = 0;
            rc = ctx->models_.register_all(catalog, &registered);
        }
        if (rc != MRT_SUCCESS) {
            MRT_LOG_ERROR("SDK", "Model catalog rejected (%s)", mrt_error_message(rc));
            return MRT_ERROR_INVALID_CONFIGURATION;
        }
        MRT_LOG_INFO("SDK", "Registered %zu catalog model(s)", catalog.size());
    }

    ctx->workers_ = std::make_unique<WorkerPool>(
        config.worker_threads > 0 ? static_cast<size_t>(config.worker_threads) : 0);

    DownloadManager::Options download_options;
    download_options.queue_capacity = config.stream_buffer_chunks > 0
                                          ? static_cast<size_t>(config.stream_buffer_chunks)
                                          : kDefaultStreamChunks;
    download_options.persist_interval_bytes = config.download_persist_interval_bytes > 0
                                                  ? config.download_persist_interval_bytes
                                                  : kDefaultPersistInterval;
    ctx->downloads_ = std::make_unique<DownloadManager>(
        ctx->models_, *ctx->store_, *ctx->workers_,
        make_http_transport(ctx->platform_.http_transport()), ctx->events_, download_options);

    int64_t ceiling = resolve_memory_ceiling(config.memory_ceiling_bytes,
                                             config.memory_ceiling_fraction, ctx->platform_);
    ctx->admission_ = std::make_unique<AdmissionController>(
        ctx->models_, *ctx->store_, ctx->backends_, *ctx->workers_, ctx->platform_, ceiling);

    ctx->sessions_ = std::make_unique<SessionManager>(*ctx->admission_, ctx->events_,
                                                      download_options.queue_capacity);
    SessionManager* sessions = ctx->sessions_.get();
    ctx->admission_->set_unload_hook(
        [sessions](const LoadedModel& model) { sessions->cancel_dependents(model); });
    ctx->pipelines_ = std::make_unique<VoicePipelineManager>(*ctx->sessions_);

    MRT_LOG_INFO("SDK", "Runtime ready: %zu workers, memory ceiling %lld bytes, models in %s",
                 ctx->workers_->size(), static_cast<long long>(ceiling),
                 config.models_directory);
    *out = std::move(ctx);
    return MRT_SUCCESS;
}

void RuntimeContext::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (pipelines_) {
        pipelines_->cancel_all();
    }
    if (sessions_) {
        sessions_->cancel_all();
    }
    if (downloads_) {
        downloads_->cancel_all();
    }
    if (workers_) {
        workers_->shutdown();
    }
    if (admission_) {
        admission_->unload_all();
    }
}

}  // namespace mrt
