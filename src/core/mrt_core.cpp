/**
 * @file mrt_core.cpp
 * @brief modelrt - Core Initialization
 */

#include "mrt/core/mrt_core.h"

#include <mutex>

#include "core/logger.h"
#include "core/runtime_context.h"
#include "mrt/core/mrt_logger.h"

namespace {

constexpr const char* kVersion = "1.0.0";

// Serializes mrt_init() against mrt_shutdown()
std::mutex g_lifecycle_mutex;

mrt_result_t validate_config(const mrt_config_t& config) {
    if (config.models_directory == nullptr || config.models_directory[0] == '\0') {
        mrt_error_set_details("models_directory is required");
        return MRT_ERROR_INVALID_CONFIGURATION;
    }
    if (config.memory_ceiling_bytes < 0) {
        mrt_error_set_details("memory_ceiling_bytes must not be negative");
        return MRT_ERROR_INVALID_CONFIGURATION;
    }
    if (config.memory_ceiling_bytes == 0 &&
        (config.memory_ceiling_fraction <= 0.0f || config.memory_ceiling_fraction > 1.0f)) {
        mrt_error_set_details("memory_ceiling_fraction must be in (0, 1]");
        return MRT_ERROR_INVALID_CONFIGURATION;
    }
    if (config.storage_quota_bytes < 0 || config.worker_threads < 0 ||
        config.stream_buffer_chunks < 0 || config.download_persist_interval_bytes < 0) {
        mrt_error_set_details("Sizes and counts must not be negative");
        return MRT_ERROR_INVALID_CONFIGURATION;
    }
    return MRT_SUCCESS;
}

void configure_logger(const mrt_config_t& config) {
    auto& logger = mrt::Logger::instance();
    mrt_log_level_t level = config.log_level;
    if (config.environment == MRT_ENV_PRODUCTION && level < MRT_LOG_INFO) {
        level = MRT_LOG_INFO;
    }
    logger.set_min_level(level);
    logger.set_tag(config.log_tag != nullptr ? config.log_tag : "modelrt");

    const mrt_platform_adapter_t* adapter = config.platform_adapter;
    if (adapter != nullptr && adapter->log != nullptr) {
        logger.set_callback(adapter->log, adapter->user_data);
    } else {
        logger.set_callback(nullptr, nullptr);
    }
}

}  // namespace

extern "C" {

void mrt_config_init(mrt_config_t* config) {
    if (config == nullptr) {
        return;
    }
    *config = mrt_config_t{};
    config->platform_adapter = nullptr;
    config->log_level = MRT_LOG_DEBUG;
    config->log_tag = "modelrt";
    config->environment = MRT_ENV_DEVELOPMENT;
    config->models_directory = nullptr;
    config->memory_ceiling_bytes = 0;
    config->memory_ceiling_fraction = 0.5f;
    config->storage_quota_bytes = 0;
    config->worker_threads = 0;
    config->stream_buffer_chunks = 64;
    config->download_persist_interval_bytes = 4 * 1024 * 1024;
    config->catalog_json = nullptr;
}

mrt_result_t mrt_init(const mrt_config_t* config) {
    if (config == nullptr) {
        return MRT_ERROR_INVALID_CONFIGURATION;
    }

    std::lock_guard<std::mutex> lock(g_lifecycle_mutex);
    if (mrt::current_context()) {
        return MRT_ERROR_ALREADY_INITIALIZED;
    }

    mrt_result_t rc = validate_config(*config);
    if (rc != MRT_SUCCESS) {
        return rc;
    }

    configure_logger(*config);
    MRT_LOG_INFO("SDK", "Initializing modelrt %s", kVersion);

    std::shared_ptr<mrt::RuntimeContext> ctx;
    rc = mrt::RuntimeContext::create(*config, &ctx);
    if (rc != MRT_SUCCESS) {
        mrt::Logger::instance().set_callback(nullptr, nullptr);
        return rc;
    }
    if (!mrt::install_context(ctx)) {
        return MRT_ERROR_ALREADY_INITIALIZED;
    }
    return MRT_SUCCESS;
}

void mrt_shutdown(void) {
    std::lock_guard<std::mutex> lock(g_lifecycle_mutex);
    auto ctx = mrt::take_context();
    if (!ctx) {
        return;
    }
    MRT_LOG_INFO("SDK", "Shutting down");
    ctx->shutdown();
    ctx.reset();
    mrt::Logger::instance().set_callback(nullptr, nullptr);
}

mrt_bool_t mrt_is_initialized(void) {
    return mrt::current_context() ? MRT_TRUE : MRT_FALSE;
}

const char* mrt_get_version(void) {
    return kVersion;
}

const mrt_platform_adapter_t* mrt_get_platform_adapter(void) {
    auto ctx = mrt::current_context();
    if (!ctx) {
        return nullptr;
    }
    return ctx->platform().adapter();
}

}  // extern "C"
