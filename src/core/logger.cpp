/**
 * @file logger.cpp
 * @brief modelrt - Logger Implementation
 */

#include "logger.h"

#include <cstdarg>
#include <cstdio>

#include "mrt/core/mrt_logger.h"

namespace mrt {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_callback(LogCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
    user_data_ = user_data;
}

void Logger::set_min_level(mrt_log_level_t level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

mrt_log_level_t Logger::min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_stderr_fallback(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_fallback_ = enabled;
}

void Logger::set_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    tag_ = tag.empty() ? "modelrt" : tag;
}

bool Logger::enabled(mrt_log_level_t level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::log(mrt_log_level_t level, const char* category, const char* message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    const char* cat = category ? category : "";
    const char* msg = message ? message : "";
    if (callback_) {
        callback_(level, cat, msg, user_data_);
    } else if (stderr_fallback_) {
        log_to_stderr(level, cat, msg);
    }
}

void Logger::log_to_stderr(mrt_log_level_t level, const char* category, const char* message) {
    FILE* stream = (level >= MRT_LOG_ERROR) ? stderr : stdout;
    fprintf(stream, "[%s][%s][%s] %s\n", tag_.c_str(), level_to_string(level), category, message);
    fflush(stream);
}

const char* Logger::level_to_string(mrt_log_level_t level) {
    switch (level) {
        case MRT_LOG_TRACE:
            return "TRACE";
        case MRT_LOG_DEBUG:
            return "DEBUG";
        case MRT_LOG_INFO:
            return "INFO";
        case MRT_LOG_WARNING:
            return "WARN";
        case MRT_LOG_ERROR:
            return "ERROR";
        case MRT_LOG_FATAL:
            return "FATAL";
        default:
            return "???";
    }
}

}  // namespace mrt

// =============================================================================
// PUBLIC API
// =============================================================================

extern "C" {

void mrt_log(mrt_log_level_t level, const char* category, const char* message) {
    mrt::Logger::instance().log(level, category, message);
}

void mrt_logf(mrt_log_level_t level, const char* category, const char* format, ...) {
    auto& logger = mrt::Logger::instance();
    if (!logger.enabled(level) || format == nullptr) {
        return;
    }

    char buffer[2048];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    logger.log(level, category, buffer);
}

void mrt_logger_set_min_level(mrt_log_level_t level) {
    mrt::Logger::instance().set_min_level(level);
}

mrt_log_level_t mrt_logger_get_min_level(void) {
    return mrt::Logger::instance().min_level();
}

void mrt_logger_set_stderr_fallback(mrt_bool_t enabled) {
    mrt::Logger::instance().set_stderr_fallback(enabled == MRT_TRUE);
}

}  // extern "C"
