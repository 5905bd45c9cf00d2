/**
 * @file logger.h
 * @brief modelrt - Internal Logger
 *
 * Process-wide logger behind mrt_log(). Routes to the platform adapter's log
 * callback once mrt_init() has installed one, otherwise writes to
 * stdout/stderr.
 */

#ifndef MRT_INTERNAL_LOGGER_H
#define MRT_INTERNAL_LOGGER_H

#include <mutex>
#include <string>

#include "mrt/core/mrt_types.h"

namespace mrt {

using LogCallback = void (*)(mrt_log_level_t level, const char* category, const char* message,
                             void* user_data);

class Logger {
   public:
    static Logger& instance();

    // Route logs to an external sink (nullptr restores the fallback)
    void set_callback(LogCallback callback, void* user_data);

    void set_min_level(mrt_log_level_t level);
    mrt_log_level_t min_level() const;

    void set_stderr_fallback(bool enabled);

    // Prefix used by the stdout/stderr fallback
    void set_tag(const std::string& tag);

    bool enabled(mrt_log_level_t level) const;

    void log(mrt_log_level_t level, const char* category, const char* message);

    static const char* level_to_string(mrt_log_level_t level);

   private:
    Logger() = default;

    void log_to_stderr(mrt_log_level_t level, const char* category, const char* message);

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    mrt_log_level_t min_level_ = MRT_LOG_INFO;
    bool stderr_fallback_ = true;
    std::string tag_ = "modelrt";
};

}  // namespace mrt

#endif  // MRT_INTERNAL_LOGGER_H
