/**
 * @file vsc_logger.h
 * @brief VoiceStream Commons - Logger
 *
 * Process-wide logger with printf-style macros. Output goes to an external
 * callback when one is installed (e.g. a UI status line), otherwise to
 * stdout/stderr.
 *
 * Usage:
 *   VSC_LOG_INFO("Session", "Started %s", session_id.c_str());
 *   VSC_LOG_ERROR("Ingestor", "Transfer failed: %s", message);
 */

#ifndef VSC_LOGGER_H
#define VSC_LOGGER_H

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

#include <strings.h>

namespace vsc {

// =============================================================================
// LOG LEVELS
// =============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warning = 3, Error = 4, Fatal = 5 };

/**
 * External log callback type.
 *
 * @param level Log level
 * @param category Log category (e.g., "Session")
 * @param message Formatted message
 * @param user_data Optional user context
 */
using LogCallback = void (*)(LogLevel level, const char* category, const char* message,
                             void* user_data);

/**
 * Parses "trace", "debug", "info", "warn"/"warning", "error", "fatal"
 * (case-insensitive). Returns false and leaves @p out untouched otherwise.
 */
inline bool parse_log_level(const char* text, LogLevel& out) {
    if (!text) return false;

    struct Entry {
        const char* name;
        LogLevel level;
    };
    static const Entry kEntries[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},     {"info", LogLevel::Info},
        {"warn", LogLevel::Warning}, {"warning", LogLevel::Warning}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
    };
    for (const auto& entry : kEntries) {
        if (strcasecmp(text, entry.name) == 0) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

// =============================================================================
// LOGGER CLASS
// =============================================================================

class Logger {
   public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_callback(LogCallback callback, void* user_data = nullptr) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        user_data_ = user_data;
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel min_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    // Console output when no callback is installed
    void set_console_fallback(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_fallback_ = enabled;
    }

    void log(LogLevel level, const char* category, const char* format, ...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }
        }

        char buffer[2048];
        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        std::lock_guard<std::mutex> lock(mutex_);
        if (callback_) {
            callback_(level, category, buffer, user_data_);
        } else if (console_fallback_) {
            log_to_console(level, category, buffer);
        }
    }

    static const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:
                return "TRACE";
            case LogLevel::Debug:
                return "DEBUG";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Warning:
                return "WARN";
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Fatal:
                return "FATAL";
            default:
                return "???";
        }
    }

   private:
    Logger() = default;

    void log_to_console(LogLevel level, const char* category, const char* message) {
        FILE* stream = (level >= LogLevel::Warning) ? stderr : stdout;
        fprintf(stream, "[%s][%s] %s\n", level_name(level), category, message);
        fflush(stream);
    }

    mutable std::mutex mutex_;
    LogCallback callback_ = nullptr;
    void* user_data_ = nullptr;
    LogLevel min_level_ = LogLevel::Info;
    bool console_fallback_ = true;
};

}  // namespace vsc

// =============================================================================
// CONVENIENCE MACROS
// =============================================================================

#define VSC_LOG_TRACE(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Trace, category, __VA_ARGS__)

#define VSC_LOG_DEBUG(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Debug, category, __VA_ARGS__)

#define VSC_LOG_INFO(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Info, category, __VA_ARGS__)

#define VSC_LOG_WARNING(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Warning, category, __VA_ARGS__)

#define VSC_LOG_ERROR(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Error, category, __VA_ARGS__)

#define VSC_LOG_FATAL(category, ...) \
    vsc::Logger::instance().log(vsc::LogLevel::Fatal, category, __VA_ARGS__)

#endif  // VSC_LOGGER_H
