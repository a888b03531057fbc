#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <functional>
#include <cstdint>

#ifdef _WIN32
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace whisp {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives every formatted log line that passes the level filter.
 * The line carries no trailing newline and no colour codes.
 */
using LogSink = std::function<void(LogLevel level, const std::string& module, const std::string& line)>;

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    /**
     * Strip directory components from paths and mask long hex runs
     * (keys, digests) before a line is written. Enabled by default.
     */
    void set_redaction_enabled(bool enabled);
    bool is_redaction_enabled() const;

    /**
     * Route output to a custom sink instead of stdout/stderr.
     * Pass an empty function to restore console output.
     */
    void set_sink(LogSink sink);

    void log(LogLevel level, const std::string& module, const std::string& message);

    /**
     * Apply the redaction rules to a message.
     * @param message Raw log message
     * @return Message with paths reduced to file names and hex runs of
     *         40 or more characters replaced with [REDACTED]
     */
    static std::string redact(const std::string& message);

    static const char* level_name(LogLevel level);

private:
    Logger();

    std::string get_color_code(LogLevel level) const;
    std::string get_module_color(const std::string& module) const;
    std::string get_reset_code() const;
    static uint32_t hash_string(const std::string& str);

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool redaction_enabled_;
    bool is_terminal_;
    LogSink sink_;
};

} // namespace whisp

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        if (whisp::Logger::getInstance().get_log_level() <= whisp::LogLevel::DEBUG) { \
            std::ostringstream oss; \
            oss << message; \
            whisp::Logger::getInstance().log(whisp::LogLevel::DEBUG, module, oss.str()); \
        } \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        whisp::Logger::getInstance().log(whisp::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        whisp::Logger::getInstance().log(whisp::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        whisp::Logger::getInstance().log(whisp::LogLevel::ERROR, module, oss.str()); \
    } while(0)
