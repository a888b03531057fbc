#include "logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <cctype>
#include <ctime>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace whisp {

namespace {

// Hex runs at least this long are treated as key or digest material.
constexpr size_t kRedactHexRun = 40;

bool is_path_separator(char c) {
    return c == '/' || c == '\\';
}

std::string strip_directories(const std::string& token) {
    size_t end = token.size();
    while (end > 1 && is_path_separator(token[end - 1])) {
        --end;
    }
    size_t start = end;
    while (start > 0 && !is_path_separator(token[start - 1])) {
        --start;
    }
    return token.substr(start, end - start);
}

std::string mask_hex_runs(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (std::isxdigit(static_cast<unsigned char>(text[i]))) {
            size_t j = i;
            while (j < text.size() && std::isxdigit(static_cast<unsigned char>(text[j]))) {
                ++j;
            }
            if (j - i >= kRedactHexRun) {
                out += "[REDACTED]";
            } else {
                out.append(text, i, j - i);
            }
            i = j;
        } else {
            out += text[i++];
        }
    }
    return out;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true),
      redaction_enabled_(true) {
    is_terminal_ = isatty(fileno(stdout));

#ifdef _WIN32
    if (is_terminal_) {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, dwMode);
    }
#endif
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

void Logger::set_redaction_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    redaction_enabled_ = enabled;
}

bool Logger::is_redaction_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redaction_enabled_;
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const std::string body = redaction_enabled_ ? redact(message) : message;

    if (sink_) {
        std::ostringstream line;
        line << "[" << level_name(level) << "]";
        if (!module.empty()) {
            line << " [" << module << "]";
        }
        line << " " << body;
        sink_(level, module, line.str());
        return;
    }

    const bool colored = colors_enabled_ && is_terminal_;
    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (colored) {
        oss << get_color_code(level) << "[" << level_name(level) << "]" << get_reset_code();
    } else {
        oss << "[" << level_name(level) << "]";
    }

    if (!module.empty()) {
        if (colored) {
            oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << body << std::endl;

    if (level >= LogLevel::ERROR) {
        std::cerr << oss.str();
        std::cerr.flush();
    } else {
        std::cout << oss.str();
        std::cout.flush();
    }
}

std::string Logger::redact(const std::string& message) {
    std::string out;
    out.reserve(message.size());

    size_t i = 0;
    while (i < message.size()) {
        if (std::isspace(static_cast<unsigned char>(message[i]))) {
            out += message[i++];
            continue;
        }
        size_t j = i;
        bool has_separator = false;
        while (j < message.size() && !std::isspace(static_cast<unsigned char>(message[j]))) {
            has_separator = has_separator || is_path_separator(message[j]);
            ++j;
        }
        std::string token = message.substr(i, j - i);
        out += has_separator ? strip_directories(token) : token;
        i = j;
    }

    return mask_hex_runs(out);
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) const {
    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

std::string Logger::get_reset_code() const {
    return "\033[0m";
}

uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c); // hash * 33 + c
    }
    return hash;
}

} // namespace whisp
