// =============================================================================
// logging.hpp - Process-wide leveled logger
// =============================================================================
// Records go to stderr by default so replies printed on stdout by the chat
// front end are never interleaved with diagnostics. Each record carries a
// millisecond timestamp, the level and the call site:
//
//   [2024-05-01 12:00:00.042] WARN config.hpp:184 validate() - ...
//
// LOG_FATAL is reserved for broken brain invariants and aborts after the
// record is flushed.
// =============================================================================

#pragma once

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace halbrain {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Four-letter tag printed in each record.
inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::FATAL: return "FATL";
    }
    return "UNKN";
}

// Accepts debug/info/warn/error/fatal; returns false for anything else.
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") out = LogLevel::DEBUG;
    else if (name == "info") out = LogLevel::INFO;
    else if (name == "warn") out = LogLevel::WARN;
    else if (name == "error") out = LogLevel::ERROR;
    else if (name == "fatal") out = LogLevel::FATAL;
    else return false;
    return true;
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level == LogLevel::FATAL || level >= level_;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        // Built outside the lock; only the write is serialized.
        std::ostringstream record;
        record << '[' << timestamp() << "] " << log_level_name(level) << ' '
               << basename(file) << ':' << line << ' ' << func << "() - ";
        append(record, std::forward<Args>(args)...);

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << record.str() << std::endl;
        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&secs, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms;
        return out.str();
    }

    static const char* basename(const char* path) {
        const char* slash = std::strrchr(path, '/');
        if (!slash) slash = std::strrchr(path, '\\');
        return slash ? slash + 1 : path;
    }

    static void append(std::ostringstream&) {}

    template<typename T, typename... Rest>
    static void append(std::ostringstream& out, T&& value, Rest&&... rest) {
        out << value;
        append(out, std::forward<Rest>(rest)...);
    }

    LogLevel level_ = LogLevel::INFO;
    std::ostream* output_ = &std::cerr;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) halbrain::Logger::getInstance().log(halbrain::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  halbrain::Logger::getInstance().log(halbrain::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  halbrain::Logger::getInstance().log(halbrain::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) halbrain::Logger::getInstance().log(halbrain::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(...) halbrain::Logger::getInstance().log(halbrain::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace halbrain
