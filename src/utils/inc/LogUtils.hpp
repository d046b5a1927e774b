#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Initialize the log system
void init(Level level = Level::Info,
          const std::string& log_file = "log/boltsql.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);
bool is_initialized();

// Logger instance, null until init() and again after shutdown()
extern std::shared_ptr<spdlog::logger> logger;

// False when the message would be dropped by the logger's level.
// Without a logger everything except Debug reaches the console.
bool should_log(Level level);

// Sends one formatted line to the logger, or to stdout/stderr with a
// [LEVEL] prefix when the logger is not initialized.
void write(Level level, const std::string& msg);

inline void debug(const std::string& msg) { write(Level::Debug, msg); }
inline void info(const std::string& msg)  { write(Level::Info, msg); }
inline void warn(const std::string& msg)  { write(Level::Warn, msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }
inline void fatal(const std::string& msg) { write(Level::Fatal, msg); }

template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (!should_log(level)) return;
    write(level, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Fatal, fmt, std::forward<Args>(args)...);
}

class LoggerGuard {
public:
    LoggerGuard(Level level = Level::Info,
                const std::string& log_file = "log/boltsql.log",
                size_t max_file_size = 1024 * 1024 * 5,
                size_t max_files = 3) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
