#include "LogUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>
#include <filesystem>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
        default:           return spdlog::level::info;
    }
}

class LevelFullNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        static const char* level_names[] = {
            "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
        };
        auto lvl = static_cast<size_t>(msg.level);
        const char* name = lvl < sizeof(level_names) / sizeof(level_names[0]) ? level_names[lvl] : "INFO ";
        dest.append(name, name + std::strlen(name));
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelFullNameFormatter>();
    }
};

}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    if (logger) {
        shutdown();
    }

    std::filesystem::path log_path(log_file);
    std::filesystem::path parent_dir = log_path.parent_path();

    if (!parent_dir.empty() && !std::filesystem::exists(parent_dir)) {
        std::filesystem::create_directories(parent_dir);
    }

    spdlog::init_thread_pool(8192, 1);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, max_file_size, max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger = std::make_shared<spdlog::async_logger>(
        "boltsql_logger", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>(
        "%Y-%m-%d %H:%M:%S.%f %t %X %v"
    );
    formatter->add_flag<LevelFullNameFormatter>('X');

    logger->set_formatter(std::move(formatter));
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void shutdown() {
    if (logger) logger->flush();
    logger.reset();
    spdlog::shutdown();
}

void set_level(Level level) {
    if (logger) logger->set_level(to_spdlog_level(level));
}

bool is_initialized() {
    return logger != nullptr;
}

bool should_log(Level level) {
    if (logger) {
        return logger->should_log(to_spdlog_level(level));
    }
    return level != Level::Debug;
}

void write(Level level, const std::string& msg) {
    if (logger) {
        logger->log(to_spdlog_level(level), msg);
        return;
    }

    switch (level) {
        case Level::Debug: std::cout << "[DEBUG] " << msg << std::endl; break;
        case Level::Info:  std::cout << "[INFO] " << msg << std::endl; break;
        case Level::Warn:  std::cout << "[WARN] " << msg << std::endl; break;
        case Level::Error: std::cerr << "[ERROR] " << msg << std::endl; break;
        case Level::Fatal: std::cerr << "[FATAL] " << msg << std::endl; break;
    }
}

}
