#include "LogUtils.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

const fs::path LOG_DIR = "testlog";

std::string read_all(const fs::path& file) {
    std::ifstream fin(file);
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return buffer.str();
}

bool contains(const std::string& text, const std::string& keyword) {
    return text.find(keyword) != std::string::npos;
}

// Fresh log file under LOG_DIR; removes the directory on destruction
struct LogFile {
    fs::path path;

    explicit LogFile(const std::string& name) : path(LOG_DIR / name) {
        fs::remove_all(path.parent_path());
    }
    ~LogFile() {
        fs::remove_all(LOG_DIR);
    }

    std::string text() const { return read_all(path); }
};

}

void test_file_sink_and_level_filter() {
    LogFile file("driver/levels.log");
    LogUtils::init(LogUtils::Level::Info, file.path.string(), 1024 * 1024, 1);
    assert(LogUtils::is_initialized());
    assert(!LogUtils::should_log(LogUtils::Level::Debug));
    assert(LogUtils::should_log(LogUtils::Level::Error));

    LogUtils::debug("Running query: SELECT 1");
    LogUtils::info("Query fetched 1 rows");
    LogUtils::warn("Cancel request returned status 400");
    LogUtils::error("HTTP request failed");
    LogUtils::fatal("Unrecoverable");
    LogUtils::shutdown();
    assert(!LogUtils::is_initialized());

    // The parent directory is created on demand
    assert(fs::exists(file.path));
    const std::string text = file.text();
    assert(!contains(text, "Running query"));
    assert(contains(text, "INFO  Query fetched 1 rows"));
    assert(contains(text, "WARN  Cancel request returned status 400"));
    assert(contains(text, "ERROR HTTP request failed"));
    assert(contains(text, "FATAL Unrecoverable"));
    std::cout << "test_file_sink_and_level_filter passed" << std::endl;
}

void test_format_arguments() {
    LogFile file("format.log");
    LogUtils::init(LogUtils::Level::Debug, file.path.string(), 1024 * 1024, 1);
    LogUtils::debug("Session parameter {} set to {}", "time_zone", "UTC");
    LogUtils::info("Query fetched {} rows in {:.3f} seconds", 42, 0.5);
    LogUtils::error("HTTP error {}: {}", 503, "unavailable");
    LogUtils::shutdown();

    const std::string text = file.text();
    assert(contains(text, "Session parameter time_zone set to UTC"));
    assert(contains(text, "Query fetched 42 rows in 0.500 seconds"));
    assert(contains(text, "HTTP error 503: unavailable"));
    std::cout << "test_format_arguments passed" << std::endl;
}

void test_set_level_runtime() {
    LogFile file("runtime.log");
    LogUtils::init(LogUtils::Level::Warn, file.path.string(), 1024 * 1024, 1);
    LogUtils::info("before {}", "raise");
    LogUtils::set_level(LogUtils::Level::Debug);
    LogUtils::debug("after {}", "raise");
    LogUtils::shutdown();

    const std::string text = file.text();
    assert(!contains(text, "before raise"));
    assert(contains(text, "after raise"));
    std::cout << "test_set_level_runtime passed" << std::endl;
}

void test_reinit_replaces_logger() {
    LogFile first("first.log");
    LogUtils::init(LogUtils::Level::Info, first.path.string(), 1024 * 1024, 1);
    LogUtils::info("to first");

    const fs::path second = LOG_DIR / "second.log";
    LogUtils::init(LogUtils::Level::Info, second.string(), 1024 * 1024, 1);
    LogUtils::info("to second");
    LogUtils::shutdown();

    assert(contains(first.text(), "to first"));
    assert(!contains(first.text(), "to second"));
    assert(contains(read_all(second), "to second"));
    std::cout << "test_reinit_replaces_logger passed" << std::endl;
}

void test_console_fallback_without_logger() {
    LogUtils::shutdown();
    assert(!LogUtils::is_initialized());
    assert(!LogUtils::should_log(LogUtils::Level::Debug));
    assert(LogUtils::should_log(LogUtils::Level::Info));

    std::stringstream captured;
    std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());
    LogUtils::info("fallback {}", 1);
    LogUtils::debug("hidden {}", 2);
    std::cout.rdbuf(previous);

    assert(contains(captured.str(), "[INFO] fallback 1"));
    assert(!contains(captured.str(), "hidden 2"));
    std::cout << "test_console_fallback_without_logger passed" << std::endl;
}

void test_logger_guard() {
    LogFile file("guard.log");
    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Warn, file.path.string(), 1024 * 1024, 1);
        LogUtils::info("guard quiet");
        guard.set_level(LogUtils::Level::Info);
        LogUtils::info("guard loud");
    }
    assert(!LogUtils::is_initialized());

    const std::string text = file.text();
    assert(!contains(text, "guard quiet"));
    assert(contains(text, "guard loud"));
    std::cout << "test_logger_guard passed" << std::endl;
}

int main() {
    test_file_sink_and_level_filter();
    test_format_arguments();
    test_set_level_runtime();
    test_reinit_replaces_logger();
    test_console_fallback_without_logger();
    test_logger_guard();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
