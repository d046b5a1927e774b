#pragma once

#include <optional>
#include <string>

class Connection;

struct EngineInfo {
    std::string url;
    std::string status;
    std::optional<std::string> attached_database;
};

// Catalog lookups run on a system-engine connection
class EngineResolver {
public:
    static constexpr const char* STATUS_RUNNING = "Running";

    explicit EngineResolver(Connection& system_engine) : system_engine_(system_engine) {}

    /**
     * @throws EngineNotFoundError When the catalog has no engine by that name
     */
    EngineInfo resolve_engine(const std::string& engine_name);

    // Status of the engine behind `engine_url`, compared case-sensitively with "Running"
    bool is_running(const std::string& engine_url);

    bool is_database_available(const std::string& database);

private:
    Connection& system_engine_;
};
