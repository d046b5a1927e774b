#pragma once

#include "ConnectionConfig.hpp"
#include <optional>
#include <string>

// Everything the command-line client needs for one run
struct ClientConfig {
    ConnectionConfig connection;
    std::optional<std::string> query;
    bool skip_parsing = false;
    bool verbose = false;
    std::string log_file = "log/boltsql.log";
};
