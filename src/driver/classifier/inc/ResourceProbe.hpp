#pragma once

#include <string>

// Control-plane lookups used to explain ambiguous HTTP failures
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;

    virtual bool is_database_available(const std::string& database) = 0;
    virtual bool is_engine_running(const std::string& engine_url) = 0;
};
