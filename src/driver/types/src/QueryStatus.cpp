#include "QueryStatus.hpp"
#include "DriverErrors.hpp"
#include <array>
#include <utility>

namespace {

const std::array<std::pair<QueryStatus, const char*>, 6> STATUS_NAMES = {{
    {QueryStatus::NOT_READY, "NOT_READY"},
    {QueryStatus::STARTED_EXECUTION, "STARTED_EXECUTION"},
    {QueryStatus::PARSE_ERROR, "PARSE_ERROR"},
    {QueryStatus::CANCELED_EXECUTION, "CANCELED_EXECUTION"},
    {QueryStatus::EXECUTION_ERROR, "EXECUTION_ERROR"},
    {QueryStatus::ENDED_SUCCESSFULLY, "ENDED_SUCCESSFULLY"},
}};

}

namespace QueryStatusUtils {

QueryStatus from_string(const std::string& status) {
    if (status.empty()) {
        return QueryStatus::NOT_READY;
    }
    for (const auto& [value, name] : STATUS_NAMES) {
        if (status == name) return value;
    }
    throw OperationalError("Unknown asynchronous query status: " + status);
}

std::string to_string(QueryStatus status) {
    for (const auto& [value, name] : STATUS_NAMES) {
        if (status == value) return name;
    }
    return "UNKNOWN";
}

bool is_terminal(QueryStatus status) {
    switch (status) {
        case QueryStatus::PARSE_ERROR:
        case QueryStatus::CANCELED_EXECUTION:
        case QueryStatus::EXECUTION_ERROR:
        case QueryStatus::ENDED_SUCCESSFULLY:
            return true;
        default:
            return false;
    }
}

}
