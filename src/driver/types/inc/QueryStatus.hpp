#pragma once

#include <string>

// Server-side asynchronous query status
enum class QueryStatus {
    NOT_READY,
    STARTED_EXECUTION,
    PARSE_ERROR,
    CANCELED_EXECUTION,
    EXECUTION_ERROR,
    ENDED_SUCCESSFULLY
};

namespace QueryStatusUtils {

    /**
     * Map the status text of the status endpoint to a QueryStatus.
     * An empty string means the query is not ready yet.
     * @throws OperationalError On any unrecognized status text
     */
    QueryStatus from_string(const std::string& status);

    std::string to_string(QueryStatus status);

    // ENDED_SUCCESSFULLY, EXECUTION_ERROR, PARSE_ERROR or CANCELED_EXECUTION
    bool is_terminal(QueryStatus status);
}
