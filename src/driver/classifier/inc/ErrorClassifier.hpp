#pragma once

#include "HttpTransport.hpp"
#include "ResourceProbe.hpp"
#include <optional>
#include <string>

/**
 * Turns a non-2xx query response into the most specific driver error.
 *
 *   500        -> OperationalError with the response body
 *   403        -> DatabaseNotFoundError if the configured database is gone,
 *                 else ProgrammingError
 *   503 / 404  -> EngineNotRunningError if the engine is not running,
 *                 else HttpError
 *   other      -> HttpError
 *
 * The probes run synchronously before the error is raised. A probe that fails
 * is logged and the error derived from the original response is raised.
 */
class ErrorClassifier {
public:
    ErrorClassifier(ResourceProbe* probe, std::optional<std::string> database, std::string engine_url);

    // Returns normally for 2xx responses
    void raise_if_error(const HttpResponse& response) const;

private:
    bool database_missing() const;
    bool engine_stopped() const;

    ResourceProbe* probe_;
    std::optional<std::string> database_;
    std::string engine_url_;
};
