#include "ErrorClassifier.hpp"
#include "DriverErrors.hpp"
#include "LogUtils.hpp"

ErrorClassifier::ErrorClassifier(ResourceProbe* probe, std::optional<std::string> database,
                                 std::string engine_url)
    : probe_(probe), database_(std::move(database)), engine_url_(std::move(engine_url)) {}

bool ErrorClassifier::database_missing() const {
    if (!probe_ || !database_ || database_->empty()) {
        return false;
    }
    try {
        return !probe_->is_database_available(*database_);
    } catch (const std::exception& e) {
        LogUtils::warn("Database existence check for {} failed: {}", *database_, e.what());
        return false;
    }
}

bool ErrorClassifier::engine_stopped() const {
    if (!probe_) {
        return false;
    }
    try {
        return !probe_->is_engine_running(engine_url_);
    } catch (const std::exception& e) {
        LogUtils::warn("Engine status check for {} failed: {}", engine_url_, e.what());
        return false;
    }
}

void ErrorClassifier::raise_if_error(const HttpResponse& response) const {
    if (response.ok()) {
        return;
    }

    switch (response.status_code) {
        case HttpStatus::INTERNAL_SERVER_ERROR:
            throw OperationalError("Error executing query:\n" + response.body);

        case HttpStatus::FORBIDDEN:
            if (database_missing()) {
                throw DatabaseNotFoundError(*database_);
            }
            throw ProgrammingError(response.body);

        case HttpStatus::SERVICE_UNAVAILABLE:
        case HttpStatus::NOT_FOUND:
            if (engine_stopped()) {
                throw EngineNotRunningError(engine_url_);
            }
            break;

        default:
            break;
    }
    throw HttpError(response.status_code, response.body);
}
