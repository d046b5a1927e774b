#include "EngineResolver.hpp"
#include "Connection.hpp"
#include "DriverErrors.hpp"
#include "UrlUtils.hpp"

namespace {

std::string text_of(const ColValue& value) {
    return value.is<std::string>() ? value.get<std::string>() : fmt::format("{}", value);
}

// Catalog queries must not trigger classifier probes themselves
std::shared_ptr<Cursor> probe_cursor(Connection& connection) {
    auto cursor = connection.cursor();
    cursor->set_diagnostics(false);
    return cursor;
}

}

EngineInfo EngineResolver::resolve_engine(const std::string& engine_name) {
    auto cursor = probe_cursor(system_engine_);
    cursor->execute(
        "SELECT url, attached_to, status FROM information_schema.engines WHERE engine_name=?",
        {engine_name});
    std::optional<Row> row = cursor->fetchone();
    cursor->close();
    if (!row || row->size() < 3) {
        throw EngineNotFoundError(engine_name);
    }

    EngineInfo info;
    info.url = text_of((*row)[0]);
    if (!(*row)[1].is_null() && !text_of((*row)[1]).empty()) {
        info.attached_database = text_of((*row)[1]);
    }
    info.status = text_of((*row)[2]);
    return info;
}

bool EngineResolver::is_running(const std::string& engine_url) {
    return resolve_engine(UrlUtils::engine_name_from_url(engine_url)).status == STATUS_RUNNING;
}

bool EngineResolver::is_database_available(const std::string& database) {
    auto cursor = probe_cursor(system_engine_);
    const int64_t rows = cursor->execute(
        "SELECT 1 FROM information_schema.databases WHERE database_name=?", {database});
    cursor->close();
    return rows > 0;
}
