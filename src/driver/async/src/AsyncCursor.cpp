#include "AsyncCursor.hpp"

AsyncCursor::AsyncCursor(std::shared_ptr<Connection> owner,
                         std::shared_ptr<Cursor> cursor,
                         std::shared_ptr<TaskExecutor> executor)
    : owner_(std::move(owner)), cursor_(std::move(cursor)), executor_(std::move(executor)) {
    if (!owner_ || !cursor_ || !executor_) {
        throw std::invalid_argument("AsyncCursor requires a connection, a cursor and an executor");
    }
}

std::future<int64_t> AsyncCursor::execute(std::string query, ParameterSet parameters, bool skip_parsing) {
    return submit([query = std::move(query), parameters = std::move(parameters), skip_parsing](Cursor& cursor) {
        return cursor.execute(query, parameters, skip_parsing);
    });
}

std::future<int64_t> AsyncCursor::executemany(std::string query, std::vector<ParameterSet> parameter_sets,
                                              bool skip_parsing) {
    return submit([query = std::move(query), parameter_sets = std::move(parameter_sets),
                   skip_parsing](Cursor& cursor) {
        return cursor.executemany(query, parameter_sets, skip_parsing);
    });
}

std::future<std::string> AsyncCursor::execute_async(std::string query, ParameterSet parameters,
                                                    bool skip_parsing) {
    return submit([query = std::move(query), parameters = std::move(parameters), skip_parsing](Cursor& cursor) {
        return cursor.execute_async(query, parameters, skip_parsing);
    });
}

std::future<std::optional<Row>> AsyncCursor::fetchone() {
    return submit([](Cursor& cursor) { return cursor.fetchone(); });
}

std::future<std::vector<Row>> AsyncCursor::fetchmany(std::optional<size_t> size) {
    return submit([size](Cursor& cursor) { return cursor.fetchmany(size); });
}

std::future<std::vector<Row>> AsyncCursor::fetchall() {
    return submit([](Cursor& cursor) { return cursor.fetchall(); });
}

std::future<std::optional<bool>> AsyncCursor::nextset() {
    return submit([](Cursor& cursor) { return cursor.nextset(); });
}

std::future<QueryStatus> AsyncCursor::get_status(std::string query_id) {
    return submit([query_id = std::move(query_id)](Cursor& cursor) { return cursor.get_status(query_id); });
}

std::future<void> AsyncCursor::cancel(std::string query_id) {
    return submit([query_id = std::move(query_id)](Cursor& cursor) { cursor.cancel(query_id); });
}
