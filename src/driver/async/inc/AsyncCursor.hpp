#pragma once

#include "Connection.hpp"
#include "Cursor.hpp"
#include "TaskExecutor.hpp"
#include <future>
#include <memory>

/**
 * Cursor whose network-bound operations run on a TaskExecutor. Each call
 * returns at once; errors surface from future::get(). Calls that need no
 * I/O answer synchronously from the wrapped cursor.
 */
class AsyncCursor {
public:
    // `owner` keeps the connection alive until every submitted operation has run
    AsyncCursor(std::shared_ptr<Connection> owner,
                std::shared_ptr<Cursor> cursor,
                std::shared_ptr<TaskExecutor> executor);

    std::future<int64_t> execute(std::string query, ParameterSet parameters = {},
                                 bool skip_parsing = false);
    std::future<int64_t> executemany(std::string query, std::vector<ParameterSet> parameter_sets,
                                     bool skip_parsing = false);
    std::future<std::string> execute_async(std::string query, ParameterSet parameters = {},
                                           bool skip_parsing = false);

    std::future<std::optional<Row>> fetchone();
    std::future<std::vector<Row>> fetchmany(std::optional<size_t> size = std::nullopt);
    std::future<std::vector<Row>> fetchall();
    std::future<std::optional<bool>> nextset();

    std::future<QueryStatus> get_status(std::string query_id);
    std::future<void> cancel(std::string query_id);

    int64_t rowcount() const { return cursor_->rowcount(); }
    std::optional<ColumnVector> description() const { return cursor_->description(); }
    std::optional<std::string> query_id() const { return cursor_->query_id(); }
    CursorState state() const { return cursor_->state(); }
    bool closed() const { return cursor_->closed(); }
    void set_arraysize(size_t size) { cursor_->set_arraysize(size); }

    void close() { cursor_->close(); }

    Cursor& sync() { return *cursor_; }

private:
    template <typename Fn>
    auto submit(Fn&& fn) {
        return executor_->submit([owner = owner_, cursor = cursor_, fn = std::forward<Fn>(fn)]() mutable {
            return fn(*cursor);
        });
    }

    std::shared_ptr<Connection> owner_;
    std::shared_ptr<Cursor> cursor_;
    std::shared_ptr<TaskExecutor> executor_;
};
