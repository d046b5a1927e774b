#pragma once

#include "AsyncCursor.hpp"
#include "Connect.hpp"
#include "Connection.hpp"
#include "TaskExecutor.hpp"
#include <future>
#include <memory>

/**
 * Connection driven through a shared TaskExecutor. Pending operations keep the
 * underlying connection alive; destroying the AsyncConnection closes it, so
 * operations still queued then fail with a closed-cursor error.
 */
class AsyncConnection {
public:
    AsyncConnection(std::unique_ptr<Connection> connection, std::shared_ptr<TaskExecutor> executor);
    ~AsyncConnection();

    AsyncConnection(const AsyncConnection&) = delete;
    AsyncConnection& operator=(const AsyncConnection&) = delete;

    // Registration only, no I/O
    std::shared_ptr<AsyncCursor> cursor();

    std::future<void> close();
    bool closed() const { return connection_->closed(); }
    void commit() { connection_->commit(); }

    Connection& sync() { return *connection_; }
    const std::shared_ptr<TaskExecutor>& executor() const { return executor_; }

private:
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<TaskExecutor> executor_;
};

std::future<std::unique_ptr<AsyncConnection>> connect_async(const ConnectionConfig& config,
                                                            std::shared_ptr<TaskExecutor> executor);

std::future<std::unique_ptr<AsyncConnection>> connect_async(const ConnectionConfig& config,
                                                            TransportFactory make_transport,
                                                            std::shared_ptr<TaskExecutor> executor);
