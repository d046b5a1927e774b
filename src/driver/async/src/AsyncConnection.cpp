#include "AsyncConnection.hpp"
#include "LogUtils.hpp"

namespace {

// Queued tasks hold the executor weakly; the last strong reference must never be dropped on a worker
std::shared_ptr<TaskExecutor> pool_of(const std::weak_ptr<TaskExecutor>& weak) {
    auto executor = weak.lock();
    if (!executor) {
        throw InterfaceError("Task executor is shut down.");
    }
    return executor;
}

}

AsyncConnection::AsyncConnection(std::unique_ptr<Connection> connection, std::shared_ptr<TaskExecutor> executor)
    : connection_(std::move(connection)), executor_(std::move(executor)) {
    if (!connection_ || !executor_) {
        throw std::invalid_argument("AsyncConnection requires a connection and an executor");
    }
}

AsyncConnection::~AsyncConnection() {
    connection_->close();
}

std::shared_ptr<AsyncCursor> AsyncConnection::cursor() {
    return std::make_shared<AsyncCursor>(connection_, connection_->cursor(), executor_);
}

std::future<void> AsyncConnection::close() {
    return executor_->submit([connection = connection_]() { connection->close(); });
}

std::future<std::unique_ptr<AsyncConnection>> connect_async(const ConnectionConfig& config,
                                                            std::shared_ptr<TaskExecutor> executor) {
    if (!executor) {
        throw std::invalid_argument("connect_async requires an executor");
    }
    std::weak_ptr<TaskExecutor> weak = executor;
    return executor->submit([config, weak]() {
        return std::make_unique<AsyncConnection>(connect(config), pool_of(weak));
    });
}

std::future<std::unique_ptr<AsyncConnection>> connect_async(const ConnectionConfig& config,
                                                            TransportFactory make_transport,
                                                            std::shared_ptr<TaskExecutor> executor) {
    if (!executor) {
        throw std::invalid_argument("connect_async requires an executor");
    }
    std::weak_ptr<TaskExecutor> weak = executor;
    return executor->submit([config, make_transport = std::move(make_transport), weak]() {
        LogUtils::debug("Connecting to account {} in the background", config.account_name);
        return std::make_unique<AsyncConnection>(connect(config, make_transport), pool_of(weak));
    });
}
