#include "Connection.hpp"
#include "DriverErrors.hpp"
#include "EngineResolver.hpp"
#include "LogUtils.hpp"
#include <algorithm>

Connection::Connection(std::string engine_url,
                       std::optional<std::string> database,
                       std::unique_ptr<HttpTransport> transport,
                       std::string account_id,
                       std::unique_ptr<Connection> system_engine)
    : engine_url_(std::move(engine_url)),
      database_(std::move(database)),
      transport_(std::move(transport)),
      account_id_(std::move(account_id)),
      system_engine_(std::move(system_engine)) {
    if (!transport_) {
        throw std::invalid_argument("Connection requires a transport");
    }
}

Connection::~Connection() {
    close();
}

std::shared_ptr<Cursor> Connection::cursor() {
    std::lock_guard<std::mutex> lock(cursors_mutex_);
    if (closed_) {
        throw ConnectionClosedError("Unable to create cursor: connection closed.");
    }
    auto cursor = std::make_shared<Cursor>(this);
    cursors_.erase(std::remove_if(cursors_.begin(), cursors_.end(),
                                  [](const std::weak_ptr<Cursor>& c) { return c.expired(); }),
                   cursors_.end());
    cursors_.push_back(cursor);
    return cursor;
}

void Connection::close() {
    std::vector<std::weak_ptr<Cursor>> open;
    {
        std::lock_guard<std::mutex> lock(cursors_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        open.swap(cursors_);
    }

    for (auto& weak : open) {
        if (auto cursor = weak.lock()) {
            cursor->close();
        }
    }
    transport_->close();
    if (system_engine_) {
        system_engine_->close();
    }
    LogUtils::debug("Connection to {} closed", engine_url_);
}

void Connection::commit() {
    if (closed()) {
        throw ConnectionClosedError("Unable to commit: connection closed.");
    }
}

HttpTransport& Connection::transport() {
    if (closed()) {
        throw ConnectionClosedError();
    }
    return *transport_;
}

size_t Connection::open_cursors() const {
    std::lock_guard<std::mutex> lock(cursors_mutex_);
    return static_cast<size_t>(std::count_if(cursors_.begin(), cursors_.end(),
                                             [](const std::weak_ptr<Cursor>& c) { return !c.expired(); }));
}

void Connection::remove_cursor(const Cursor* cursor) {
    std::lock_guard<std::mutex> lock(cursors_mutex_);
    cursors_.erase(std::remove_if(cursors_.begin(), cursors_.end(),
                                  [cursor](const std::weak_ptr<Cursor>& c) {
                                      auto locked = c.lock();
                                      return !locked || locked.get() == cursor;
                                  }),
                   cursors_.end());
}

Connection& Connection::catalog() {
    return system_engine_ ? *system_engine_ : *this;
}

bool Connection::is_database_available(const std::string& database) {
    return EngineResolver(catalog()).is_database_available(database);
}

bool Connection::is_engine_running(const std::string& engine_url) {
    if (is_system()) {
        return true;
    }
    return EngineResolver(*system_engine_).is_running(engine_url);
}
