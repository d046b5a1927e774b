#pragma once

#include "Cursor.hpp"
#include "HttpTransport.hpp"
#include "ResourceProbe.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Owns the transport to one engine endpoint and the cursors created on it.
 * A connection without a system-engine connection is itself a system-engine
 * connection; a user-engine connection owns the system-engine connection it
 * uses for catalog lookups.
 */
class Connection : public ResourceProbe {
public:
    Connection(std::string engine_url,
               std::optional<std::string> database,
               std::unique_ptr<HttpTransport> transport,
               std::string account_id,
               std::unique_ptr<Connection> system_engine = nullptr);
    ~Connection() override;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Create a cursor bound to this connection.
     * @throws ConnectionClosedError After close()
     */
    std::shared_ptr<Cursor> cursor();

    // Close every open cursor, the transport and the owned system-engine connection
    void close();
    bool closed() const { return closed_; }

    // No transactions on the engine; only checks that the connection is open
    void commit();

    const std::string& engine_url() const { return engine_url_; }
    const std::optional<std::string>& database() const { return database_; }
    const std::string& account_id() const { return account_id_; }
    bool is_system() const { return !system_engine_; }
    Connection* system_engine() const { return system_engine_.get(); }

    HttpTransport& transport();

    size_t open_cursors() const;

    // No-op when the cursor is not registered
    void remove_cursor(const Cursor* cursor);

    bool is_database_available(const std::string& database) override;
    bool is_engine_running(const std::string& engine_url) override;

private:
    Connection& catalog();

    std::string engine_url_;
    std::optional<std::string> database_;
    std::unique_ptr<HttpTransport> transport_;
    std::string account_id_;
    std::unique_ptr<Connection> system_engine_;

    mutable std::mutex cursors_mutex_;
    std::vector<std::weak_ptr<Cursor>> cursors_;
    std::atomic<bool> closed_{false};
};
