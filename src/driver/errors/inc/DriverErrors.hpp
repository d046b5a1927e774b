#pragma once

#include <stdexcept>
#include <string>

// Root of every error raised by the driver
class DriverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Misuse of the driver interface, or a failure outside the query engine
class InterfaceError : public DriverError {
public:
    using DriverError::DriverError;
};

class ConnectionClosedError : public InterfaceError {
public:
    ConnectionClosedError() : InterfaceError("Connection is closed.") {}
    using InterfaceError::InterfaceError;
};

class CursorClosedError : public InterfaceError {
public:
    CursorClosedError() : InterfaceError("Cursor is closed.") {}
    using InterfaceError::InterfaceError;
};

class AccountNotFoundError : public InterfaceError {
public:
    explicit AccountNotFoundError(const std::string& account_name)
        : InterfaceError("Account \"" + account_name + "\" does not exist"),
          account_name_(account_name) {}

    const std::string& account_name() const { return account_name_; }

private:
    std::string account_name_;
};

class AsyncExecutionUnavailableError : public InterfaceError {
public:
    using InterfaceError::InterfaceError;
};

// Errors reported by, or attributed to, the database engine
class DatabaseError : public DriverError {
public:
    using DriverError::DriverError;
};

class OperationalError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class InvalidParameterError : public OperationalError {
public:
    using OperationalError::OperationalError;
};

class EngineNotRunningError : public OperationalError {
public:
    explicit EngineNotRunningError(const std::string& engine_name)
        : OperationalError("Engine " + engine_name + " needs to be running to run queries against it"),
          engine_name_(engine_name) {}

    const std::string& engine_name() const { return engine_name_; }

private:
    std::string engine_name_;
};

class ProgrammingError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class DataError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

class NoDataError : public DataError {
public:
    NoDataError() : DataError("no rows to fetch") {}
    using DataError::DataError;
};

class DecodeError : public DataError {
public:
    using DataError::DataError;
};

class ParameterCountError : public DataError {
public:
    using DataError::DataError;
};

class MalformedQueryError : public DataError {
public:
    using DataError::DataError;
};

class DatabaseNotFoundError : public DatabaseError {
public:
    explicit DatabaseNotFoundError(const std::string& database)
        : DatabaseError("Database " + database + " does not exist"), database_(database) {}

    const std::string& database() const { return database_; }

private:
    std::string database_;
};

class EngineNotFoundError : public DatabaseError {
public:
    explicit EngineNotFoundError(const std::string& engine_name)
        : DatabaseError("Engine with name " + engine_name + " doesn't exist"),
          engine_name_(engine_name) {}

    const std::string& engine_name() const { return engine_name_; }

private:
    std::string engine_name_;
};

class NotSupportedError : public DatabaseError {
public:
    using DatabaseError::DatabaseError;
};

// Non-2xx response that no more specific error explains.
// status_code() is 0 when the request never got a response.
class HttpError : public DriverError {
public:
    HttpError(int status_code, std::string body)
        : DriverError(make_message(status_code, body)),
          status_code_(status_code), body_(std::move(body)) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    static std::string make_message(int status_code, const std::string& body) {
        if (status_code == 0) {
            return "HTTP request failed: " + body;
        }
        return "HTTP error " + std::to_string(status_code) + ": " + body;
    }

    int status_code_;
    std::string body_;
};
