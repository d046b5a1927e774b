#include "DriverErrors.hpp"
#include <cassert>
#include <iostream>
#include <string>

template <typename Base, typename Derived>
bool caught_as(const Derived& error) {
    try {
        throw error;
    } catch (const Base&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void test_hierarchy() {
    assert((caught_as<InterfaceError>(ConnectionClosedError())));
    assert((caught_as<InterfaceError>(CursorClosedError())));
    assert((caught_as<InterfaceError>(AccountNotFoundError("acc"))));
    assert((caught_as<InterfaceError>(AsyncExecutionUnavailableError("no"))));
    assert((caught_as<OperationalError>(InvalidParameterError("bad"))));
    assert((caught_as<OperationalError>(EngineNotRunningError("eng"))));
    assert((caught_as<DataError>(NoDataError())));
    assert((caught_as<DataError>(DecodeError("x"))));
    assert((caught_as<DataError>(ParameterCountError("x"))));
    assert((caught_as<DataError>(MalformedQueryError("x"))));
    assert((caught_as<DatabaseError>(DatabaseNotFoundError("db"))));
    assert((caught_as<DatabaseError>(EngineNotFoundError("eng"))));
    assert((caught_as<DatabaseError>(ProgrammingError("x"))));
    assert((caught_as<DriverError>(HttpError(502, "bad gateway"))));
    assert((caught_as<std::runtime_error>(NotSupportedError("x"))));

    assert(!(caught_as<DatabaseError>(AccountNotFoundError("acc"))));
    assert(!(caught_as<DatabaseError>(HttpError(404, ""))));
    std::cout << "test_hierarchy passed" << std::endl;
}

void test_messages() {
    assert(std::string(AccountNotFoundError("acme").what()) == "Account \"acme\" does not exist");
    assert(std::string(DatabaseNotFoundError("sales").what()) == "Database sales does not exist");
    assert(std::string(EngineNotFoundError("eng_1").what()) == "Engine with name eng_1 doesn't exist");
    assert(EngineNotRunningError("eng_1").engine_name() == "eng_1");
    std::cout << "test_messages passed" << std::endl;
}

void test_http_error_payload() {
    HttpError err(503, "unavailable");
    assert(err.status_code() == 503);
    assert(err.body() == "unavailable");
    assert(std::string(err.what()).find("503") != std::string::npos);

    HttpError transport(0, "Connection refused");
    assert(transport.status_code() == 0);
    assert(std::string(transport.what()).find("Connection refused") != std::string::npos);
    std::cout << "test_http_error_payload passed" << std::endl;
}

int main() {
    test_hierarchy();
    test_messages();
    test_http_error_payload();

    std::cout << "All DriverErrors tests passed." << std::endl;
    return 0;
}
