#include "Connection.hpp"
#include "DriverErrors.hpp"
#include "MockTransport.hpp"
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

const char* SYSTEM_URL = "https://acme-sys.example.io/dynamic/query";
const char* USER_URL = "https://acme-etl.example.io";

struct UserFixture {
    MockTransport* system_mock;
    MockTransport* user_mock;
    std::unique_ptr<Connection> connection;
};

UserFixture make_user_connection() {
    auto system_transport = std::make_unique<MockTransport>();
    auto user_transport = std::make_unique<MockTransport>();
    UserFixture f{system_transport.get(), user_transport.get(), nullptr};
    auto system = std::make_unique<Connection>(SYSTEM_URL, std::nullopt, std::move(system_transport), "acc-1");
    f.connection = std::make_unique<Connection>(USER_URL, std::string("sales"), std::move(user_transport),
                                                "acc-1", std::move(system));
    return f;
}

HttpResponse engine_row(const std::string& status) {
    return MockTransport::respond_rows(
        {{"url", "text"}, {"attached_to", "text"}, {"status", "text"}},
        nlohmann::json::array({nlohmann::json::array({"acme-etl.example.io", "sales", status})}));
}

HttpResponse database_rows(bool exists) {
    return MockTransport::respond_rows(
        {{"1", "int"}}, exists ? nlohmann::json::parse("[[1]]") : nlohmann::json::array());
}

template <typename E, typename Fn>
std::string expect_error(Fn&& fn) {
    try {
        fn();
    } catch (const E& e) {
        return e.what();
    }
    assert(false && "expected exception");
    return "";
}

}

void test_close_cascades() {
    auto f = make_user_connection();
    auto first = f.connection->cursor();
    auto second = f.connection->cursor();
    assert(f.connection->open_cursors() == 2);

    f.connection->close();
    assert(f.connection->closed());
    assert(first->closed() && second->closed());
    assert(f.user_mock->is_closed());
    assert(f.system_mock->is_closed());
    assert(f.connection->system_engine()->closed());

    assert(expect_error<ConnectionClosedError>([&] { f.connection->cursor(); }) ==
           "Unable to create cursor: connection closed.");
    assert(expect_error<ConnectionClosedError>([&] { f.connection->commit(); }) ==
           "Unable to commit: connection closed.");
    expect_error<ConnectionClosedError>([&] { f.connection->transport(); });

    // Second close is a no-op
    f.connection->close();
    std::cout << "test_close_cascades passed" << std::endl;
}

void test_commit_and_registry() {
    auto f = make_user_connection();
    f.connection->commit();

    auto cursor = f.connection->cursor();
    {
        auto scoped = f.connection->cursor();
        assert(f.connection->open_cursors() == 2);
    }
    // Destroyed cursors drop out of the registry
    assert(f.connection->open_cursors() == 1);

    auto other = make_user_connection();
    auto stranger = other.connection->cursor();
    f.connection->remove_cursor(stranger.get());
    assert(f.connection->open_cursors() == 1);

    cursor->close();
    f.connection->remove_cursor(cursor.get());
    assert(f.connection->open_cursors() == 0);
    std::cout << "test_commit_and_registry passed" << std::endl;
}

void test_constructor_requires_transport() {
    expect_error<std::invalid_argument>([] { Connection c(USER_URL, std::nullopt, nullptr, "acc-1"); });
    std::cout << "test_constructor_requires_transport passed" << std::endl;
}

void test_forbidden_with_missing_database() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT secret", MockTransport::respond(HttpStatus::FORBIDDEN, "denied"));
    f.system_mock->on_query("information_schema.databases", database_rows(false));

    auto cursor = f.connection->cursor();
    std::string message = expect_error<DatabaseNotFoundError>([&] { cursor->execute("SELECT secret"); });
    assert(message == "Database sales does not exist");

    RecordedRequest probe = f.system_mock->last_request();
    assert(probe.body == "SELECT 1 FROM information_schema.databases WHERE database_name='sales'");
    assert(probe.param("account_id") == "acc-1");
    std::cout << "test_forbidden_with_missing_database passed" << std::endl;
}

void test_forbidden_with_existing_database() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT secret", MockTransport::respond(HttpStatus::FORBIDDEN, "denied"));
    f.system_mock->on_query("information_schema.databases", database_rows(true));

    auto cursor = f.connection->cursor();
    assert(expect_error<ProgrammingError>([&] { cursor->execute("SELECT secret"); }) == "denied");
    std::cout << "test_forbidden_with_existing_database passed" << std::endl;
}

void test_probe_failure_keeps_primary_error() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT secret", MockTransport::respond(HttpStatus::FORBIDDEN, "denied"));
    f.system_mock->on_query("information_schema.databases",
                            MockTransport::respond(HttpStatus::INTERNAL_SERVER_ERROR, "catalog down"));

    auto cursor = f.connection->cursor();
    assert(expect_error<ProgrammingError>([&] { cursor->execute("SELECT secret"); }) == "denied");
    // Probe cursors do not probe again
    assert(f.system_mock->requests().size() == 1);
    std::cout << "test_probe_failure_keeps_primary_error passed" << std::endl;
}

void test_unavailable_with_stopped_engine() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT 1", MockTransport::respond(HttpStatus::SERVICE_UNAVAILABLE, "unavailable"));
    f.system_mock->on_query("information_schema.engines", engine_row("Stopped"));

    auto cursor = f.connection->cursor();
    std::string message = expect_error<EngineNotRunningError>([&] { cursor->execute("SELECT 1"); });
    assert(message.find(USER_URL) != std::string::npos);
    assert(f.system_mock->last_request().body.find("engine_name='acme_etl'") != std::string::npos);
    std::cout << "test_unavailable_with_stopped_engine passed" << std::endl;
}

void test_unavailable_with_running_engine() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT 1", MockTransport::respond(HttpStatus::SERVICE_UNAVAILABLE, "unavailable"));
    f.system_mock->on_query("information_schema.engines", engine_row("Running"));

    auto cursor = f.connection->cursor();
    try {
        cursor->execute("SELECT 1");
        assert(false);
    } catch (const HttpError& e) {
        assert(e.status_code() == 503);
        assert(e.body() == "unavailable");
    }
    std::cout << "test_unavailable_with_running_engine passed" << std::endl;
}

void test_not_found_with_unknown_engine() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT 1", MockTransport::respond(HttpStatus::NOT_FOUND, "gone"));
    f.system_mock->on_query("information_schema.engines",
                            MockTransport::respond_rows({{"url", "text"}, {"attached_to", "text"}, {"status", "text"}},
                                                        nlohmann::json::array()));

    auto cursor = f.connection->cursor();
    try {
        cursor->execute("SELECT 1");
        assert(false);
    } catch (const HttpError& e) {
        assert(e.status_code() == 404);
    }
    std::cout << "test_not_found_with_unknown_engine passed" << std::endl;
}

void test_system_engine_never_probes_engine_status() {
    auto transport = std::make_unique<MockTransport>();
    MockTransport* mock = transport.get();
    Connection connection(SYSTEM_URL, std::nullopt, std::move(transport), "acc-1");
    mock->on_query("SELECT 1", MockTransport::respond(HttpStatus::SERVICE_UNAVAILABLE, "busy"));

    auto cursor = connection.cursor();
    expect_error<HttpError>([&] { cursor->execute("SELECT 1"); });
    assert(mock->requests().size() == 1);
    std::cout << "test_system_engine_never_probes_engine_status passed" << std::endl;
}

// Several failing cursors probe the catalog at once; each gets its own classified error
void test_concurrent_probes() {
    auto f = make_user_connection();
    f.user_mock->on_query("SELECT secret", MockTransport::respond(HttpStatus::FORBIDDEN, "denied"));
    f.system_mock->on_query("information_schema.databases", database_rows(false));

    const int thread_count = 4;
    std::atomic<int> classified{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&f, &classified]() {
            auto cursor = f.connection->cursor();
            try {
                cursor->execute("SELECT secret");
            } catch (const DatabaseNotFoundError&) {
                ++classified;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(classified == thread_count);
    assert(f.system_mock->count("", "information_schema.databases") == static_cast<size_t>(thread_count));
    std::cout << "test_concurrent_probes passed" << std::endl;
}

int main() {
    test_close_cascades();
    test_commit_and_registry();
    test_constructor_requires_transport();
    test_forbidden_with_missing_database();
    test_forbidden_with_existing_database();
    test_probe_failure_keeps_primary_error();
    test_unavailable_with_stopped_engine();
    test_unavailable_with_running_engine();
    test_not_found_with_unknown_engine();
    test_system_engine_never_probes_engine_status();
    test_concurrent_probes();
    std::cout << "All Connection tests passed!" << std::endl;
    return 0;
}
