#include "Connection.hpp"
#include "DriverErrors.hpp"
#include "EngineResolver.hpp"
#include "MockTransport.hpp"
#include <cassert>
#include <iostream>

namespace {

struct Fixture {
    MockTransport* mock;
    std::unique_ptr<Connection> system;
};

Fixture make_system() {
    auto transport = std::make_unique<MockTransport>();
    MockTransport* raw = transport.get();
    auto system = std::make_unique<Connection>("https://acme-sys.example.io/dynamic/query",
                                               std::nullopt, std::move(transport), "acc-1");
    return {raw, std::move(system)};
}

HttpResponse engines(const nlohmann::json& data) {
    return MockTransport::respond_rows(
        {{"url", "text"}, {"attached_to", "text null"}, {"status", "text"}}, data);
}

}

void test_resolve_engine() {
    auto f = make_system();
    f.mock->on_query("information_schema.engines",
                     engines(nlohmann::json::parse(R"([["acme-etl.example.io", "sales", "Running"]])")));

    EngineResolver resolver(*f.system);
    EngineInfo info = resolver.resolve_engine("etl");
    assert(info.url == "acme-etl.example.io");
    assert(info.attached_database == std::optional<std::string>("sales"));
    assert(info.status == "Running");

    // Probe cursors are closed after use
    assert(f.system->open_cursors() == 0);
    std::cout << "test_resolve_engine passed" << std::endl;
}

void test_resolve_engine_detached_and_missing() {
    auto f = make_system();
    f.mock->on_query("engine_name='idle'",
                     engines(nlohmann::json::parse(R"([["acme-idle.example.io", null, "Stopped"]])")));
    f.mock->on_query("engine_name='ghost'", engines(nlohmann::json::array()));

    EngineResolver resolver(*f.system);
    EngineInfo info = resolver.resolve_engine("idle");
    assert(!info.attached_database.has_value());
    assert(info.status == "Stopped");

    try {
        resolver.resolve_engine("ghost");
        assert(false);
    } catch (const EngineNotFoundError& e) {
        assert(std::string(e.what()) == "Engine with name ghost doesn't exist");
    }
    std::cout << "test_resolve_engine_detached_and_missing passed" << std::endl;
}

void test_is_running_uses_catalog_key() {
    auto f = make_system();
    f.mock->on_query("engine_name='my_etl'",
                     engines(nlohmann::json::parse(R"([["my-etl.example.io", "sales", "Running"]])")));
    f.mock->on_query("engine_name='other'",
                     engines(nlohmann::json::parse(R"([["other.example.io", "sales", "running"]])")));

    EngineResolver resolver(*f.system);
    assert(resolver.is_running("https://my-etl.example.io"));
    // Status comparison is case-sensitive
    assert(!resolver.is_running("other.example.io"));
    std::cout << "test_is_running_uses_catalog_key passed" << std::endl;
}

void test_is_database_available() {
    auto f = make_system();
    f.mock->on_query("database_name='sales'",
                     MockTransport::respond_rows({{"1", "int"}}, nlohmann::json::parse("[[1]]")));
    f.mock->on_query("database_name='ghost'",
                     MockTransport::respond_rows({{"1", "int"}}, nlohmann::json::array()));

    EngineResolver resolver(*f.system);
    assert(resolver.is_database_available("sales"));
    assert(!resolver.is_database_available("ghost"));
    assert(f.system->is_database_available("sales"));
    std::cout << "test_is_database_available passed" << std::endl;
}

int main() {
    test_resolve_engine();
    test_resolve_engine_detached_and_missing();
    test_is_running_uses_catalog_key();
    test_is_database_available();
    std::cout << "All EngineResolver tests passed!" << std::endl;
    return 0;
}
