#include "Connect.hpp"
#include "DriverErrors.hpp"
#include "EngineResolver.hpp"
#include "GatewayClient.hpp"
#include "HttplibTransport.hpp"
#include "LogUtils.hpp"
#include "UrlUtils.hpp"
#include <optional>

namespace {

struct SystemEngine {
    std::string url;
    std::string account_id;
};

SystemEngine locate_system_engine(const ConnectionConfig& config, const TransportFactory& make_transport) {
    auto gateway_transport = make_transport(UrlUtils::fix_url_schema(config.api_endpoint));
    GatewayClient gateway(*gateway_transport);

    SystemEngine system;
    system.url = UrlUtils::fix_url_schema(gateway.system_engine_url(config.account_name));
    system.account_id = gateway.resolve_account(config.account_name);
    gateway_transport->close();
    return system;
}

// Database the user engine runs against, given what the catalog reports
std::string pick_database(const ConnectionConfig& config, const EngineInfo& info) {
    const std::string& engine_name = *config.engine_name;
    if (config.database) {
        if (!info.attached_database) {
            throw InterfaceError("Engine " + engine_name + " is not attached to any database");
        }
        if (*info.attached_database != *config.database) {
            throw InterfaceError("Engine " + engine_name + " is attached to " + *info.attached_database +
                                 " instead of " + *config.database);
        }
        return *config.database;
    }
    if (!info.attached_database) {
        throw InterfaceError("Engine " + engine_name + " is not attached to any database");
    }
    return *info.attached_database;
}

}

std::shared_ptr<AuthProvider> make_auth(const ConnectionConfig& config) {
    if (config.auth.has_token()) {
        return std::make_shared<StaticTokenAuth>(*config.auth.token);
    }
    if (config.auth.has_client_credentials()) {
        return std::make_shared<ClientCredentialsAuth>(*config.auth.client_id, *config.auth.client_secret,
                                                       config.api_endpoint, config.timeout_seconds);
    }
    throw std::runtime_error("Missing credentials: provide auth.token or auth.client_id and auth.client_secret");
}

std::unique_ptr<Connection> connect(const ConnectionConfig& config) {
    config.validate();
    auto auth = make_auth(config);

    TransportOptions options;
    options.timeout_seconds = config.timeout_seconds;
    options.user_agent = config.user_agent;

    return connect(config, [auth, options](const std::string& base_url) {
        return std::make_unique<HttplibTransport>(base_url, auth, options);
    });
}

std::unique_ptr<Connection> connect(const ConnectionConfig& config, const TransportFactory& make_transport) {
    config.validate();
    if (!make_transport) {
        throw std::invalid_argument("connect requires a transport factory");
    }

    const SystemEngine located = locate_system_engine(config, make_transport);
    LogUtils::info("Connecting to account {} through system engine {}", config.account_name, located.url);

    // Catalog lookups on the system engine are not scoped to the user's database
    const bool system_only = !config.engine_url && !config.engine_name;
    auto system = std::make_unique<Connection>(located.url,
                                               system_only ? config.database : std::optional<std::string>(),
                                               make_transport(located.url), located.account_id);

    if (config.engine_url) {
        const std::string url = UrlUtils::fix_url_schema(*config.engine_url);
        return std::make_unique<Connection>(url, config.database, make_transport(url),
                                            located.account_id, std::move(system));
    }

    if (system_only) {
        return system;
    }

    const EngineInfo info = EngineResolver(*system).resolve_engine(*config.engine_name);
    if (info.status != EngineResolver::STATUS_RUNNING) {
        throw EngineNotRunningError(*config.engine_name);
    }
    const std::string database = pick_database(config, info);
    const std::string url = UrlUtils::fix_url_schema(info.url);
    LogUtils::info("Engine {} resolved to {} (database {})", *config.engine_name, url, database);

    return std::make_unique<Connection>(url, database, make_transport(url),
                                        located.account_id, std::move(system));
}
