#pragma once

#include "AuthProvider.hpp"
#include "Connection.hpp"
#include "ConnectionConfig.hpp"
#include "HttpTransport.hpp"
#include <functional>
#include <memory>
#include <string>

// Builds the transport for one base URL (gateway, system engine or user engine)
using TransportFactory = std::function<std::unique_ptr<HttpTransport>(const std::string& base_url)>;

/**
 * Credential source for a validated config: the static token when one is
 * given, otherwise the client-credentials grant.
 * @throws std::runtime_error If the config carries neither
 */
std::shared_ptr<AuthProvider> make_auth(const ConnectionConfig& config);

/**
 * Open a connection as described by `config`.
 *
 * The account's system engine is located through the API gateway. With an
 * engine_url the returned connection targets that URL directly; with an
 * engine_name the engine is looked up in the catalog and must be running;
 * with neither the system-engine connection itself is returned.
 *
 * @throws std::runtime_error On an invalid config
 * @throws AccountNotFoundError, EngineNotFoundError, EngineNotRunningError, InterfaceError
 */
std::unique_ptr<Connection> connect(const ConnectionConfig& config);

// Same as above with caller-supplied transports; the factory carries the credentials
std::unique_ptr<Connection> connect(const ConnectionConfig& config, const TransportFactory& make_transport);
