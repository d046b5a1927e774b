#pragma once

#include "Version.hpp"
#include <optional>
#include <string>

struct AuthConfig {
    std::optional<std::string> token;
    std::optional<std::string> client_id;
    std::optional<std::string> client_secret;

    bool has_token() const { return token && !token->empty(); }
    bool has_client_credentials() const {
        return client_id && !client_id->empty() && client_secret && !client_secret->empty();
    }
};

struct ConnectionConfig {
    static constexpr const char* DEFAULT_API_ENDPOINT = "api.app.firebolt.io";
    static constexpr const char* DSN_SCHEME = "boltsql";

    std::string dsn;
    std::string account_name;
    std::string api_endpoint = DEFAULT_API_ENDPOINT;
    std::optional<std::string> engine_name;
    std::optional<std::string> engine_url;      // bypasses engine resolution
    std::optional<std::string> database;
    AuthConfig auth;
    int timeout_seconds = 60;
    std::string user_agent = "boltsql/" BOLTSQL_VERSION;

    ConnectionConfig() = default;
    explicit ConnectionConfig(std::string input_dsn);

    /**
     * Fill account, endpoint, database and engine from `dsn`:
     *   boltsql://<account>@<api_endpoint>/<database>?engine=<name>
     * Every part but the account is optional.
     * @throws std::runtime_error On a malformed DSN
     */
    void parse_dsn();

    /**
     * @throws std::runtime_error If the account or credentials are missing,
     *         or both engine_name and engine_url are set
     */
    void validate() const;
};
