#include "ConnectionConfig.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

ConnectionConfig::ConnectionConfig(std::string input_dsn) : dsn(std::move(input_dsn)) {
    parse_dsn();
}

void ConnectionConfig::parse_dsn() {
    // 1. Check scheme "://"
    const size_t scheme_pos = dsn.find("://");
    if (scheme_pos == std::string::npos) {
        throw std::runtime_error("DSN invalid: missing '://' protocol separator");
    }
    const std::string scheme = dsn.substr(0, scheme_pos);
    if (scheme != DSN_SCHEME) {
        throw std::runtime_error("DSN invalid: unsupported protocol '" + scheme + "'");
    }

    // 2. Split account@endpoint, /database and ?query
    std::string rest = dsn.substr(scheme_pos + 3);
    std::string query;
    const size_t query_pos = rest.find('?');
    if (query_pos != std::string::npos) {
        query = rest.substr(query_pos + 1);
        rest = rest.substr(0, query_pos);
    }

    const size_t path_pos = rest.find('/');
    const std::string authority = rest.substr(0, path_pos);
    if (path_pos != std::string::npos) {
        const std::string db = rest.substr(path_pos + 1);
        if (db.find('/') != std::string::npos) {
            throw std::runtime_error("DSN invalid: unexpected path '" + db + "'");
        }
        if (!db.empty()) database = db;
    }

    // 3. account@api_endpoint
    const size_t at_pos = authority.find('@');
    account_name = authority.substr(0, at_pos);
    if (at_pos != std::string::npos) {
        const std::string endpoint = authority.substr(at_pos + 1);
        if (endpoint.empty()) {
            throw std::runtime_error("DSN invalid: empty API endpoint after '@'");
        }
        api_endpoint = endpoint;
    }
    if (account_name.empty()) {
        throw std::runtime_error("DSN invalid: missing account name");
    }

    // 4. key=value options
    size_t start = 0;
    while (start < query.size()) {
        const size_t amp = query.find('&', start);
        const std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        start = amp == std::string::npos ? query.size() : amp + 1;
        if (pair.empty()) continue;

        const size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == pair.size()) {
            throw std::runtime_error("DSN invalid: malformed option '" + pair + "'");
        }
        const std::string key = pair.substr(0, eq);
        const std::string value = pair.substr(eq + 1);
        if (key == "engine") {
            engine_name = value;
        } else if (key == "engine_url") {
            engine_url = value;
        } else if (key == "timeout") {
            try {
                timeout_seconds = std::stoi(value);
            } catch (const std::exception&) {
                throw std::runtime_error("DSN invalid: timeout '" + value + "' is not a number");
            }
        } else {
            throw std::runtime_error("DSN invalid: unknown option '" + key + "'");
        }
    }
}

void ConnectionConfig::validate() const {
    if (StringUtils::trimmed(account_name).empty()) {
        throw std::runtime_error("Missing required setting: account_name");
    }
    if (StringUtils::trimmed(api_endpoint).empty()) {
        throw std::runtime_error("Missing required setting: api_endpoint");
    }
    if (engine_name && engine_url) {
        throw std::runtime_error("Both engine_name and engine_url are provided. Provide only one to connect.");
    }
    if (!auth.has_token() && !auth.has_client_credentials()) {
        throw std::runtime_error("Missing credentials: provide auth.token or auth.client_id and auth.client_secret");
    }
    if (timeout_seconds <= 0) {
        throw std::runtime_error("Invalid timeout_seconds: " + std::to_string(timeout_seconds));
    }
}
