#pragma once

#include "ClientConfig.hpp"
#include "ConnectionConfig.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<AuthConfig> {
        static bool decode(const Node& node, AuthConfig& rhs) {
            static const std::set<std::string> valid_keys = {"token", "client_id", "client_secret"};
            check_unknown_keys(node, valid_keys, "connection::auth");

            if (node["token"]) rhs.token = node["token"].as<std::string>();
            if (node["client_id"]) rhs.client_id = node["client_id"].as<std::string>();
            if (node["client_secret"]) rhs.client_secret = node["client_secret"].as<std::string>();
            return true;
        }
    };

    template<>
    struct convert<ConnectionConfig> {
        static bool decode(const Node& node, ConnectionConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "dsn", "account_name", "api_endpoint", "engine_name", "engine_url",
                "database", "auth", "timeout_seconds", "user_agent"
            };
            check_unknown_keys(node, valid_keys, "connection");

            // Explicit keys override what the DSN carries
            if (node["dsn"]) {
                rhs.dsn = node["dsn"].as<std::string>();
                rhs.parse_dsn();
            }
            if (node["account_name"]) {
                rhs.account_name = node["account_name"].as<std::string>();
            }
            if (node["api_endpoint"]) {
                rhs.api_endpoint = node["api_endpoint"].as<std::string>();
            }
            if (node["engine_name"]) {
                rhs.engine_name = node["engine_name"].as<std::string>();
            }
            if (node["engine_url"]) {
                rhs.engine_url = node["engine_url"].as<std::string>();
            }
            if (node["database"]) {
                rhs.database = node["database"].as<std::string>();
            }
            if (node["auth"]) {
                rhs.auth = node["auth"].as<AuthConfig>();
            }
            if (node["timeout_seconds"]) {
                rhs.timeout_seconds = node["timeout_seconds"].as<int>();
            }
            if (node["user_agent"]) {
                rhs.user_agent = node["user_agent"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<ClientConfig> {
        static bool decode(const Node& node, ClientConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "connection", "query", "skip_parsing", "verbose", "log_file"
            };
            check_unknown_keys(node, valid_keys, "root");

            if (node["connection"]) {
                rhs.connection = node["connection"].as<ConnectionConfig>();
            }
            if (node["query"]) {
                rhs.query = node["query"].as<std::string>();
            }
            if (node["skip_parsing"]) {
                rhs.skip_parsing = node["skip_parsing"].as<bool>();
            }
            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["log_file"]) {
                rhs.log_file = node["log_file"].as<std::string>();
            }
            return true;
        }
    };

} // namespace YAML
