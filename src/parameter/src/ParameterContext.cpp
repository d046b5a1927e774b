#include "ParameterContext.hpp"
#include "Version.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify config file path", true},
    {"--dsn", 'D', "Connection string: boltsql://account@endpoint/database?engine=name", true},
    {"--account", 'a', "The account to connect to", true},
    {"--api-endpoint", 'E', "The API endpoint of the service", true},
    {"--engine", 'e', "The engine to run queries on", true},
    {"--engine-url", 'u', "Connect to an engine URL directly", true},
    {"--database", 'd', "The database to use", true},
    {"--token", 't', "Access token used for authentication", true},
    {"--client-id", 'i', "Client id for the client credentials flow", true},
    {"--client-secret", 'k', "Client secret for the client credentials flow", true},
    {"--query", 'q', "SQL to execute", true},
    {"--skip-parsing", 's', "Send the query as-is without splitting", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: boltsql [OPTIONS]...\n\n"
              << "Options:\n";

    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();
        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');
        std::cout << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  boltsql --config-file=connection.yaml -q \"SELECT 1\"\n"
              << "  boltsql -a my_account -e my_engine -d my_db -t $TOKEN -q \"SELECT 1; SELECT 2\"\n\n";
}

void ParameterContext::show_version() {
    std::cout << "boltsql version: " << BOLTSQL_VERSION << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    config_ = config.as<ClientConfig>();
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        merge_yaml(cli_params["--config-file"]);
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value && pos == std::string::npos) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (!arg.empty() && arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& conn = config_.connection;

    // A DSN goes first so that explicit options can override its parts
    if (cli_params.count("--dsn")) {
        conn.dsn = cli_params["--dsn"];
        conn.parse_dsn();
    }
    if (cli_params.count("--account"))
        conn.account_name = cli_params["--account"];
    if (cli_params.count("--api-endpoint"))
        conn.api_endpoint = cli_params["--api-endpoint"];
    if (cli_params.count("--engine"))
        conn.engine_name = cli_params["--engine"];
    if (cli_params.count("--engine-url"))
        conn.engine_url = cli_params["--engine-url"];
    if (cli_params.count("--database"))
        conn.database = cli_params["--database"];
    if (cli_params.count("--token"))
        conn.auth.token = cli_params["--token"];
    if (cli_params.count("--client-id"))
        conn.auth.client_id = cli_params["--client-id"];
    if (cli_params.count("--client-secret"))
        conn.auth.client_secret = cli_params["--client-secret"];

    if (cli_params.count("--query"))
        config_.query = cli_params["--query"];
    if (cli_params.count("--skip-parsing"))
        config_.skip_parsing = true;
    if (cli_params.count("--verbose"))
        config_.verbose = true;
}

void ParameterContext::merge_environment_vars() {
    std::vector<std::pair<std::string, std::string>> env_mappings = {
        {"BOLTSQL_ACCOUNT", "account"},
        {"BOLTSQL_API_ENDPOINT", "api_endpoint"},
        {"BOLTSQL_ENGINE", "engine"},
        {"BOLTSQL_DATABASE", "database"},
        {"BOLTSQL_TOKEN", "token"},
        {"BOLTSQL_CLIENT_ID", "client_id"},
        {"BOLTSQL_CLIENT_SECRET", "client_secret"}
    };

    auto& conn = config_.connection;
    for (const auto& [env_var, key] : env_mappings) {
        const char* env_value = std::getenv(env_var.c_str());
        if (!env_value) {
            continue;
        }
        if (key == "account") {
            conn.account_name = env_value;
        } else if (key == "api_endpoint") {
            conn.api_endpoint = env_value;
        } else if (key == "engine") {
            conn.engine_name = env_value;
        } else if (key == "database") {
            conn.database = env_value;
        } else if (key == "token") {
            conn.auth.token = env_value;
        } else if (key == "client_id") {
            conn.auth.client_id = env_value;
        } else if (key == "client_secret") {
            conn.auth.client_secret = env_value;
        }
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const ClientConfig& ParameterContext::get_config() const {
    return config_;
}

const ConnectionConfig& ParameterContext::get_connection() const {
    return config_.connection;
}
