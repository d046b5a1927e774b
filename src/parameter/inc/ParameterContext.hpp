#pragma once

#include "ConfigParser.hpp"
#include "ClientConfig.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // False when the run should stop after --help or --version
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    const ClientConfig& get_config() const;
    const ConnectionConfig& get_connection() const;

private:
    ClientConfig config_;

    // Command line storage, keyed by long option
    std::unordered_map<std::string, std::string> cli_params;

    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--account")
        char short_opt;          // Short option (e.g. 'a')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
