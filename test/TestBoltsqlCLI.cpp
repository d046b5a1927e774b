#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string find_boltsql_bin() {
    if (const char* env = std::getenv("BOLTSQL_BIN")) {
        if (env[0] != '\0' && fs::exists(env)) {
            return fs::absolute(env).string();
        }
    }

    std::vector<std::string> candidates = {
        "./boltsql",
        "../boltsql",
        "./src/boltsql",
        "../build/boltsql"
    };

    for (const auto& c : candidates) {
        if (fs::exists(c)) {
            return fs::absolute(fs::path(c)).string();
        }
    }

    return {};
}

// Credentials from the developer's environment must not leak into these runs
static std::string clean_env() {
    return "env -u BOLTSQL_ACCOUNT -u BOLTSQL_API_ENDPOINT -u BOLTSQL_ENGINE -u BOLTSQL_DATABASE "
           "-u BOLTSQL_TOKEN -u BOLTSQL_CLIENT_ID -u BOLTSQL_CLIENT_SECRET ";
}

static int run_cmd(const std::string& cmd) {
    std::cout << "[RUN] " << cmd << std::endl;
    return std::system(cmd.c_str());
}

void test_help_command() {
    const auto bin = find_boltsql_bin();
    assert(!bin.empty() && "boltsql binary not found; set BOLTSQL_BIN");

    int rc = run_cmd(clean_env() + "\"" + bin + "\" --help");
    (void)rc;
    assert(rc == 0 && "boltsql --help should exit 0");
    std::cout << "test_help_command passed\n";
}

void test_version_command() {
    const auto bin = find_boltsql_bin();
    assert(!bin.empty() && "boltsql binary not found; set BOLTSQL_BIN");

    int rc = run_cmd(clean_env() + "\"" + bin + "\" -V");
    (void)rc;
    assert(rc == 0 && "boltsql -V should exit 0");
    std::cout << "test_version_command passed\n";
}

void test_unknown_argument() {
    const auto bin = find_boltsql_bin();
    assert(!bin.empty() && "boltsql binary not found; set BOLTSQL_BIN");

    int rc = run_cmd(clean_env() + "\"" + bin + "\" --unknown-arg");
    (void)rc;
    assert(rc != 0 && "boltsql with unknown args should exit non-zero");
    std::cout << "test_unknown_argument passed\n";
}

void test_missing_credentials() {
    const auto bin = find_boltsql_bin();
    assert(!bin.empty() && "boltsql binary not found; set BOLTSQL_BIN");

    int rc = run_cmd(clean_env() + "\"" + bin + "\" -a acme -q \"SELECT 1\"");
    (void)rc;
    assert(rc != 0 && "boltsql without credentials should exit non-zero");
    std::cout << "test_missing_credentials passed\n";
}

void test_invalid_config_file() {
    const auto bin = find_boltsql_bin();
    assert(!bin.empty() && "boltsql binary not found; set BOLTSQL_BIN");

    const fs::path cfg = fs::temp_directory_path() / "boltsql_cli_invalid.yaml";
    {
        std::ofstream out(cfg);
        out << "connection:\n  account_name: acme\n  hostname: nowhere\n";
    }
    int rc = run_cmd(clean_env() + "\"" + bin + "\" -c \"" + cfg.string() + "\" -q \"SELECT 1\"");
    (void)rc;
    fs::remove(cfg);
    assert(rc != 0 && "boltsql with an unknown config key should exit non-zero");
    std::cout << "test_invalid_config_file passed\n";
}

int main() {
    test_help_command();
    test_version_command();
    test_unknown_argument();
    test_missing_credentials();
    test_invalid_config_file();
    std::cout << "All boltsql command tests passed.\n";
    return 0;
}
