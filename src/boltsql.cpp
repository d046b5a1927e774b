#include "Connect.hpp"
#include "DriverErrors.hpp"
#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <iostream>
#include <iterator>

namespace {

std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

std::string join_row(const Row& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += '\t';
        line += fmt::format("{}", row[i]);
    }
    return line;
}

// Print the current result set and every one after it
void print_results(Cursor& cursor) {
    do {
        auto description = cursor.description();
        if (!description) {
            std::cout << "OK" << std::endl;
            continue;
        }

        std::string header;
        for (size_t i = 0; i < description->size(); ++i) {
            if (i > 0) header += '\t';
            header += (*description)[i].name;
        }
        std::cout << header << std::endl;

        size_t count = 0;
        cursor.for_each_row([&count](const Row& row) {
            std::cout << join_row(row) << std::endl;
            ++count;
        });
        std::cout << fmt::format("({} row{})", count, count == 1 ? "" : "s") << std::endl;
    } while (cursor.nextset());
}

}

int main(int argc, char* argv[]) {
    int result = 0;

    try {
        // 1. Collect configuration from file, environment and command line
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return 0;
        }
        const ClientConfig& config = context.get_config();

        LogUtils::init(config.verbose ? LogUtils::Level::Debug : LogUtils::Level::Info, config.log_file);

        std::string query = config.query ? *config.query : read_stdin();
        if (StringUtils::trimmed(query).empty()) {
            throw std::runtime_error("No query given; use --query or pipe SQL on standard input");
        }

        // 2. Connect and run
        try {
            auto connection = connect(config.connection);
            auto cursor = connection->cursor();
            cursor->execute(query, {}, config.skip_parsing);
            print_results(*cursor);
            connection->close();
        } catch (const DriverError& e) {
            LogUtils::error("Query failed: {}", e.what());
            result = 1;
        }

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    LogUtils::shutdown();
    return result;
}
