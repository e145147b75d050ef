#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "Result.hpp"
#include "SQLiteConnection.hpp"
#include "SQLiteDialect.hpp"
#include "PostgreSQLConnection.hpp"
#include "PostgreSQLDialect.hpp"
#ifdef SQLCURSOR_HAVE_MYSQL
#include "MySQLConnection.hpp"
#include "MySQLDialect.hpp"
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace sqlcursor;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Diagnostics go to stderr so rows on stdout stay machine readable
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sqlcursor", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printCSV(const Config& config, Result& result) {
    CSVOptions options;
    options.includeHeader = config.output.include_header;
    const auto columns = result.keys();

    bool sawRows = false;
    result.partitions([&](std::vector<Row>&& rows) {
        std::cout << FormatConverter::toCSV(columns, rows, options);
        options.includeHeader = false;
        sawRows = true;
    });
    if (!sawRows && options.includeHeader) {
        std::cout << FormatConverter::toCSV(columns, {}, options);
    }
}

void printJSON(const Config& config, Result& result) {
    JSONOptions options;
    options.pretty = config.output.pretty_json;
    const auto columns = result.keys();
    std::cout << FormatConverter::toJSON(columns, result.fetchAll(), options) << std::endl;
}

int printResult(const Config& config, const Dialect& dialect,
                std::unique_ptr<DriverCursor> cursor) {
    Result result(ExecutionContext::forText(dialect, std::move(cursor),
                                            ExecutionOptions::fromConfig(config.result)));
    spdlog::debug("Fetching with {} strategy", result.fetchStrategyName());

    if (!result.returnsRows()) {
        std::cout << result.rowCount() << " row(s) affected";
        if (auto id = result.lastRowId()) {
            std::cout << ", last row id " << *id;
        }
        std::cout << std::endl;
        return 0;
    }

    if (config.output.format == "json") {
        printJSON(config, result);
    } else {
        printCSV(config, result);
    }
    result.close();
    return 0;
}

int run(const Config& config) {
    DialectOptions options;
    options.caseSensitive = config.dialect.case_sensitive;
    options.normalizeNames = config.dialect.normalize_names;

    const auto& type = config.connection.type;
    if (type == "sqlite") {
        SQLiteConnection conn(config.connection.path);
        SQLiteDialect dialect(options);
        return printResult(config, dialect, conn.execute(config.sql));
    }
    if (type == "postgresql") {
        PostgreSQLConnection conn(config.connection);
        PostgreSQLDialect dialect(options);
        return printResult(config, dialect, conn.execute(config.sql));
    }
#ifdef SQLCURSOR_HAVE_MYSQL
    if (type == "mysql") {
        MySQLConnection conn(config.connection);
        MySQLDialect dialect(options);
        return printResult(config, dialect, conn.execute(config.sql));
    }
#endif
    spdlog::error("Database type {} is not available in this build", type);
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    spdlog::debug("Connecting to {} database", config.connection.type);

    try {
        return run(config);
    } catch (const DriverError& e) {
        spdlog::error("{} error {}: {}", ErrorHandler::backendName(e.backend()),
                      e.errorCode(), e.what());
    } catch (const SqlCursorError& e) {
        spdlog::error("{}", e.what());
    }
    return 1;
}
