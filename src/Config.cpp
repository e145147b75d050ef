#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace sqlcursor {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "dialect") {
                if (key == "case_sensitive") config.dialect.case_sensitive = parseBool(value);
                else if (key == "normalize_names") config.dialect.normalize_names = parseBool(value);
            }
            else if (current_section == "result") {
                if (key == "stream_results")
                    config.result.stream_results = parseBool(value);
                else if (key == "buffer_results")
                    config.result.buffer_results = parseBool(value);
                else if (key == "max_row_buffer")
                    config.result.max_row_buffer = static_cast<size_t>(std::stoul(value));
                else if (key == "growth_factor")
                    config.result.growth_factor = static_cast<size_t>(std::stoul(value));
                else if (key == "yield_per")
                    config.result.yield_per = static_cast<size_t>(std::stoul(value));
                else if (key == "echo")
                    config.result.echo = parseBool(value);
            }
            else if (current_section == "cache") {
                if (key == "max_entries")
                    config.cache.max_entries = static_cast<size_t>(std::stoul(value));
                else if (key == "enabled")
                    config.cache.enabled = parseBool(value);
            }
            else if (current_section == "connection") {
                if (key == "type") config.connection.type = value;
                else if (key == "path") config.connection.path = value;
                else if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
                else if (key == "user") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "database") config.connection.database = value;
            }
            else if (current_section == "output") {
                if (key == "format") config.output.format = value;
                else if (key == "pretty_json") config.output.pretty_json = parseBool(value);
                else if (key == "include_header") config.output.include_header = parseBool(value);
            }
        } catch (const std::logic_error& e) {
            spdlog::warn("{}:{}: invalid value '{}' for {}: {}", path.string(), line_number,
                         value, key, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    // Config file first; options given on the command line override it
    std::string config_file;
    {
        CLI::App pre;
        pre.allow_extras();
        pre.set_help_flag();
        pre.add_option("-c,--config", config_file);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError&) {
            config_file.clear();
        }
    }

    Config config;
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = std::move(*file_config);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    CLI::App app{"sqlcursor - run a SQL statement and print its rows"};

    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Connection options
    app.add_option("-t,--type", config.connection.type,
                   "Database type (sqlite, postgresql, mysql)")
        ->check(CLI::IsMember({"sqlite", "postgresql", "mysql"}));
    app.add_option("-f,--file", config.connection.path, "SQLite database file");
    app.add_option("-H,--host", config.connection.host, "Database server host");
    app.add_option("-P,--port", config.connection.port, "Database server port");
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password, "Database password");
    app.add_option("-D,--database", config.connection.database, "Database name");

    // Result options
    app.add_flag("--stream", config.result.stream_results,
                 "Fetch rows in growing batches instead of one call per row");
    app.add_flag("--buffer", config.result.buffer_results,
                 "Fetch all rows before returning the first one");
    app.add_option("--max-row-buffer", config.result.max_row_buffer,
                   "Largest batch fetched when streaming");
    app.add_option("--growth-factor", config.result.growth_factor,
                   "Batch growth factor when streaming");
    app.add_option("--yield-per", config.result.yield_per, "Fetch in fixed batches of N rows");
    app.add_flag("--echo", config.result.echo, "Log columns and rows at debug level");

    // Dialect options
    app.add_flag("--case-insensitive", [&config](int64_t) {
        config.dialect.case_sensitive = false;
    }, "Match column names case-insensitively");
    app.add_flag("--normalize-names", config.dialect.normalize_names,
                 "Fold upper-case column names to lower case");

    // Output options
    app.add_option("-o,--format", config.output.format, "Output format (csv, json)")
        ->check(CLI::IsMember({"csv", "json"}));
    app.add_flag("--no-header", [&config](int64_t) { config.output.include_header = false; },
                 "Omit the CSV header line");
    app.add_flag("--compact", [&config](int64_t) { config.output.pretty_json = false; },
                 "Print JSON on one line");

    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("-l,--log-file", config.log_file, "Also write log messages to FILE");

    // Statement (positional)
    app.add_option("sql", config.sql, "SQL statement to execute")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Resolve password from environment if not set
    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (connection.type != "sqlite" && connection.type != "postgresql" &&
        connection.type != "mysql") {
        spdlog::error("Unknown database type: {}", connection.type);
        return false;
    }

    if (connection.type == "sqlite" && connection.path.empty()) {
        spdlog::error("SQLite database file is required (use -f option)");
        return false;
    }

    if (connection.type == "mysql" && connection.user.empty()) {
        spdlog::error("Database username is required (use -u option)");
        return false;
    }

    if (result.stream_results && result.buffer_results) {
        spdlog::error("--stream and --buffer are mutually exclusive");
        return false;
    }

    if (result.max_row_buffer == 0) {
        spdlog::error("max_row_buffer must be at least 1");
        return false;
    }

    if (output.format != "csv" && output.format != "json") {
        spdlog::error("Unknown output format: {}", output.format);
        return false;
    }

    if (sql.empty()) {
        spdlog::error("SQL statement is required");
        return false;
    }

    return true;
}

void Config::resolvePassword() {
    if (!connection.password.empty()) {
        return;
    }
    const char* variable = connection.type == "postgresql" ? "PGPASSWORD" : "MYSQL_PWD";
    const char* env_pwd = std::getenv(variable);
    if (env_pwd) {
        connection.password = env_pwd;
    }
}

}  // namespace sqlcursor
