#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sqlcursor {

struct DialectConfig {
    bool case_sensitive = true;
    bool normalize_names = false;
};

struct ResultConfig {
    bool stream_results = false;
    bool buffer_results = false;
    size_t max_row_buffer = 1000;
    size_t growth_factor = 5;
    size_t yield_per = 0;  // 0 = off
    bool echo = false;
};

struct CacheConfig {
    size_t max_entries = 500;
    bool enabled = true;
};

struct ConnectionConfig {
    std::string type = "sqlite";  // sqlite, postgresql, mysql
    std::string path = ":memory:";
    std::string host = "localhost";
    uint16_t port = 0;  // 0 = driver default
    std::string user;
    std::string password;
    std::string database;
};

struct OutputConfig {
    std::string format = "csv";  // csv, json
    bool pretty_json = true;
    bool include_header = true;
};

struct Config {
    DialectConfig dialect;
    ResultConfig result;
    CacheConfig cache;
    ConnectionConfig connection;
    OutputConfig output;

    std::string sql;
    std::string log_file;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace sqlcursor
