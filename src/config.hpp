#pragma once

#include <string>
#include <cstdint>

namespace sd {

struct ServerConfig {
    std::string root_directory = ".";
    uint16_t port = 8080;
    std::string bind_address = "0.0.0.0";
    std::string index_file = "index.html";
    int listen_backlog = 128;
    int header_timeout_ms = 10000;   // 0 = wait forever for the request head
    size_t max_header_bytes = 8192;
};

struct ListingConfig {
    std::string locale;              // empty = environment locale
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AccessLogConfig {
    bool enabled = true;
    std::string file;                // empty = stdout
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    ListingConfig listing;
    LoggingConfig logging;
    AccessLogConfig access_log;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Defaults plus environment variable overrides, no file
AppConfig default_config();

// Check port and root; rewrites root_directory to its canonical absolute path.
// Throws std::runtime_error describing the first problem found.
void validate_config(AppConfig& config);

} // namespace sd
