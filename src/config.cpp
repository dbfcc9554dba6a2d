#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace sd {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val || !*val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + val);
    }
}

static void apply_env_overrides(AppConfig& cfg) {
    // Environment variable overrides (Docker / systemd)
    cfg.server.root_directory = env_or("SERVE_DIR_ROOT", cfg.server.root_directory);
    int port = env_int_or("SERVE_DIR_PORT", cfg.server.port);
    if (port < 1 || port > 65535) {
        throw std::runtime_error("SERVE_DIR_PORT out of range: " + std::to_string(port));
    }
    cfg.server.port = static_cast<uint16_t>(port);
    cfg.server.bind_address = env_or("SERVE_DIR_BIND", cfg.server.bind_address);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

AppConfig default_config() {
    AppConfig cfg;
    apply_env_overrides(cfg);
    return cfg;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.root_directory = s["root"].as<std::string>(cfg.server.root_directory);
            int port = s["port"].as<int>(cfg.server.port);
            if (port < 1 || port > 65535) {
                throw std::runtime_error("server.port out of range: " + std::to_string(port));
            }
            cfg.server.port = static_cast<uint16_t>(port);
            cfg.server.bind_address = s["bind_address"].as<std::string>(cfg.server.bind_address);
            cfg.server.index_file = s["index_file"].as<std::string>(cfg.server.index_file);
            cfg.server.listen_backlog = s["listen_backlog"].as<int>(cfg.server.listen_backlog);
            cfg.server.header_timeout_ms = s["header_timeout_ms"].as<int>(cfg.server.header_timeout_ms);
            cfg.server.max_header_bytes = s["max_header_bytes"].as<size_t>(cfg.server.max_header_bytes);
        }

        // Listing
        if (auto l = root["listing"]) {
            cfg.listing.locale = l["locale"].as<std::string>(cfg.listing.locale);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }

        // Access log
        if (auto a = root["access_log"]) {
            cfg.access_log.enabled = a["enabled"].as<bool>(cfg.access_log.enabled);
            cfg.access_log.file = a["file"].as<std::string>("");
            cfg.access_log.max_file_size_mb = a["max_file_size_mb"].as<int>(cfg.access_log.max_file_size_mb);
            cfg.access_log.max_files = a["max_files"].as<int>(cfg.access_log.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config " + path + ": " + std::string(e.what()));
    }

    apply_env_overrides(cfg);
    return cfg;
}

void validate_config(AppConfig& config) {
    if (config.server.port == 0) {
        throw std::runtime_error("Port must be between 1 and 65535");
    }
    if (config.server.listen_backlog <= 0) {
        throw std::runtime_error("listen_backlog must be positive");
    }
    if (config.server.max_header_bytes < 64) {
        throw std::runtime_error("max_header_bytes is too small");
    }
    if (config.server.index_file.empty() ||
        config.server.index_file.find('/') != std::string::npos) {
        throw std::runtime_error("index_file must be a plain file name");
    }

    const std::string& dir = config.server.root_directory;
    std::error_code ec;
    auto status = fs::status(dir, ec);
    if (ec || !fs::exists(status)) {
        throw std::runtime_error("Directory '" + dir + "' does not exist.");
    }
    if (!fs::is_directory(status)) {
        throw std::runtime_error("'" + dir + "' is not a directory.");
    }

    auto canonical = fs::canonical(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot resolve '" + dir + "': " + ec.message());
    }
    config.server.root_directory = canonical.string();
}

} // namespace sd
