#include "config.hpp"
#include "logger.hpp"
#include "directory_listing.hpp"
#include "request_dispatcher.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<int> g_shutdown_signal{0};

static void signal_handler(int sig) {
    g_shutdown_signal.store(sig);
}

static void print_usage() {
    std::cout << "serve-dir " APP_VERSION " - Serve any directory as a static website\n"
              << "\n"
              << "Usage: serve-dir [directory] [options]\n"
              << "\n"
              << "Options:\n"
              << "  -p, --port <number>    Port to listen on (default: 8080)\n"
              << "  -c, --config <path>    YAML config file (optional)\n"
              << "  -h, --help             Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  SERVE_DIR_ROOT         Directory to serve\n"
              << "  SERVE_DIR_PORT         Port to listen on\n"
              << "  SERVE_DIR_BIND         Bind address (default: 0.0.0.0)\n"
              << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n"
              << "\n"
              << "Examples:\n"
              << "  serve-dir                    # Serve current directory on port 8080\n"
              << "  serve-dir ./public           # Serve ./public directory\n"
              << "  serve-dir --port 3000        # Use port 3000\n"
              << "  serve-dir ./dist -p 9000     # Serve ./dist on port 9000\n";
}

static void print_banner(const sd::AppConfig& cfg, uint16_t port) {
    spdlog::info("Serving {}", cfg.server.root_directory);
    spdlog::info("Server running at http://localhost:{}/", port);
    spdlog::info("  Bind address    : {}", cfg.server.bind_address);
    spdlog::info("  Index file      : {}", cfg.server.index_file);
    spdlog::info("  Access log      : {}", !cfg.access_log.enabled ? "(disabled)"
                 : cfg.access_log.file.empty() ? "stdout" : cfg.access_log.file);
    spdlog::info("Press Ctrl+C to stop");
}

static bool parse_port(const std::string& text, uint16_t& port) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 1 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    std::string directory;
    std::string port_arg;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            directory = arg;
        } else {
            std::cerr << "Error: unknown option '" << arg << "' (see --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    sd::AppConfig config;
    try {
        config = config_path.empty() ? sd::default_config() : sd::load_config(config_path);

        // Command line wins over file and environment
        if (!directory.empty()) {
            config.server.root_directory = std::filesystem::absolute(directory).string();
        }
        if (!port_arg.empty() && !parse_port(port_arg, config.server.port)) {
            throw std::runtime_error("Invalid port '" + port_arg + "'");
        }

        sd::validate_config(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    sd::init_logger(config.logging);
    std::shared_ptr<spdlog::logger> access_log;
    try {
        access_log = sd::make_access_logger(config.access_log);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::critical("Failed to open access log: {}", e.what());
        return 1;
    }

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Create components ────────────────────────────────────────────────────
    sd::ListingRenderer listing(sd::make_collation_locale(config.listing.locale));
    sd::RequestDispatcher dispatcher(config.server, listing, *access_log);
    sd::HttpServer http_server(config.server, dispatcher);

    // ─── Start ────────────────────────────────────────────────────────────────
    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.port);
        return 1;
    }
    print_banner(config, http_server.port());

    // ─── Main loop ────────────────────────────────────────────────────────────
    while (g_shutdown_signal.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Received signal {}, shutting down server...", g_shutdown_signal.load());
    http_server.stop();
    access_log->flush();
    spdlog::info("Server stopped");

    return 0;
}
