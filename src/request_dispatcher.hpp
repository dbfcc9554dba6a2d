#pragma once

#include "config.hpp"
#include "directory_listing.hpp"
#include "path_resolver.hpp"
#include <spdlog/logger.h>
#include <chrono>
#include <string>
#include <system_error>

namespace sd {

struct Response {
    int status = 200;
    std::string content_type;
    std::string body;
};

struct AccessLogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::string request_path;
    int status_code = 0;
};

// "[2026-01-31 12:00:00] GET /docs/ - 200"; control bytes are escaped
std::string format_access_line(const AccessLogEntry& entry);

// Read a whole file. Returns the errno-derived error on failure.
std::error_code read_file(const std::string& path, std::string& out);

const char* status_text(int status);

// Turns one request into one response and one access-log line. Holds no
// per-request state, so a single instance serves all worker threads.
class RequestDispatcher {
public:
    enum class State {
        Start,
        Resolve,
        Stat,
        Directory,
        File,
        Served,
        Rejected,
        NotFound,
        ServerError,
    };

    RequestDispatcher(const ServerConfig& config,
                      const ListingRenderer& listing,
                      spdlog::logger& access_log);

    // Non-copyable
    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    Response handle(const std::string& method, const std::string& request_target) const;

    // Writes the access-log line for a request answered outside handle(),
    // such as a malformed or oversized request head. Unknown fields are "-".
    void log_access(const std::string& method, const std::string& request_target, int status) const;

private:
    Response dispatch(const std::string& request_target) const;

    ServerConfig config_;
    const ListingRenderer& listing_;
    spdlog::logger& access_log_;
};

} // namespace sd
