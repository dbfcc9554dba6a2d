#include "request_dispatcher.hpp"
#include "format.hpp"
#include "mime_types.hpp"
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace sd {

static bool is_absence(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

static Response error_response(int status) {
    Response r;
    r.status = status;
    r.content_type = "text/plain";
    switch (status) {
        case 403: r.body = "403 Forbidden: path outside root directory"; break;
        case 404: r.body = "404 Not Found"; break;
        default:  r.body = "500 Internal Server Error"; break;
    }
    return r;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

std::string format_access_line(const AccessLogEntry& entry) {
    auto printable = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (unsigned char c : s) {
            if (c < 0x20 || c == 0x7f) {
                char buf[5];
                std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                out += buf;
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
        return out;
    };

    return "[" + format_local_time(entry.timestamp) + "] " +
           printable(entry.method) + " " + printable(entry.request_path) + " - " +
           std::to_string(entry.status_code);
}

std::error_code read_file(const std::string& path, std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::error_code(errno, std::generic_category());
    }

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<size_t>(st.st_size));
    }

    std::error_code ec;
    char buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ec = std::error_code(errno, std::generic_category());
            break;
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }

    ::close(fd);
    return ec;
}

RequestDispatcher::RequestDispatcher(const ServerConfig& config,
                                     const ListingRenderer& listing,
                                     spdlog::logger& access_log)
    : config_(config)
    , listing_(listing)
    , access_log_(access_log)
{
}

Response RequestDispatcher::handle(const std::string& method, const std::string& request_target) const {
    Response response;
    try {
        response = dispatch(request_target);
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error serving {}: {}", request_target, e.what());
        response = error_response(500);
    }

    log_access(method, request_target, response.status);
    return response;
}

void RequestDispatcher::log_access(const std::string& method, const std::string& request_target,
                                   int status) const {
    AccessLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.method = method.empty() ? "-" : method;
    entry.request_path = request_target.substr(0, request_target.find_first_of("?#"));
    if (entry.request_path.empty()) entry.request_path = "-";
    entry.status_code = status;
    access_log_.info("{}", format_access_line(entry));
}

Response RequestDispatcher::dispatch(const std::string& request_target) const {
    State state = State::Start;
    ResolvedTarget target;
    Response response;
    struct stat st{};

    auto fail = [&](const char* what, const std::error_code& ec) {
        if (is_absence(ec)) return State::NotFound;
        spdlog::error("{} '{}': {}", what, target.absolute_path, ec.message());
        return State::ServerError;
    };

    while (true) {
        switch (state) {
            case State::Start:
                state = State::Resolve;
                break;

            case State::Resolve:
                target = resolve_target(config_.root_directory, request_target);
                if (!target.within_root) {
                    spdlog::warn("Path traversal attempt: {}", request_target);
                    state = State::Rejected;
                } else {
                    state = State::Stat;
                }
                break;

            case State::Stat:
                if (::stat(target.absolute_path.c_str(), &st) != 0) {
                    state = fail("Cannot stat", std::error_code(errno, std::generic_category()));
                } else if (S_ISDIR(st.st_mode)) {
                    state = State::Directory;
                } else if (S_ISREG(st.st_mode)) {
                    state = State::File;
                } else {
                    // FIFOs, sockets and devices are never served
                    state = State::NotFound;
                }
                break;

            case State::Directory: {
                fs::path index = fs::path(target.absolute_path) / config_.index_file;
                struct stat index_st{};
                if (::stat(index.c_str(), &index_st) == 0 && S_ISREG(index_st.st_mode)) {
                    auto ec = read_file(index.string(), response.body);
                    if (ec) {
                        state = fail("Cannot read index", ec);
                        break;
                    }
                } else {
                    try {
                        response.body = listing_.render(target.absolute_path, target.url_path);
                    } catch (const fs::filesystem_error& e) {
                        state = fail("Cannot list", e.code());
                        break;
                    }
                }
                response.status = 200;
                response.content_type = "text/html";
                state = State::Served;
                break;
            }

            case State::File: {
                auto ec = read_file(target.absolute_path, response.body);
                if (ec) {
                    state = fail("Cannot read", ec);
                    break;
                }
                response.status = 200;
                response.content_type = content_type_for(target.absolute_path);
                state = State::Served;
                break;
            }

            case State::Served:
                return response;
            case State::Rejected:
                return error_response(403);
            case State::NotFound:
                return error_response(404);
            case State::ServerError:
                return error_response(500);
        }
    }
}

} // namespace sd
