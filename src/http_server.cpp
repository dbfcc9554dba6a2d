#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace sd {

HttpServer::HttpServer(const ServerConfig& config, const RequestDispatcher& dispatcher)
    : config_(config)
    , dispatcher_(dispatcher)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::check_root() const {
    std::error_code ec;
    auto status = fs::status(config_.root_directory, ec);
    if (ec || !fs::exists(status)) {
        spdlog::error("HTTP: Root directory '{}' does not exist", config_.root_directory);
        return false;
    }
    if (!fs::is_directory(status)) {
        spdlog::error("HTTP: Root '{}' is not a directory", config_.root_directory);
        return false;
    }
    return true;
}

bool HttpServer::start() {
    State expected = State::Stopped;
    if (!state_.compare_exchange_strong(expected, State::Starting)) {
        spdlog::warn("HTTP server already started");
        return expected == State::Listening;
    }

    if (!check_root()) {
        state_.store(State::Stopped);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid bind address '{}'", config_.bind_address);
        state_.store(State::Stopped);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        state_.store(State::Stopped);
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}",
                      config_.bind_address, config_.port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        state_.store(State::Stopped);
        return false;
    }

    if (listen(server_fd_, config_.listen_backlog) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        state_.store(State::Stopped);
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    state_.store(State::Listening);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://{}:{} (root: {})",
                 config_.bind_address, bound_port_, config_.root_directory);
    return true;
}

void HttpServer::stop() {
    State expected = State::Listening;
    if (!state_.compare_exchange_strong(expected, State::Draining)) {
        return;
    }

    spdlog::info("HTTP server draining ({} in flight)", in_flight());

    // Wakes the blocked accept(); nothing new is taken after this
    shutdown(server_fd_, SHUT_RDWR);
    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::unique_lock<std::mutex> lock(inflight_mutex_);
        inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
    }

    close(server_fd_);
    server_fd_ = -1;
    state_.store(State::Stopped);
    spdlog::info("HTTP server stopped");
}

size_t HttpServer::in_flight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_;
}

void HttpServer::server_thread() {
    while (state_.load() == State::Listening) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (state_.load() != State::Listening) {
                break;
            }
            if (errno == EMFILE || errno == ENFILE) {
                spdlog::warn("HTTP: Out of file descriptors, backing off");
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            } else if (errno != EINTR && errno != ECONNABORTED) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            ++inflight_;
        }

        auto finish = [this, client_fd]() {
            close(client_fd);
            std::lock_guard<std::mutex> lock(inflight_mutex_);
            --inflight_;
            inflight_cv_.notify_all();
        };

        // One detached worker per connection; stop() waits on inflight_
        try {
            std::thread([this, client_fd, finish]() {
                try {
                    handle_client(client_fd);
                } catch (const std::exception& e) {
                    spdlog::error("HTTP: Worker failed: {}", e.what());
                }
                finish();
            }).detach();
        } catch (const std::system_error& e) {
            spdlog::error("HTTP: Failed to start worker thread: {}", e.what());
            finish();
        }
    }
}

void HttpServer::handle_client(int client_fd) {
    if (config_.header_timeout_ms > 0) {
        timeval tv{};
        tv.tv_sec = config_.header_timeout_ms / 1000;
        tv.tv_usec = (config_.header_timeout_ms % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    std::string head;
    switch (read_request_head(client_fd, config_.max_header_bytes, head)) {
        case HeadStatus::Complete:
            break;
        case HeadStatus::TooLarge:
            send_response(client_fd, 431, "text/plain", "431 Request Header Fields Too Large");
            dispatcher_.log_access("-", "-", 431);
            return;
        case HeadStatus::TimedOut:
            spdlog::debug("HTTP: Timed out waiting for request head");
            return;
        case HeadStatus::Closed:
            return;
        case HeadStatus::Error:
            spdlog::debug("HTTP: Receive failed: {}", std::strerror(errno));
            return;
    }

    RequestLine line;
    if (!parse_request_line(head, line)) {
        spdlog::debug("HTTP: Malformed request line");
        send_response(client_fd, 400, "text/plain", "400 Bad Request");
        dispatcher_.log_access("-", "-", 400);
        return;
    }

    Response response = dispatcher_.handle(line.method, line.target);
    send_response(client_fd, response.status, response.content_type, response.body);
}

void HttpServer::send_response(int fd, int status, const std::string& content_type,
                               const std::string& body) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Server: serve-dir/" << APP_VERSION << "\r\n"
        << "Connection: close\r\n"
        << "\r\n";

    if (!send_all(fd, oss.str()) || !send_all(fd, body)) {
        spdlog::debug("HTTP: Client went away before the response was sent: {}",
                      std::strerror(errno));
    }
}

HeadStatus read_request_head(int fd, size_t max_bytes, std::string& head) {
    head.clear();
    char buf[4096];
    while (true) {
        if (head.find("\r\n\r\n") != std::string::npos ||
            head.find("\n\n") != std::string::npos) {
            return HeadStatus::Complete;
        }
        if (head.size() >= max_bytes) {
            return HeadStatus::TooLarge;
        }

        size_t want = std::min(sizeof(buf), max_bytes - head.size());
        ssize_t n = recv(fd, buf, want, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return HeadStatus::TimedOut;
            return HeadStatus::Error;
        }
        if (n == 0) {
            return HeadStatus::Closed;
        }
        head.append(buf, static_cast<size_t>(n));
    }
}

static bool is_token_char(unsigned char c) {
    return std::isalnum(c) || (c != 0 && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr);
}

bool parse_request_line(const std::string& head, RequestLine& out) {
    std::string line = head.substr(0, head.find('\n'));
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    auto sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    auto sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;

    out.method = line.substr(0, sp1);
    out.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    out.version = line.substr(sp2 + 1);

    if (!std::all_of(out.method.begin(), out.method.end(),
                     [](char c) { return is_token_char(static_cast<unsigned char>(c)); })) {
        return false;
    }
    if (out.version.rfind("HTTP/", 0) != 0 || out.version.find(' ') != std::string::npos) {
        return false;
    }

    // Absolute-form ("http://host/path") is reduced to the path
    auto scheme = out.target.find("://");
    if (out.target[0] != '/' && scheme != std::string::npos) {
        auto path = out.target.find('/', scheme + 3);
        out.target = path == std::string::npos ? "/" : out.target.substr(path);
    }
    return out.target[0] == '/';
}

bool send_all(int fd, const std::string& data) {
    const char* ptr = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = send(fd, ptr, left, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace sd
