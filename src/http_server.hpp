#pragma once

#include "config.hpp"
#include "request_dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace sd {

// Listening socket plus one worker thread per accepted connection.
// stop() drains: no new connections, in-flight ones run to completion.
class HttpServer {
public:
    enum class State { Stopped, Starting, Listening, Draining };

    HttpServer(const ServerConfig& config, const RequestDispatcher& dispatcher);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Check the root, bind and start accepting. Returns false (and logs why)
    // if the root is unusable or the port can't be bound.
    bool start();

    // Stop accepting and wait for in-flight requests. Safe to call twice.
    void stop();

    bool is_running() const { return state_.load() == State::Listening; }
    State state() const { return state_.load(); }

    // Port actually bound; differs from the configured one when that is 0
    uint16_t port() const { return bound_port_; }

    size_t in_flight() const;

private:
    bool check_root() const;
    void server_thread();
    void handle_client(int client_fd);
    void send_response(int fd, int status, const std::string& content_type,
                       const std::string& body);

    ServerConfig config_;
    const RequestDispatcher& dispatcher_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<State> state_{State::Stopped};
    std::thread thread_;

    mutable std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t inflight_ = 0;
};

// Read until the blank line ending the request head.
enum class HeadStatus { Complete, Closed, TooLarge, TimedOut, Error };
HeadStatus read_request_head(int fd, size_t max_bytes, std::string& head);

struct RequestLine {
    std::string method;
    std::string target;
    std::string version;
};

// "GET /path HTTP/1.1" -> parts. Absolute-form targets are reduced to their
// path. Returns false if the line is malformed.
bool parse_request_line(const std::string& head, RequestLine& out);

// Write all of `data`, retrying short writes.
bool send_all(int fd, const std::string& data);

} // namespace sd
