#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <cstdint>

namespace hookdeploy {

// A parsed inbound HTTP request.
struct WebhookRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/webhook", query string removed
    std::map<std::string, std::string> headers;  // names lowercased
    std::string body;

    // Header value by case-insensitive name, or nullopt if absent.
    std::optional<std::string> header(const std::string& name) const;
};

struct WebhookResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Minimal HTTP/1.1 server for inbound webhook calls. The accept loop runs
// in a background thread; each accepted connection is served on its own
// thread so a slow client never delays /health. Every response closes the
// connection. Request bodies are fully buffered before the handler runs.
class WebhookServer {
public:
    using Handler = std::function<WebhookResponse(const WebhookRequest&)>;

    // listen_addr:     "host:port", e.g. "0.0.0.0:9000"
    // max_body:        maximum POST body size in bytes; larger bodies get 413
    // max_connections: concurrent connections; further ones get 503
    // read_timeout:    time allowed to receive the whole request; 408 after
    WebhookServer(std::string listen_addr, uint32_t max_body,
                  uint32_t max_connections, Handler handler,
                  std::chrono::milliseconds read_timeout = std::chrono::seconds(10));
    ~WebhookServer();

    WebhookServer(const WebhookServer&) = delete;
    WebhookServer& operator=(const WebhookServer&) = delete;

    // Bind and start the background accept thread. Returns false and
    // populates error on failure.
    bool start(std::string& error);

    // Stop accepting, wait for in-flight connections to finish, join.
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (useful when listening on port 0).
    uint16_t bound_port() const { return bound_port_; }

private:
    void accept_loop();
    void serve_connection(int client_fd);
    void handle_connection(int client_fd) const;

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;
    std::chrono::milliseconds read_timeout_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    uint32_t active_connections_ = 0;
};

// Parse "host:port" into host and port. Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted only when
// allow_ephemeral is set.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral = false);

} // namespace hookdeploy
