#include "server/webhook_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <stdexcept>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace hookdeploy {

// ── Request ───────────────────────────────────────────────────────────────────

std::optional<std::string> WebhookRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string port_str = addr.substr(pos + 1);
    if (port_str.empty() || port_str.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        int p = std::stoi(port_str);
        if (p < 0 || p > 65535) return false;
        if (p == 0 && !allow_ephemeral) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "OK";
    }
}

static void send_http_response(int fd, int status, const std::string& content_type,
                               const std::string& body) {
    std::string resp =
        "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n"
        "Content-Type: " + content_type + "\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n\r\n" + body;

    size_t sent = 0;
    while (sent < resp.size()) {
        ssize_t n = ::send(fd, resp.data() + sent, resp.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

// recv() bounded by an absolute deadline. Returns -1 with errno ETIMEDOUT
// once the deadline has passed.
static ssize_t recv_before(int fd, char* buf, size_t len,
                           std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            errno = ETIMEDOUT;
            return -1;
        }
        struct pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        if (ret == 0) continue;
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

static void send_json_error(int fd, int status, const std::string& message) {
    send_http_response(fd, status, "application/json",
                       "{\"error\":\"" + message + "\"}");
}

// ── WebhookServer ─────────────────────────────────────────────────────────────

WebhookServer::WebhookServer(std::string listen_addr,
                             uint32_t max_body,
                             uint32_t max_connections,
                             Handler handler,
                             std::chrono::milliseconds read_timeout)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_connections_(max_connections)
    , handler_(std::move(handler))
    , read_timeout_(read_timeout)
{}

WebhookServer::~WebhookServer() {
    stop();
}

bool WebhookServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe2(shutdown_pipe_, O_CLOEXEC) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    // Close-on-exec: deployment children must not inherit the listening port.
    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        error = "Failed to create server socket";
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    auto fail = [this, &error](const std::string& msg) {
        error = msg;
        ::close(server_fd_); server_fd_ = -1;
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail(std::string("listen failed: ") + std::strerror(errno));
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void WebhookServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }

    // Let in-flight requests complete.
    {
        std::unique_lock<std::mutex> lock(conn_mutex_);
        conn_cv_.wait(lock, [this]() { return active_connections_ == 0; });
    }

    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void WebhookServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN; fds[1].revents = 0;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept4(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen,
                            SOCK_CLOEXEC);
        if (cfd < 0) continue;

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            if (active_connections_ >= max_connections_) {
                send_json_error(cfd, 503, "Too many connections");
                ::close(cfd);
                continue;
            }
            ++active_connections_;
        }

        try {
            std::thread([this, cfd]() { serve_connection(cfd); }).detach();
        } catch (const std::system_error&) {
            send_json_error(cfd, 503, "Server busy");
            ::close(cfd);
            std::lock_guard<std::mutex> lock(conn_mutex_);
            --active_connections_;
            conn_cv_.notify_all();
        }
    }
}

void WebhookServer::serve_connection(int client_fd) {
    try {
        handle_connection(client_fd);
    } catch (const std::exception&) {
        send_json_error(client_fd, 500, "Internal error");
    }
    ::close(client_fd);

    // Last touch of *this: stop() may return as soon as the count hits zero.
    std::lock_guard<std::mutex> lock(conn_mutex_);
    --active_connections_;
    conn_cv_.notify_all();
}

void WebhookServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    // The whole request, headers and body, must arrive before the deadline.
    auto deadline = std::chrono::steady_clock::now() + read_timeout_;
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv_before(fd, tmp, sizeof(tmp), deadline);
        if (n < 0 && errno == ETIMEDOUT) {
            send_json_error(fd, 408, "Request timeout");
            return;
        }
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_json_error(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    WebhookRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) {
            send_json_error(fd, 400, "Bad request");
            return;
        }
        // Routing ignores the query string.
        req.path = pq.substr(0, pq.find('?'));
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Buffer the whole body before the handler runs.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        const std::string& v = it->second;
        if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos ||
            v.size() > 12) {
            send_json_error(fd, 400, "Invalid Content-Length");
            return;
        }
        content_len = std::stoull(v);
    }

    if (content_len > max_body_) {
        send_json_error(fd, 413, "Payload too large");
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = recv_before(fd, tmp, sizeof(tmp), deadline);
        if (n < 0 && errno == ETIMEDOUT) {
            send_json_error(fd, 408, "Request timeout");
            return;
        }
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) {
        req.body.resize(content_len);
    }

    WebhookResponse resp = handler_(req);
    send_http_response(fd, resp.status, resp.content_type, resp.body);
}

} // namespace hookdeploy
