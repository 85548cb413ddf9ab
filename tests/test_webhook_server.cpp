#include <catch2/catch_test_macros.hpp>
#include "server/webhook_server.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace hookdeploy;
using namespace std::chrono_literals;

static int connect_loopback(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

static std::string read_all(int fd) {
    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

// Writes a request one byte every 100 ms until told to stop or the peer
// closes the connection.
struct SlowSender {
    int fd;
    std::atomic<bool> done{false};
    std::thread thread;

    explicit SlowSender(int socket_fd) : fd(socket_fd) {
        thread = std::thread([this]() {
            const std::string raw = "GET /health HTTP/1.1\r\nHost: localhost\r\nX-Padding: ";
            size_t i = 0;
            while (!done.load()) {
                char c = i < raw.size() ? raw[i++] : 'x';
                if (::send(fd, &c, 1, MSG_NOSIGNAL) != 1) break;
                std::this_thread::sleep_for(100ms);
            }
        });
    }

    ~SlowSender() {
        done = true;
        if (thread.joinable()) thread.join();
        ::close(fd);
    }

    SlowSender(const SlowSender&) = delete;
    SlowSender& operator=(const SlowSender&) = delete;
};

// Send a raw request to 127.0.0.1:port and return the full response.
static std::string http_exchange(uint16_t port, const std::string& raw) {
    int fd = connect_loopback(port);
    if (fd < 0) return "";
    size_t sent = 0;
    while (sent < raw.size()) {
        ssize_t n = ::send(fd, raw.data() + sent, raw.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
    }
    std::string out = read_all(fd);
    ::close(fd);
    return out;
}

static std::string post_request(const std::string& path, const std::string& body,
                                const std::string& extra_headers = "") {
    return "POST " + path + " HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           extra_headers + "\r\n" + body;
}

// ── parse_listen_addr ─────────────────────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid host:port", "[webhook_server]") {
    std::string host; uint16_t port;
    REQUIRE(parse_listen_addr("127.0.0.1:9000", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 9000);
}

TEST_CASE("parse_listen_addr: missing colon returns false", "[webhook_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1", host, port));
}

TEST_CASE("parse_listen_addr: non-numeric port returns false", "[webhook_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:http", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:-1", host, port));
    REQUIRE_FALSE(parse_listen_addr("127.0.0.1:", host, port));
}

TEST_CASE("parse_listen_addr: empty host or string returns false", "[webhook_server]") {
    std::string host; uint16_t port;
    REQUIRE_FALSE(parse_listen_addr("", host, port));
    REQUIRE_FALSE(parse_listen_addr(":9000", host, port));
}

TEST_CASE("parse_listen_addr: port range", "[webhook_server]") {
    std::string host; uint16_t port;
    REQUIRE(parse_listen_addr("0.0.0.0:65535", host, port));
    REQUIRE(port == 65535);
    REQUIRE_FALSE(parse_listen_addr("0.0.0.0:65536", host, port));
    REQUIRE_FALSE(parse_listen_addr("0.0.0.0:99999999999999", host, port));
    REQUIRE_FALSE(parse_listen_addr("0.0.0.0:0", host, port));
    REQUIRE(parse_listen_addr("0.0.0.0:0", host, port, true));
    REQUIRE(port == 0);
}

// ── WebhookRequest ────────────────────────────────────────────────────────────

TEST_CASE("WebhookRequest: header lookup is case-insensitive", "[webhook_server]") {
    WebhookRequest req;
    req.headers["x-github-event"] = "push";
    REQUIRE(req.header("X-GitHub-Event").value_or("") == "push");
    REQUIRE(req.header("x-github-event").value_or("") == "push");
    REQUIRE_FALSE(req.header("X-Hub-Signature-256").has_value());
}

// ── Live server ───────────────────────────────────────────────────────────────

TEST_CASE("WebhookServer: invalid listen address fails to start", "[webhook_server]") {
    WebhookServer server("not-an-address", 1024, 4,
                         [](const WebhookRequest&) { return WebhookResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE_FALSE(error.empty());
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("WebhookServer: serves requests on an ephemeral port", "[webhook_server]") {
    std::atomic<int> calls{0};
    WebhookRequest seen;
    WebhookServer server("127.0.0.1:0", 1024, 4, [&](const WebhookRequest& req) {
        calls++;
        seen = req;
        return WebhookResponse{200, "application/json", R"({"status":"ok"})"};
    });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.is_running());
    REQUIRE(server.bound_port() != 0);

    std::string body = R"({"ref":"refs/heads/main"})";
    auto resp = http_exchange(server.bound_port(),
        post_request("/webhook?x=1", body, "X-GitHub-Event: push\r\n"));

    REQUIRE(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(resp.find("Connection: close") != std::string::npos);
    REQUIRE(resp.find(R"({"status":"ok"})") != std::string::npos);
    REQUIRE(calls.load() == 1);
    REQUIRE(seen.method == "POST");
    REQUIRE(seen.path == "/webhook");
    REQUIRE(seen.header("x-github-event").value_or("") == "push");
    REQUIRE(seen.body == body);

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("WebhookServer: oversized body gets 413 without calling handler", "[webhook_server]") {
    std::atomic<int> calls{0};
    WebhookServer server("127.0.0.1:0", 16, 4, [&](const WebhookRequest&) {
        calls++;
        return WebhookResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));

    auto resp = http_exchange(server.bound_port(),
        post_request("/webhook", std::string(64, 'x')));
    REQUIRE(resp.rfind("HTTP/1.1 413", 0) == 0);
    REQUIRE(calls.load() == 0);
}

TEST_CASE("WebhookServer: invalid Content-Length gets 400", "[webhook_server]") {
    WebhookServer server("127.0.0.1:0", 1024, 4,
                         [](const WebhookRequest&) { return WebhookResponse{}; });
    std::string error;
    REQUIRE(server.start(error));

    auto resp = http_exchange(server.bound_port(),
        "POST /webhook HTTP/1.1\r\nContent-Length: abc\r\n\r\n");
    REQUIRE(resp.rfind("HTTP/1.1 400", 0) == 0);
}

TEST_CASE("WebhookServer: slow handler does not block other connections", "[webhook_server]") {
    WebhookServer server("127.0.0.1:0", 1024, 4, [](const WebhookRequest& req) {
        if (req.path == "/slow") std::this_thread::sleep_for(1500ms);
        return WebhookResponse{200, "application/json", "{\"path\":\"" + req.path + "\"}"};
    });
    std::string error;
    REQUIRE(server.start(error));
    uint16_t port = server.bound_port();

    std::string slow_resp;
    std::thread slow([&]() {
        slow_resp = http_exchange(port, "GET /slow HTTP/1.1\r\nHost: x\r\n\r\n");
    });
    std::this_thread::sleep_for(200ms);

    auto begin = std::chrono::steady_clock::now();
    auto fast = http_exchange(port, "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(std::chrono::steady_clock::now() - begin < 1000ms);
    REQUIRE(fast.find("/health") != std::string::npos);

    slow.join();
    REQUIRE(slow_resp.find("/slow") != std::string::npos);
}

TEST_CASE("WebhookServer: stop waits for in-flight requests", "[webhook_server]") {
    std::atomic<bool> handler_done{false};
    WebhookServer server("127.0.0.1:0", 1024, 4, [&](const WebhookRequest&) {
        std::this_thread::sleep_for(500ms);
        handler_done = true;
        return WebhookResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));
    uint16_t port = server.bound_port();

    std::string resp;
    std::thread client([&]() {
        resp = http_exchange(port, "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    });
    std::this_thread::sleep_for(150ms);

    server.stop();
    REQUIRE(handler_done.load());
    client.join();
    REQUIRE(resp.rfind("HTTP/1.1 200", 0) == 0);
}

TEST_CASE("WebhookServer: request trickling past the read deadline gets 408", "[webhook_server]") {
    std::atomic<int> calls{0};
    WebhookServer server("127.0.0.1:0", 1024, 4, [&](const WebhookRequest&) {
        calls++;
        return WebhookResponse{};
    }, 500ms);
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_loopback(server.bound_port());
    REQUIRE(fd >= 0);
    SlowSender sender(fd);

    auto begin = std::chrono::steady_clock::now();
    auto resp = read_all(fd);
    REQUIRE(std::chrono::steady_clock::now() - begin < 3s);
    REQUIRE(resp.rfind("HTTP/1.1 408", 0) == 0);
    REQUIRE(calls.load() == 0);

    // The slot was released: health still answers.
    auto health = http_exchange(server.bound_port(), "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(health.rfind("HTTP/1.1 200", 0) == 0);
}

TEST_CASE("WebhookServer: stop is not held up by a trickling client", "[webhook_server]") {
    WebhookServer server("127.0.0.1:0", 1024, 4,
                         [](const WebhookRequest&) { return WebhookResponse{}; }, 500ms);
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_loopback(server.bound_port());
    REQUIRE(fd >= 0);
    SlowSender sender(fd);
    std::this_thread::sleep_for(200ms);

    auto begin = std::chrono::steady_clock::now();
    server.stop();
    REQUIRE(std::chrono::steady_clock::now() - begin < 3s);
    REQUIRE_FALSE(server.is_running());
}
