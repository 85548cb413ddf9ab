#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "append_log.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "deploy/supervisor.hpp"
#include "server/webhook_handler.hpp"
#include "server/webhook_server.hpp"
#include "signature.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace hookdeploy;
using namespace std::chrono_literals;
using json = nlohmann::json;

static std::string http_exchange(uint16_t port, const std::string& raw) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        ::close(fd);
        return "";
    }
    ssize_t n = ::send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);
    (void)n;
    std::string out;
    char buf[4096];
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

static int status_of(const std::string& resp) {
    if (resp.size() < 12) return 0;
    return std::stoi(resp.substr(9, 3));
}

static json body_of(const std::string& resp) {
    auto pos = resp.find("\r\n\r\n");
    return json::parse(resp.substr(pos + 4));
}

static std::string signed_push(const std::string& body, const std::string& secret) {
    return "POST /webhook HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n"
           "X-GitHub-Event: push\r\n"
           "X-Hub-Signature-256: " + compute_signature(body, secret) + "\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

TEST_CASE("Integration: signed push deploys once, health stays responsive", "[integration][deploy]") {
    char tmpl[] = "/tmp/hookdeploy_it_XXXXXX";
    REQUIRE(mkdtemp(tmpl) != nullptr);
    std::string dir = tmpl;
    std::filesystem::create_directories(dir + "/scripts");
    {
        std::ofstream f(dir + "/scripts/deploy.sh");
        f << "#!/bin/sh\necho \"deploying $DEPLOY_COMMIT\"\nsleep 1\necho done\n";
    }

    Config cfg;
    cfg.secret = "integration-secret";
    cfg.server.bind = "127.0.0.1";
    cfg.server.port = 9000;
    cfg.deploy.dir = dir;
    cfg.deploy.shell = "/bin/sh";
    cfg.resolve_paths();
    REQUIRE_NOTHROW(cfg.validate());

    AppendLog log(cfg.log_file);
    EventClassifier classifier(cfg.deploy.branch);
    DeploySupervisor supervisor(log, cfg.deploy.timeout);
    WebhookHandler handler(cfg, classifier, supervisor, log);
    WebhookServer server("127.0.0.1:0", cfg.server.max_body, cfg.server.max_connections,
                         [&handler](const WebhookRequest& req) { return handler.handle(req); });

    std::string error;
    REQUIRE(server.start(error));
    uint16_t port = server.bound_port();

    std::string push =
        R"({"ref":"refs/heads/main","head_commit":{"id":"abcdef1234567890","message":"fix bug"}})";

    // 1) First push starts the deployment and is answered immediately
    auto first = http_exchange(port, signed_push(push, cfg.secret));
    REQUIRE(status_of(first) == 200);
    REQUIRE(body_of(first)["status"] == "deploying");

    // 2) Health answers while the script runs
    auto health = http_exchange(port, "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(status_of(health) == 200);
    REQUIRE(body_of(health)["deploying"] == true);

    // 3) A second push during the run does not start another process
    auto second = http_exchange(port, signed_push(push, cfg.secret));
    REQUIRE(status_of(second) == 200);
    REQUIRE(body_of(second)["status"] == "ignored");

    // 4) Bad signature never reaches the supervisor
    auto forged = http_exchange(port, signed_push(push, "guess"));
    REQUIRE(status_of(forged) == 401);

    REQUIRE(supervisor.wait_idle(10s));
    REQUIRE(supervisor.runs_started() == 1);

    server.stop();

    std::ifstream f(cfg.log_file);
    std::stringstream ss;
    ss << f.rdbuf();
    std::string text = ss.str();
    REQUIRE(text.find("commit abcdef1") != std::string::npos);
    REQUIRE(text.find("[deploy] deploying abcdef1234567890") != std::string::npos);
    REQUIRE(text.find("[deploy] done") != std::string::npos);
    REQUIRE(text.find("Deployment script finished with exit code 0") != std::string::npos);
    REQUIRE(text.find("Invalid signature") != std::string::npos);

    std::filesystem::remove_all(dir);
}
