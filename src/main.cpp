#include "append_log.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "deploy/supervisor.hpp"
#include "server/webhook_handler.hpp"
#include "server/webhook_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};
static std::atomic<int> g_signal{0};

static void signal_handler(int sig) {
    g_signal.store(sig);
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: hookdeploy [options]\n"
              << "\n"
              << "Receives GitHub push webhooks and runs the deployment script\n"
              << "when the target branch is pushed.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Load settings from a JSON config file\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Endpoints:\n"
              << "  GET  /health         Liveness check\n"
              << "  POST /webhook        GitHub webhook (X-Hub-Signature-256, X-GitHub-Event)\n"
              << "\n"
              << "Environment variables (override the config file):\n"
              << "  WEBHOOK_PORT         Listening port (default: 9000)\n"
              << "  WEBHOOK_BIND         Bind address (default: 0.0.0.0)\n"
              << "  WEBHOOK_SECRET       Shared HMAC secret\n"
              << "  WEBHOOK_LOG_FILE     Log file (default: $DEPLOY_DIR/logs/webhook.log)\n"
              << "  WEBHOOK_MAX_BODY     Maximum request body in bytes (default: 5242880)\n"
              << "  WEBHOOK_MAX_CONNECTIONS  Concurrent connections (default: 16)\n"
              << "  WEBHOOK_SERVICE_NAME Name reported by /health (default: hookdeploy)\n"
              << "  DEPLOY_DIR           Deployment working directory (default: .)\n"
              << "  DEPLOY_SCRIPT        Deployment script (default: $DEPLOY_DIR/scripts/deploy.sh)\n"
              << "  DEPLOY_SHELL         Interpreter for the script (default: /bin/bash)\n"
              << "  DEPLOY_BRANCH        Branch that triggers deployment (default: main)\n"
              << "  DEPLOY_TIMEOUT       Kill the deployment after N seconds (default: 0, never)\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = hookdeploy::Config::load(config_path);
    config.validate();

    hookdeploy::AppendLog log(config.log_file, &std::cerr);

    if (config.signature_check_disabled()) {
        log.write("WARNING: WEBHOOK_SECRET is not configured. Signature verification "
                  "is DISABLED and anyone who can reach this port can trigger a deployment.");
    }

    hookdeploy::EventClassifier classifier(config.deploy.branch);
    hookdeploy::DeploySupervisor supervisor(log, config.deploy.timeout);
    hookdeploy::WebhookHandler handler(config, classifier, supervisor, log);

    hookdeploy::WebhookServer server(
        config.listen_addr(), config.server.max_body, config.server.max_connections,
        [&handler](const hookdeploy::WebhookRequest& req) { return handler.handle(req); });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::string error;
    if (!server.start(error)) {
        log.write("Failed to start webhook server: " + error);
        return 1;
    }

    log.write("Webhook server started on " + config.listen_addr());
    log.write("Endpoint: http://" + config.listen_addr() + "/webhook");
    log.write("Health check: http://" + config.listen_addr() + "/health");
    log.write("Deploying branch " + config.deploy.branch + " with " + config.deploy.script +
              " in " + config.deploy.dir);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    int sig = g_signal.load();
    log.write(std::string("Stopping webhook server (") +
              (sig == SIGINT ? "SIGINT" : "SIGTERM") + ")...");
    server.stop();

    if (supervisor.is_running()) {
        log.write("A deployment is still running; it is not waited for");
    }
    log.write("Webhook server stopped");
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
