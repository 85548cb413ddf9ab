#pragma once
#include "deploy/deployer.hpp"
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace hookdeploy {

struct ServerConfig {
    std::string bind = "0.0.0.0";
    uint16_t port = 9000;
    uint32_t max_body = 5 * 1024 * 1024;
    uint32_t max_connections = 16;
};

struct DeployConfig {
    std::string dir = ".";
    std::string script;                     // default: <dir>/scripts/deploy.sh
    std::string shell = "/bin/bash";        // empty = exec script directly
    std::string branch = "main";
    uint32_t timeout = 0;                   // seconds, 0 = no limit
    std::vector<EnvVar> env;                // from <dir>/.env
};

struct Config {
    std::string service_name = "hookdeploy";
    std::string secret = "your-webhook-secret-here";
    std::string log_file;                   // default: <dir>/logs/webhook.log

    ServerConfig server;
    DeployConfig deploy;

    // Built-in defaults < JSON file at config_path (optional) < environment.
    // Derived paths and <deploy dir>/.env are resolved last.
    // Throws std::runtime_error on an unreadable or malformed config file.
    static Config load(const std::string& config_path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config object on top of this config.
    void apply_json(const nlohmann::json& j);

    // Apply WEBHOOK_* / DEPLOY_* environment variables.
    void apply_env();

    // Fill in script and log_file defaults derived from deploy.dir, and read
    // the deployment environment overlay from <deploy.dir>/.env.
    void resolve_paths();

    // Throws std::runtime_error describing the first invalid setting.
    void validate() const;

    // True when the secret is still the shipped placeholder: webhook
    // signatures are not checked at all in that case.
    bool signature_check_disabled() const;

    std::string listen_addr() const;
};

// Parse KEY=VALUE lines. Blank lines and lines starting with '#' are skipped,
// an optional "export " prefix is dropped, and matching surrounding quotes
// are removed from the value. Returns empty when the file does not exist.
std::vector<EnvVar> load_env_file(const std::string& path);

} // namespace hookdeploy
