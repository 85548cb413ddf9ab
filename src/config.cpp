#include "config.hpp"
#include "signature.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace hookdeploy {

nlohmann::json Config::defaults_json() {
    return {
        {"service_name", "hookdeploy"},
        {"secret", kUnconfiguredSecret},
        {"log_file", ""},
        {"server", {
            {"bind", "0.0.0.0"},
            {"port", 9000},
            {"max_body", 5 * 1024 * 1024},
            {"max_connections", 16}
        }},
        {"deploy", {
            {"dir", "."},
            {"script", ""},
            {"shell", "/bin/bash"},
            {"branch", "main"},
            {"timeout", 0}
        }}
    };
}

// Non-negative integer field; throws on negative or oversized values.
static bool read_uint(const nlohmann::json& obj, const char* key, uint64_t max,
                      uint64_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return false;
    const auto& v = obj[key];
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0)
        throw std::runtime_error(std::string(key) + " must not be negative");
    uint64_t u = v.get<uint64_t>();
    if (u > max)
        throw std::runtime_error(std::string(key) + " out of range: " + std::to_string(u));
    out = u;
    return true;
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    if (j.contains("service_name") && j["service_name"].is_string())
        service_name = j["service_name"].get<std::string>();
    if (j.contains("secret") && j["secret"].is_string())
        secret = j["secret"].get<std::string>();
    if (j.contains("log_file") && j["log_file"].is_string())
        log_file = expand_home(j["log_file"].get<std::string>());

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("bind") && s["bind"].is_string())
            server.bind = s["bind"].get<std::string>();
        uint64_t v = 0;
        if (read_uint(s, "port", 65535, v)) {
            if (v == 0) throw std::runtime_error("port must not be 0");
            server.port = static_cast<uint16_t>(v);
        }
        if (read_uint(s, "max_body", UINT32_MAX, v))
            server.max_body = static_cast<uint32_t>(v);
        if (read_uint(s, "max_connections", 4096, v))
            server.max_connections = static_cast<uint32_t>(v);
    }

    if (j.contains("deploy") && j["deploy"].is_object()) {
        auto& d = j["deploy"];
        if (d.contains("dir") && d["dir"].is_string())
            deploy.dir = expand_home(d["dir"].get<std::string>());
        if (d.contains("script") && d["script"].is_string())
            deploy.script = expand_home(d["script"].get<std::string>());
        if (d.contains("shell") && d["shell"].is_string())
            deploy.shell = d["shell"].get<std::string>();
        if (d.contains("branch") && d["branch"].is_string())
            deploy.branch = d["branch"].get<std::string>();
        uint64_t v = 0;
        if (read_uint(d, "timeout", UINT32_MAX, v))
            deploy.timeout = static_cast<uint32_t>(v);
    }
}

static uint32_t parse_env_uint(const char* name, const char* value, uint32_t max) {
    std::string s = trim(value);
    size_t used = 0;
    unsigned long v = 0;
    try {
        v = std::stoul(s, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + " is not a number: " + value);
    }
    if (used != s.size() || s[0] == '-' || v > max) {
        throw std::runtime_error(std::string(name) + " is out of range: " + value);
    }
    return static_cast<uint32_t>(v);
}

void Config::apply_env() {
    if (const char* v = std::getenv("WEBHOOK_PORT")) {
        uint32_t p = parse_env_uint("WEBHOOK_PORT", v, 65535);
        if (p == 0) throw std::runtime_error("WEBHOOK_PORT must not be 0");
        server.port = static_cast<uint16_t>(p);
    }
    if (const char* v = std::getenv("WEBHOOK_BIND"))
        server.bind = v;
    if (const char* v = std::getenv("WEBHOOK_SECRET"))
        secret = v;
    if (const char* v = std::getenv("WEBHOOK_LOG_FILE"))
        log_file = v;
    if (const char* v = std::getenv("WEBHOOK_MAX_BODY"))
        server.max_body = parse_env_uint("WEBHOOK_MAX_BODY", v, UINT32_MAX);
    if (const char* v = std::getenv("WEBHOOK_MAX_CONNECTIONS"))
        server.max_connections = parse_env_uint("WEBHOOK_MAX_CONNECTIONS", v, 4096);
    if (const char* v = std::getenv("WEBHOOK_SERVICE_NAME"))
        service_name = v;

    if (const char* v = std::getenv("DEPLOY_DIR"))
        deploy.dir = v;
    if (const char* v = std::getenv("DEPLOY_SCRIPT"))
        deploy.script = v;
    if (const char* v = std::getenv("DEPLOY_SHELL"))
        deploy.shell = v;
    if (const char* v = std::getenv("DEPLOY_BRANCH"))
        deploy.branch = v;
    if (const char* v = std::getenv("DEPLOY_TIMEOUT"))
        deploy.timeout = parse_env_uint("DEPLOY_TIMEOUT", v, UINT32_MAX);
}

void Config::resolve_paths() {
    std::string dir = deploy.dir.empty() ? "." : deploy.dir;
    if (deploy.script.empty())
        deploy.script = dir + "/scripts/deploy.sh";
    if (log_file.empty())
        log_file = dir + "/logs/webhook.log";
    deploy.env = load_env_file(dir + "/.env");
}

Config Config::load(const std::string& config_path) {
    Config cfg;
    cfg.apply_json(defaults_json());

    if (!config_path.empty()) {
        std::string path = expand_home(config_path);
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open config file " + path);
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("malformed config file " + path + ": " + e.what());
        }
        cfg.apply_json(j);
    }

    // Environment variables always override the config file
    cfg.apply_env();
    cfg.resolve_paths();
    return cfg;
}

void Config::validate() const {
    if (server.port == 0)
        throw std::runtime_error("listening port must be between 1 and 65535");
    if (server.bind.empty())
        throw std::runtime_error("bind address must not be empty");
    if (server.max_body == 0)
        throw std::runtime_error("max_body must be greater than 0");
    if (server.max_connections == 0)
        throw std::runtime_error("max_connections must be greater than 0");
    if (deploy.script.empty())
        throw std::runtime_error("deployment script is not configured");
    if (deploy.branch.empty())
        throw std::runtime_error("deployment branch must not be empty");
    if (log_file.empty())
        throw std::runtime_error("log file is not configured");
    if (secret.empty())
        throw std::runtime_error("webhook secret must not be empty");
}

bool Config::signature_check_disabled() const {
    return secret == kUnconfiguredSecret;
}

std::string Config::listen_addr() const {
    return server.bind + ":" + std::to_string(server.port);
}

std::vector<EnvVar> load_env_file(const std::string& path) {
    std::vector<EnvVar> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    std::string line;
    while (std::getline(file, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (starts_with(t, "export ")) t = trim(t.substr(7));

        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (key.empty()) continue;
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        bool replaced = false;
        for (auto& kv : vars) {
            if (kv.first == key) {
                kv.second = value;
                replaced = true;
                break;
            }
        }
        if (!replaced) vars.emplace_back(std::move(key), std::move(value));
    }
    return vars;
}

} // namespace hookdeploy
