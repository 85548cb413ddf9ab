#include "server/webhook_handler.hpp"
#include "append_log.hpp"
#include "config.hpp"
#include "signature.hpp"

#include <nlohmann/json.hpp>

namespace hookdeploy {

static WebhookResponse json_response(int status, const nlohmann::json& body) {
    // Header values are not UTF-8 validated; replace rather than throw.
    return {status, "application/json",
            body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

WebhookHandler::WebhookHandler(const Config& config, const EventClassifier& classifier,
                               Deployer& deployer, AppendLog& log)
    : config_(config), classifier_(classifier), deployer_(deployer), log_(log)
{}

WebhookResponse WebhookHandler::handle(const WebhookRequest& req) {
    if (req.method == "GET" && req.path == "/health") {
        return handle_health();
    }
    if (req.method == "POST" && req.path == "/webhook") {
        return handle_webhook(req);
    }
    return json_response(404, {{"error", "Not found"}});
}

WebhookResponse WebhookHandler::handle_health() const {
    return json_response(200, {
        {"status", "ok"},
        {"service", config_.service_name},
        {"deploying", deployer_.is_running()},
        {"signature_check", !config_.signature_check_disabled()}
    });
}

WebhookResponse WebhookHandler::handle_webhook(const WebhookRequest& req) {
    std::string event = req.header(kEventHeader).value_or("");
    log_.write("Webhook received: " + (event.empty() ? std::string("(no event)") : event));

    if (!config_.signature_check_disabled()) {
        if (!verify_signature(req.body, req.header(kSignatureHeader), config_.secret)) {
            log_.write("Invalid signature, request rejected");
            return json_response(401, {{"error", "Invalid signature"}});
        }
    }

    Decision decision = classifier_.classify(event, req.body);

    switch (decision.kind) {
        case Decision::Kind::Deploy:
            return start_deployment(decision);

        case Decision::Kind::Pong:
            log_.write("Ping received");
            return json_response(200, {{"status", "pong"}});

        case Decision::Kind::Malformed:
            log_.write("Payload parse error: " + decision.detail);
            return json_response(400, {{"error", "Invalid payload"}});

        case Decision::Kind::Ignored:
            break;
    }

    if (event == "push") {
        log_.write("Push to " + (decision.branch.empty() ? std::string("(no branch)")
                                                           : decision.branch) +
                   " ignored (" + decision.reason + ")");
    } else {
        log_.write("Event " + (event.empty() ? std::string("(none)") : event) + " ignored");
    }
    return json_response(200, {
        {"status", "ignored"},
        {"reason", decision.reason},
        {"event", event}
    });
}

DeployContext WebhookHandler::make_context(const Decision& decision) const {
    DeployContext ctx;
    ctx.working_dir = config_.deploy.dir;
    ctx.command = config_.deploy.script;
    ctx.interpreter = config_.deploy.shell;
    ctx.env = config_.deploy.env;
    ctx.branch = decision.branch;
    ctx.commit = decision.commit_id;
    return ctx;
}

WebhookResponse WebhookHandler::start_deployment(const Decision& decision) {
    log_.write("Push to " + decision.branch + " detected - commit " + decision.short_id());
    log_.write("Message: " + decision.commit_message);

    TriggerResult result = deployer_.trigger(make_context(decision));

    if (result == TriggerResult::Started) {
        return json_response(200, {
            {"status", "deploying"},
            {"branch", decision.branch},
            {"commit", decision.commit_id},
            {"message", decision.commit_message}
        });
    }

    std::string reason = result == TriggerResult::AlreadyRunning
        ? "deployment already in progress"
        : std::string("deployment not started: ") + trigger_result_name(result);
    return json_response(200, {
        {"status", "ignored"},
        {"reason", reason},
        {"commit", decision.commit_id}
    });
}

} // namespace hookdeploy
