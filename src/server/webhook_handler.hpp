#pragma once
#include "server/webhook_server.hpp"
#include "classifier.hpp"
#include "deploy/deployer.hpp"

namespace hookdeploy {

struct Config;
class AppendLog;

inline constexpr const char* kSignatureHeader = "x-hub-signature-256";
inline constexpr const char* kEventHeader = "x-github-event";

// Routes webhook traffic:
//   GET  /health   liveness, never touches the verifier or the deployer
//   POST /webhook  authenticate -> classify -> (trigger) -> respond
//   anything else  404
// The response is produced as soon as a deployment has been requested; the
// deployment itself runs in the Deployer.
class WebhookHandler {
public:
    WebhookHandler(const Config& config, const EventClassifier& classifier,
                   Deployer& deployer, AppendLog& log);

    WebhookResponse handle(const WebhookRequest& req);

    // Deployment request derived from configuration and a Deploy decision.
    DeployContext make_context(const Decision& decision) const;

private:
    WebhookResponse handle_health() const;
    WebhookResponse handle_webhook(const WebhookRequest& req);
    WebhookResponse start_deployment(const Decision& decision);

    const Config& config_;
    const EventClassifier& classifier_;
    Deployer& deployer_;
    AppendLog& log_;
};

} // namespace hookdeploy
