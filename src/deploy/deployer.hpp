#pragma once
#include <string>
#include <utility>
#include <vector>

namespace hookdeploy {

using EnvVar = std::pair<std::string, std::string>;

// Everything needed to start one deployment run.
struct DeployContext {
    std::string working_dir;
    std::string command;      // deployment script
    std::string interpreter;  // e.g. "/bin/bash"; empty = exec command directly
    std::vector<EnvVar> env;  // overlay on the inherited environment
    std::string branch;
    std::string commit;
};

enum class TriggerResult {
    Started,         // run accepted; it proceeds in the background
    AlreadyRunning,  // a run is active; this trigger was rejected and logged
    ShuttingDown,    // supervisor is being torn down
    StartFailed      // no supervisor thread could be created
};

const char* trigger_result_name(TriggerResult result);

// Fire-and-forget deployment interface (injectable for testing).
// trigger() never waits for the deployment to finish.
class Deployer {
public:
    virtual ~Deployer() = default;
    virtual TriggerResult trigger(const DeployContext& ctx) = 0;
    virtual bool is_running() const = 0;
};

} // namespace hookdeploy
