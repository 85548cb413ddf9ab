#pragma once
#include "deploy/deployer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace hookdeploy {

class AppendLog;

enum class RunOutcome {
    Running,
    Exited,       // exit_code set
    Signaled,     // term_signal set
    StartFailed,  // process could not be spawned
    Abandoned     // supervisor shut down while the process was still running
};

const char* run_outcome_name(RunOutcome outcome);

struct DeployRun {
    uint64_t id = 0;
    std::string started_at;
    std::string finished_at;
    std::string branch;
    std::string commit;
    pid_t pid = -1;
    std::vector<std::string> output;  // "[deploy] ..." / "[deploy:err] ..."
    bool output_truncated = false;
    bool timed_out = false;
    RunOutcome outcome = RunOutcome::Running;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
};

// Owns the single deployment slot. At most one deployment process exists at
// any time: a trigger that arrives while a run is active is rejected and
// logged ("debounce"), never queued.
//
// Each accepted run is supervised on a dedicated thread that spawns the
// script in its own session with stdin on /dev/null, forwards stdout and
// stderr line by line to the AppendLog, and logs the exit status.
//
// Destroying the supervisor while a run is active stops the supervision but
// not the process: the script keeps running in its own session, unobserved.
class DeploySupervisor : public Deployer {
public:
    // timeout_seconds: kill the run's process group after this long (0 = never)
    explicit DeploySupervisor(AppendLog& log, uint32_t timeout_seconds = 0);
    ~DeploySupervisor() override;

    DeploySupervisor(const DeploySupervisor&) = delete;
    DeploySupervisor& operator=(const DeploySupervisor&) = delete;

    TriggerResult trigger(const DeployContext& ctx) override;
    bool is_running() const override;

    // Block until no run is active. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    // Snapshot of the active run, if any.
    std::optional<DeployRun> current_run() const;

    // Snapshot of the most recently completed run, if any.
    std::optional<DeployRun> last_run() const;

    uint64_t runs_started() const;

private:
    static constexpr size_t kMaxRunLines = 1000;
    static constexpr size_t kMaxLineBytes = 16384;
    static constexpr int kPollIntervalMs = 500;

    struct SpawnedProcess {
        pid_t pid = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
    };

    void run(DeployContext ctx);
    bool spawn(const DeployContext& ctx, SpawnedProcess& proc, std::string& error);
    void make_executable(const std::string& command);

    // Pump both output pipes until EOF. Returns false when the supervisor is
    // shutting down before the process finished; in that case status is unset.
    bool stream_output(SpawnedProcess& proc, int& status, bool& reaped);

    void emit_line(const char* tag, const std::string& line);
    void finish_run(RunOutcome outcome, std::optional<int> exit_code,
                    std::optional<int> term_signal);

    AppendLog& log_;
    uint32_t timeout_seconds_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::optional<DeployRun> active_;
    std::optional<DeployRun> last_;
    uint64_t next_run_id_ = 1;

    std::thread worker_;
    std::atomic<bool> stopping_{false};
    int shutdown_pipe_[2] = {-1, -1};
};

} // namespace hookdeploy
