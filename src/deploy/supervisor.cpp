#include "deploy/supervisor.hpp"
#include "append_log.hpp"
#include "util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace hookdeploy {

const char* trigger_result_name(TriggerResult result) {
    switch (result) {
        case TriggerResult::Started:        return "started";
        case TriggerResult::AlreadyRunning: return "already_running";
        case TriggerResult::ShuttingDown:   return "shutting_down";
        case TriggerResult::StartFailed:    return "start_failed";
    }
    return "unknown";
}

const char* run_outcome_name(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Running:     return "running";
        case RunOutcome::Exited:      return "exited";
        case RunOutcome::Signaled:    return "signaled";
        case RunOutcome::StartFailed: return "start_failed";
        case RunOutcome::Abandoned:   return "abandoned";
    }
    return "unknown";
}

// ── Helpers ──────────────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Inherited environment with ctx.env and the DEPLOY_* variables layered on
// top; later entries replace earlier ones with the same key.
static std::vector<std::string> build_environment(const DeployContext& ctx) {
    std::vector<EnvVar> vars;
    auto set = [&vars](const std::string& key, const std::string& value) {
        for (auto& kv : vars) {
            if (kv.first == key) {
                kv.second = value;
                return;
            }
        }
        vars.emplace_back(key, value);
    };

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        set(entry.substr(0, eq), entry.substr(eq + 1));
    }
    for (const auto& kv : ctx.env) {
        set(kv.first, kv.second);
    }
    if (!ctx.branch.empty()) set("DEPLOY_BRANCH", ctx.branch);
    if (!ctx.commit.empty()) set("DEPLOY_COMMIT", ctx.commit);

    std::vector<std::string> out;
    out.reserve(vars.size());
    for (const auto& kv : vars) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

// ── DeploySupervisor ─────────────────────────────────────────────

DeploySupervisor::DeploySupervisor(AppendLog& log, uint32_t timeout_seconds)
    : log_(log), timeout_seconds_(timeout_seconds)
{
    if (::pipe2(shutdown_pipe_, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(),
                                "DeploySupervisor: failed to create shutdown pipe");
    }
}

DeploySupervisor::~DeploySupervisor() {
    stopping_.store(true);
    char b = 0;
    ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
    (void)n;
    if (worker_.joinable()) worker_.join();
    close_fd(shutdown_pipe_[0]);
    close_fd(shutdown_pipe_[1]);
}

TriggerResult DeploySupervisor::trigger(const DeployContext& ctx) {
    std::string short_id = ctx.commit.substr(0, 7);

    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_.load()) {
        return TriggerResult::ShuttingDown;
    }
    if (active_) {
        pid_t pid = active_->pid;
        lock.unlock();
        std::string msg = "Deployment already in progress";
        if (pid > 0) msg += " (pid " + std::to_string(pid) + ")";
        msg += ", skipping";
        if (!short_id.empty()) msg += " commit " + short_id;
        log_.write(msg);
        return TriggerResult::AlreadyRunning;
    }

    DeployRun run;
    run.id = next_run_id_++;
    run.started_at = timestamp_now();
    run.branch = ctx.branch;
    run.commit = ctx.commit;
    active_ = std::move(run);

    // The previous worker released the slot as its last action, so this join
    // returns promptly.
    if (worker_.joinable()) worker_.join();

    try {
        worker_ = std::thread(&DeploySupervisor::run, this, ctx);
    } catch (const std::system_error& e) {
        active_.reset();
        idle_cv_.notify_all();
        lock.unlock();
        log_.write(std::string("Deployment could not be scheduled: ") + e.what());
        return TriggerResult::StartFailed;
    }
    return TriggerResult::Started;
}

bool DeploySupervisor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.has_value();
}

bool DeploySupervisor::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return !active_.has_value(); });
}

std::optional<DeployRun> DeploySupervisor::current_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::optional<DeployRun> DeploySupervisor::last_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

uint64_t DeploySupervisor::runs_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_run_id_ - 1;
}

void DeploySupervisor::make_executable(const std::string& command) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::permissions(command,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        log_.write("Warning: could not make " + command + " executable: " + ec.message());
    }
}

void DeploySupervisor::run(DeployContext ctx) {
    log_.write("Launching deployment script " + ctx.command);
    make_executable(ctx.command);

    if (stopping_.load()) {
        log_.write("Service stopping, deployment not started");
        finish_run(RunOutcome::StartFailed, std::nullopt, std::nullopt);
        return;
    }

    SpawnedProcess proc;
    std::string error;
    if (!spawn(ctx, proc, error)) {
        log_.write("Deployment failed to start: " + error);
        finish_run(RunOutcome::StartFailed, std::nullopt, std::nullopt);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_->pid = proc.pid;
    }
    log_.write("Deployment started (pid " + std::to_string(proc.pid) + ")");

    int status = 0;
    bool reaped = false;
    bool completed = stream_output(proc, status, reaped);
    close_fd(proc.stdout_fd);
    close_fd(proc.stderr_fd);

    if (!completed) {
        log_.write("Service stopping; deployment (pid " + std::to_string(proc.pid) +
                   ") continues unsupervised");
        finish_run(RunOutcome::Abandoned, std::nullopt, std::nullopt);
        return;
    }

    if (!reaped) {
        pid_t r;
        do {
            r = ::waitpid(proc.pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r < 0) {
            log_.write(std::string("Deployment status unavailable: ") + std::strerror(errno));
            finish_run(RunOutcome::Exited, std::nullopt, std::nullopt);
            return;
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            log_.write("Deployment script finished with exit code 0");
        } else {
            log_.write("Deployment script failed with exit code " + std::to_string(code));
        }
        finish_run(RunOutcome::Exited, code, std::nullopt);
    } else if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        log_.write("Deployment script terminated by signal " + std::to_string(sig));
        finish_run(RunOutcome::Signaled, std::nullopt, sig);
    } else {
        finish_run(RunOutcome::Exited, std::nullopt, std::nullopt);
    }
}

bool DeploySupervisor::spawn(const DeployContext& ctx, SpawnedProcess& proc,
                             std::string& error) {
    // argv and envp are materialised before fork(): the child only makes
    // async-signal-safe calls.
    std::vector<std::string> args;
    if (!ctx.interpreter.empty()) args.push_back(ctx.interpreter);
    args.push_back(ctx.command);
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(ctx);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* exe = argv[0];
    const char* workdir = ctx.working_dir.empty() ? nullptr : ctx.working_dir.c_str();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        close_all();
        return false;
    }

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        error = std::string("open /dev/null: ") + std::strerror(errno);
        close_all();
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        ::close(devnull);
        close_all();
        return false;
    }

    if (pid == 0) {
        // Child: own session, so terminal signals aimed at the service and
        // the service's exit do not reach the deployment.
        ::setsid();

        // Ignored dispositions survive execve; the service ignores SIGPIPE.
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);

        ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        int report[2] = {0, 0};
        if (workdir && ::chdir(workdir) != 0) {
            report[0] = 1;
            report[1] = errno;
        } else {
            ::execve(exe, argv.data(), envp.data());
            report[0] = 2;
            report[1] = errno;
        }
        ssize_t n = ::write(status_pipe[1], report, sizeof(report));
        (void)n;
        ::_exit(127);
    }

    ::close(devnull);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // EOF on the status pipe means execve succeeded (close-on-exec).
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (report[0] == 1) {
            error = "cannot enter working directory " + ctx.working_dir + ": " +
                    std::strerror(report[1]);
        } else {
            error = std::string("cannot execute ") + exe + ": " + std::strerror(report[1]);
        }
        return false;
    }

    proc.pid = pid;
    proc.stdout_fd = out_pipe[0];
    proc.stderr_fd = err_pipe[0];
    return true;
}

bool DeploySupervisor::stream_output(SpawnedProcess& proc, int& status, bool& reaped) {
    struct Stream {
        int* fd;
        const char* tag;
        std::string pending;
    };
    Stream streams[2] = {{&proc.stdout_fd, "deploy", {}},
                         {&proc.stderr_fd, "deploy:err", {}}};

    auto flush_lines = [this](Stream& s, bool eof) {
        size_t pos;
        while ((pos = s.pending.find('\n')) != std::string::npos) {
            std::string line = s.pending.substr(0, pos);
            s.pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!trim(line).empty()) emit_line(s.tag, line);
        }
        if (s.pending.size() >= kMaxLineBytes || (eof && !s.pending.empty())) {
            if (!trim(s.pending).empty()) emit_line(s.tag, s.pending);
            s.pending.clear();
        }
    };

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(timeout_seconds_);
    bool killed = false;
    char buf[4096];

    // Runs until the script is reaped and both pipes are drained. A script
    // that closes its own stdout/stderr is still watched for the deadline and
    // for shutdown.
    while (!reaped || *streams[0].fd >= 0 || *streams[1].fd >= 0) {
        struct pollfd fds[3];
        nfds_t nfds = 0;
        int index[3] = {-1, -1, -1};
        for (int i = 0; i < 2; ++i) {
            if (*streams[i].fd < 0) continue;
            fds[nfds].fd = *streams[i].fd;
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            index[nfds] = i;
            ++nfds;
        }
        fds[nfds].fd = shutdown_pipe_[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds_t shutdown_slot = nfds++;

        // Once the script has exited, only drain what is already buffered:
        // a background grandchild may keep the pipes open indefinitely.
        int timeout_ms = reaped ? 0 : kPollIntervalMs;
        int ret = ::poll(fds, nfds, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (fds[shutdown_slot].revents & POLLIN) {
            return false;
        }

        if (!reaped && timeout_seconds_ > 0 && !killed &&
            std::chrono::steady_clock::now() >= deadline) {
            log_.write("Deployment exceeded timeout of " +
                       std::to_string(timeout_seconds_) +
                       "s, killing process group " + std::to_string(proc.pid));
            ::kill(-proc.pid, SIGKILL);
            killed = true;
            std::lock_guard<std::mutex> lock(mutex_);
            active_->timed_out = true;
        }

        if (!reaped) {
            pid_t r = ::waitpid(proc.pid, &status, WNOHANG);
            if (r == proc.pid) reaped = true;
            else if (r < 0 && errno != EINTR) break;
        }

        if (ret == 0) {
            if (reaped) break;
            continue;
        }

        for (nfds_t k = 0; k < shutdown_slot; ++k) {
            if (fds[k].revents == 0) continue;
            Stream& s = streams[index[k]];
            ssize_t n = ::read(*s.fd, buf, sizeof(buf));
            if (n > 0) {
                s.pending.append(buf, static_cast<size_t>(n));
                flush_lines(s, false);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                flush_lines(s, true);
                close_fd(*s.fd);
            }
        }
    }

    for (auto& s : streams) flush_lines(s, true);
    return true;
}

void DeploySupervisor::emit_line(const char* tag, const std::string& line) {
    std::string tagged = std::string("[") + tag + "] " + line;
    log_.write(tagged);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return;
    if (active_->output.size() < kMaxRunLines) {
        active_->output.push_back(std::move(tagged));
    } else {
        active_->output_truncated = true;
    }
}

void DeploySupervisor::finish_run(RunOutcome outcome, std::optional<int> exit_code,
                                  std::optional<int> term_signal) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.write("Deployment run " + std::to_string(active_->id) + " ended: " +
               run_outcome_name(outcome));
    active_->outcome = outcome;
    active_->exit_code = exit_code;
    active_->term_signal = term_signal;
    active_->finished_at = timestamp_now();
    last_ = std::move(active_);
    active_.reset();
    idle_cv_.notify_all();
}

} // namespace hookdeploy
