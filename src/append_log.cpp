#include "append_log.hpp"
#include "util.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

namespace hookdeploy {

AppendLog::AppendLog(std::string path, std::ostream* console)
    : path_(std::move(path)), console_(console)
{}

bool AppendLog::ensure_parent_dir(std::string& error) {
    if (dir_ready_) return true;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }
    dir_ready_ = true;
    return true;
}

void AppendLog::write(const std::string& message) {
    std::string line = "[" + timestamp_now() + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(mutex_);

    if (console_) {
        *console_ << line << std::flush;
    }

    std::string error;
    if (ensure_parent_dir(error)) {
        int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0) {
            error = std::strerror(errno);
        } else {
            size_t written = 0;
            while (written < line.size()) {
                ssize_t n = ::write(fd, line.data() + written, line.size() - written);
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) {
                    error = n < 0 ? std::strerror(errno) : "short write";
                    break;
                }
                written += static_cast<size_t>(n);
            }
            ::close(fd);
        }
    }

    if (!error.empty()) {
        ++failed_writes_;
        std::ostream& fallback = console_ ? *console_ : std::cerr;
        fallback << "[log] Failed to write " << path_ << ": " << error << "\n"
                 << std::flush;
        // A later write retries directory creation (e.g. after the operator
        // fixes permissions).
        dir_ready_ = false;
    }
}

uint64_t AppendLog::failed_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_writes_;
}

} // namespace hookdeploy
