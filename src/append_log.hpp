#pragma once
#include <string>
#include <ostream>
#include <mutex>
#include <cstdint>

namespace hookdeploy {

// Process-wide append-only log. Each write() produces one line
// "[<ISO-8601>] <message>" in the destination file and, when a console
// stream is set, the same line on the console. Missing parent directories
// are created on first use. Thread-safe.
//
// The file is opened close-on-exec and closed again after each write, so
// deployment children never inherit it and external rotation is picked up.
//
// Write failures never propagate; they are reported on the console stream
// (or std::cerr when no console is set) and processing continues.
class AppendLog {
public:
    explicit AppendLog(std::string path, std::ostream* console = nullptr);

    void write(const std::string& message);

    const std::string& path() const { return path_; }

    // Number of writes that failed to reach the destination file.
    uint64_t failed_writes() const;

private:
    bool ensure_parent_dir(std::string& error);

    std::string path_;
    std::ostream* console_;
    mutable std::mutex mutex_;
    bool dir_ready_ = false;
    uint64_t failed_writes_ = 0;
};

} // namespace hookdeploy
