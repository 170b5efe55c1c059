#pragma once
#include <sys/types.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspc {

/// A spawned server process with its stdin and stdout connected to pipes.
/// stderr goes to /dev/null.
class ChildProcess {
public:
    /// Parent-side pipe ends. The caller owns both descriptors.
    struct Pipes {
        int read_fd;   // child's stdout
        int write_fd;  // child's stdin
    };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec `command` (looked up in PATH) with `args`.
    /// Throws LaunchError if pipes cannot be created, fork fails, or the
    /// executable cannot be run.
    [[nodiscard]] Pipes spawn(const std::string& command,
                              const std::vector<std::string>& args);

    /// Kill and reap the process. Idempotent.
    void terminate();

    /// Reaps the child if it has exited on its own.
    [[nodiscard]] bool is_running();

    [[nodiscard]] pid_t pid() const;

    /// Raw wait status once the child has been reaped.
    [[nodiscard]] std::optional<int> exit_status() const;

private:
    mutable std::mutex mutex_;
    pid_t pid_{-1};
    std::optional<int> exit_status_;
};

} // namespace lspc
