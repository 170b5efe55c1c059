#include "lspc/process.hpp"
#include "lspc/error.hpp"
#include "lspc/logging.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>

namespace lspc {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// A write to a server that has exited must fail with EPIPE rather than kill
// the host.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

pid_t wait_for(pid_t pid, int& status) {
    pid_t r;
    do {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

} // anonymous namespace

ChildProcess::~ChildProcess() {
    terminate();
}

ChildProcess::Pipes ChildProcess::spawn(const std::string& command,
                                        const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        throw LaunchError("Process already spawned (pid " + std::to_string(pid_) + ")");
    }
    if (command.empty()) {
        throw LaunchError("Empty command");
    }
    ignore_sigpipe();

    // All three pipes are close-on-exec: the child only keeps the copies
    // dup2'd onto its stdin/stdout, and the status pipe closes on a
    // successful exec.
    int in_pipe[2]{-1, -1}, out_pipe[2]{-1, -1}, status_pipe[2]{-1, -1};
    auto close_all = [&] {
        close_fd(in_pipe[0]); close_fd(in_pipe[1]);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
    };
    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0
        || ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_all();
        throw LaunchError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    // Build argv before forking; the child must not allocate.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(command);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv_vec;
    for (auto& a : argv_storage) argv_vec.push_back(a.data());
    argv_vec.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw LaunchError(std::string("Failed to fork process: ") + std::strerror(err));
    }
    if (pid == 0) {
        // Child: stdin/stdout onto the pipes, stderr into /dev/null
        int err = 0;
        if (::dup2(in_pipe[0], STDIN_FILENO) < 0 || ::dup2(out_pipe[1], STDOUT_FILENO) < 0) {
            err = errno;
        } else {
            int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
            if (devnull >= 0) {
                ::dup2(devnull, STDERR_FILENO);
            } else {
                ::close(STDERR_FILENO);
            }
            ::execvp(argv_vec[0], argv_vec.data());
            err = errno;
        }
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        wait_for(pid, status);
        close_all();
        throw LaunchError("Failed to launch '" + command + "': " + std::strerror(child_errno));
    }

    pid_ = pid;
    exit_status_.reset();
    logger()->debug("Spawned '{}' as pid {}", command, pid);
    return Pipes{out_pipe[0], in_pipe[1]};
}

void ChildProcess::terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exit_status_) return;

    if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        logger()->warn("Failed to kill pid {}: {}", pid_, std::strerror(errno));
    }
    int status = 0;
    if (wait_for(pid_, status) == pid_) {
        exit_status_ = status;
        logger()->debug("Reaped pid {}", pid_);
    } else {
        // Reaped elsewhere; nothing left to wait for.
        exit_status_ = -1;
    }
}

bool ChildProcess::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exit_status_) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    exit_status_ = r == pid_ ? status : -1;
    return false;
}

pid_t ChildProcess::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

std::optional<int> ChildProcess::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_status_;
}

} // namespace lspc
