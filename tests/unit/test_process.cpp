#include <gtest/gtest.h>
#include "lspc/error.hpp"
#include "lspc/process.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace lspc;

namespace {

std::string read_exactly(int fd, size_t n) {
    std::string out;
    char buf[256];
    while (out.size() < n) {
        ssize_t r = ::read(fd, buf, std::min(sizeof(buf), n - out.size()));
        if (r <= 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

} // anonymous namespace

TEST(ChildProcess, PipesReachChild) {
    ChildProcess proc;
    auto pipes = proc.spawn("cat", {});
    EXPECT_GT(proc.pid(), 0);
    EXPECT_TRUE(proc.is_running());

    const std::string msg = "Content-Length: 2\r\n\r\n{}";
    ASSERT_EQ(::write(pipes.write_fd, msg.data(), msg.size()), static_cast<ssize_t>(msg.size()));
    EXPECT_EQ(read_exactly(pipes.read_fd, msg.size()), msg);

    ::close(pipes.write_fd);
    ::close(pipes.read_fd);
    proc.terminate();
    EXPECT_FALSE(proc.is_running());
    EXPECT_TRUE(proc.exit_status().has_value());
}

TEST(ChildProcess, StderrIsNotOnStdout) {
    ChildProcess proc;
    auto pipes = proc.spawn("sh", {"-c", "echo noise >&2; echo out"});
    EXPECT_EQ(read_exactly(pipes.read_fd, 4), "out\n");
    char extra;
    EXPECT_EQ(::read(pipes.read_fd, &extra, 1), 0);
    ::close(pipes.write_fd);
    ::close(pipes.read_fd);
}

TEST(ChildProcess, MissingExecutable) {
    ChildProcess proc;
    try {
        (void)proc.spawn("/nonexistent/lspc-no-such-server", {"-config", "x.yml"});
        FAIL() << "expected LaunchError";
    } catch (const LaunchError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/lspc-no-such-server"), std::string::npos);
    }
    EXPECT_EQ(proc.pid(), -1);
    EXPECT_FALSE(proc.is_running());
}

TEST(ChildProcess, EmptyCommand) {
    ChildProcess proc;
    EXPECT_THROW((void)proc.spawn("", {}), LaunchError);
}

TEST(ChildProcess, SpawnTwiceRejected) {
    ChildProcess proc;
    auto pipes = proc.spawn("cat", {});
    EXPECT_THROW((void)proc.spawn("cat", {}), LaunchError);
    ::close(pipes.write_fd);
    ::close(pipes.read_fd);
}

TEST(ChildProcess, ExitedChildIsReaped) {
    ChildProcess proc;
    auto pipes = proc.spawn("sh", {"-c", "exit 3"});
    char c;
    EXPECT_EQ(::read(pipes.read_fd, &c, 1), 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (proc.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_FALSE(proc.is_running());
    ASSERT_TRUE(proc.exit_status().has_value());
    EXPECT_TRUE(WIFEXITED(*proc.exit_status()));
    EXPECT_EQ(WEXITSTATUS(*proc.exit_status()), 3);

    proc.terminate();
    ::close(pipes.write_fd);
    ::close(pipes.read_fd);
}

TEST(ChildProcess, TerminateIsIdempotent) {
    ChildProcess proc;
    proc.terminate();
    auto pipes = proc.spawn("cat", {});
    proc.terminate();
    proc.terminate();
    ASSERT_TRUE(proc.exit_status().has_value());
    EXPECT_TRUE(WIFSIGNALED(*proc.exit_status()));
    ::close(pipes.write_fd);
    ::close(pipes.read_fd);
}
