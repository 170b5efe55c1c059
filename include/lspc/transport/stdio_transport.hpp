#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>

namespace lspc {

/// StdioTransport speaks Content-Length framed JSON-RPC over a pair of file
/// descriptors, normally the pipes connected to a language server's stdin and
/// stdout. Reads happen on the thread that calls start(); writes happen on the
/// sender's thread, one whole frame at a time. The write end is non-blocking
/// so a server that stops reading its input cannot wedge a sender past its
/// deadline or past shutdown().
class StdioTransport : public ITransport {
public:
    /// Takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    using ITransport::send;
    void send(const JsonRpcMessage& msg, Deadline deadline) override;
    void close_input() override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_all(const std::string& frame, Deadline deadline);

    int read_fd_;
    int write_fd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::timed_mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // lets shutdown() interrupt reads and writes
};

} // namespace lspc
