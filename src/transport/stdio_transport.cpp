#include "lspc/transport/stdio_transport.hpp"
#include "lspc/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstring>
#include <mutex>

namespace lspc {

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
    int flags = ::fcntl(write_fd_, F_GETFL);
    if (flags < 0 || ::fcntl(write_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw TransportError(std::string("Failed to make output non-blocking: ") + strerror(errno));
    }
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (read_fd_ >= 0) ::close(read_fd_);
    {
        std::lock_guard<std::timed_mutex> lock(write_mutex_);
        if (write_fd_ >= 0) ::close(write_fd_);
        write_fd_ = -1;
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    // shutdown() before start() means there is nothing to run.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;
    read_loop(on_message, on_error);
    connected_ = false;
    running_ = false;
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    FrameDecoder decoder;
    char chunk[4096];

    auto report = [&on_error](const std::string& what, bool framing) {
        if (!on_error) return;
        on_error(framing ? std::make_exception_ptr(FramingError(what))
                         : std::make_exception_ptr(TransportError(what)));
    };

    while (running_) {
        // poll() so that shutdown() can interrupt the blocking read via the
        // wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(std::string("poll failed: ") + strerror(errno), false);
            break;
        }

        // Wakeup pipe has data: shutdown() was called
        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to see EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!running_) break;
            report(std::string("Read error: ") + strerror(errno), false);
            break;
        }
        if (n == 0) break; // EOF: the server closed its stdout

        decoder.feed(std::string_view(chunk, static_cast<size_t>(n)));

        while (true) {
            std::optional<std::string> body;
            try {
                body = decoder.next();
            } catch (const FramingError& e) {
                report(e.what(), true);
                continue;
            }
            if (!body) break;

            JsonRpcMessage msg;
            try {
                msg = Codec::parse(*body);
            } catch (const FramingError& e) {
                report(e.what(), true);
                continue;
            }
            on_message(std::move(msg));
        }
    }
}

namespace {

// Milliseconds left until `deadline` for poll(), -1 for no deadline.
int poll_timeout(ITransport::Deadline deadline) {
    if (deadline == ITransport::Deadline::max()) return -1;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) return 0;
    return left.count() > INT_MAX ? INT_MAX : static_cast<int>(left.count());
}

} // anonymous namespace

void StdioTransport::write_all(const std::string& frame, Deadline deadline) {
    const char* data = frame.data();
    size_t remaining = frame.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written >= 0) {
            data += written;
            remaining -= static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw TransportError(std::string("Write error: ") + strerror(errno));
        }

        // Pipe full: wait for room, shutdown() or the deadline.
        struct pollfd fds[2];
        fds[0].fd = write_fd_;
        fds[0].events = POLLOUT;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, poll_timeout(deadline));
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + strerror(errno));
        }
        if (fds[1].revents & POLLIN) {
            throw TransportError("Transport shut down");
        }
        if (ret == 0) {
            if (remaining == frame.size()) {
                throw TimeoutError("Timed out waiting for the server to read its input");
            }
            // Half a frame is on the wire; nothing written after it could be
            // parsed, so the input is unusable from here on.
            ::close(write_fd_);
            write_fd_ = -1;
            throw TimeoutError("Timed out in the middle of a frame, server input closed");
        }
        // POLLERR/POLLHUP fall through to write(), which reports EPIPE.
    }
}

void StdioTransport::send(const JsonRpcMessage& msg, Deadline deadline) {
    // Throw only if permanently shut down, not if start() hasn't run yet.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string frame = Codec::encode_frame(msg);

    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (deadline == Deadline::max()) {
        lock.lock();
    } else if (!lock.try_lock_until(deadline)) {
        throw TimeoutError("Timed out waiting for another write to finish");
    }
    // A blocked writer released by shutdown() hands the lock on to us.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    if (write_fd_ < 0) {
        throw TransportError("Transport input closed");
    }
    write_all(frame, deadline);
}

void StdioTransport::close_input() {
    std::lock_guard<std::timed_mutex> lock(write_mutex_);
    if (write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    // The byte is never drained, so the reader and every blocked writer see it.
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace lspc
