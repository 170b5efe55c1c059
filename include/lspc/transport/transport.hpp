#pragma once
#include "../json_rpc.hpp"
#include <chrono>
#include <exception>
#include <functional>

namespace lspc {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Callback for recoverable read-side errors (bad frames); the loop keeps going.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop on the calling thread. Returns when the peer closes
    /// its output or shutdown() is called.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    using Deadline = std::chrono::steady_clock::time_point;

    /// Write one message. Returns once the whole frame has been written.
    /// Throws TimeoutError if the frame cannot be written by `deadline`.
    virtual void send(const JsonRpcMessage& msg, Deadline deadline) = 0;

    /// Write one message with no deadline. shutdown() still interrupts it.
    void send(const JsonRpcMessage& msg) { send(msg, Deadline::max()); }

    /// Close the outbound direction, signalling end of input to the peer.
    virtual void close_input() = 0;

    /// Stop the read loop, interrupt a blocked send and refuse further sends.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace lspc
