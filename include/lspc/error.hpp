#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace lspc {

class LspcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The server process could not be spawned, or the client cannot be started
/// from its current state.
class LaunchError : public LspcError {
public:
    using LspcError::LspcError;
};

/// Operation attempted before start, after stop, or after the server closed
/// its output.
class NotRunningError : public LspcError {
public:
    using LspcError::LspcError;
};

class TimeoutError : public LspcError {
public:
    using LspcError::LspcError;
};

/// The server answered with a JSON-RPC error object.
class ProtocolError : public LspcError {
public:
    int code;
    std::optional<nlohmann::json> data;
    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : LspcError(msg), code(code), data(std::move(data)) {}
};

/// Malformed header block or unparseable body.
class FramingError : public LspcError {
public:
    using LspcError::LspcError;
};

class TransportError : public LspcError {
public:
    using LspcError::LspcError;
};

namespace error {
    constexpr int ParseError           = -32700;
    constexpr int InvalidRequest       = -32600;
    constexpr int MethodNotFound       = -32601;
    constexpr int InvalidParams        = -32602;
    constexpr int InternalError        = -32603;
    constexpr int ServerNotInitialized = -32002;
    constexpr int RequestCancelled     = -32800;
    constexpr int ContentModified      = -32801;
} // namespace error

} // namespace lspc
