#pragma once
#include "json_rpc.hpp"
#include <cstddef>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace lspc {

enum class ClientState {
    Unstarted,
    Running,
    Stopped
};

const char* to_string(ClientState s);

/// Handle returned to the caller that registered a request.
struct PendingCall {
    RequestId id;
    std::future<JsonRpcResponse> response;
};

/// Request bookkeeping for one client: lifecycle state, the id counter and
/// the table of calls waiting for a response. All members are guarded by one
/// mutex, so ids are unique and increasing across threads.
class Session {
public:
    Session();

    ClientState state() const;

    /// Unstarted -> Running. Returns false if the session was not Unstarted.
    bool begin();

    /// Moves to Stopped and fails every pending call with `reason`.
    /// Returns false if the session was already Stopped.
    bool close(std::exception_ptr reason);

    /// Allocate an id and register a pending call for it.
    /// Throws NotRunningError unless the session is Running.
    [[nodiscard]] PendingCall register_request(const std::string& method);

    /// Deliver a response to its pending call. Returns false for orphans.
    bool complete_request(const JsonRpcResponse& resp);

    /// Drop a pending call without delivering anything. Returns false if it
    /// was already completed or never existed.
    bool remove_request(const RequestId& id);

    bool has_pending_request(const RequestId& id) const;
    size_t pending_count() const;

private:
    mutable std::mutex mutex_;
    ClientState state_{ClientState::Unstarted};
    std::map<int64_t, std::promise<JsonRpcResponse>> pending_requests_;
    int64_t next_id_{1};
};

} // namespace lspc
