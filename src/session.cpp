#include "lspc/session.hpp"
#include "lspc/error.hpp"

namespace lspc {

const char* to_string(ClientState s) {
    switch (s) {
        case ClientState::Unstarted: return "unstarted";
        case ClientState::Running:   return "running";
        case ClientState::Stopped:   return "stopped";
    }
    return "unknown";
}

Session::Session() = default;

ClientState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ClientState::Unstarted) return false;
    state_ = ClientState::Running;
    return true;
}

bool Session::close(std::exception_ptr reason) {
    std::map<int64_t, std::promise<JsonRpcResponse>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ClientState::Stopped) return false;
        state_ = ClientState::Stopped;
        abandoned.swap(pending_requests_);
    }
    for (auto& entry : abandoned) {
        entry.second.set_exception(reason);
    }
    return true;
}

PendingCall Session::register_request(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != ClientState::Running) {
        throw NotRunningError(std::string("Client is ") + to_string(state_) + ", cannot send " + method);
    }
    int64_t id = next_id_++;
    std::promise<JsonRpcResponse> promise;
    PendingCall call{RequestId{id}, promise.get_future()};
    pending_requests_.emplace(id, std::move(promise));
    return call;
}

bool Session::complete_request(const JsonRpcResponse& resp) {
    // Only integer ids are ever issued.
    auto* int_id = std::get_if<int64_t>(&resp.id);
    if (!int_id) return false;

    std::promise<JsonRpcResponse> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_requests_.find(*int_id);
        if (it == pending_requests_.end()) return false;
        promise = std::move(it->second);
        pending_requests_.erase(it);
    }
    promise.set_value(resp);
    return true;
}

bool Session::remove_request(const RequestId& id) {
    auto* int_id = std::get_if<int64_t>(&id);
    if (!int_id) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_requests_.erase(*int_id) > 0;
}

bool Session::has_pending_request(const RequestId& id) const {
    auto* int_id = std::get_if<int64_t>(&id);
    if (!int_id) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_requests_.count(*int_id) > 0;
}

size_t Session::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_requests_.size();
}

} // namespace lspc
