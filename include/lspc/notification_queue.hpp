#pragma once
#include "json_rpc.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace lspc {

/// Bounded queue of server-initiated messages (notifications and requests the
/// client does not answer). push() never blocks the reader thread: when the
/// queue is full the oldest message is dropped to make room.
class NotificationQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit NotificationQueue(size_t capacity = DEFAULT_CAPACITY);

    /// Returns false if an older message had to be dropped.
    bool push(JsonRpcMessage msg);

    [[nodiscard]] std::optional<JsonRpcMessage> try_pop();
    [[nodiscard]] std::optional<JsonRpcMessage> pop_for(std::chrono::milliseconds timeout);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] size_t dropped() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<JsonRpcMessage> queue_;
    size_t dropped_{0};
};

} // namespace lspc
