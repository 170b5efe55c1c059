#include "lspc/notification_queue.hpp"

namespace lspc {

NotificationQueue::NotificationQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool NotificationQueue::push(JsonRpcMessage msg) {
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
            kept_all = false;
        }
        queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return kept_all;
}

std::optional<JsonRpcMessage> NotificationQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    JsonRpcMessage msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

std::optional<JsonRpcMessage> NotificationQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    JsonRpcMessage msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t NotificationQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace lspc
