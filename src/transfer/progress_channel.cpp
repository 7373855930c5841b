/**
 * @file progress_channel.cpp
 * @brief Bounded, drop-oldest progress notification channel
 */

#include "edgefirst/sync/transfer/progress_channel.h"

#include <algorithm>

namespace edgefirst::sync {

progress_channel::progress_channel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto progress_channel::push(const transfer_progress& update) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(update);
    }
    cv_.notify_one();
    return true;
}

auto progress_channel::try_pop() -> std::optional<transfer_progress> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto update = queue_.front();
    queue_.pop_front();
    return update;
}

auto progress_channel::wait_pop_for(std::chrono::milliseconds timeout)
    -> std::optional<transfer_progress> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto update = queue_.front();
    queue_.pop_front();
    return update;
}

auto progress_channel::drain() -> std::vector<transfer_progress> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<transfer_progress> out(queue_.begin(), queue_.end());
    queue_.clear();
    return out;
}

void progress_channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto progress_channel::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto progress_channel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

auto progress_channel::dropped() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

}  // namespace edgefirst::sync
