/**
 * @file worker_pool.cpp
 * @brief Bounded gate limiting concurrent part transfers
 */

#include "edgefirst/sync/transfer/worker_pool.h"

#include "edgefirst/sync/core/logging.h"

#include <algorithm>
#include <vector>

namespace edgefirst::sync {

transfer_worker_pool::transfer_worker_pool(std::size_t capacity,
                                           std::shared_ptr<adapters::task_executor> executor)
    : capacity_(std::max<std::size_t>(capacity, 1)), executor_(std::move(executor)) {
    if (!executor_) {
        executor_ = adapters::executor_factory::create(capacity_, "edgefirst_sync_transfer");
    }
    EDGEFIRST_LOG_DEBUG(log_category::pool,
        "Worker pool created with capacity " + std::to_string(capacity_) +
        " on " + std::to_string(executor_->worker_count()) + " workers");
}

transfer_worker_pool::~transfer_worker_pool() {
    wait_idle();
}

void transfer_worker_pool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(job));
        ++submitted_;
    }
    dispatch();
}

void transfer_worker_pool::take_ready(std::vector<std::function<void()>>& ready) {
    while (in_flight_ < capacity_ && !pending_.empty()) {
        ready.push_back(std::move(pending_.front()));
        pending_.pop_front();
        ++in_flight_;
        peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    }
}

void transfer_worker_pool::run(std::vector<std::function<void()>>& ready) {
    for (auto& job : ready) {
        (void)executor_->submit([this, job = std::move(job)] {
            job();
            on_complete();
        });
    }
}

void transfer_worker_pool::dispatch() {
    std::vector<std::function<void()>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        take_ready(ready);
    }
    run(ready);
}

void transfer_worker_pool::on_complete() {
    std::vector<std::function<void()>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
        ++completed_;
        take_ready(ready);
        if (in_flight_ == 0 && pending_.empty()) {
            // The pool may be destroyed as soon as the lock is released
            idle_cv_.notify_all();
            return;
        }
    }
    run(ready);
}

void transfer_worker_pool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return in_flight_ == 0 && pending_.empty(); });
}

auto transfer_worker_pool::in_flight() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

auto transfer_worker_pool::peak_in_flight() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_flight_;
}

auto transfer_worker_pool::submitted() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_;
}

auto transfer_worker_pool::completed() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

auto transfer_worker_pool::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace edgefirst::sync
