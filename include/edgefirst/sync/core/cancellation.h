/**
 * @file cancellation.h
 * @brief Shared cancellation signal for transfer sessions
 */

#ifndef EDGEFIRST_SYNC_CORE_CANCELLATION_H
#define EDGEFIRST_SYNC_CORE_CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace edgefirst::sync {

/**
 * @brief Copyable handle to a one-way cancellation flag
 *
 * Copies share state: cancelling any copy cancels all of them. Waiting
 * threads are woken as soon as cancel() is called.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for up to @p delay
     * @return true if the token was cancelled before or during the wait
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> delay) const -> bool {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, delay, [this] { return state_->cancelled; });
    }

private:
    struct state {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<state> state_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CORE_CANCELLATION_H
