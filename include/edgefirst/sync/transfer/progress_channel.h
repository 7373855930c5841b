/**
 * @file progress_channel.h
 * @brief Bounded, drop-oldest progress notification channel
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_PROGRESS_CHANNEL_H
#define EDGEFIRST_SYNC_TRANSFER_PROGRESS_CHANNEL_H

#include "edgefirst/sync/transfer/transfer_types.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Single-producer, single-consumer progress channel
 *
 * push() never blocks: when the channel is full the oldest pending update is
 * discarded. Progress is best-effort and must not slow a transfer down.
 *
 * @code
 * auto progress = std::make_shared<progress_channel>(64);
 * std::thread consumer([&] {
 *     while (auto update = progress->wait_pop_for(std::chrono::seconds(1))) {
 *         render(*update);
 *     }
 * });
 * engine.upload(path, key, progress);
 * progress->close();
 * @endcode
 */
class progress_channel {
public:
    explicit progress_channel(std::size_t capacity = 64);

    /**
     * @brief Enqueue an update, dropping the oldest one if full
     * @return false if the channel is closed
     */
    auto push(const transfer_progress& update) -> bool;

    [[nodiscard]] auto try_pop() -> std::optional<transfer_progress>;

    /**
     * @brief Wait up to @p timeout for an update
     *
     * Returns nullopt on timeout, or once the channel is closed and empty.
     */
    [[nodiscard]] auto wait_pop_for(std::chrono::milliseconds timeout)
        -> std::optional<transfer_progress>;

    /**
     * @brief Remove and return every pending update
     */
    [[nodiscard]] auto drain() -> std::vector<transfer_progress>;

    /**
     * @brief Stop accepting updates and wake waiting consumers
     */
    void close();

    [[nodiscard]] auto is_closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    /**
     * @brief Updates discarded because the consumer fell behind
     */
    [[nodiscard]] auto dropped() const -> std::size_t;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<transfer_progress> queue_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_PROGRESS_CHANNEL_H
