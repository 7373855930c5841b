/**
 * @file worker_pool.h
 * @brief Bounded gate limiting concurrent part transfers
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_WORKER_POOL_H
#define EDGEFIRST_SYNC_TRANSFER_WORKER_POOL_H

#include "edgefirst/sync/adapters/task_executor.h"
#include "edgefirst/sync/core/types.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Shared pool of part transfer slots
 *
 * Jobs queue in submission order and at most capacity() of them run on the
 * executor at once, across every session that shares the pool. The pool is
 * an ordinary object: create one per engine, or a small one per test.
 *
 * @code
 * auto pool = std::make_shared<transfer_worker_pool>(4);
 * auto token = pool->submit<std::string>([] () -> result<std::string> {
 *     return std::string("etag");
 * });
 * auto etag = token.get();
 * @endcode
 */
class transfer_worker_pool {
public:
    /**
     * @param capacity Concurrent slots (values below 1 are raised to 1)
     * @param executor Where jobs run; defaults to executor_factory::create(capacity)
     */
    explicit transfer_worker_pool(std::size_t capacity,
                                  std::shared_ptr<adapters::task_executor> executor = nullptr);

    /**
     * @brief Blocks until every queued and running job has finished
     */
    ~transfer_worker_pool();

    transfer_worker_pool(const transfer_worker_pool&) = delete;
    auto operator=(const transfer_worker_pool&) -> transfer_worker_pool& = delete;

    /**
     * @brief Queue a job and get its result asynchronously
     */
    template <typename T>
    [[nodiscard]] auto submit(std::function<result<T>()> job) -> std::future<result<T>> {
        auto task = std::make_shared<std::packaged_task<result<T>()>>(std::move(job));
        auto future = task->get_future();
        enqueue([task] { (*task)(); });
        return future;
    }

    /**
     * @brief Block until no job is queued or running
     */
    void wait_idle();

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto in_flight() const -> std::size_t;
    [[nodiscard]] auto peak_in_flight() const -> std::size_t;
    [[nodiscard]] auto submitted() const -> std::size_t;
    [[nodiscard]] auto completed() const -> std::size_t;
    [[nodiscard]] auto pending() const -> std::size_t;

private:
    void enqueue(std::function<void()> job);
    void take_ready(std::vector<std::function<void()>>& ready);
    void run(std::vector<std::function<void()>>& ready);
    void dispatch();
    void on_complete();

    const std::size_t capacity_;
    std::shared_ptr<adapters::task_executor> executor_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> pending_;
    std::size_t in_flight_ = 0;
    std::size_t peak_in_flight_ = 0;
    std::size_t submitted_ = 0;
    std::size_t completed_ = 0;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_WORKER_POOL_H
