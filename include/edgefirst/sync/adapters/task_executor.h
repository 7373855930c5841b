// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_executor.h
 * @brief Executor adapter used by the transfer worker pool
 *
 * Provides a unified execution interface for part transfers, backed by
 * thread_system when it is available and by a built-in fixed set of worker
 * threads otherwise.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace edgefirst::sync::adapters {

/**
 * @brief Interface for running part transfer jobs
 */
class task_executor {
public:
    virtual ~task_executor() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the executor accepts work
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_executor : public task_executor {
public:
    explicit thread_system_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "edgefirst_sync_pool",
        size_t worker_count = 0);

    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    thread_system_executor& operator=(const thread_system_executor&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = auto-detect from hardware)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_executor> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "edgefirst_sync_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback executor with a fixed set of std::thread workers
 *
 * Tasks run in submission order. The destructor finishes queued tasks
 * before joining the workers.
 */
class thread_executor : public task_executor {
public:
    explicit thread_executor(size_t worker_count = 0);
    ~thread_executor() override;

    thread_executor(const thread_executor&) = delete;
    thread_executor& operator=(const thread_executor&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<size_t> outstanding_{0};
    bool stopping_ = false;
};

/**
 * @brief Creates the best available executor
 *
 * 1. thread_system_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. thread_executor (fallback)
 */
class executor_factory {
public:
    /**
     * @param worker_count Number of worker threads (0 = auto-detect)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<task_executor> create(
        size_t worker_count = 0,
        const std::string& pool_name = "edgefirst_sync_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace edgefirst::sync::adapters
