// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_executor.cpp
 * @brief Executor adapter implementation
 */

#include "edgefirst/sync/adapters/task_executor.h"

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace edgefirst::sync::adapters {

namespace {

size_t resolve_worker_count(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "part_transfer")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<size_t> outstanding{0};
};

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_executor::~thread_system_executor() {
    if (pimpl_ && pimpl_->pool) {
        // Drains queued jobs before the workers exit
        (void)pimpl_->pool->stop(false);
    }
}

std::shared_ptr<thread_system_executor>
thread_system_executor::create_default(size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_executor>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_executor::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* outstanding = &pimpl_->outstanding;
    outstanding->fetch_add(1, std::memory_order_relaxed);

    auto wrapped_task = [task = std::move(task), promise, outstanding]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        outstanding->fetch_sub(1, std::memory_order_relaxed);
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task));
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_executor::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_executor::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_executor::pending_tasks() const {
    return pimpl_->outstanding.load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_executor::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// thread_executor implementation
// ============================================================================

thread_executor::thread_executor(size_t worker_count) {
    worker_count = resolve_worker_count(worker_count);
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

thread_executor::~thread_executor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> thread_executor::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto future = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(packaged));
        outstanding_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
    return future;
}

void thread_executor::worker_loop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // Exceptions are stored in the task's future
        task();
        outstanding_.fetch_sub(1, std::memory_order_relaxed);
    }
}

size_t thread_executor::worker_count() const {
    return workers_.size();
}

bool thread_executor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t thread_executor::pending_tasks() const {
    return outstanding_.load(std::memory_order_relaxed);
}

// ============================================================================
// executor_factory implementation
// ============================================================================

std::shared_ptr<task_executor> executor_factory::create(size_t worker_count,
                                                        const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_executor::create_default(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<thread_executor>(worker_count);
#endif
}

}  // namespace edgefirst::sync::adapters
