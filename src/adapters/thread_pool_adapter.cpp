// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for log_harvest
 */

#include "kcenon/log_harvest/adapters/thread_pool_adapter.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::log_harvest::adapters {

namespace {

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// stage_tracker
// ============================================================================

void stage_tracker::increment(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[stage_name];
}

void stage_tracker::decrement(const std::string& stage_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    if (it != counts_.end() && it->second > 0) {
        --it->second;
    }
}

size_t stage_tracker::count(const std::string& stage_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(stage_name);
    return it != counts_.end() ? it->second : 0;
}

// ============================================================================
// thread_system_harvest_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Run a task, release the stage, then forward its outcome to the promise
 */
void run_staged(const std::function<void()>& task,
                std::promise<void>& promise,
                stage_tracker* tracker,
                const std::string& stage) {
    std::exception_ptr failure;
    try {
        task();
    } catch (...) {
        failure = std::current_exception();
    }
    if (tracker) {
        tracker->decrement(stage);
    }
    if (failure) {
        promise.set_exception(failure);
    } else {
        promise.set_value();
    }
}

}  // namespace

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
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

struct thread_system_harvest_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
};

thread_system_harvest_adapter::thread_system_harvest_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_harvest_adapter::~thread_system_harvest_adapter() = default;

std::shared_ptr<thread_system_harvest_adapter>
thread_system_harvest_adapter::create_default(size_t worker_count,
                                              const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_harvest_adapter>(
        std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_harvest_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<function_job>(
        [task = std::move(task), promise]() {
            run_staged(task, *promise, nullptr, {});
        },
        "harvest_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

std::future<void> thread_system_harvest_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* tracker = &pimpl_->tracker;
    auto job = std::make_unique<function_job>(
        [task = std::move(task), promise, tracker, stage = stage_name]() {
            run_staged(task, *promise, tracker, stage);
        },
        stage_name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_harvest_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_harvest_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_harvest_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_harvest_adapter::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_harvest_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_harvest_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_harvest_pool
// ============================================================================

// Shared with running tasks so counters stay valid if the pool goes first
struct async_harvest_pool::impl {
    std::atomic<size_t> active_tasks{0};
    stage_tracker tracker;
};

async_harvest_pool::async_harvest_pool()
    : pimpl_(std::make_shared<impl>()) {}

async_harvest_pool::~async_harvest_pool() = default;

std::future<void> async_harvest_pool::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [state = pimpl_, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                      });
}

std::future<void> async_harvest_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [state = pimpl_, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                              state->tracker.decrement(stage);
                              throw;
                          }
                          state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
                          state->tracker.decrement(stage);
                      });
}

size_t async_harvest_pool::worker_count() const {
    return default_worker_count(0);
}

bool async_harvest_pool::is_running() const { return true; }

size_t async_harvest_pool::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

size_t async_harvest_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// harvest_pool_factory
// ============================================================================

std::shared_ptr<harvest_thread_pool_interface> harvest_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_harvest_adapter::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_harvest_pool>();
#endif
}

}  // namespace kcenon::log_harvest::adapters
