// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for chunk copies and fleet harvests
 *
 * Chunk tasks run on stage "chunk_copy", per-machine harvests on stage
 * "machine_harvest". Backed by thread_system when it is linked, otherwise
 * by std::async.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::log_harvest::adapters {

/// Stage name of range copy tasks
inline constexpr const char* chunk_copy_stage = "chunk_copy";

/// Stage name of per-machine harvest tasks
inline constexpr const char* machine_harvest_stage = "machine_harvest";

/**
 * @brief Interface for thread pool operations in log_harvest
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class harvest_thread_pool_interface {
public:
    virtual ~harvest_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task and count it against a stage until it finishes
     * @param task The task to execute
     * @param stage_name Stage the task belongs to
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Tasks of one stage submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

/**
 * @brief Per-stage counters of unfinished tasks
 */
class stage_tracker {
public:
    void increment(const std::string& stage_name);
    void decrement(const std::string& stage_name);
    [[nodiscard]] size_t count(const std::string& stage_name) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that runs harvest tasks on a thread_system thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_harvest_adapter : public harvest_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing, started thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_harvest_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "log_harvest_pool",
        size_t worker_count = 0);

    ~thread_system_harvest_adapter() override;

    thread_system_harvest_adapter(const thread_system_harvest_adapter&) = delete;
    thread_system_harvest_adapter& operator=(const thread_system_harvest_adapter&) = delete;

    /**
     * @brief Create a pool with the given number of workers and start it
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<thread_system_harvest_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "log_harvest_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool using one std::async thread per task
 *
 * Never queues: every submitted task starts immediately, so tasks that wait
 * on other tasks of the same pool cannot starve it.
 */
class async_harvest_pool : public harvest_thread_pool_interface {
public:
    async_harvest_pool();
    ~async_harvest_pool() override;

    async_harvest_pool(const async_harvest_pool&) = delete;
    async_harvest_pool& operator=(const async_harvest_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool implementation
 *
 * 1. thread_system_harvest_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_harvest_pool (fallback)
 *
 * worker_count sizes the thread_system pool only. The async fallback starts
 * one thread per submitted task and ignores it.
 */
class harvest_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<harvest_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "log_harvest_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::log_harvest::adapters
