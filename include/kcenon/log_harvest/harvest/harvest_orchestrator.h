/**
 * @file harvest_orchestrator.h
 * @brief Locate, copy and hand over the newest log of a machine
 *
 * @code
 * auto orchestrator = harvest_orchestrator::builder()
 *     .with_parallel_threshold(10 * 1024 * 1024)
 *     .with_chunk_count(4)
 *     .build();
 *
 * auto result = orchestrator.value().harvest({"WEB01", "OrderService"});
 * if (result.success) {
 *     open_viewer(*result.local_file_path);
 * }
 * @endcode
 */

#ifndef KCENON_LOG_HARVEST_HARVEST_HARVEST_ORCHESTRATOR_H
#define KCENON_LOG_HARVEST_HARVEST_HARVEST_ORCHESTRATOR_H

#include <kcenon/log_harvest/adapters/thread_pool_adapter.h>
#include <kcenon/log_harvest/core/cancellation.h>
#include <kcenon/log_harvest/core/harvest_types.h>
#include <kcenon/log_harvest/core/log_file_registry.h>
#include <kcenon/log_harvest/core/remote_file_locator.h>
#include <kcenon/log_harvest/core/transfer_strategy.h>
#include <kcenon/log_harvest/core/types.h>
#include <kcenon/log_harvest/core/workspace.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::log_harvest {

/**
 * @brief Harvest engine entry point
 *
 * Each call works in its own workspace and shares no mutable state with
 * other calls beyond the logger, the worker pools and the registry, so one
 * instance serves any number of concurrent harvests.
 */
class harvest_orchestrator {
public:
    /**
     * @brief Builder for harvest_orchestrator
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(harvest_config config) -> builder&;

        /**
         * @brief Set the remote directory template
         * @param share_template Path with {machine} and {item} placeholders
         */
        auto with_share_template(std::string share_template) -> builder&;

        /**
         * @brief Set the parent directory of per-harvest workspaces
         */
        auto with_workspace_root(std::filesystem::path root) -> builder&;

        /**
         * @brief Enable or disable the chunked strategy
         */
        auto with_parallel(bool enable) -> builder&;

        /**
         * @brief Set the size at which chunked copy takes over (inclusive)
         */
        auto with_parallel_threshold(uint64_t bytes) -> builder&;

        /**
         * @brief Set the number of ranges of a chunked copy
         */
        auto with_chunk_count(uint32_t count) -> builder&;

        /**
         * @brief Set the minimum range size; fewer ranges are used for small files
         */
        auto with_min_chunk_bytes(uint64_t bytes) -> builder&;

        auto with_sequential_buffer_size(std::size_t bytes) -> builder&;

        /**
         * @brief Set a deadline for each harvest (zero = none)
         */
        auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Compute a SHA-256 digest of every harvested file
         */
        auto with_sha256(bool enable) -> builder&;

        /**
         * @brief Size the default pools; effective with thread_system only
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Pool running chunk copy tasks
         */
        auto with_thread_pool(std::shared_ptr<adapters::harvest_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief Pool running per-machine tasks of harvest_many()
         *
         * Must not be the chunk pool when it has a fixed number of workers:
         * machine tasks block on chunk tasks.
         */
        auto with_fleet_pool(std::shared_ptr<adapters::harvest_thread_pool_interface> pool)
            -> builder&;

        /**
         * @brief Register every harvested file with this registry
         */
        auto with_registry(std::shared_ptr<log_file_registry> registry) -> builder&;

        /**
         * @brief Observe workspaces that could not be removed after a failure
         */
        auto with_cleanup_observer(cleanup_observer observer) -> builder&;

        /**
         * @brief Replace the function removing a workspace after a failure
         */
        auto with_workspace_remover(workspace_remover remover) -> builder&;

        /**
         * @brief Replace the strategy used below the parallel threshold
         */
        auto with_sequential_strategy(std::shared_ptr<transfer_strategy> strategy) -> builder&;

        /**
         * @brief Replace the strategy used at or above the parallel threshold
         */
        auto with_chunked_strategy(std::shared_ptr<transfer_strategy> strategy) -> builder&;

        /**
         * @brief Build the orchestrator
         * @return Orchestrator or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<harvest_orchestrator>;

    private:
        harvest_config config_;
        std::shared_ptr<adapters::harvest_thread_pool_interface> chunk_pool_;
        std::shared_ptr<adapters::harvest_thread_pool_interface> fleet_pool_;
        std::shared_ptr<log_file_registry> registry_;
        cleanup_observer observer_;
        workspace_remover remover_;
        std::shared_ptr<transfer_strategy> sequential_;
        std::shared_ptr<transfer_strategy> chunked_;
    };

    harvest_orchestrator(const harvest_orchestrator&) = delete;
    auto operator=(const harvest_orchestrator&) -> harvest_orchestrator& = delete;
    harvest_orchestrator(harvest_orchestrator&&) noexcept;
    auto operator=(harvest_orchestrator&&) noexcept -> harvest_orchestrator&;
    ~harvest_orchestrator();

    /**
     * @brief Harvest the newest log of one machine
     *
     * Never throws. On success the returned file and its workspace belong
     * to the caller; on failure no workspace is left behind.
     *
     * @param request Machine and item to harvest
     * @return Outcome with either local_file_path or error_message set
     */
    [[nodiscard]] auto harvest(const harvest_request& request) const noexcept -> harvest_result;

    /**
     * @brief Harvest with a caller-controlled token
     *
     * The configured timeout is not applied; the token alone decides.
     */
    [[nodiscard]] auto harvest(const harvest_request& request,
                               const cancellation_token& token) const noexcept
        -> harvest_result;

    /**
     * @brief Harvest the same item from many machines concurrently
     * @return One result per machine, in input order
     */
    [[nodiscard]] auto harvest_many(const std::vector<std::string>& machines,
                                    const std::string& item) const
        -> std::vector<harvest_result>;

    /**
     * @brief Fleet harvest sharing one token; cancelling it stops every machine
     */
    [[nodiscard]] auto harvest_many(const std::vector<std::string>& machines,
                                    const std::string& item,
                                    const cancellation_token& token) const
        -> std::vector<harvest_result>;

    /**
     * @brief Run harvest() on a background thread
     */
    [[nodiscard]] auto harvest_async(harvest_request request) const
        -> std::future<harvest_result>;

    /**
     * @brief Check a request before any I/O
     * @return invalid_request with the reason when rejected
     */
    [[nodiscard]] static auto validate_request(const harvest_request& request) -> result<void>;

    [[nodiscard]] auto config() const -> const harvest_config&;

    [[nodiscard]] auto locator() const -> const remote_file_locator&;

private:
    struct impl;

    explicit harvest_orchestrator(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_HARVEST_HARVEST_ORCHESTRATOR_H
