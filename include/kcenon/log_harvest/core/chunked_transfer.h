/**
 * @file chunked_transfer.h
 * @brief Parallel copy of disjoint byte ranges
 */

#ifndef KCENON_LOG_HARVEST_CORE_CHUNKED_TRANSFER_H
#define KCENON_LOG_HARVEST_CORE_CHUNKED_TRANSFER_H

#include <kcenon/log_harvest/adapters/thread_pool_adapter.h>
#include <kcenon/log_harvest/core/chunk_config.h>
#include <kcenon/log_harvest/core/transfer_strategy.h>

#include <memory>

namespace kcenon::log_harvest {

/**
 * @brief Copies a file of known size as K concurrent range copies
 *
 * The destination is pre-sized, then every range is copied by its own pool
 * task through its own read and write handles using positional I/O. A
 * failing task raises a shared stop flag so the others abandon their
 * ranges; the first failure is reported.
 *
 * @code
 * chunked_transfer copier(chunk_config{4}, pool);
 * auto stats = copier.copy(remote, local, size, cancellation_token{});
 * @endcode
 */
class chunked_transfer final : public transfer_strategy {
public:
    /**
     * @param config Range count and per-task buffer size
     * @param pool Pool running the range tasks; a default pool when null
     */
    explicit chunked_transfer(
        chunk_config config = chunk_config{},
        std::shared_ptr<adapters::harvest_thread_pool_interface> pool = nullptr);

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::chunked;
    }

    [[nodiscard]] auto copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            uint64_t expected_size,
                            const cancellation_token& token)
        -> result<transfer_stats> override;

    [[nodiscard]] auto config() const noexcept -> const chunk_config& { return config_; }

private:
    chunk_config config_;
    std::shared_ptr<adapters::harvest_thread_pool_interface> pool_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_CHUNKED_TRANSFER_H
