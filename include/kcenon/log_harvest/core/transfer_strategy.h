/**
 * @file transfer_strategy.h
 * @brief Interface of a single-file copy mechanism
 */

#ifndef KCENON_LOG_HARVEST_CORE_TRANSFER_STRATEGY_H
#define KCENON_LOG_HARVEST_CORE_TRANSFER_STRATEGY_H

#include <kcenon/log_harvest/core/cancellation.h>
#include <kcenon/log_harvest/core/harvest_types.h>
#include <kcenon/log_harvest/core/types.h>

#include <cstdint>
#include <filesystem>

namespace kcenon::log_harvest {

/**
 * @brief Copies one remote file to a local destination
 *
 * Implementations never remove the destination on failure; the caller owns
 * the workspace it lives in and discards it as a whole.
 */
class transfer_strategy {
public:
    virtual ~transfer_strategy() = default;

    [[nodiscard]] virtual auto mode() const noexcept -> transfer_mode = 0;

    /**
     * @brief Copy source to destination
     * @param source Remote file
     * @param destination Local file, created or truncated
     * @param expected_size Size reported by enumeration
     * @param token Checked between I/O operations
     * @return Copy statistics or the first error encountered
     */
    [[nodiscard]] virtual auto copy(const std::filesystem::path& source,
                                    const std::filesystem::path& destination,
                                    uint64_t expected_size,
                                    const cancellation_token& token)
        -> result<transfer_stats> = 0;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_TRANSFER_STRATEGY_H
