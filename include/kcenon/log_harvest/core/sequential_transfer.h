/**
 * @file sequential_transfer.h
 * @brief Forward-only streaming copy with a large buffer
 */

#ifndef KCENON_LOG_HARVEST_CORE_SEQUENTIAL_TRANSFER_H
#define KCENON_LOG_HARVEST_CORE_SEQUENTIAL_TRANSFER_H

#include <kcenon/log_harvest/core/transfer_strategy.h>

#include <cstddef>

namespace kcenon::log_harvest {

/**
 * @brief Streams the source until end of file
 *
 * A file that grows during the copy is taken as a best-effort snapshot of
 * the bytes present at each read, so the copied length may exceed the
 * size seen at enumeration.
 */
class sequential_transfer final : public transfer_strategy {
public:
    explicit sequential_transfer(
        std::size_t buffer_size = harvest_config::default_sequential_buffer);

    [[nodiscard]] auto mode() const noexcept -> transfer_mode override {
        return transfer_mode::sequential;
    }

    [[nodiscard]] auto copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            uint64_t expected_size,
                            const cancellation_token& token)
        -> result<transfer_stats> override;

    [[nodiscard]] auto buffer_size() const noexcept -> std::size_t { return buffer_size_; }

private:
    std::size_t buffer_size_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_SEQUENTIAL_TRANSFER_H
