/**
 * @file sequential_transfer.cpp
 * @brief Implementation of the streaming copy
 */

#include <kcenon/log_harvest/core/sequential_transfer.h>

#include <kcenon/log_harvest/core/file_io.h>
#include <kcenon/log_harvest/core/logging.h>

#include <chrono>
#include <vector>

namespace kcenon::log_harvest {

sequential_transfer::sequential_transfer(std::size_t buffer_size)
    : buffer_size_(buffer_size > 0 ? buffer_size : harvest_config::default_sequential_buffer) {}

auto sequential_transfer::copy(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               uint64_t expected_size,
                               const cancellation_token& token) -> result<transfer_stats> {
    auto start = std::chrono::steady_clock::now();

    if (auto check = token.check(); !check) {
        return unexpected(check.error());
    }

    auto in = file_handle::open_for_read(source, access_pattern::sequential);
    if (!in) {
        return unexpected(in.error());
    }
    auto out = file_handle::open_for_write(destination, access_pattern::sequential, true);
    if (!out) {
        return unexpected(out.error());
    }

    std::vector<std::byte> buffer(buffer_size_);
    uint64_t copied = 0;

    for (;;) {
        if (auto check = token.check(); !check) {
            return unexpected(check.error());
        }

        auto n = in.value().read(buffer);
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            break;
        }

        auto written = out.value().write(std::span<const std::byte>(buffer.data(), n.value()));
        if (!written) {
            return unexpected(written.error());
        }
        copied += n.value();
    }

    if (auto closed = out.value().close_checked(); !closed) {
        return unexpected(closed.error());
    }

    transfer_stats stats;
    stats.bytes_copied = copied;
    stats.chunks = 1;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (copied < expected_size) {
        // Truncated or rotated between enumeration and copy
        LH_LOG_WARN(log_category::transfer,
            "Copied " + std::to_string(copied) + " of " + std::to_string(expected_size) +
            " bytes from " + source.string() + "; file shrank during harvest");
    }

    return stats;
}

}  // namespace kcenon::log_harvest
