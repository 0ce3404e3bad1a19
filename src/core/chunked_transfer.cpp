/**
 * @file chunked_transfer.cpp
 * @brief Implementation of the parallel range copy
 */

#include <kcenon/log_harvest/core/chunked_transfer.h>

#include <kcenon/log_harvest/core/file_io.h>
#include <kcenon/log_harvest/core/logging.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::log_harvest {

namespace {

/**
 * @brief State shared by all range tasks of one copy
 */
struct copy_state {
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> bytes_copied{0};
    std::mutex error_mutex;
    std::optional<error> first_error;

    void fail(error err) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
            first_error = std::move(err);
        }
        stop.store(true, std::memory_order_release);
    }

    [[nodiscard]] auto stopped() const noexcept -> bool {
        return stop.load(std::memory_order_acquire);
    }
};

/**
 * @brief Copy one range; returns early once any task has failed
 */
auto copy_range(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                const chunk_range& range,
                std::size_t buffer_size,
                const cancellation_token& token,
                copy_state& state) -> result<void> {
    auto in = file_handle::open_for_read(source, access_pattern::random);
    if (!in) {
        return unexpected(in.error());
    }
    auto out = file_handle::open_for_write(destination, access_pattern::random, false);
    if (!out) {
        return unexpected(out.error());
    }

    std::vector<std::byte> buffer(
        static_cast<std::size_t>(std::min<uint64_t>(buffer_size, std::max<uint64_t>(range.length, 1))));
    uint64_t position = range.offset;
    const uint64_t end = range.end();

    while (position < end) {
        if (state.stopped()) {
            return {};
        }
        if (auto check = token.check(); !check) {
            return check;
        }

        auto want = static_cast<std::size_t>(std::min<uint64_t>(buffer.size(), end - position));
        auto n = in.value().read_at(position, std::span<std::byte>(buffer.data(), want));
        if (!n) {
            return unexpected(n.error());
        }
        if (n.value() == 0) {
            return unexpected(error{
                error_code::short_read,
                "Unexpected end of " + source.string() + " at offset " +
                    std::to_string(position) + " in chunk " + std::to_string(range.index) +
                    " (" + std::to_string(end - position) + " bytes missing)"});
        }

        auto written = out.value().write_at(
            position, std::span<const std::byte>(buffer.data(), n.value()));
        if (!written) {
            return written;
        }

        position += n.value();
        state.bytes_copied.fetch_add(n.value(), std::memory_order_relaxed);
    }

    return out.value().close_checked();
}

}  // namespace

chunked_transfer::chunked_transfer(
    chunk_config config,
    std::shared_ptr<adapters::harvest_thread_pool_interface> pool)
    : config_(config), pool_(std::move(pool)) {
    if (!pool_) {
        pool_ = adapters::harvest_pool_factory::create(config_.chunk_count, "log_harvest_chunks");
    }
}

auto chunked_transfer::copy(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            uint64_t expected_size,
                            const cancellation_token& token) -> result<transfer_stats> {
    auto start = std::chrono::steady_clock::now();

    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (auto check = token.check(); !check) {
        return unexpected(check.error());
    }

    // Pre-size so every task writes inside an existing extent
    {
        auto out = file_handle::open_for_write(destination, access_pattern::random, true);
        if (!out) {
            return unexpected(out.error());
        }
        if (auto sized = out.value().resize(expected_size); !sized) {
            return unexpected(sized.error());
        }
        if (auto closed = out.value().close_checked(); !closed) {
            return unexpected(closed.error());
        }
    }

    const auto ranges = config_.partition(expected_size);
    const auto total = static_cast<uint32_t>(ranges.size());
    const std::size_t buffer_size = config_.chunk_buffer_size;

    LH_LOG_DEBUG(log_category::chunk,
        "Copying " + source.string() + " in " + std::to_string(total) + " chunks of ~" +
        std::to_string(total > 0 ? ranges.front().length : 0) + " bytes");

    auto state = std::make_shared<copy_state>();

    std::vector<std::future<void>> futures;
    futures.reserve(ranges.size());
    for (const auto& range : ranges) {
        futures.push_back(pool_->submit_to_stage(
            [source, destination, range, buffer_size, token, state, total]() {
                auto copied = copy_range(source, destination, range, buffer_size, token, *state);
                if (!copied) {
                    harvest_log_context ctx;
                    ctx.remote_path = source.string();
                    ctx.chunk_index = range.index;
                    ctx.total_chunks = total;
                    ctx.error_message = copied.error().message;
                    LH_LOG_WARN_CTX(log_category::chunk, "Chunk copy failed", ctx);
                    state->fail(copied.error());
                }
            },
            adapters::chunk_copy_stage));
    }

    // Wait for every task before returning: they reference the destination
    for (auto& future : futures) {
        try {
            future.get();
        } catch (const std::exception& e) {
            state->fail(error{error_code::transfer_failed,
                              std::string("Chunk task failed: ") + e.what()});
        } catch (...) {
            state->fail(error{error_code::transfer_failed, "Chunk task failed"});
        }
    }

    if (state->first_error) {
        return unexpected(*state->first_error);
    }

    const uint64_t copied = state->bytes_copied.load();
    if (copied != expected_size) {
        return unexpected(error{error_code::transfer_failed,
                                "Copied " + std::to_string(copied) + " of " +
                                    std::to_string(expected_size) + " bytes"});
    }

    transfer_stats stats;
    stats.bytes_copied = copied;
    stats.chunks = total;
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return stats;
}

}  // namespace kcenon::log_harvest
