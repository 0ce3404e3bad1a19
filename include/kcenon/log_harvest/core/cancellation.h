/**
 * @file cancellation.h
 * @brief Deadline and cancellation flag shared by copy tasks
 */

#ifndef KCENON_LOG_HARVEST_CORE_CANCELLATION_H
#define KCENON_LOG_HARVEST_CORE_CANCELLATION_H

#include <kcenon/log_harvest/core/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace kcenon::log_harvest {

/**
 * @brief Cooperative cancellation token with an optional deadline
 *
 * Copies are shared cheaply: every copy observes the same state, so a
 * cancel() from any holder stops all chunk tasks of a harvest.
 */
class cancellation_token {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Token that never expires unless cancelled
     */
    cancellation_token() : state_(std::make_shared<shared_state>()) {}

    /**
     * @brief Token that expires after the given timeout (zero = never)
     */
    [[nodiscard]] static auto with_timeout(std::chrono::milliseconds timeout)
        -> cancellation_token {
        cancellation_token token;
        if (timeout.count() > 0) {
            token.state_->deadline = clock::now() + timeout;
        }
        return token;
    }

    void cancel() noexcept { state_->cancelled.store(true, std::memory_order_release); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto is_expired() const noexcept -> bool {
        return state_->deadline && clock::now() >= *state_->deadline;
    }

    /**
     * @brief Check the token between I/O operations
     * @return Error when cancelled or past the deadline
     */
    [[nodiscard]] auto check() const -> result<void> {
        if (is_cancelled()) {
            return unexpected(error{error_code::transfer_cancelled, "Harvest was cancelled"});
        }
        if (is_expired()) {
            return unexpected(error{error_code::transfer_timeout, "Harvest deadline exceeded"});
        }
        return {};
    }

private:
    struct shared_state {
        std::atomic<bool> cancelled{false};
        std::optional<clock::time_point> deadline;
    };

    std::shared_ptr<shared_state> state_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_CANCELLATION_H
