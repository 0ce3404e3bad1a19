/**
 * @file types.h
 * @brief Core type definitions for log_harvest
 */

#ifndef KCENON_LOG_HARVEST_CORE_TYPES_H
#define KCENON_LOG_HARVEST_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::log_harvest {

/**
 * @brief Error codes for harvest operations
 *
 * Error code ranges:
 * - -100 to -119: Request Errors
 * - -120 to -139: Remote Share Errors
 * - -140 to -159: Workspace Errors
 * - -160 to -179: Transfer Errors
 * - -180 to -199: Configuration Errors
 * - -200 to -219: Internal Errors
 */
enum class error_code {
    success = 0,

    // Request errors (-100 to -119)
    invalid_request = -100,

    // Remote share errors (-120 to -139)
    path_not_accessible = -120,
    no_files_found = -121,

    // Workspace errors (-140 to -159)
    workspace_create_failed = -140,
    workspace_cleanup_failed = -141,

    // Transfer errors (-160 to -179)
    file_open_error = -160,
    file_read_error = -161,
    file_write_error = -162,
    short_read = -163,
    transfer_timeout = -164,
    transfer_cancelled = -165,
    transfer_failed = -166,

    // Configuration errors (-180 to -199)
    invalid_configuration = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::path_not_accessible:
            return "path not accessible";
        case error_code::no_files_found:
            return "no files found";
        case error_code::workspace_create_failed:
            return "workspace creation failed";
        case error_code::workspace_cleanup_failed:
            return "workspace cleanup failed";
        case error_code::file_open_error:
            return "file open error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::short_read:
            return "source ended before range was copied";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Coarse failure classes reported to callers
 *
 * Callers cannot act differently on an unreachable host, a missing share
 * or a permission error, so all of them map to path_not_accessible.
 */
enum class failure_kind {
    none,
    validation,
    path_not_accessible,
    no_files_found,
    transfer_failure
};

[[nodiscard]] constexpr auto classify(error_code code) noexcept -> failure_kind {
    switch (code) {
        case error_code::success:
            return failure_kind::none;
        case error_code::invalid_request:
        case error_code::invalid_configuration:
            return failure_kind::validation;
        case error_code::path_not_accessible:
            return failure_kind::path_not_accessible;
        case error_code::no_files_found:
            return failure_kind::no_files_found;
        default:
            return failure_kind::transfer_failure;
    }
}

[[nodiscard]] constexpr auto to_string(failure_kind kind) noexcept -> const char* {
    switch (kind) {
        case failure_kind::none: return "none";
        case failure_kind::validation: return "validation_error";
        case failure_kind::path_not_accessible: return "path_not_accessible";
        case failure_kind::no_files_found: return "no_files_found";
        case failure_kind::transfer_failure: return "transfer_failure";
        default: return "unknown";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_TYPES_H
