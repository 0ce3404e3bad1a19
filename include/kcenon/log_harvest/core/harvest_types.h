/**
 * @file harvest_types.h
 * @brief Request, result and configuration types for log harvesting
 */

#ifndef KCENON_LOG_HARVEST_CORE_HARVEST_TYPES_H
#define KCENON_LOG_HARVEST_CORE_HARVEST_TYPES_H

#include <kcenon/log_harvest/core/chunk_config.h>
#include <kcenon/log_harvest/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace kcenon::log_harvest {

/**
 * @brief Identifies one log to harvest: a machine and a log item on it
 */
struct harvest_request {
    std::string machine;
    std::string item;
};

/**
 * @brief Metadata of a file found on a remote share
 */
struct remote_file_ref {
    std::filesystem::path full_path;
    std::string name;
    uint64_t size_bytes = 0;
    std::filesystem::file_time_type last_write_time{};
};

/**
 * @brief Copy mechanism used for a harvest
 */
enum class transfer_mode {
    none,
    sequential,
    chunked
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) noexcept -> const char* {
    switch (mode) {
        case transfer_mode::none: return "none";
        case transfer_mode::sequential: return "sequential";
        case transfer_mode::chunked: return "chunked";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of a single copy performed by a transfer strategy
 */
struct transfer_stats {
    uint64_t bytes_copied = 0;
    uint32_t chunks = 1;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Result of a harvest call
 *
 * Exactly one of local_file_path (success) and error_message (failure) is
 * set. On success the caller owns the file and its workspace directory.
 */
struct harvest_result {
    std::string machine_name;
    std::string item_name;
    bool success = false;
    std::optional<std::filesystem::path> local_file_path;
    std::optional<std::string> error_message;
    error_code code = error_code::success;

    std::optional<remote_file_ref> remote_file;
    transfer_mode mode = transfer_mode::none;
    uint64_t bytes_copied = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<std::string> sha256_hash;

    [[nodiscard]] auto failure() const noexcept -> failure_kind {
        return classify(code);
    }
};

/**
 * @brief Hook invoked when a workspace could not be removed after a failure
 *
 * Receives the directory left behind and the reason removal failed.
 */
using cleanup_observer =
    std::function<void(const std::filesystem::path&, const std::string&)>;

/**
 * @brief Default share path of a machine's log directory
 */
inline constexpr const char* default_share_template = R"(\\{machine}\D$\Proj\LogFiles\{item})";

/**
 * @brief Default workspace root: <temp>/XceleratorLogs
 */
[[nodiscard]] inline auto default_workspace_root() -> std::filesystem::path {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = std::filesystem::path(".");
    }
    return temp / "XceleratorLogs";
}

/**
 * @brief Harvest engine configuration
 */
struct harvest_config {
    /// Default sequential buffer (8MB)
    static constexpr std::size_t default_sequential_buffer = 8 * 1024 * 1024;

    /// Minimum sequential buffer (4KB)
    static constexpr std::size_t min_sequential_buffer = 4 * 1024;

    /// Maximum sequential buffer (256MB)
    static constexpr std::size_t max_sequential_buffer = 256 * 1024 * 1024;

    /// Default size at which chunked copy takes over (10MB)
    static constexpr uint64_t default_parallel_threshold = 10 * 1024 * 1024;

    /// Remote directory template; {machine} and {item} are substituted
    std::string share_template = default_share_template;

    /// Parent directory of all per-harvest workspaces
    std::filesystem::path workspace_root = default_workspace_root();

    std::size_t sequential_buffer_size = default_sequential_buffer;

    /// Chunked copy is used for files at or above parallel_threshold
    bool enable_parallel = true;
    uint64_t parallel_threshold = default_parallel_threshold;

    chunk_config chunks;

    /// Deadline for a whole harvest; zero disables it
    std::chrono::milliseconds harvest_timeout{0};

    /// Fill harvest_result::sha256_hash after a successful copy
    bool compute_sha256 = false;

    /// Worker threads for chunk and fleet tasks (0 = hardware concurrency).
    /// Applies to the thread_system backend only; the async fallback ignores it.
    std::size_t worker_count = 0;

    [[nodiscard]] auto validate() const -> result<void> {
        if (share_template.find("{machine}") == std::string::npos) {
            return unexpected(error{error_code::invalid_configuration,
                                    "share template must contain {machine}"});
        }
        if (workspace_root.empty()) {
            return unexpected(error{error_code::invalid_configuration,
                                    "workspace root is empty"});
        }
        if (sequential_buffer_size < min_sequential_buffer ||
            sequential_buffer_size > max_sequential_buffer) {
            return unexpected(error{
                error_code::invalid_configuration,
                "sequential buffer must be between " + std::to_string(min_sequential_buffer) +
                    " and " + std::to_string(max_sequential_buffer) + " bytes"});
        }
        if (enable_parallel && parallel_threshold == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "parallel threshold must be greater than zero"});
        }
        if (harvest_timeout.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "harvest timeout must not be negative"});
        }
        return chunks.validate();
    }

    /**
     * @brief Strategy a file of the given size is routed to
     *
     * The threshold is inclusive on the chunked side.
     */
    [[nodiscard]] auto select_mode(uint64_t file_size) const noexcept -> transfer_mode {
        if (enable_parallel && file_size >= parallel_threshold) {
            return transfer_mode::chunked;
        }
        return transfer_mode::sequential;
    }
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_HARVEST_TYPES_H
