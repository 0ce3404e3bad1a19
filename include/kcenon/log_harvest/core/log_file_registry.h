/**
 * @file log_file_registry.h
 * @brief Tracks harvested files for later bulk cleanup
 */

#ifndef KCENON_LOG_HARVEST_CORE_LOG_FILE_REGISTRY_H
#define KCENON_LOG_HARVEST_CORE_LOG_FILE_REGISTRY_H

#include <kcenon/log_harvest/core/types.h>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::log_harvest {

/**
 * @brief Outcome counters of log_file_registry::cleanup_all()
 */
struct cleanup_statistics {
    std::size_t files_deleted = 0;
    std::size_t files_already_deleted = 0;
    std::size_t files_failed = 0;
    std::size_t directories_deleted = 0;
    std::size_t directories_failed = 0;

    [[nodiscard]] auto total_files_processed() const noexcept -> std::size_t {
        return files_deleted + files_already_deleted + files_failed;
    }

    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Thread-safe list of harvested files owned by the caller
 *
 * cleanup_all() deletes every tracked file, then the directories that held
 * them once empty (deepest first), then the workspace root if it is empty.
 *
 * @code
 * auto registry = std::make_shared<log_file_registry>(config.workspace_root);
 * auto orchestrator = harvest_orchestrator::builder().with_registry(registry).build();
 * // ...
 * auto stats = registry->cleanup_all();
 * @endcode
 */
class log_file_registry {
public:
    explicit log_file_registry(std::filesystem::path workspace_root);

    log_file_registry(const log_file_registry&) = delete;
    auto operator=(const log_file_registry&) -> log_file_registry& = delete;

    /**
     * @brief Track a file; empty paths are ignored
     */
    void register_file(const std::filesystem::path& file);

    /**
     * @brief Stop tracking a file and optionally delete it now
     * @param file Tracked or untracked path
     * @param delete_file Delete the file and its directory if left empty
     * @return Error when the path is empty or deletion failed
     */
    [[nodiscard]] auto remove_file(const std::filesystem::path& file, bool delete_file = true)
        -> result<void>;

    /**
     * @brief Delete everything tracked and forget it
     *
     * Safe to call repeatedly and concurrently with register_file().
     */
    auto cleanup_all() -> cleanup_statistics;

    [[nodiscard]] auto tracked_count() const -> std::size_t;

    [[nodiscard]] auto tracked_files() const -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto workspace_root() const -> const std::filesystem::path& {
        return workspace_root_;
    }

private:
    std::filesystem::path workspace_root_;
    std::vector<std::filesystem::path> files_;
    mutable std::mutex files_mutex_;
    std::mutex cleanup_mutex_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_LOG_FILE_REGISTRY_H
