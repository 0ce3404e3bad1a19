/**
 * @file log_file_registry.cpp
 * @brief Implementation of harvested file tracking and cleanup
 */

#include <kcenon/log_harvest/core/log_file_registry.h>

#include <kcenon/log_harvest/core/logging.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>

namespace kcenon::log_harvest {

namespace {

// A directory that no longer exists is neither empty nor an error
auto is_empty_directory(const std::filesystem::path& dir, std::error_code& ec) -> bool {
    auto status = std::filesystem::status(dir, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        ec.clear();
        return false;
    }
    if (ec || status.type() != std::filesystem::file_type::directory) {
        return false;
    }
    return std::filesystem::is_empty(dir, ec) && !ec;
}

}  // namespace

auto cleanup_statistics::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "Files: " << files_deleted << " deleted, " << files_already_deleted
        << " already deleted, " << files_failed << " failed | Directories: "
        << directories_deleted << " deleted, " << directories_failed << " failed";
    return oss.str();
}

log_file_registry::log_file_registry(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

void log_file_registry::register_file(const std::filesystem::path& file) {
    if (file.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        files_.push_back(file);
    }
    LH_LOG_DEBUG(log_category::registry, "Registered " + file.string() + " for cleanup");
}

auto log_file_registry::remove_file(const std::filesystem::path& file, bool delete_file)
    -> result<void> {
    if (file.empty()) {
        return unexpected(error{error_code::invalid_request, "File path is empty"});
    }

    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        files_.erase(std::remove(files_.begin(), files_.end(), file), files_.end());
    }

    if (!delete_file) {
        return {};
    }

    std::error_code ec;
    if (std::filesystem::exists(file, ec)) {
        std::filesystem::remove(file, ec);
        if (ec) {
            LH_LOG_WARN(log_category::registry,
                "Cannot delete " + file.string() + ": " + ec.message());
            return unexpected(error{error_code::workspace_cleanup_failed,
                                    "Cannot delete " + file.string() + ": " + ec.message()});
        }

        auto parent = file.parent_path();
        if (!parent.empty() && is_empty_directory(parent, ec)) {
            std::filesystem::remove(parent, ec);
            if (ec) {
                return unexpected(error{error_code::workspace_cleanup_failed,
                                        "Cannot remove directory " + parent.string() + ": " +
                                            ec.message()});
            }
        }
    } else if (ec) {
        return unexpected(error{error_code::workspace_cleanup_failed,
                                "Cannot inspect " + file.string() + ": " + ec.message()});
    }

    return {};
}

auto log_file_registry::cleanup_all() -> cleanup_statistics {
    std::lock_guard<std::mutex> cleanup_lock(cleanup_mutex_);

    std::vector<std::filesystem::path> files;
    {
        std::lock_guard<std::mutex> lock(files_mutex_);
        files.swap(files_);
    }

    LH_LOG_INFO(log_category::registry,
        "Starting cleanup of " + std::to_string(files.size()) + " harvested files");

    cleanup_statistics stats;
    std::set<std::filesystem::path> directories;

    for (const auto& file : files) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            if (ec) {
                ++stats.files_failed;
                LH_LOG_WARN(log_category::registry,
                    "Cannot inspect " + file.string() + ": " + ec.message());
            } else {
                ++stats.files_already_deleted;
            }
            continue;
        }

        std::filesystem::remove(file, ec);
        if (ec) {
            ++stats.files_failed;
            LH_LOG_WARN(log_category::registry,
                "Cannot delete " + file.string() + ": " + ec.message());
            continue;
        }

        ++stats.files_deleted;
        if (file.has_parent_path()) {
            directories.insert(file.parent_path());
        }
    }

    // Deepest first so nested workspaces empty their parents
    std::vector<std::filesystem::path> ordered(directories.begin(), directories.end());
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.native().size() > b.native().size(); });

    for (const auto& dir : ordered) {
        std::error_code ec;
        if (!is_empty_directory(dir, ec)) {
            if (ec) {
                ++stats.directories_failed;
            }
            continue;
        }
        std::filesystem::remove(dir, ec);
        if (ec) {
            ++stats.directories_failed;
            LH_LOG_WARN(log_category::registry,
                "Cannot remove directory " + dir.string() + ": " + ec.message());
        } else {
            ++stats.directories_deleted;
        }
    }

    if (!workspace_root_.empty()) {
        std::error_code ec;
        if (is_empty_directory(workspace_root_, ec)) {
            std::filesystem::remove(workspace_root_, ec);
            if (ec) {
                LH_LOG_WARN(log_category::registry,
                    "Cannot remove workspace root " + workspace_root_.string() + ": " +
                    ec.message());
            } else {
                ++stats.directories_deleted;
            }
        }
    }

    LH_LOG_INFO(log_category::registry, "Cleanup completed: " + stats.to_string());
    return stats;
}

auto log_file_registry::tracked_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(files_mutex_);
    return files_.size();
}

auto log_file_registry::tracked_files() const -> std::vector<std::filesystem::path> {
    std::lock_guard<std::mutex> lock(files_mutex_);
    return files_;
}

}  // namespace kcenon::log_harvest
