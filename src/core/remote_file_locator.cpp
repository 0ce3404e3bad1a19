/**
 * @file remote_file_locator.cpp
 * @brief Implementation of newest-file lookup on remote shares
 */

#include <kcenon/log_harvest/core/remote_file_locator.h>

#include <kcenon/log_harvest/core/logging.h>

#include <optional>
#include <system_error>
#include <utility>

namespace kcenon::log_harvest {

namespace {

void replace_all(std::string& text, std::string_view token, std::string_view value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

auto not_accessible(const std::filesystem::path& dir) -> unexpected {
    return unexpected(error{error_code::path_not_accessible,
                            "Path not accessible: " + dir.string()});
}

}  // namespace

remote_file_locator::remote_file_locator(std::string share_template)
    : share_template_(std::move(share_template)) {}

auto remote_file_locator::resolve_remote_path(std::string_view machine,
                                              std::string_view item) const
    -> std::filesystem::path {
    std::string resolved = share_template_;
    replace_all(resolved, "{machine}", machine);
    replace_all(resolved, "{item}", item);
    return std::filesystem::path(resolved);
}

auto remote_file_locator::locate(const std::filesystem::path& remote_directory) const
    -> result<remote_file_ref> {
    std::error_code ec;
    if (!std::filesystem::is_directory(remote_directory, ec) || ec) {
        LH_LOG_DEBUG(log_category::locator,
            "Directory missing or unreachable: " + remote_directory.string() +
            (ec ? " (" + ec.message() + ")" : std::string()));
        return not_accessible(remote_directory);
    }

    std::filesystem::directory_iterator it(remote_directory, ec);
    if (ec) {
        LH_LOG_DEBUG(log_category::locator,
            "Cannot enumerate " + remote_directory.string() + ": " + ec.message());
        return not_accessible(remote_directory);
    }

    std::optional<remote_file_ref> newest;
    std::size_t skipped = 0;

    const auto end = std::filesystem::end(it);
    for (; it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
            if (entry_ec) ++skipped;
            continue;
        }

        auto write_time = entry.last_write_time(entry_ec);
        if (entry_ec) {
            ++skipped;
            continue;
        }
        auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            ++skipped;
            continue;
        }

        auto name = entry.path().filename().string();
        if (!newest || write_time > newest->last_write_time ||
            (write_time == newest->last_write_time && name > newest->name)) {
            remote_file_ref ref;
            ref.full_path = entry.path();
            ref.name = std::move(name);
            ref.size_bytes = static_cast<uint64_t>(size);
            ref.last_write_time = write_time;
            newest = std::move(ref);
        }
    }
    if (ec) {
        return not_accessible(remote_directory);
    }

    if (skipped > 0) {
        LH_LOG_DEBUG(log_category::locator,
            "Skipped " + std::to_string(skipped) + " entries that could not be inspected in " +
            remote_directory.string());
    }

    if (!newest) {
        return unexpected(error{error_code::no_files_found, "No log files found."});
    }

    LH_LOG_DEBUG(log_category::locator,
        "Newest file in " + remote_directory.string() + ": " + newest->name + " (" +
        std::to_string(newest->size_bytes) + " bytes)");
    return std::move(*newest);
}

}  // namespace kcenon::log_harvest
