/**
 * @file remote_file_locator.h
 * @brief Resolves a machine's log directory and finds its newest file
 */

#ifndef KCENON_LOG_HARVEST_CORE_REMOTE_FILE_LOCATOR_H
#define KCENON_LOG_HARVEST_CORE_REMOTE_FILE_LOCATOR_H

#include <kcenon/log_harvest/core/harvest_types.h>
#include <kcenon/log_harvest/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::log_harvest {

/**
 * @brief Metadata-only lookup of the most recently written log file
 *
 * Never opens or reads file contents.
 */
class remote_file_locator {
public:
    explicit remote_file_locator(std::string share_template = default_share_template);

    /**
     * @brief Substitute machine and item into the share template
     *
     * Every occurrence of {machine} and {item} is replaced; the rest of the
     * template is kept verbatim.
     */
    [[nodiscard]] auto resolve_remote_path(std::string_view machine,
                                           std::string_view item) const
        -> std::filesystem::path;

    /**
     * @brief Find the regular file with the latest write time
     * @param remote_directory Directory to enumerate (not recursive)
     * @return File metadata, path_not_accessible or no_files_found
     *
     * Equal write times are broken by the greatest file name. Entries that
     * vanish or cannot be stat'ed while enumerating are skipped.
     */
    [[nodiscard]] auto locate(const std::filesystem::path& remote_directory) const
        -> result<remote_file_ref>;

    [[nodiscard]] auto share_template() const -> const std::string& { return share_template_; }

private:
    std::string share_template_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_REMOTE_FILE_LOCATOR_H
