/**
 * @file workspace.h
 * @brief Per-harvest temporary directory with failure cleanup
 */

#ifndef KCENON_LOG_HARVEST_CORE_WORKSPACE_H
#define KCENON_LOG_HARVEST_CORE_WORKSPACE_H

#include <kcenon/log_harvest/core/types.h>

#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace kcenon::log_harvest {

/**
 * @brief Removes a workspace directory tree, reporting failure through ec
 *
 * Defaults to std::filesystem::remove_all.
 */
using workspace_remover =
    std::function<void(const std::filesystem::path&, std::error_code&)>;

/**
 * @brief Uniquely named scratch directory owned by one harvest call
 *
 * The directory lives at <root>/<uuid>. It is removed when the workspace
 * is discarded or destroyed, unless release() handed it to the caller.
 */
class workspace {
public:
    /**
     * @brief Create a fresh workspace under the given root
     * @param root Parent directory; created if missing
     * @param remover Used by discard() and the destructor; remove_all when empty
     * @return Workspace or workspace_create_failed
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root,
                                     workspace_remover remover = {}) -> result<workspace>;

    /**
     * @brief Generate a random RFC 4122 version 4 identifier
     */
    [[nodiscard]] static auto generate_id() -> std::string;

    ~workspace();

    workspace(workspace&& other) noexcept;
    auto operator=(workspace&& other) noexcept -> workspace&;

    workspace(const workspace&) = delete;
    auto operator=(const workspace&) -> workspace& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto id() const -> const std::string& { return id_; }

    /**
     * @brief Hand the directory over to the caller; it is no longer removed
     * @return Directory path
     */
    auto release() noexcept -> std::filesystem::path;

    /**
     * @brief Remove the directory and everything in it now
     * @return workspace_cleanup_failed with the OS reason on failure
     */
    [[nodiscard]] auto discard() -> result<void>;

    [[nodiscard]] auto is_active() const noexcept -> bool { return active_; }

private:
    workspace(std::filesystem::path path, std::string id, workspace_remover remover) noexcept;

    void remove_tree(std::error_code& ec) const;

    std::filesystem::path path_;
    std::string id_;
    workspace_remover remover_;
    bool active_ = false;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_WORKSPACE_H
