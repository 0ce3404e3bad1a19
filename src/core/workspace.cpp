/**
 * @file workspace.cpp
 * @brief Implementation of per-harvest workspaces
 */

#include <kcenon/log_harvest/core/workspace.h>

#include <kcenon/log_harvest/core/logging.h>

#include <array>
#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

namespace kcenon::log_harvest {

auto workspace::generate_id() -> std::string {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    std::array<uint8_t, 16> bytes{};
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

auto workspace::create(const std::filesystem::path& root, workspace_remover remover)
    -> result<workspace> {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        LH_LOG_ERROR(log_category::workspace,
            "Cannot create workspace root " + root.string() + ": " + ec.message());
        return unexpected(error{error_code::workspace_create_failed,
                                "Cannot create workspace root " + root.string() + ": " +
                                    ec.message()});
    }

    auto id = generate_id();
    auto dir = root / id;

    // create_directory reports false for an existing directory, which would
    // mean an id collision with another harvest
    bool created = std::filesystem::create_directory(dir, ec);
    if (ec || !created) {
        auto reason = ec ? ec.message() : std::string("directory already exists");
        LH_LOG_ERROR(log_category::workspace,
            "Cannot create workspace " + dir.string() + ": " + reason);
        return unexpected(error{error_code::workspace_create_failed,
                                "Cannot create workspace " + dir.string() + ": " + reason});
    }

    LH_LOG_DEBUG(log_category::workspace, "Created workspace " + dir.string());
    return workspace(std::move(dir), std::move(id), std::move(remover));
}

workspace::workspace(std::filesystem::path path, std::string id, workspace_remover remover) noexcept
    : path_(std::move(path)), id_(std::move(id)), remover_(std::move(remover)), active_(true) {}

void workspace::remove_tree(std::error_code& ec) const {
    if (remover_) {
        remover_(path_, ec);
    } else {
        std::filesystem::remove_all(path_, ec);
    }
}

workspace::~workspace() {
    if (!active_) {
        return;
    }
    std::error_code ec;
    try {
        remove_tree(ec);
    } catch (const std::exception& e) {
        LH_LOG_WARN(log_category::workspace,
            "Abandoned workspace could not be removed " + path_.string() + ": " + e.what());
        return;
    }
    if (ec) {
        LH_LOG_WARN(log_category::workspace,
            "Abandoned workspace could not be removed " + path_.string() + ": " + ec.message());
    }
}

workspace::workspace(workspace&& other) noexcept
    : path_(std::move(other.path_)),
      id_(std::move(other.id_)),
      remover_(std::move(other.remover_)),
      active_(std::exchange(other.active_, false)) {}

auto workspace::operator=(workspace&& other) noexcept -> workspace& {
    if (this != &other) {
        if (active_) {
            std::error_code ec;
            try {
                remove_tree(ec);
            } catch (const std::exception& e) {
                LH_LOG_WARN(log_category::workspace,
                    "Replaced workspace could not be removed " + path_.string() + ": " + e.what());
            }
        }
        path_ = std::move(other.path_);
        id_ = std::move(other.id_);
        remover_ = std::move(other.remover_);
        active_ = std::exchange(other.active_, false);
    }
    return *this;
}

auto workspace::release() noexcept -> std::filesystem::path {
    active_ = false;
    return path_;
}

auto workspace::discard() -> result<void> {
    if (!active_) {
        return {};
    }
    active_ = false;

    std::error_code ec;
    try {
        remove_tree(ec);
    } catch (const std::exception& e) {
        return unexpected(error{error_code::workspace_cleanup_failed,
                                "Cannot remove workspace " + path_.string() + ": " + e.what()});
    }
    if (ec) {
        return unexpected(error{error_code::workspace_cleanup_failed,
                                "Cannot remove workspace " + path_.string() + ": " +
                                    ec.message()});
    }

    LH_LOG_DEBUG(log_category::workspace, "Removed workspace " + path_.string());
    return {};
}

}  // namespace kcenon::log_harvest
