/**
 * @file checksum.h
 * @brief SHA-256 digests of harvested files
 */

#ifndef KCENON_LOG_HARVEST_CORE_CHECKSUM_H
#define KCENON_LOG_HARVEST_CORE_CHECKSUM_H

#include <kcenon/log_harvest/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::log_harvest {

/**
 * @brief SHA-256 helpers used to fingerprint local copies
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return Lowercase hex digest, or error if the file cannot be read
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of an in-memory buffer
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_CHECKSUM_H
