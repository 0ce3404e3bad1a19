/**
 * @file chunk_config.h
 * @brief Configuration and range planning for parallel chunked copies
 */

#ifndef KCENON_LOG_HARVEST_CORE_CHUNK_CONFIG_H
#define KCENON_LOG_HARVEST_CORE_CHUNK_CONFIG_H

#include <kcenon/log_harvest/core/types.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::log_harvest {

/**
 * @brief Contiguous byte range of a source file copied by one task
 */
struct chunk_range {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] constexpr auto end() const noexcept -> uint64_t {
        return offset + length;
    }

    [[nodiscard]] constexpr auto operator==(const chunk_range& other) const noexcept
        -> bool = default;
};

/**
 * @brief Configuration for chunked copy operations
 */
struct chunk_config {
    /// Default number of concurrent ranges
    static constexpr uint32_t default_chunk_count = 4;

    /// Maximum allowed number of ranges
    static constexpr uint32_t max_chunk_count = 64;

    /// Default per-task read/write buffer (1MB)
    static constexpr std::size_t default_buffer_size = 1024 * 1024;

    /// Minimum allowed per-task buffer (4KB)
    static constexpr std::size_t min_buffer_size = 4 * 1024;

    /// Maximum allowed per-task buffer (64MB)
    static constexpr std::size_t max_buffer_size = 64 * 1024 * 1024;

    /// Number of ranges the file is split into
    uint32_t chunk_count = default_chunk_count;

    /// Sub-buffer used by each task
    std::size_t chunk_buffer_size = default_buffer_size;

    /// When non-zero, no range is planned smaller than this (adaptive fan-out)
    uint64_t min_chunk_bytes = 0;

    chunk_config() = default;

    explicit chunk_config(uint32_t count) : chunk_count(count) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_count == 0 || chunk_count > max_chunk_count) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk count must be between 1 and " + std::to_string(max_chunk_count)});
        }
        if (chunk_buffer_size < min_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk buffer too small (minimum: " + std::to_string(min_buffer_size) + ")"});
        }
        if (chunk_buffer_size > max_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk buffer too large (maximum: " + std::to_string(max_buffer_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Number of ranges actually used for a file of the given size
     *
     * Equals chunk_count unless min_chunk_bytes is set, in which case the
     * fan-out shrinks so that every range holds at least min_chunk_bytes.
     * Never more ranges than bytes, never fewer than one.
     */
    [[nodiscard]] auto effective_chunk_count(uint64_t file_size) const -> uint32_t {
        uint64_t count = chunk_count;
        if (min_chunk_bytes > 0) {
            count = std::min<uint64_t>(count, file_size / min_chunk_bytes);
        }
        count = std::min<uint64_t>(count, std::max<uint64_t>(file_size, 1));
        return static_cast<uint32_t>(std::max<uint64_t>(count, 1));
    }

    /**
     * @brief Split [0, file_size) into contiguous, non-overlapping ranges
     *
     * Every range has file_size / count bytes except the last, which also
     * takes the remainder of the division.
     */
    [[nodiscard]] auto partition(uint64_t file_size) const -> std::vector<chunk_range> {
        const uint32_t count = effective_chunk_count(file_size);
        const uint64_t base = file_size / count;

        std::vector<chunk_range> ranges;
        ranges.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            chunk_range range;
            range.index = i;
            range.offset = base * i;
            range.length = (i == count - 1) ? file_size - range.offset : base;
            ranges.push_back(range);
        }
        return ranges;
    }
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_CHUNK_CONFIG_H
