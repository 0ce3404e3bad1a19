/**
 * @file file_io.h
 * @brief Native file handles with access-pattern hints and positional I/O
 */

#ifndef KCENON_LOG_HARVEST_CORE_FILE_IO_H
#define KCENON_LOG_HARVEST_CORE_FILE_IO_H

#include <kcenon/log_harvest/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>

namespace kcenon::log_harvest {

/**
 * @brief Access pattern hint passed to the operating system on open
 */
enum class access_pattern {
    sequential,  ///< Forward-only streaming; lets the OS read ahead
    random       ///< Positional access at arbitrary offsets
};

/**
 * @brief Move-only owner of a native file handle
 *
 * Read handles never lock the file: the remote process may keep appending
 * to the log while it is copied. All operations report failures through
 * result<T> with the OS error text; nothing throws.
 */
class file_handle {
public:
#if defined(_WIN32)
    using native_handle_type = void*;
#else
    using native_handle_type = int;
#endif

    /**
     * @brief Open an existing file for reading
     * @param path File to open
     * @param pattern Access pattern hint
     */
    [[nodiscard]] static auto open_for_read(
        const std::filesystem::path& path,
        access_pattern pattern) -> result<file_handle>;

    /**
     * @brief Open a file for writing, creating it if needed
     * @param path File to open
     * @param pattern Access pattern hint
     * @param truncate Discard existing content
     */
    [[nodiscard]] static auto open_for_write(
        const std::filesystem::path& path,
        access_pattern pattern,
        bool truncate) -> result<file_handle>;

    file_handle() noexcept;
    ~file_handle();

    file_handle(file_handle&& other) noexcept;
    auto operator=(file_handle&& other) noexcept -> file_handle&;

    file_handle(const file_handle&) = delete;
    auto operator=(const file_handle&) -> file_handle& = delete;

    /**
     * @brief Read at the current position
     * @return Bytes read; 0 at end of file
     */
    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t>;

    /**
     * @brief Read at an absolute offset without moving the position
     * @return Bytes read; 0 at end of file
     */
    [[nodiscard]] auto read_at(uint64_t offset, std::span<std::byte> buffer)
        -> result<std::size_t>;

    /**
     * @brief Write the whole buffer at the current position
     */
    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Write the whole buffer at an absolute offset
     */
    [[nodiscard]] auto write_at(uint64_t offset, std::span<const std::byte> data)
        -> result<void>;

    /**
     * @brief Set the file length, extending with zeros or truncating
     */
    [[nodiscard]] auto resize(uint64_t size) -> result<void>;

    [[nodiscard]] auto is_open() const noexcept -> bool;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /**
     * @brief Close the handle and report the OS result
     *
     * Deferred write-back failures (ENOSPC, EIO on delayed allocation or
     * network file systems) surface here as file_write_error. The handle is
     * released whether or not the close succeeds.
     */
    [[nodiscard]] auto close_checked() -> result<void>;

    void close() noexcept;

private:
    file_handle(native_handle_type handle, std::filesystem::path path) noexcept;

    native_handle_type handle_;
    std::filesystem::path path_;
};

}  // namespace kcenon::log_harvest

#endif  // KCENON_LOG_HARVEST_CORE_FILE_IO_H
