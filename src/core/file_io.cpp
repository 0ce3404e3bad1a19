/**
 * @file file_io.cpp
 * @brief Native file handle implementation (POSIX and Win32)
 */

#include <kcenon/log_harvest/core/file_io.h>

#include <algorithm>
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace kcenon::log_harvest {

namespace {

#if defined(_WIN32)
const file_handle::native_handle_type invalid_handle = INVALID_HANDLE_VALUE;

auto last_os_error() -> std::string {
    return std::system_category().message(static_cast<int>(::GetLastError()));
}

// ReadFile/WriteFile take a DWORD length
constexpr std::size_t max_io_size = 64 * 1024 * 1024;
#else
const file_handle::native_handle_type invalid_handle = -1;

auto last_os_error() -> std::string {
    return std::system_category().message(errno);
}
#endif

auto io_error(error_code code, const char* what, const std::filesystem::path& path)
    -> unexpected {
    auto reason = last_os_error();
    return unexpected(error{code, std::string(what) + " " + path.string() + ": " + reason});
}

}  // namespace

file_handle::file_handle() noexcept : handle_(invalid_handle) {}

file_handle::file_handle(native_handle_type handle, std::filesystem::path path) noexcept
    : handle_(handle), path_(std::move(path)) {}

file_handle::~file_handle() {
    close();
}

file_handle::file_handle(file_handle&& other) noexcept
    : handle_(std::exchange(other.handle_, invalid_handle)),
      path_(std::move(other.path_)) {}

auto file_handle::operator=(file_handle&& other) noexcept -> file_handle& {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, invalid_handle);
        path_ = std::move(other.path_);
    }
    return *this;
}

auto file_handle::is_open() const noexcept -> bool {
    return handle_ != invalid_handle;
}

#if defined(_WIN32)

auto file_handle::open_for_read(const std::filesystem::path& path, access_pattern pattern)
    -> result<file_handle> {
    DWORD flags = FILE_ATTRIBUTE_NORMAL |
                  (pattern == access_pattern::sequential ? FILE_FLAG_SEQUENTIAL_SCAN
                                                         : FILE_FLAG_RANDOM_ACCESS);
    HANDLE h = ::CreateFileW(path.c_str(), GENERIC_READ,
                             FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING, flags, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return io_error(error_code::file_open_error, "cannot open", path);
    }
    return file_handle(h, path);
}

auto file_handle::open_for_write(const std::filesystem::path& path,
                                 access_pattern pattern,
                                 bool truncate) -> result<file_handle> {
    DWORD flags = FILE_ATTRIBUTE_NORMAL |
                  (pattern == access_pattern::sequential ? FILE_FLAG_SEQUENTIAL_SCAN
                                                         : FILE_FLAG_RANDOM_ACCESS);
    HANDLE h = ::CreateFileW(path.c_str(), GENERIC_WRITE,
                             FILE_SHARE_READ | FILE_SHARE_WRITE,
                             nullptr, truncate ? CREATE_ALWAYS : OPEN_ALWAYS, flags, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return io_error(error_code::file_open_error, "cannot create", path);
    }
    return file_handle(h, path);
}

auto file_handle::read(std::span<std::byte> buffer) -> result<std::size_t> {
    DWORD bytes_read = 0;
    auto size = static_cast<DWORD>(std::min(buffer.size(), max_io_size));
    if (!::ReadFile(handle_, buffer.data(), size, &bytes_read, nullptr)) {
        return io_error(error_code::file_read_error, "read failed on", path_);
    }
    return static_cast<std::size_t>(bytes_read);
}

auto file_handle::read_at(uint64_t offset, std::span<std::byte> buffer)
    -> result<std::size_t> {
    OVERLAPPED ov{};
    ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFFu);
    ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
    DWORD bytes_read = 0;
    auto size = static_cast<DWORD>(std::min(buffer.size(), max_io_size));
    if (!::ReadFile(handle_, buffer.data(), size, &bytes_read, &ov)) {
        if (::GetLastError() == ERROR_HANDLE_EOF) {
            return std::size_t{0};
        }
        return io_error(error_code::file_read_error, "read failed on", path_);
    }
    return static_cast<std::size_t>(bytes_read);
}

auto file_handle::write(std::span<const std::byte> data) -> result<void> {
    while (!data.empty()) {
        DWORD written = 0;
        auto size = static_cast<DWORD>(std::min(data.size(), max_io_size));
        if (!::WriteFile(handle_, data.data(), size, &written, nullptr)) {
            return io_error(error_code::file_write_error, "write failed on", path_);
        }
        data = data.subspan(written);
    }
    return {};
}

auto file_handle::write_at(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    while (!data.empty()) {
        OVERLAPPED ov{};
        ov.Offset = static_cast<DWORD>(offset & 0xFFFFFFFFu);
        ov.OffsetHigh = static_cast<DWORD>(offset >> 32);
        DWORD written = 0;
        auto size = static_cast<DWORD>(std::min(data.size(), max_io_size));
        if (!::WriteFile(handle_, data.data(), size, &written, &ov)) {
            return io_error(error_code::file_write_error, "write failed on", path_);
        }
        data = data.subspan(written);
        offset += written;
    }
    return {};
}

auto file_handle::resize(uint64_t size) -> result<void> {
    FILE_END_OF_FILE_INFO info{};
    info.EndOfFile.QuadPart = static_cast<LONGLONG>(size);
    if (!::SetFileInformationByHandle(handle_, FileEndOfFileInfo, &info, sizeof(info))) {
        return io_error(error_code::file_write_error, "cannot resize", path_);
    }
    return {};
}

auto file_handle::close_checked() -> result<void> {
    if (handle_ == invalid_handle) {
        return {};
    }
    HANDLE h = std::exchange(handle_, invalid_handle);
    if (!::CloseHandle(h)) {
        return io_error(error_code::file_write_error, "close failed on", path_);
    }
    return {};
}

void file_handle::close() noexcept {
    if (handle_ != invalid_handle) {
        ::CloseHandle(handle_);
        handle_ = invalid_handle;
    }
}

#else  // POSIX

namespace {

void advise(int fd, access_pattern pattern) {
#if defined(POSIX_FADV_SEQUENTIAL)
    // Advisory only; a refusal does not affect correctness
    (void)::posix_fadvise(fd, 0, 0,
                          pattern == access_pattern::sequential ? POSIX_FADV_SEQUENTIAL
                                                                : POSIX_FADV_RANDOM);
#else
    (void)fd;
    (void)pattern;
#endif
}

}  // namespace

auto file_handle::open_for_read(const std::filesystem::path& path, access_pattern pattern)
    -> result<file_handle> {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return io_error(error_code::file_open_error, "cannot open", path);
    }
    advise(fd, pattern);
    return file_handle(fd, path);
}

auto file_handle::open_for_write(const std::filesystem::path& path,
                                 access_pattern pattern,
                                 bool truncate) -> result<file_handle> {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return io_error(error_code::file_open_error, "cannot create", path);
    }
    advise(fd, pattern);
    return file_handle(fd, path);
}

auto file_handle::read(std::span<std::byte> buffer) -> result<std::size_t> {
    for (;;) {
        auto n = ::read(handle_, buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return io_error(error_code::file_read_error, "read failed on", path_);
        }
    }
}

auto file_handle::read_at(uint64_t offset, std::span<std::byte> buffer)
    -> result<std::size_t> {
    for (;;) {
        auto n = ::pread(handle_, buffer.data(), buffer.size(), static_cast<off_t>(offset));
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return io_error(error_code::file_read_error, "read failed on", path_);
        }
    }
}

auto file_handle::write(std::span<const std::byte> data) -> result<void> {
    while (!data.empty()) {
        auto n = ::write(handle_, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(error_code::file_write_error, "write failed on", path_);
        }
        data = data.subspan(static_cast<std::size_t>(n));
    }
    return {};
}

auto file_handle::write_at(uint64_t offset, std::span<const std::byte> data) -> result<void> {
    while (!data.empty()) {
        auto n = ::pwrite(handle_, data.data(), data.size(), static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error(error_code::file_write_error, "write failed on", path_);
        }
        data = data.subspan(static_cast<std::size_t>(n));
        offset += static_cast<uint64_t>(n);
    }
    return {};
}

auto file_handle::resize(uint64_t size) -> result<void> {
    if (::ftruncate(handle_, static_cast<off_t>(size)) != 0) {
        return io_error(error_code::file_write_error, "cannot resize", path_);
    }
    return {};
}

auto file_handle::close_checked() -> result<void> {
    if (handle_ == invalid_handle) {
        return {};
    }
    // The descriptor is released even when close reports EINTR or EIO
    int fd = std::exchange(handle_, invalid_handle);
    if (::close(fd) != 0 && errno != EINTR) {
        return io_error(error_code::file_write_error, "close failed on", path_);
    }
    return {};
}

void file_handle::close() noexcept {
    if (handle_ != invalid_handle) {
        ::close(handle_);
        handle_ = invalid_handle;
    }
}

#endif

}  // namespace kcenon::log_harvest
