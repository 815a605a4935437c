#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <string_view>
#include <utility>
#include <system_error>
#include <fmt/core.h>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <fcntl.h>
    #include <sys/ioctl.h>
    #include <sys/stat.h>
    #include <unistd.h>
    #ifdef __linux__
        #include <linux/fs.h>
    #endif
#endif

namespace ayumi::adapters::fs {

namespace {

auto last_os_error() -> std::error_code {
#ifdef _WIN32
    return {static_cast<int>(::GetLastError()), std::system_category()};
#else
    return {errno, std::system_category()};
#endif
}

#ifdef _WIN32
// \\.\PhysicalDrive1, \\.\E:: пространство имён устройств Win32
auto is_win32_device_path(const std::filesystem::path& path) -> bool {
    const auto text = path.native();
    return text.rfind(LR"(\\.\)", 0) == 0;
}
#endif

} // namespace

auto classify_target(const std::filesystem::path& target) -> TargetKind {
#ifdef _WIN32
    if (is_win32_device_path(target)) {
        return TargetKind::Device;
    }
#endif
    std::error_code ec;
    const auto status = std::filesystem::status(target, ec);
    if (ec) {
        // Несуществующий путь: будущий обычный файл
        return TargetKind::File;
    }
    if (std::filesystem::is_directory(status)) {
        return TargetKind::Directory;
    }
    if (std::filesystem::is_block_file(status) || std::filesystem::is_character_file(status)) {
        return TargetKind::Device;
    }
    return TargetKind::File;
}

auto resolve_destination(const std::filesystem::path& source,
                         const std::filesystem::path& target) -> Destination {
    const auto kind = classify_target(target);
    if (kind == TargetKind::Directory) {
        return Destination{.path = target / source.filename(), .kind = TargetKind::File};
    }
    return Destination{.path = target, .kind = kind};
}

auto same_file(const std::filesystem::path& a, const std::filesystem::path& b) -> bool {
    // Несуществующий путь ни с чем не совпадает
    std::error_code ec;
    return std::filesystem::equivalent(a, b, ec) && !ec;
}

// =============== FileHandle ===============

FileHandle::~FileHandle() {
    if (is_open()) {
#ifdef _WIN32
        ::CloseHandle(handle_);
#else
        ::close(handle_);
#endif
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : handle_(std::exchange(other.handle_, invalid())) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        FileHandle old(std::exchange(handle_, std::exchange(other.handle_, invalid())));
    }
    return *this;
}

auto FileHandle::invalid() -> native_type {
#ifdef _WIN32
    return INVALID_HANDLE_VALUE;
#else
    return -1;
#endif
}

auto FileHandle::is_open() const -> bool {
    return handle_ != invalid();
}

auto FileHandle::close() -> infra::VoidResult {
    if (!is_open()) {
        return {};
    }
    const auto handle = std::exchange(handle_, invalid());
#ifdef _WIN32
    if (!::CloseHandle(handle)) {
        return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "close failed", last_os_error()));
    }
#else
    if (::close(handle) != 0) {
        return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "close failed", last_os_error()));
    }
#endif
    return {};
}

// =============== Open ===============

auto open_for_read(const std::filesystem::path& path) -> infra::Result<FileHandle> {
#ifdef _WIN32
    HANDLE handle = ::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                                  OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
#else
    int handle = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (handle == -1) {
#endif
        return std::unexpected(infra::make_os_error(infra::ErrorCode::OpenError,
                                                    fmt::format("Cannot open source {}", path.string()),
                                                    last_os_error()));
    }
    return FileHandle{handle};
}

auto open_for_write(const Destination& destination) -> infra::Result<FileHandle> {
    const auto& path = destination.path;
    const bool raw = destination.kind == TargetKind::Device;
#ifdef _WIN32
    HANDLE handle = ::CreateFileW(path.c_str(), GENERIC_WRITE,
                                  raw ? (FILE_SHARE_READ | FILE_SHARE_WRITE) : 0, nullptr,
                                  raw ? OPEN_EXISTING : CREATE_ALWAYS,
                                  raw ? FILE_FLAG_WRITE_THROUGH : FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
#else
    // Устройство не усекается и не создаётся: пишем поверх с начала
    const int flags = raw ? (O_WRONLY | O_CLOEXEC) : (O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
    int handle = ::open(path.c_str(), flags, 0644);
    if (handle == -1) {
#endif
        return std::unexpected(infra::make_os_error(infra::ErrorCode::OpenError,
                                                    fmt::format("Cannot open destination {}", path.string()),
                                                    last_os_error()));
    }
    return FileHandle{handle};
}

// =============== Size ===============

auto size_of(const FileHandle& file) -> std::optional<std::uint64_t> {
#ifdef _WIN32
    LARGE_INTEGER size{};
    if (!::GetFileSizeEx(file.native(), &size)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size.QuadPart);
#else
    struct stat sb{};
    if (::fstat(file.native(), &sb) == -1) {
        return std::nullopt;
    }
    if (S_ISREG(sb.st_mode)) {
        return static_cast<std::uint64_t>(sb.st_size);
    }
#ifdef __linux__
    if (S_ISBLK(sb.st_mode)) {
        std::uint64_t bytes = 0;
        if (::ioctl(file.native(), BLKGETSIZE64, &bytes) == 0) {
            return bytes;
        }
    }
#endif
    return std::nullopt;
#endif
}

// =============== Read / Write ===============

auto read_some(const FileHandle& file, std::span<std::byte> buffer) -> infra::Result<std::size_t> {
#ifdef _WIN32
    DWORD bytes_read = 0;
    const auto request = static_cast<DWORD>(std::min<std::size_t>(buffer.size(), std::numeric_limits<DWORD>::max()));
    if (!::ReadFile(file.native(), buffer.data(), request, &bytes_read, nullptr)) {
        return std::unexpected(infra::make_os_error(infra::ErrorCode::ReadError, "Read failed", last_os_error()));
    }
    return static_cast<std::size_t>(bytes_read);
#else
    for (;;) {
        const ssize_t n = ::read(file.native(), buffer.data(), buffer.size());
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(infra::make_os_error(infra::ErrorCode::ReadError, "Read failed", last_os_error()));
        }
    }
#endif
}

auto write_all(const FileHandle& file, std::span<const std::byte> buffer) -> infra::VoidResult {
    while (!buffer.empty()) {
#ifdef _WIN32
        DWORD written = 0;
        const auto request = static_cast<DWORD>(std::min<std::size_t>(buffer.size(), std::numeric_limits<DWORD>::max()));
        if (!::WriteFile(file.native(), buffer.data(), request, &written, nullptr)) {
            return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "Write failed", last_os_error()));
        }
#else
        const ssize_t written = ::write(file.native(), buffer.data(), buffer.size());
        if (written < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "Write failed", last_os_error()));
        }
#endif
        if (written == 0) {
            return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "Write failed",
                                                        std::make_error_code(std::errc::no_space_on_device)));
        }
        buffer = buffer.subspan(static_cast<std::size_t>(written));
    }
    return {};
}

auto flush(const FileHandle& file) -> infra::VoidResult {
#ifdef _WIN32
    if (!::FlushFileBuffers(file.native())) {
        return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "Flush failed", last_os_error()));
    }
#else
    if (::fsync(file.native()) != 0) {
        // Символьные устройства и каналы fsync не поддерживают
        if (errno == EINVAL || errno == EROFS) {
            return {};
        }
        return std::unexpected(infra::make_os_error(infra::ErrorCode::WriteError, "Flush failed", last_os_error()));
    }
#endif
    return {};
}

} // namespace ayumi::adapters::fs
