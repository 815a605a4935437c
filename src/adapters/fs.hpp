#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include "infra/error_handler/error.hpp"

namespace ayumi::adapters::fs {

enum class TargetKind {
    File,        // обычный файл: create-or-truncate
    Directory,   // точка монтирования: образ пишется внутрь под своим именем
    Device,      // блочное/символьное устройство: без усечения, с нулевого смещения
};

[[nodiscard]] auto classify_target(const std::filesystem::path& target) -> TargetKind;

struct Destination {
    std::filesystem::path path;
    TargetKind kind;
};

/// Куда реально пойдёт запись для данной пары источник/цель.
[[nodiscard]] auto resolve_destination(const std::filesystem::path& source,
                                       const std::filesystem::path& target) -> Destination;

/// true, если оба пути существуют и ведут к одному и тому же файлу.
[[nodiscard]] auto same_file(const std::filesystem::path& a, const std::filesystem::path& b) -> bool;

// Владеющая обёртка над дескриптором ОС
class FileHandle {
public:
#ifdef _WIN32
    using native_type = void*;
#else
    using native_type = int;
#endif

    FileHandle() = default;
    explicit FileHandle(native_type handle) : handle_(handle) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    [[nodiscard]] auto is_open() const -> bool;
    [[nodiscard]] auto native() const -> native_type { return handle_; }

    /// Закрывает дескриптор; ошибка close() на устройстве означает потерю данных.
    [[nodiscard]] auto close() -> infra::VoidResult;

private:
    static auto invalid() -> native_type;

    native_type handle_ = invalid();
};

[[nodiscard]] auto open_for_read(const std::filesystem::path& path) -> infra::Result<FileHandle>;

[[nodiscard]] auto open_for_write(const Destination& destination) -> infra::Result<FileHandle>;

/// Длина файла или ёмкость устройства; nullopt, если ОС её не сообщает.
[[nodiscard]] auto size_of(const FileHandle& file) -> std::optional<std::uint64_t>;

/// Читает до buffer.size() байт; 0: конец данных.
[[nodiscard]] auto read_some(const FileHandle& file, std::span<std::byte> buffer)
    -> infra::Result<std::size_t>;

/// Пишет весь буфер, повторяя частичные записи.
[[nodiscard]] auto write_all(const FileHandle& file, std::span<const std::byte> buffer)
    -> infra::VoidResult;

/// Сбрасывает данные на носитель.
[[nodiscard]] auto flush(const FileHandle& file) -> infra::VoidResult;

} // namespace ayumi::adapters::fs
