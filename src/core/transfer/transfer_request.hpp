#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "core/device/device.hpp"
#include "infra/error_handler/error.hpp"

namespace ayumi::core {

/// Проверенный снимок запроса на запись.
///
/// Создаётся только через validate(); после создания не меняется, поэтому
/// последующий выбор другого файла или устройства в интерфейсе не влияет
/// на уже запущенную запись. Устройство хранится копией идентификатора,
/// а не живым дескриптором.
class TransferRequest {
public:
    [[nodiscard]] auto source_path() const -> const std::filesystem::path& { return source_path_; }
    [[nodiscard]] auto target() const -> const std::string& { return target_; }
    [[nodiscard]] auto target_label() const -> const std::string& { return target_label_; }
    [[nodiscard]] auto target_kind() const -> DeviceKind { return target_kind_; }
    [[nodiscard]] auto target_capacity() const -> std::optional<std::uint64_t> { return target_capacity_; }
    [[nodiscard]] auto source_size() const -> std::optional<std::uint64_t> { return source_size_; }

private:
    friend auto validate(std::string_view source_path, const Device& target)
        -> infra::Result<TransferRequest>;

    TransferRequest() = default;

    std::filesystem::path source_path_;
    std::string target_;
    std::string target_label_;
    DeviceKind target_kind_ = DeviceKind::RawDevice;
    std::optional<std::uint64_t> target_capacity_;
    std::optional<std::uint64_t> source_size_;
};

/// Проверяет запрос до запуска фоновой работы.
///
/// Ошибки (ErrorCode):
///   EmptySource:      путь к образу не задан;
///   EmptyTarget:      устройство не выбрано;
///   SourceUnreadable: путь не ведёт к читаемому файлу (проверка best-effort);
///   TargetIsSource:   цель (или файл внутри каталога-цели) и есть сам образ;
///   TargetTooSmall:   образ больше известной ёмкости устройства.
[[nodiscard]] auto validate(std::string_view source_path, const Device& target)
    -> infra::Result<TransferRequest>;

/// Устройство, известное только по идентификатору (например, путь из CLI).
[[nodiscard]] auto device_from_identifier(std::string_view identifier) -> Device;

} // namespace ayumi::core
