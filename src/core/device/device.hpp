#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ayumi::core {

enum class DeviceKind {
    RawDevice,   // узел устройства, запись с нулевого смещения
    MountPoint,  // корень смонтированной ФС, образ пишется файлом
};

struct Device {
    std::string identifier;                    // /dev/sdb, /media/usb, E:\ ...
    std::string display_label;
    std::optional<std::uint64_t> capacity_bytes;
    bool removable = false;
    DeviceKind kind = DeviceKind::RawDevice;
};

inline constexpr std::string_view kUnknownDeviceName = "Removable disk";

/// Человекочитаемая подпись в формате "<where> (<name>) - 16.0 GB".
/// Пустое имя и неизвестный размер заменяются заглушками.
[[nodiscard]] auto format_label(std::string_view where,
                                std::string_view name,
                                std::optional<std::uint64_t> capacity_bytes) -> std::string;

/// Сравнивает идентификаторы как пути: "/media/usb/" и "/media/usb" совпадают.
[[nodiscard]] auto same_identifier(std::string_view a, std::string_view b) -> bool;

[[nodiscard]] auto to_string(DeviceKind kind) -> std::string_view;

} // namespace ayumi::core
