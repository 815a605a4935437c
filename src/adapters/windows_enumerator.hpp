#pragma once

#include "core/device/device_enumerator.hpp"

namespace ayumi::adapters {

/// Логические диски Windows с типом DRIVE_REMOVABLE.
/// Идентификатор: корень диска ("E:\\"), запись идёт файлом на его ФС.
class WindowsDriveEnumerator final : public core::DeviceEnumerator {
public:
    [[nodiscard]] auto list_devices() const -> std::vector<core::Device> override;
};

} // namespace ayumi::adapters
