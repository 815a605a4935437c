#pragma once

#include <memory>
#include <vector>
#include "device.hpp"
#include "infra/config/config.hpp"

namespace ayumi::core {

/// Источник списка целевых устройств.
///
/// list_devices() синхронен, не имеет побочных эффектов и может вызываться
/// повторно (ручное обновление списка). В результат попадают только
/// съёмные устройства; отсутствие устройств даёт пустой список, а не ошибку.
/// Порядок детерминирован для неизменного набора оборудования.
class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    [[nodiscard]] virtual auto list_devices() const -> std::vector<Device> = 0;
};

/// Реализация для текущей платформы (выбирается при сборке).
[[nodiscard]] auto make_platform_enumerator(const infra::Config& config)
    -> std::unique_ptr<DeviceEnumerator>;

} // namespace ayumi::core
