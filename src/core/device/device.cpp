#include "device.hpp"

#include <filesystem>
#include <fmt/core.h>

namespace ayumi::core {

auto format_label(std::string_view where,
                  std::string_view name,
                  std::optional<std::uint64_t> capacity_bytes) -> std::string
{
    const auto shown_name = name.empty() ? kUnknownDeviceName : name;
    if (!capacity_bytes) {
        return fmt::format("{} ({}) - unknown size", where, shown_name);
    }
    // Десятичные гигабайты, как на упаковке флешки
    return fmt::format("{} ({}) - {:.1f} GB", where, shown_name,
                       static_cast<double>(*capacity_bytes) / 1'000'000'000.0);
}

namespace {

auto normalized(std::string_view identifier) -> std::filesystem::path {
    auto path = std::filesystem::path(identifier).lexically_normal();
    // Завершающий разделитель даёт пустое имя файла; корень ("/", "E:\\") не трогаем
    while (!path.has_filename() && path.has_relative_path()) {
        path = path.parent_path();
    }
    return path;
}

} // namespace

auto same_identifier(std::string_view a, std::string_view b) -> bool {
    return normalized(a) == normalized(b);
}

auto to_string(DeviceKind kind) -> std::string_view {
    switch (kind) {
        case DeviceKind::RawDevice:  return "device";
        case DeviceKind::MountPoint: return "mount";
    }
    return "device";
}

} // namespace ayumi::core
