#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "core/device/device_enumerator.hpp"
#include "infra/config/config.hpp"

namespace ayumi::adapters {

// Корни, из которых читается состояние ядра. В тестах подменяются
// на фиктивное дерево во временном каталоге.
struct SysfsPaths {
    std::filesystem::path sys_root = "/sys";
    std::filesystem::path dev_root = "/dev";
    std::filesystem::path mounts_file = "/proc/self/mounts";
};

struct MountEntry {
    std::string source;
    std::string mount_point;
};

/// Разбирает таблицу монтирования в формате /proc/mounts.
/// Экранирование вида \040 в путях раскрывается.
[[nodiscard]] auto parse_mounts(std::string_view text) -> std::vector<MountEntry>;

class SysfsEnumerator final : public core::DeviceEnumerator {
public:
    explicit SysfsEnumerator(infra::EnumerationMode mode = infra::EnumerationMode::Device,
                             SysfsPaths paths = {});

    [[nodiscard]] auto list_devices() const -> std::vector<core::Device> override;

private:
    struct BlockDisk {
        std::string name;                       // sdb, mmcblk0
        std::string model;                      // vendor + model, может быть пустым
        std::optional<std::uint64_t> capacity;
        std::vector<std::string> partitions;    // sdb1, mmcblk0p1
    };

    [[nodiscard]] auto scan_removable_disks_() const -> std::vector<BlockDisk>;
    [[nodiscard]] auto read_disk_(const std::filesystem::path& dir, std::string name) const -> BlockDisk;
    [[nodiscard]] auto list_raw_(const std::vector<BlockDisk>& disks) const -> std::vector<core::Device>;
    [[nodiscard]] auto list_mounted_(const std::vector<BlockDisk>& disks) const -> std::vector<core::Device>;

    infra::EnumerationMode mode_;
    SysfsPaths paths_;
};

} // namespace ayumi::adapters
