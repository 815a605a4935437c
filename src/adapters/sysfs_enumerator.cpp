#include "sysfs_enumerator.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace ayumi::adapters {

namespace fs = std::filesystem;

namespace {

// Размер в /sys/block/*/size всегда в 512-байтных секторах
constexpr std::uint64_t kSysfsSectorSize = 512;

// loop, ram, device-mapper, CD-ROM и т.п. не являются целями записи
constexpr std::array kSkippedPrefixes = {
    std::string_view{"loop"}, std::string_view{"ram"}, std::string_view{"dm-"},
    std::string_view{"sr"}, std::string_view{"zram"}, std::string_view{"md"},
};

auto trim(std::string value) -> std::string {
    const auto last = value.find_last_not_of(" \n\r\t");
    value.erase(last == std::string::npos ? 0 : last + 1);
    const auto first = value.find_first_not_of(" \t");
    value.erase(0, first == std::string::npos ? value.size() : first);
    return value;
}

// Первая строка файла sysfs; nullopt, если файл не читается
auto read_file_line(const fs::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string value;
    std::getline(file, value);
    return trim(std::move(value));
}

auto read_capacity(const fs::path& size_file) -> std::optional<std::uint64_t> {
    const auto text = read_file_line(size_file);
    if (!text || text->empty()) {
        return std::nullopt;
    }
    std::uint64_t sectors = 0;
    const auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), sectors);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        return std::nullopt;
    }
    return sectors * kSysfsSectorSize;
}

auto is_skipped(std::string_view name) -> bool {
    return std::any_of(kSkippedPrefixes.begin(), kSkippedPrefixes.end(),
                       [name](std::string_view prefix) { return name.starts_with(prefix); });
}

auto unescape_mount_field(std::string_view field) -> std::string {
    std::string out;
    out.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const auto octal = field.substr(i + 1, 3);
            unsigned value = 0;
            const auto [ptr, ec] = std::from_chars(octal.data(), octal.data() + octal.size(), value, 8);
            if (ec == std::errc{} && ptr == octal.data() + octal.size()) {
                out.push_back(static_cast<char>(value));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

} // namespace

auto parse_mounts(std::string_view text) -> std::vector<MountEntry> {
    std::vector<MountEntry> entries;
    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string source;
        std::string mount_point;
        if (!(fields >> source >> mount_point)) {
            continue;
        }
        entries.push_back(MountEntry{
            .source = unescape_mount_field(source),
            .mount_point = unescape_mount_field(mount_point),
        });
    }
    return entries;
}

SysfsEnumerator::SysfsEnumerator(infra::EnumerationMode mode, SysfsPaths paths)
    : mode_(mode), paths_(std::move(paths)) {}

auto SysfsEnumerator::list_devices() const -> std::vector<core::Device> {
    const auto disks = scan_removable_disks_();
    auto devices = mode_ == infra::EnumerationMode::Mount ? list_mounted_(disks) : list_raw_(disks);
    spdlog::debug("Enumerated {} removable target(s) in {} mode", devices.size(),
                  mode_ == infra::EnumerationMode::Mount ? "mount" : "device");
    return devices;
}

auto SysfsEnumerator::scan_removable_disks_() const -> std::vector<BlockDisk> {
    std::vector<BlockDisk> disks;
    const auto block_dir = paths_.sys_root / "block";

    std::error_code ec;
    if (!fs::is_directory(block_dir, ec)) {
        spdlog::warn("{} is not available, no devices can be listed", block_dir.string());
        return disks;
    }

    // Имена сортируются: порядок обхода каталога ядром не гарантирован
    std::vector<std::string> names;
    for (auto it = fs::directory_iterator(block_dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        spdlog::warn("Failed to scan {}: {}", block_dir.string(), ec.message());
    }
    std::sort(names.begin(), names.end());

    for (auto& name : names) {
        if (is_skipped(name)) continue;

        const auto dir = block_dir / name;
        const auto removable = read_file_line(dir / "removable");
        if (!removable) {
            spdlog::debug("Skipping {}: removable flag unreadable", name);
            continue;
        }
        if (*removable != "1") continue;

        disks.push_back(read_disk_(dir, std::move(name)));
    }
    return disks;
}

auto SysfsEnumerator::read_disk_(const fs::path& dir, std::string name) const -> BlockDisk {
    BlockDisk disk;
    disk.name = std::move(name);

    const auto vendor = read_file_line(dir / "device" / "vendor").value_or("");
    const auto model = read_file_line(dir / "device" / "model").value_or("");
    disk.model = trim(vendor + " " + model);
    if (disk.model.empty()) {
        spdlog::warn("Device {}: model is unreadable, using placeholder", disk.name);
    }

    disk.capacity = read_capacity(dir / "size");
    if (!disk.capacity) {
        spdlog::warn("Device {}: size is unreadable, capacity unknown", disk.name);
    }

    // Разделы: подкаталоги с файлом "partition"
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        std::error_code part_ec;
        if (fs::exists(it->path() / "partition", part_ec)) {
            disk.partitions.push_back(it->path().filename().string());
        }
    }
    std::sort(disk.partitions.begin(), disk.partitions.end());
    return disk;
}

auto SysfsEnumerator::list_raw_(const std::vector<BlockDisk>& disks) const -> std::vector<core::Device> {
    std::vector<core::Device> devices;
    std::set<std::string> seen;
    for (const auto& disk : disks) {
        auto identifier = (paths_.dev_root / disk.name).string();
        if (!seen.insert(identifier).second) continue;

        devices.push_back(core::Device{
            .identifier = identifier,
            .display_label = core::format_label(identifier, disk.model, disk.capacity),
            .capacity_bytes = disk.capacity,
            .removable = true,
            .kind = core::DeviceKind::RawDevice,
        });
    }
    return devices;
}

auto SysfsEnumerator::list_mounted_(const std::vector<BlockDisk>& disks) const -> std::vector<core::Device> {
    std::vector<core::Device> devices;

    std::ifstream file(paths_.mounts_file);
    if (!file.is_open()) {
        spdlog::warn("Cannot read mount table {}", paths_.mounts_file.string());
        return devices;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const auto mounts = parse_mounts(buffer.str());

    std::set<std::string> seen_sources;
    std::set<std::string> seen_mount_points;
    for (const auto& disk : disks) {
        // Сначала сам диск (ФС без таблицы разделов), затем разделы
        std::vector<std::pair<std::string, std::optional<std::uint64_t>>> nodes;
        nodes.emplace_back(disk.name, disk.capacity);
        for (const auto& part : disk.partitions) {
            nodes.emplace_back(part, read_capacity(paths_.sys_root / "block" / disk.name / part / "size"));
        }

        for (const auto& [node, capacity] : nodes) {
            const auto source = (paths_.dev_root / node).string();
            const auto mount = std::find_if(mounts.begin(), mounts.end(),
                                            [&source](const MountEntry& m) { return m.source == source; });
            if (mount == mounts.end()) continue;
            if (!seen_sources.insert(source).second) continue;
            if (!seen_mount_points.insert(mount->mount_point).second) continue;

            devices.push_back(core::Device{
                .identifier = mount->mount_point,
                .display_label = core::format_label(mount->mount_point, disk.model, capacity),
                .capacity_bytes = capacity,
                .removable = true,
                .kind = core::DeviceKind::MountPoint,
            });
        }
    }
    return devices;
}

} // namespace ayumi::adapters
