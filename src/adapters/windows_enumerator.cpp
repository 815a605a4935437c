#include "windows_enumerator.hpp"

#include <windows.h>
#include <array>
#include <string>
#include <spdlog/spdlog.h>

namespace ayumi::adapters {

namespace {

auto narrow(const std::wstring& wide) -> std::string {
    if (wide.empty()) return {};
    const int size = ::WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                                           nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(size), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                          out.data(), size, nullptr, nullptr);
    return out;
}

} // namespace

auto WindowsDriveEnumerator::list_devices() const -> std::vector<core::Device> {
    std::vector<core::Device> devices;

    // Бит 0 = A:, бит 1 = B:, ...
    DWORD drive_mask = ::GetLogicalDrives();
    if (drive_mask == 0) {
        spdlog::warn("GetLogicalDrives failed, error {}", ::GetLastError());
        return devices;
    }

    for (wchar_t letter = L'A'; drive_mask != 0; ++letter, drive_mask >>= 1) {
        if ((drive_mask & 1) == 0) continue;

        const std::wstring root{letter, L':', L'\\'};
        if (::GetDriveTypeW(root.c_str()) != DRIVE_REMOVABLE) continue;

        // Пустой картридер тоже DRIVE_REMOVABLE, но без носителя метаданные не читаются
        std::array<wchar_t, MAX_PATH + 1> name_buf{};
        if (!::GetVolumeInformationW(root.c_str(), name_buf.data(), static_cast<DWORD>(name_buf.size()),
                                     nullptr, nullptr, nullptr, nullptr, 0)) {
            spdlog::warn("Drive {}: volume label is unreadable, using placeholder", narrow(root));
            name_buf[0] = L'\0';
        }

        std::optional<std::uint64_t> capacity;
        ULARGE_INTEGER total_bytes{};
        if (::GetDiskFreeSpaceExW(root.c_str(), nullptr, &total_bytes, nullptr)) {
            capacity = total_bytes.QuadPart;
        } else {
            spdlog::warn("Drive {}: capacity is unreadable, error {}", narrow(root), ::GetLastError());
        }

        const auto identifier = narrow(root);
        devices.push_back(core::Device{
            .identifier = identifier,
            .display_label = core::format_label(identifier, narrow(name_buf.data()), capacity),
            .capacity_bytes = capacity,
            .removable = true,
            .kind = core::DeviceKind::MountPoint,
        });
    }

    spdlog::debug("Enumerated {} removable drive(s)", devices.size());
    return devices;
}

} // namespace ayumi::adapters
