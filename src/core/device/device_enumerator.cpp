#include "device_enumerator.hpp"

#if defined(_WIN32)
    #include "adapters/windows_enumerator.hpp"
#elif defined(__linux__)
    #include "adapters/sysfs_enumerator.hpp"
#else
    #error "ayumi: no device enumerator for this platform"
#endif

namespace ayumi::core {

auto make_platform_enumerator(const infra::Config& config)
    -> std::unique_ptr<DeviceEnumerator>
{
#if defined(_WIN32)
    (void)config;
    return std::make_unique<adapters::WindowsDriveEnumerator>();
#else
    return std::make_unique<adapters::SysfsEnumerator>(
        config.enumeration_mode.value_or(infra::EnumerationMode::Device));
#endif
}

} // namespace ayumi::core
