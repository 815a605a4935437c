#include "transfer_request.hpp"

#include <system_error>
#include <fmt/core.h>
#include "adapters/fs.hpp"

namespace ayumi::core {

auto validate(std::string_view source_path, const Device& target)
    -> infra::Result<TransferRequest>
{
    if (source_path.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::EmptySource, "No image file selected"));
    }
    if (target.identifier.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::EmptyTarget, "No target device selected"));
    }

    const std::filesystem::path source{source_path};

    std::error_code ec;
    if (std::filesystem::is_directory(source, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceUnreadable,
                             fmt::format("Source is a directory: {}", source.string())));
    }

    // Пробное открытие: существование файла ещё не означает права на чтение
    auto probe = adapters::fs::open_for_read(source);
    if (!probe) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceUnreadable, probe.error().message));
    }
    const auto source_size = adapters::fs::size_of(*probe);

    // Цель не может совпадать с самим образом
    const auto destination = adapters::fs::resolve_destination(source, target.identifier);
    if (adapters::fs::same_file(source, destination.path)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TargetIsSource,
                             fmt::format("Destination {} is the image itself", destination.path.string())));
    }

    if (source_size && target.capacity_bytes && *source_size > *target.capacity_bytes) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TargetTooSmall,
                             fmt::format("Image is {} bytes but {} holds only {} bytes",
                                         *source_size, target.identifier, *target.capacity_bytes)));
    }

    TransferRequest request;
    request.source_path_ = source;
    request.target_ = target.identifier;
    request.target_label_ = target.display_label.empty() ? target.identifier : target.display_label;
    request.target_kind_ = target.kind;
    request.target_capacity_ = target.capacity_bytes;
    request.source_size_ = source_size;
    return request;
}

auto device_from_identifier(std::string_view identifier) -> Device {
    Device device;
    device.identifier = std::string(identifier);
    device.display_label = device.identifier;
    device.removable = true;
    device.kind = adapters::fs::classify_target(device.identifier) == adapters::fs::TargetKind::Directory
        ? DeviceKind::MountPoint
        : DeviceKind::RawDevice;
    return device;
}

} // namespace ayumi::core
