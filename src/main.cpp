#include <iostream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/confirm/confirm.hpp"
#include "core/device/device_enumerator.hpp"
#include "core/transfer/transfer_request.hpp"
#include "core/transfer/transfer_status.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include "adapters/fs.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <thread>

using ARGS = ayumi::args_parser::CLIArgs;
using CONFIG = ayumi::infra::Config;

constexpr auto load_from_cli = ayumi::infra::config_from_cli;
constexpr auto load_config_file = ayumi::infra::load_config_from_file;
constexpr auto args_parser = ayumi::args_parser::parse_args;
constexpr auto build = ayumi::build_info::get_build_info();

constexpr auto kPollInterval = std::chrono::milliseconds(100);

static auto
out_build_info()
-> void {
    fmt::print("ayumi {}\n", build.version);
    fmt::print("Git commit: {}\n", build.commit);
    fmt::print("Git commit short: {}\n", build.commit_short);
    fmt::print("Git dirty: {}\n", build.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", build.timestamp);
}

static auto
apply_log_level(const CONFIG& config)
-> void {
    if (config.quiet) {
        spdlog::set_level(spdlog::level::warn);
        return;
    }
    if (config.log_level) {
        const auto level = spdlog::level::from_str(*config.log_level);
        // from_str возвращает off для неизвестных имён
        if (level == spdlog::level::off && *config.log_level != "off") {
            spdlog::warn("Unknown log level '{}', keeping info", *config.log_level);
            return;
        }
        spdlog::set_level(level);
    }
}

// Ищет цель среди перечисленных съёмных устройств в обоих режимах
[[nodiscard]]
static auto
find_listed_device(const CONFIG& config, const std::string& identifier)
-> std::optional<ayumi::core::Device> {
    for (const auto mode : {ayumi::infra::EnumerationMode::Device, ayumi::infra::EnumerationMode::Mount}) {
        auto lookup = config;
        lookup.enumeration_mode = mode;
        for (auto& device : ayumi::core::make_platform_enumerator(lookup)->list_devices()) {
            if (ayumi::core::same_identifier(device.identifier, identifier)) {
                return device;
            }
        }
    }
    return std::nullopt;
}

[[nodiscard]]
static auto
cmd_list(const CONFIG& config)
-> int {
    const auto enumerator = ayumi::core::make_platform_enumerator(config);
    const auto devices = enumerator->list_devices();

    if (devices.empty()) {
        fmt::print("No removable devices found\n");
        return 0;
    }
    for (const auto& device : devices) {
        fmt::print("  {:<24} {}\n", device.identifier, device.display_label);
    }
    fmt::print("Removable devices found: {}\n", devices.size());
    return 0;
}

[[nodiscard]]
static auto
cmd_info(const ARGS& args)
-> int {
    std::error_code ec;
    const auto size = std::filesystem::file_size(args.image, ec);
    if (ec) {
        spdlog::error("Cannot read {}: {}", args.image, ec.message());
        return 1;
    }
    fmt::print("Image: {}\n", args.image);
    fmt::print("File Size: {:.2f} MB\n", static_cast<double>(size) / 1'048'576.0);
    return 0;
}

[[nodiscard]]
static auto
cmd_write(const ARGS& args, const CONFIG& config)
-> int {
    namespace core = ayumi::core;
    namespace infra = ayumi::infra;

    // Узлы устройств принимаются только из списка съёмных
    auto device = find_listed_device(config, args.target);
    if (!device) {
        if (ayumi::adapters::fs::classify_target(args.target) == ayumi::adapters::fs::TargetKind::Device) {
            spdlog::error("Refusing to write to {}: not a removable device", args.target);
            return 1;
        }
        device = core::device_from_identifier(args.target);
    }

    auto request = core::validate(args.image, *device);
    if (!request) {
        auto err = infra::log_and_return(std::move(request.error()));
        return err.to_exit_code();
    }

    if (!args.yes && !ayumi::cli::confirm_transfer(*request, std::cin, std::cout)) {
        spdlog::warn("Aborted, nothing was written");
        return 1;
    }

    infra::install_signal_handler();

    core::TransferStatus status;
    core::TransferEngine engine(status, config);

    auto start_time = std::chrono::steady_clock::now();
    if (auto started = engine.start(std::move(*request)); !started) {
        auto err = infra::log_and_return(std::move(started.error()));
        return err.to_exit_code();
    }

    core::StatusSnapshot snap;
    std::optional<core::TransferFailure> failure;
    {
        infra::ProgressMonitor monitor(config.progress, config.quiet);
        bool cancel_requested = false;
        for (;;) {
            if (infra::is_interrupted() && !cancel_requested) {
                spdlog::warn("Interrupt received, stopping after the current chunk...");
                engine.cancel();
                cancel_requested = true;
            }

            snap = status.snapshot();
            if (snap.last_error) {
                failure = snap.last_error;
            }
            monitor.update(snap.progress, snap.bytes_written, snap.total_bytes);
            monitor.render();

            if (!snap.running) break;
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    engine.wait();

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    switch (snap.state) {
        case core::TransferState::Completed:
            spdlog::info("Write completed: {} bytes ({:.2f} MB)",
                         snap.bytes_written, snap.bytes_written / 1024.0 / 1024.0);
            spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
            if (snap.bytes_written > 0 && duration.count() > 0) {
                double speed_mbps = (snap.bytes_written / 1024.0 / 1024.0) / (duration.count() / 1000.0);
                spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
            }
            return 0;
        case core::TransferState::Cancelled:
            spdlog::warn("Write cancelled; {} holds a partial image ({} bytes)",
                         args.target, snap.bytes_written);
            return 130;
        default:
            break;
    }

    const auto code = failure ? failure->code : infra::ErrorCode::Unknown;
    const auto message = failure ? failure->message : std::string("transfer ended without a result");
    spdlog::error("Write failed: {}", message);
    return infra::make_error(code, message).to_exit_code();
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = args.config_file
            ? ayumi::infra::load_config(*args.config_file)
            : load_config_file();
        if (!config_res) {
            auto err = ayumi::infra::log_and_return(
                ayumi::infra::make_error(ayumi::infra::ErrorCode::InvalidConfig, config_res.error()));
            return err.to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет
        apply_log_level(config);

        switch (args.command) {
            case ayumi::args_parser::Command::List:
                return cmd_list(config);
            case ayumi::args_parser::Command::Info:
                return cmd_info(args);
            case ayumi::args_parser::Command::Write:
                return cmd_write(args, config);
            case ayumi::args_parser::Command::Version:
                out_build_info();
                return 0;
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
