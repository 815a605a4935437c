#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>
#include <system_error>
#include <vector>


#ifdef _WIN32
    #include <windows.h>
    #include <shlobj.h>
    #include <knownfolders.h>
#endif

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace ayumi::infra {
    auto Config::effective_chunk_size() const -> std::size_t {
        return std::clamp(chunk_size.value_or(kDefaultChunkSize), kMinChunkSize, kMaxChunkSize);
    }

    void Config::merge_with(const Config& other) {
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.enumeration_mode) enumeration_mode = other.enumeration_mode;
        if (other.log_level) log_level = other.log_level;
        if (!other.sync) sync = false;         // CLI может отключить
        if (!other.progress) progress = false;
        if (other.quiet) quiet = true;
    }

    auto parse_enumeration_mode(std::string_view text) -> std::optional<EnumerationMode> {
        if (text == "device") return EnumerationMode::Device;
        if (text == "mount") return EnumerationMode::Mount;
        return std::nullopt;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".ayumi.yaml");

        // 2. Глобальный файл
    #ifdef _WIN32
        PWSTR appdata_path = nullptr;
        if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appdata_path))) {
            paths.push_back(std::filesystem::path(appdata_path) / "ayumi" / "config.yaml");
            CoTaskMemFree(appdata_path);
        }
    #else
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "ayumi" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "ayumi" / "config.yaml");
            }
        }
    #endif

        return paths;
    }

    auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (const auto transfer = config["transfer"]) {
                if (transfer["chunk_size"]) cfg.chunk_size = transfer["chunk_size"].as<std::size_t>();
                if (transfer["sync"]) cfg.sync = transfer["sync"].as<bool>();
            }

            if (const auto enumeration = config["enumeration"]) {
                if (enumeration["mode"]) {
                    const auto text = enumeration["mode"].as<std::string>();
                    cfg.enumeration_mode = parse_enumeration_mode(text);
                    if (!cfg.enumeration_mode) {
                        return std::unexpected(fmt::format("{}: unknown enumeration mode '{}'",
                                                           path.string(), text));
                    }
                }
            }

            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const ayumi::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.chunk_size = args.chunk_size;
        cfg.sync = !args.no_sync;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        if (args.mode) cfg.enumeration_mode = parse_enumeration_mode(*args.mode);
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace ayumi::infra
