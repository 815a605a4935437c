#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <string_view>
#include <filesystem>

namespace ayumi::args_parser {
    struct CLIArgs;
}

namespace ayumi::infra {

enum class EnumerationMode {
    Device,   // узел блочного устройства целиком (/dev/sdb)
    Mount,    // точки монтирования разделов съёмного диска
};

struct Config {
    static constexpr std::size_t kDefaultChunkSize = 4 * 1024 * 1024;
    static constexpr std::size_t kMinChunkSize = 4 * 1024;
    static constexpr std::size_t kMaxChunkSize = 64 * 1024 * 1024;

    // I/O
    std::optional<std::size_t> chunk_size;   // bytes
    bool sync = true;

    // Enumeration
    std::optional<EnumerationMode> enumeration_mode;

    // Output
    std::optional<std::string> log_level;
    bool progress = true;
    bool quiet = false;

    /// Размер чанка с учётом значения по умолчанию и допустимых границ.
    [[nodiscard]] auto effective_chunk_size() const -> std::size_t;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

[[nodiscard]] auto parse_enumeration_mode(std::string_view text) -> std::optional<EnumerationMode>;

/// Загружает конфигурацию из конкретного YAML-файла.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string>;

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.ayumi.yaml
///   2. ~/.config/ayumi/config.yaml (Linux/macOS)
///   3. %APPDATA%/ayumi/config.yaml (Windows)
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const ayumi::args_parser::CLIArgs& args) -> Config;

} // namespace ayumi::infra
