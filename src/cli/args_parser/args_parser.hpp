#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <expected>



namespace ayumi::args_parser {

enum class Command {
    List,
    Info,
    Write,
    Version,
};

struct CLIArgs
{
    Command command{Command::List};
    std::string image;                        // info/write: путь к образу
    std::string target;                       // write: идентификатор устройства
    std::optional<std::string> mode;          // list: --mode device|mount
    std::optional<std::string> config_file;   // --config FILE
    std::optional<std::size_t> chunk_size;    // write: --chunk-size=SIZE
    bool yes{false};                          // write: -y, --yes
    bool no_sync{false};                      // write: --no-sync
    bool no_progress{false};                  // write: --no-progress
    bool verbose{false};                      // -v, --verbose
    bool quiet{false};                        // -q, --quiet
};



/// Parses command-line arguments.
/// On --help or a usage error returns the process exit code CLI11 chose.
std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv);

} // namespace ayumi::args_parser
