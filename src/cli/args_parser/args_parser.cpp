#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace ayumi::args_parser {

std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;

    CLI::App app{"Write disk images to removable media", "ayumi"};
    app.require_subcommand(1);

    std::string config_file;
    app.add_option("--config", config_file, "Path to a YAML config file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");

    // list
    std::string mode;
    auto* list = app.add_subcommand("list", "List removable target devices");
    list->add_option("--mode", mode, "Enumeration mode")
        ->check(CLI::IsMember({"device", "mount"}));

    // info
    auto* info = app.add_subcommand("info", "Show information about an image file");
    info->add_option("image", args.image, "Path to the image file")->required();

    // write
    std::size_t chunk_size = 0;
    auto* write = app.add_subcommand("write", "Write an image onto a device");
    write->add_option("image", args.image, "Path to the image file")->required();
    write->add_option("target", args.target, "Device node, mount point or file path")->required();
    write->add_flag("-y,--yes", args.yes, "Do not ask for confirmation");
    write->add_option("--chunk-size", chunk_size, "Chunk size in bytes")
        ->check(CLI::PositiveNumber);
    write->add_flag("--no-sync", args.no_sync, "Do not flush the destination at the end");
    write->add_flag("--no-progress", args.no_progress, "Do not draw the progress bar");

    // version
    auto* version = app.add_subcommand("version", "Print build information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help печатается и завершает работу с кодом 0
        const int code = app.exit(e);
        return std::unexpected(code == 0 ? 0 : 2);
    }

    if (list->parsed()) {
        args.command = Command::List;
    } else if (info->parsed()) {
        args.command = Command::Info;
    } else if (write->parsed()) {
        args.command = Command::Write;
    } else if (version->parsed()) {
        args.command = Command::Version;
    }

    if (!mode.empty()) args.mode = mode;
    if (!config_file.empty()) args.config_file = config_file;
    if (chunk_size != 0) args.chunk_size = chunk_size;

    return args;
}

} // namespace ayumi::args_parser
