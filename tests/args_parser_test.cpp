#include <gtest/gtest.h>

#include <vector>

#include "cli/args_parser/args_parser.hpp"

using namespace ayumi::args_parser;

namespace {

auto parse(std::vector<const char*> argv) -> std::expected<CLIArgs, int> {
    argv.insert(argv.begin(), "ayumi");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ArgsParserTest, WriteWithFlags) {
    auto res = parse({"write", "ubuntu.iso", "/dev/sdb", "-y", "--chunk-size", "65536", "--no-sync"});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->command, Command::Write);
    EXPECT_EQ(res->image, "ubuntu.iso");
    EXPECT_EQ(res->target, "/dev/sdb");
    EXPECT_TRUE(res->yes);
    EXPECT_TRUE(res->no_sync);
    EXPECT_FALSE(res->no_progress);
    ASSERT_TRUE(res->chunk_size.has_value());
    EXPECT_EQ(*res->chunk_size, 65536u);
}

TEST(ArgsParserTest, WriteDefaultsAskForConfirmation) {
    auto res = parse({"write", "a.img", "/media/usb"});
    ASSERT_TRUE(res);
    EXPECT_FALSE(res->yes);
    EXPECT_FALSE(res->chunk_size.has_value());
}

TEST(ArgsParserTest, ListWithMode) {
    auto res = parse({"-v", "list", "--mode", "mount"});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->command, Command::List);
    ASSERT_TRUE(res->mode.has_value());
    EXPECT_EQ(*res->mode, "mount");
    EXPECT_TRUE(res->verbose);
}

TEST(ArgsParserTest, UnknownModeIsUsageError) {
    auto res = parse({"list", "--mode", "network"});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), 2);
}

TEST(ArgsParserTest, InfoAndVersion) {
    auto info = parse({"info", "disk.img"});
    ASSERT_TRUE(info);
    EXPECT_EQ(info->command, Command::Info);
    EXPECT_EQ(info->image, "disk.img");

    auto version = parse({"version"});
    ASSERT_TRUE(version);
    EXPECT_EQ(version->command, Command::Version);
}

TEST(ArgsParserTest, MissingSubcommandIsUsageError) {
    auto res = parse({});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), 2);
}

TEST(ArgsParserTest, WriteWithoutTargetIsUsageError) {
    auto res = parse({"write", "a.img"});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), 2);
}

TEST(ArgsParserTest, HelpExitsWithZero) {
    auto res = parse({"--help"});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error(), 0);
}
