#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace peerdrop;
using namespace peerdrop::cli;

namespace {

CliOptions ParseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "peerdrop");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return ArgumentParser(static_cast<int>(argv.size()), argv.data()).Parse();
}

} // namespace

TEST(ArgumentParserTest, ParsesSendCommand) {
    auto options = ParseArgs({"-p", "40000", "--pacing-ms", "0", "send", "photo.png"});

    EXPECT_EQ(*options.port, 40000);
    EXPECT_EQ(*options.pacing_delay_ms, 0u);
    ASSERT_TRUE(options.command);
    EXPECT_EQ(*options.command, "send");
    EXPECT_EQ(options.command_args, (std::vector<std::string>{"photo.png"}));
}

TEST(ArgumentParserTest, ParsesReceiveCommand) {
    auto options = ParseArgs({"--json",
                              "-o",
                              "/tmp/in",
                              "--timeout",
                              "0",
                              "--allow-incomplete",
                              "-l",
                              "debug",
                              "receive",
                              "192.168.1.20",
                              "56789"});

    EXPECT_TRUE(options.json_output);
    EXPECT_TRUE(options.allow_incomplete);
    EXPECT_EQ(*options.output_dir, "/tmp/in");
    EXPECT_EQ(*options.stall_timeout_seconds, 0u);
    EXPECT_EQ(*options.log_level, "debug");
    EXPECT_EQ(*options.command, "receive");
    EXPECT_EQ(options.command_args, (std::vector<std::string>{"192.168.1.20", "56789"}));
}

TEST(ArgumentParserTest, HelpSkipsValidation) {
    auto options = ParseArgs({"--help"});
    EXPECT_TRUE(options.show_help);
    EXPECT_FALSE(options.command);
}

TEST(ArgumentParserTest, RejectsUsageErrors) {
    EXPECT_THROW(ParseArgs({}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"--bogus", "send", "a"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"-p"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"-p", "80", "send", "a"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"-p", "http", "send", "a"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"-l", "verbose", "send", "a"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"send"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"send", "a", "b"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"receive", "host"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"receive", "host", "0"}), std::invalid_argument);
    EXPECT_THROW(ParseArgs({"list"}), std::invalid_argument);
}

TEST(ArgumentParserTest, ParseNumberChecksRange) {
    EXPECT_EQ(ParseNumber("42", "value", 0, 100), 42u);
    EXPECT_THROW(ParseNumber("", "value", 0, 100), std::invalid_argument);
    EXPECT_THROW(ParseNumber("-1", "value", 0, 100), std::invalid_argument);
    EXPECT_THROW(ParseNumber("12abc", "value", 0, 100), std::invalid_argument);
    EXPECT_THROW(ParseNumber("101", "value", 0, 100), std::invalid_argument);
}

TEST(ArgumentParserTest, HelpListsCommands) {
    std::ostringstream out;
    ArgumentParser::ShowHelp(out);
    EXPECT_NE(out.str().find("send FILE"), std::string::npos);
    EXPECT_NE(out.str().find("receive HOST PORT"), std::string::npos);
}

TEST(CliManagerTest, FlagsOverrideSettings) {
    core::Settings settings{.port = 56789,
                            .save_dir = "/home/me/Downloads",
                            .pacing_delay_ms = 10,
                            .stall_timeout_seconds = 30,
                            .allow_incomplete = false,
                            .log_level = "info"};
    auto options = ParseArgs({"-p", "40000", "-o", "/tmp/in", "--allow-incomplete", "send", "a"});

    CliManager::ApplyOverrides(options, settings);

    EXPECT_EQ(settings.port, 40000);
    EXPECT_EQ(settings.save_dir, std::filesystem::path("/tmp/in"));
    EXPECT_TRUE(settings.allow_incomplete);
    EXPECT_EQ(settings.pacing_delay_ms, 10u);
    EXPECT_EQ(settings.stall_timeout_seconds, 30u);
    EXPECT_EQ(settings.log_level, "info");
}
