#include <gtest/gtest.h>
#include "core/system/command_line.hpp"

using namespace BalanceMonitor::System;

TEST(CommandLineTest, DefaultsToQueryWithoutArguments) {
    CommandLine command_line = parse_command_line({});
    EXPECT_EQ(command_line.command, "query");
    EXPECT_TRUE(command_line.arguments.empty());
    EXPECT_TRUE(command_line.config_dir.empty());
}

TEST(CommandLineTest, ConfigDirInBothForms) {
    CommandLine separate = parse_command_line({"--config-dir", "/etc/monitor", "cached"});
    EXPECT_EQ(separate.config_dir, "/etc/monitor");
    EXPECT_EQ(separate.command, "cached");

    CommandLine joined = parse_command_line({"--config-dir=/opt/monitor"});
    EXPECT_EQ(joined.config_dir, "/opt/monitor");
    EXPECT_EQ(joined.command, "query");
}

TEST(CommandLineTest, MissingConfigDirValueIsUsageError) {
    EXPECT_THROW(parse_command_line({"--config-dir"}), UsageError);
}

TEST(CommandLineTest, TargetAccountIsPassedThrough) {
    CommandLine command_line = parse_command_line({"web-login", "alice"});
    EXPECT_EQ(command_line.command, "web-login");
    ASSERT_EQ(command_line.arguments.size(), 1u);
    EXPECT_EQ(command_line.arguments[0], "alice");
}

TEST(CommandLineTest, AddAccountTakesOptionalKey) {
    EXPECT_EQ(parse_command_line({"add-account", "bob", "secret"}).arguments.size(), 2u);
    EXPECT_EQ(parse_command_line({"add-account", "bob", "secret", "sk-bob"}).arguments.size(), 3u);
    EXPECT_THROW(parse_command_line({"add-account", "bob"}), UsageError);
    EXPECT_THROW(parse_command_line({"add-account", "bob", "secret", "sk-bob", "extra"}), UsageError);
}

TEST(CommandLineTest, WrongArityAndUnknownInputsAreRejected) {
    EXPECT_THROW(parse_command_line({"remove-account"}), UsageError);
    EXPECT_THROW(parse_command_line({"watch", "alice"}), UsageError);
    EXPECT_THROW(parse_command_line({"refresh"}), UsageError);
    EXPECT_THROW(parse_command_line({"--verbose"}), UsageError);
}

TEST(CommandLineTest, HelpFlagWinsOverCommand) {
    EXPECT_EQ(parse_command_line({"-h"}).command, "help");
    CommandLine command_line = parse_command_line({"query", "alice", "--help"});
    EXPECT_EQ(command_line.command, "help");
    EXPECT_TRUE(command_line.arguments.empty());
}

TEST(CommandLineTest, UsageListsEveryCommand) {
    std::string usage = usage_text("balance_monitor");
    for (const char* command : {"query", "web-login", "watch", "cached", "accounts",
                                "add-account", "remove-account", "report"}) {
        EXPECT_NE(usage.find(command), std::string::npos) << command;
    }
}
