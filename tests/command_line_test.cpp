#include "devdeck/command_line.hpp"

#include <gtest/gtest.h>

using devdeck::CommandLineOptions;
using devdeck::configureParser;

TEST(CommandLineTest, ToolFlagsAfterStreamArgumentsStayPositional) {
    QCommandLineParser parser;
    const CommandLineOptions options;
    configureParser(parser, options);

    ASSERT_TRUE(parser.parse({"devdeck", "--stream", "logcat", "-v", "brief"}));

    EXPECT_TRUE(parser.isSet(options.stream));
    EXPECT_FALSE(parser.isSet("version"));
    EXPECT_EQ(QStringList({"logcat", "-v", "brief"}), parser.positionalArguments());
}

TEST(CommandLineTest, OwnOptionsBeforeToolArgumentsAreParsed) {
    QCommandLineParser parser;
    const CommandLineOptions options;
    configureParser(parser, options);

    ASSERT_TRUE(parser.parse(
        {"devdeck", "--family", "adb", "--device", "SER1", "--stream", "shell", "ls", "-l", "--help"}));

    EXPECT_EQ("adb", parser.value(options.family));
    EXPECT_EQ("SER1", parser.value(options.device));
    EXPECT_FALSE(parser.isSet("help"));
    EXPECT_EQ(QStringList({"shell", "ls", "-l", "--help"}), parser.positionalArguments());
}

TEST(CommandLineTest, FamilyDefaultsToAdb) {
    QCommandLineParser parser;
    const CommandLineOptions options;
    configureParser(parser, options);

    ASSERT_TRUE(parser.parse({"devdeck", "--list"}));

    EXPECT_TRUE(parser.isSet(options.list));
    EXPECT_EQ("adb", parser.value(options.family));
    EXPECT_TRUE(parser.positionalArguments().isEmpty());
}
