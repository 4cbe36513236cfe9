#include "cli/CliParser.hpp"
#include <gtest/gtest.h>
#include <string>

namespace cleansheet {
namespace cli {

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        setupCliParser(app_, settings_);
    }

    // 返回 -1 表示解析成功
    int parse(const std::string& command_line) {
        try {
            app_.parse(command_line, false);
        } catch (const CLI::ParseError& e) {
            return exitCodeFor(app_, e);
        }
        return -1;
    }

    CLI::App app_{"cleansheet"};
    CliSettings settings_;
};

TEST_F(CliParserTest, DefaultsLeaveEverythingOff) {
    ASSERT_EQ(parse("in.xlsx out.xlsx"), -1);

    EXPECT_EQ(settings_.input_file, "in.xlsx");
    EXPECT_EQ(settings_.output_file, "out.xlsx");
    EXPECT_FALSE(settings_.options.remove_macros);
    EXPECT_FALSE(settings_.options.remove_hidden_sheets);
    EXPECT_FALSE(settings_.options.overwrite);
    EXPECT_TRUE(settings_.options.verify_entries);
    EXPECT_EQ(settings_.log.level, Logger::Level::INFO);
    EXPECT_TRUE(settings_.log.enable_console);
    EXPECT_TRUE(settings_.log.log_file.empty());
}

TEST_F(CliParserTest, ParsesAllFlags) {
    ASSERT_EQ(parse("--remove-macros in.xlsm out.xlsm --remove-hidden-sheets --overwrite --no-verify -q"), -1);

    EXPECT_TRUE(settings_.options.remove_macros);
    EXPECT_TRUE(settings_.options.remove_hidden_sheets);
    EXPECT_TRUE(settings_.options.overwrite);
    EXPECT_FALSE(settings_.options.verify_entries);
    EXPECT_FALSE(settings_.log.enable_console);
    EXPECT_EQ(settings_.input_file, "in.xlsm");
    EXPECT_EQ(settings_.output_file, "out.xlsm");
}

TEST_F(CliParserTest, ParsesLogOptions) {
    ASSERT_EQ(parse("in.csv out.csv --log-level DEBUG --log-file run.log"), -1);

    EXPECT_EQ(settings_.log.level, Logger::Level::DEBUG);
    EXPECT_EQ(settings_.log.log_file, "run.log");
}

TEST_F(CliParserTest, RejectsUnknownLogLevel) {
    EXPECT_EQ(parse("in.csv out.csv --log-level verbose"), 1);
}

TEST_F(CliParserTest, MissingOutputIsUsageError) {
    EXPECT_EQ(parse("in.xlsx"), 1);
}

TEST_F(CliParserTest, UnknownFlagIsUsageError) {
    EXPECT_EQ(parse("in.xlsx out.xlsx --remove-everything"), 1);
}

TEST_F(CliParserTest, HelpExitsWithZero) {
    EXPECT_EQ(parse("--help"), 0);
}

}} // namespace cleansheet::cli
