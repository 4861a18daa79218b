#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "airmon/utils/args.hpp"

namespace airmon::utils::test {

class ArgumentParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser.addArgument("config", ArgumentParser::ArgType::STRING, {},
                           "config file", {"c"});
        auto& scan = parser.addSubcommand("scan", "List devices");
        scan.addFlag("json", "JSON output");
        auto& enable = parser.addSubcommand("enable", "Enable a device");
        enable.addPositional("device", "name or mac");
        auto& monitor = parser.addSubcommand("monitor", "Telemetry");
        monitor.addArgument("count", ArgumentParser::ArgType::INTEGER, 0);
        monitor.addArgument("interval", ArgumentParser::ArgType::DOUBLE);
    }

    void parse(std::vector<std::string> argv) {
        argv.insert(argv.begin(), "airmon");
        parser.parse(argv);
    }

    ArgumentParser parser{"airmon"};
};

TEST_F(ArgumentParserTest, RootOptionThenSubcommandFlag) {
    parse({"--config", "a.json", "scan", "--json"});
    EXPECT_EQ(parser.get<std::string>("config"), "a.json");
    EXPECT_EQ(parser.activeSubcommand(), "scan");
    EXPECT_TRUE(parser.subcommand("scan").getFlag("json"));
    EXPECT_FALSE(parser.subcommand("enable").getFlag("json"));
}

TEST_F(ArgumentParserTest, AliasAndInlineValue) {
    parse({"-c=b.json", "monitor", "--count=3", "--interval", "0.5"});
    EXPECT_EQ(parser.get<std::string>("config"), "b.json");
    const auto& monitor = parser.subcommand("monitor");
    EXPECT_EQ(monitor.get<int>("count"), 3);
    EXPECT_DOUBLE_EQ(monitor.get<double>("interval").value(), 0.5);
}

TEST_F(ArgumentParserTest, DefaultsAndMissingValues) {
    parse({"monitor"});
    const auto& monitor = parser.subcommand("monitor");
    EXPECT_EQ(monitor.get<int>("count"), 0);
    EXPECT_FALSE(monitor.get<double>("interval").has_value());
    EXPECT_FALSE(parser.get<std::string>("config").has_value());
    EXPECT_FALSE(parser.get<std::string>("undeclared").has_value());
}

TEST_F(ArgumentParserTest, PositionalArgument) {
    parse({"enable", "AA:BB:CC:DD:EE:FF"});
    EXPECT_EQ(parser.subcommand("enable").getPositional("device"),
              "AA:BB:CC:DD:EE:FF");
}

TEST_F(ArgumentParserTest, HelpIsRecordedPerLevel) {
    parse({"scan", "--help"});
    EXPECT_FALSE(parser.helpRequested());
    EXPECT_TRUE(parser.subcommand("scan").helpRequested());
    EXPECT_NE(parser.helpText().find("monitor"), std::string::npos);
    EXPECT_NE(parser.subcommand("scan").helpText().find("--json"),
              std::string::npos);
}

TEST_F(ArgumentParserTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--bogus"}), error::InvalidArgument);
    EXPECT_THROW(parse({"frobnicate"}), error::InvalidArgument);
}

TEST_F(ArgumentParserTest, RejectsBadValues) {
    EXPECT_THROW(parse({"monitor", "--count", "three"}),
                 error::InvalidArgument);
}

TEST_F(ArgumentParserTest, RejectsMissingValue) {
    EXPECT_THROW(parse({"--config"}), error::InvalidArgument);
}

TEST_F(ArgumentParserTest, RejectsSurplusPositional) {
    EXPECT_THROW(parse({"enable", "a", "b"}), error::InvalidArgument);
}

TEST_F(ArgumentParserTest, TypeMismatchThrows) {
    parse({"monitor", "--count", "2"});
    EXPECT_THROW((void)parser.subcommand("monitor").get<double>("count"),
                 error::InvalidArgument);
    EXPECT_THROW((void)parser.subcommand("nope"), error::NotFound);
}

}  // namespace airmon::utils::test
