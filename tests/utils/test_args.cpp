#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "offload/error/exception.hpp"
#include "offload/utils/args.hpp"

using namespace offload::utils;

class ArgumentParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser.setDescription("test program");
        parser.addArgument("config-dir", "Config directory", "/etc/offloader");
        parser.addArgument("log-file", "Log file");
        parser.addFlag("no-sudo", "Skip sudo");
    }

    void parse(std::vector<const char*> args) {
        args.insert(args.begin(), "offloadd");
        parser.parse(args);
    }

    ArgumentParser parser{"offloadd"};
};

TEST_F(ArgumentParserTest, DefaultsApplyWhenOmitted) {
    parse({});
    EXPECT_EQ(parser.get("config-dir"), "/etc/offloader");
    EXPECT_FALSE(parser.get("log-file").has_value());
    EXPECT_FALSE(parser.getFlag("no-sudo"));
    EXPECT_FALSE(parser.helpRequested());
}

TEST_F(ArgumentParserTest, SeparateAndInlineValues) {
    parse({"--config-dir", "/tmp/cfg", "--log-file=/var/log/offload.log"});
    EXPECT_EQ(parser.get("config-dir"), "/tmp/cfg");
    EXPECT_EQ(parser.get("log-file"), "/var/log/offload.log");
}

TEST_F(ArgumentParserTest, Flags) {
    parse({"--no-sudo"});
    EXPECT_TRUE(parser.getFlag("no-sudo"));
}

TEST_F(ArgumentParserTest, HelpIsNotAnError) {
    parse({"-h"});
    EXPECT_TRUE(parser.helpRequested());
    const std::string usage = parser.usage();
    EXPECT_NE(usage.find("--config-dir"), std::string::npos);
    EXPECT_NE(usage.find("(default: /etc/offloader)"), std::string::npos);
    EXPECT_NE(usage.find("--no-sudo"), std::string::npos);
}

TEST_F(ArgumentParserTest, RejectsBadInput) {
    EXPECT_THROW(parse({"--unknown", "x"}), offload::error::InvalidArgument);
    EXPECT_THROW(parse({"positional"}), offload::error::InvalidArgument);
    EXPECT_THROW(parse({"--config-dir"}), offload::error::InvalidArgument);
    EXPECT_THROW(parse({"--no-sudo=yes"}), offload::error::InvalidArgument);
}

TEST_F(ArgumentParserTest, RejectsDuplicateOrInvalidNames) {
    EXPECT_THROW(parser.addArgument("config-dir", "again"),
                 offload::error::InvalidArgument);
    EXPECT_THROW(parser.addFlag("", "empty"), offload::error::InvalidArgument);
    EXPECT_THROW(parser.addFlag("-x", "dash"), offload::error::InvalidArgument);
}
