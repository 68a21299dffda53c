#include <gtest/gtest.h>

#include "security/CommandGuard.hpp"

#include <stdexcept>

using namespace sw::security;

TEST(CommandGuardTest, AcceptsEmptyAndPlainArguments) {
    EXPECT_TRUE(CommandGuard::validate("").ok);
    EXPECT_TRUE(CommandGuard::validate("--port 8080 --verbose").ok);
    EXPECT_TRUE(CommandGuard::validate("--name \"hello world\" --ratio 0.5").ok);
}

TEST(CommandGuardTest, RejectsChainingAndSeparators) {
    EXPECT_FALSE(CommandGuard::validate("--a && rm -rf /").ok);
    EXPECT_FALSE(CommandGuard::validate("--a || true").ok);
    EXPECT_FALSE(CommandGuard::validate("--a; reboot").ok);
}

TEST(CommandGuardTest, RejectsSubstitution) {
    EXPECT_FALSE(CommandGuard::validate("--user `whoami`").ok);
    EXPECT_FALSE(CommandGuard::validate("--user $(whoami)").ok);
}

TEST(CommandGuardTest, DollarWithoutParenIsAllowed) {
    EXPECT_TRUE(CommandGuard::validate("--home $HOME").ok);
}

TEST(CommandGuardTest, RejectsUnescapedPipeButAllowsEscaped) {
    EXPECT_FALSE(CommandGuard::validate("--log out | tee").ok);
    EXPECT_FALSE(CommandGuard::validate("|head").ok);
    EXPECT_TRUE(CommandGuard::validate("--sep \\|").ok);
}

TEST(CommandGuardTest, RejectsLineBreaks) {
    EXPECT_FALSE(CommandGuard::validate("--a\nreboot").ok);
    EXPECT_FALSE(CommandGuard::validate("--a\rreboot").ok);
}

TEST(CommandGuardTest, ReasonNamesTheOffendingConstruct) {
    EXPECT_NE(CommandGuard::validate("a && b").reason.find("&&"), std::string::npos);
    EXPECT_NE(CommandGuard::validate("a `b`").reason.find("backtick"), std::string::npos);
}

TEST(CommandGuardTest, SanitizeTrimsAcceptedInput) {
    EXPECT_EQ(CommandGuard::sanitize("  --port 8080\t"), "--port 8080");
    EXPECT_EQ(CommandGuard::sanitize(""), "");
}

TEST(CommandGuardTest, SanitizeThrowsInsteadOfRewriting) {
    EXPECT_THROW((void)CommandGuard::sanitize("--a; reboot"), std::invalid_argument);
}

TEST(CommandGuardTest, QuoteOnlyWhenNeeded) {
    EXPECT_EQ(CommandGuard::quote("/opt/app/run"), "/opt/app/run");
    EXPECT_EQ(CommandGuard::quote("/opt/my app/run"), "\"/opt/my app/run\"");
    EXPECT_EQ(CommandGuard::quote(""), "\"\"");
    EXPECT_EQ(CommandGuard::quote("say \"hi\""), "\"say \\\"hi\\\"\"");
}
