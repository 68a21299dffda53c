#include <gtest/gtest.h>

#include "process/ForkRunner.hpp"

#include <filesystem>
#include <paths.h>

using namespace sw::process;
using namespace std::chrono_literals;

class ForkRunnerTest : public ::testing::Test {
protected:
    ForkRunner runner;

    static Invocation shell(const std::string& script) {
        Invocation inv;
        inv.executable = "/bin/sh";
        inv.args = {"-c", script};
        inv.timeout = 5s;
        return inv;
    }
};

TEST_F(ForkRunnerTest, ReportsZeroExitAndCapturesStdout) {
    const auto res = runner.run(shell("echo hello"));
    EXPECT_TRUE(res.launched);
    EXPECT_FALSE(res.timed_out);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text, "hello\n");
    EXPECT_TRUE(res.succeeded());
}

TEST_F(ForkRunnerTest, ReportsNonZeroExitAndCapturesStderr) {
    const auto res = runner.run(shell("echo broken >&2; exit 3"));
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.stderr_text, "broken\n");
    EXPECT_FALSE(res.succeeded());
    EXPECT_EQ(res.diagnostics(), "broken\n");
}

TEST_F(ForkRunnerTest, ArgumentsArePassedVerbatim) {
    auto inv = shell("printf '%s|' \"$@\"");
    inv.args.emplace_back("sh");
    inv.args.emplace_back("a b");
    inv.args.emplace_back("$(x)");
    const auto res = runner.run(inv);
    EXPECT_EQ(res.stdout_text, "a b|$(x)|");
}

TEST_F(ForkRunnerTest, HonorsWorkingDirectory) {
    auto inv = shell("pwd");
    inv.working_directory = std::filesystem::path("/");
    const auto res = runner.run(inv);
    EXPECT_EQ(res.stdout_text, "/\n");
}

TEST_F(ForkRunnerTest, KillsChildOnTimeout) {
    auto inv = shell("sleep 30");
    inv.timeout = 200ms;
    const auto res = runner.run(inv);
    EXPECT_TRUE(res.launched);
    EXPECT_TRUE(res.timed_out);
    EXPECT_FALSE(res.succeeded());
    EXPECT_LT(res.elapsed, 10s);
}

TEST_F(ForkRunnerTest, MissingExecutableExits127) {
    Invocation inv;
    inv.executable = "/nonexistent/servicewarden-host";
    inv.timeout = 5s;
    const auto res = runner.run(inv);
    EXPECT_EQ(res.exit_code, 127);
    EXPECT_FALSE(res.succeeded());
}

TEST_F(ForkRunnerTest, LargeOutputDoesNotDeadlock) {
    const auto res = runner.run(shell("i=0; while [ $i -lt 20000 ]; do echo line-$i; i=$((i+1)); done"));
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_GT(res.stdout_text.size(), 100000u);
}
