#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Process.h"

namespace sb_modsign {

class ProcessRunnerTest : public ::testing::Test {
protected:
    ProcessRunner runner;
};

TEST_F(ProcessRunnerTest, CapturesStdout) {
    auto r = runner.run({"/bin/sh", "-c", "echo hello; echo world"});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.output, "hello\nworld\n");
}

TEST_F(ProcessRunnerTest, StderrIsNotCaptured) {
    auto r = runner.run({"/bin/sh", "-c", "echo oops >&2; echo out"});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.output, "out\n");
}

TEST_F(ProcessRunnerTest, ReportsExitCode) {
    auto r = runner.run({"/bin/sh", "-c", "exit 3"});
    EXPECT_TRUE(r.started);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.ok());
}

TEST_F(ProcessRunnerTest, MissingToolIsNotStarted) {
    auto r = runner.run({"sb-modsign-no-such-tool-xyz"});
    EXPECT_FALSE(r.started);
    EXPECT_FALSE(r.ok());
}

TEST_F(ProcessRunnerTest, EmptyArgv) {
    auto r = runner.run(Command{});
    EXPECT_FALSE(r.started);
}

TEST_F(ProcessRunnerTest, EnvironmentOverrides) {
    Command c{"/bin/sh", "-c", "printf %s \"$DEBIAN_FRONTEND\""};
    c.env["DEBIAN_FRONTEND"] = "noninteractive";
    auto r = runner.run(c);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.output, "noninteractive");
}

TEST_F(ProcessRunnerTest, StdinIsNotInherited) {
    // cat reads /dev/null and exits instead of waiting on the terminal
    auto r = runner.run({"cat"});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.output, "");
}

TEST_F(ProcessRunnerTest, Available) {
    EXPECT_TRUE(runner.available("sh"));
    EXPECT_TRUE(runner.available("/bin/sh"));
    EXPECT_FALSE(runner.available("sb-modsign-no-such-tool-xyz"));
    EXPECT_FALSE(runner.available("/nonexistent/tool"));
    EXPECT_FALSE(runner.available(""));
}

TEST(CommandTest, StrJoinsArgv) {
    Command c{"sign-file", "sha256", "k", "c", "m.ko"};
    EXPECT_EQ(c.str(), "sign-file sha256 k c m.ko");
}

}
