#include "core/errors.hpp"
#include "shell/executor.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <string>

using namespace cmdbench;

TEST(ShellExecutorTest, SuccessfulCommand)
{
    shell::ShellExecutor sh("sh");
    const auto r = sh.run("true", false, FailureAction::RaiseError);
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_FALSE(r.termSignal.has_value());
    EXPECT_GE(r.timing.real, 0.0);
    EXPECT_GE(r.timing.user, 0.0);
    EXPECT_GE(r.timing.system, 0.0);
}

TEST(ShellExecutorTest, WallClockCoversTheCommand)
{
    shell::ShellExecutor sh("sh");
    const auto r = sh.run("sleep 0.2", false, FailureAction::RaiseError);
    EXPECT_GE(r.timing.real, 0.19);
}

TEST(ShellExecutorTest, NonZeroExitCodeIgnored)
{
    shell::ShellExecutor sh("sh");
    const auto r = sh.run("exit 3", false, FailureAction::Ignore);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.exitCode, 3);
}

TEST(ShellExecutorTest, NonZeroExitCodeRaises)
{
    shell::ShellExecutor sh("sh");
    try
    {
        sh.run("exit 4", false, FailureAction::RaiseError);
        FAIL() << "expected CommandFailedError";
    }
    catch (const CommandFailedError& e)
    {
        EXPECT_EQ(e.code(), 4);
        EXPECT_NE(std::string(e.what()).find("--ignore-failure"),
                  std::string::npos);
    }
}

TEST(ShellExecutorTest, KilledBySignalMapsTo128PlusSignal)
{
    shell::ShellExecutor sh("sh");
    const auto r = sh.run("kill -9 $$", false, FailureAction::Ignore);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.termSignal, SIGKILL);
    EXPECT_EQ(r.exitCode, 128 + SIGKILL);
}

TEST(ShellExecutorTest, MissingShellIsSpawnError)
{
    shell::ShellExecutor sh("/nonexistent/cmdbench-shell");
    EXPECT_THROW(sh.run("true", false, FailureAction::Ignore), SpawnError);
}

TEST(ShellExecutorTest, ShellArgumentsAreSplit)
{
    shell::ShellExecutor sh("sh -e");
    EXPECT_EQ(sh.shell(), "sh -e");
    EXPECT_EQ(sh.describe("make"), "sh -e -c \"make\"");

    // -e aborts on the failing `false`, so the later exit never runs.
    const auto r = sh.run("false; exit 0", false, FailureAction::Ignore);
    EXPECT_EQ(r.exitCode, 1);
}

TEST(ShellExecutorTest, EmptyShellRejected)
{
    EXPECT_THROW(shell::ShellExecutor("   "), ConfigError);
}

TEST(ShellExecutorTest, OutputIsDiscardedUnlessRequested)
{
    shell::ShellExecutor sh("sh");

    testing::internal::CaptureStdout();
    sh.run("echo hidden", false, FailureAction::RaiseError);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    testing::internal::CaptureStdout();
    sh.run("echo shown", true, FailureAction::RaiseError);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "shown\n");
}

TEST(ShellExecutorTest, StdinIsEmpty)
{
    shell::ShellExecutor sh("sh");
    const auto r = sh.run("read line", false, FailureAction::Ignore);
    EXPECT_EQ(r.exitCode, 1);
}

TEST(ExitCodeTest, FromWaitStatus)
{
    EXPECT_EQ(shell::exitCodeFromStatus(0), 0);
    EXPECT_EQ(shell::exitCodeFromStatus(2 << 8), 2);
    EXPECT_EQ(shell::exitCodeFromStatus(SIGTERM), 128 + SIGTERM);
}
