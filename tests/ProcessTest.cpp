#include <chrono> // std::chrono::{steady_clock, seconds}

#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "Wrappers/Process.hpp"

#include "gtest/gtest.h"

using namespace gnome_mcp::utils::types;
using enum gnome_mcp::utils::error::GmcpErrorCode;

class ProcessTest : public testing::Test {};

TEST_F(ProcessTest, CapturesOutputAndExitCode) {
  Result<Process::Output> output = Process::Run({ "sh", "-c", "echo out; echo err >&2; exit 3" }, 2000);

  ASSERT_TRUE(output);
  EXPECT_EQ(output->exitCode, 3);
  EXPECT_EQ(output->stdoutText, "out\n");
  EXPECT_EQ(output->stderrText, "err\n");
}

TEST_F(ProcessTest, SlowProgramTimesOut) {
  Result<Process::Output> output = Process::Run({ "sleep", "2" }, 100);

  ASSERT_FALSE(output);
  EXPECT_EQ(output.error().code, Timeout);
}

TEST_F(ProcessTest, MissingProgramIsNotFound) {
  Result<Process::Output> output = Process::Run({ "gnome-mcp-no-such-helper" }, 2000);

  ASSERT_FALSE(output);
  EXPECT_EQ(output.error().code, NotFound);
}

TEST_F(ProcessTest, BackgroundDescendantDoesNotHoldTheCall) {
  const auto start = std::chrono::steady_clock::now();

  // The backgrounded sleep inherits the pipes, the way an app started by gtk-launch does.
  Result<Process::Output> output = Process::Run({ "sh", "-c", "sleep 3 & echo launched" }, 2000);

  ASSERT_TRUE(output);
  EXPECT_EQ(output->exitCode, 0);
  EXPECT_EQ(output->stdoutText, "launched\n");
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(ProcessTest, ChildDoesNotReadServerStdin) {
  Result<Process::Output> output = Process::Run({ "cat" }, 2000);

  ASSERT_TRUE(output);
  EXPECT_EQ(output->exitCode, 0);
  EXPECT_TRUE(output->stdoutText.empty());
}

TEST_F(ProcessTest, CheckedRunReportsStderr) {
  Result<Process::Output> output = Process::RunChecked({ "sh", "-c", "echo 'no default sink' >&2; exit 1" }, 2000);

  ASSERT_FALSE(output);
  EXPECT_EQ(output.error().code, PlatformSpecific);
  EXPECT_NE(output.error().message.find("no default sink"), String::npos);
}
