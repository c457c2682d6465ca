/***
 * Name: test_exec_wait
 * Purpose: fork/exec helper exit-code reporting.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pyscope/backend/detail/exec.h"

using namespace pyscope::backend::detail;

TEST(ExecAndWait, SuccessReturnsTrue) {
  std::vector<std::string> args{"sh", "-c", "exit 0"};
  auto argv = BuildArgvMutable(args);
  ASSERT_EQ(argv.back(), nullptr);
  int rc = -1;
  std::string err;
  EXPECT_TRUE(ExecAndWait(argv, rc, err));
  EXPECT_EQ(rc, 0);
}

TEST(ExecAndWait, NonZeroExitIsReported) {
  std::vector<std::string> args{"sh", "-c", "exit 3"};
  auto argv = BuildArgvMutable(args);
  int rc = 0;
  std::string err;
  EXPECT_FALSE(ExecAndWait(argv, rc, err));
  EXPECT_EQ(rc, 3);
  EXPECT_EQ(err.rfind("command failed (rc=3): sh -c exit 3", 0), 0u) << err;
}

TEST(ExecAndWait, MissingProgramExitsWithExecFailure) {
  std::vector<std::string> args{"/nonexistent/program"};
  auto argv = BuildArgvMutable(args);
  int rc = 0;
  std::string err;
  EXPECT_FALSE(ExecAndWait(argv, rc, err));
  EXPECT_EQ(rc, kExecFailure);
}

TEST(ExecAndWait, EmptyCommandLine) {
  std::vector<std::string> args;
  auto argv = BuildArgvMutable(args);
  int rc = 0;
  std::string err;
  EXPECT_FALSE(ExecAndWait(argv, rc, err));
  EXPECT_EQ(err, "empty command line");
}
