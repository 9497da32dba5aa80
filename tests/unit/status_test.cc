#include "procsup/status.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace procsup {

TEST(StatusTest, ExitedSuccess) {
  auto status = ExitStatus::exited(0, 42);
  EXPECT_TRUE(status.success());
  ASSERT_TRUE(status.code().has_value());
  EXPECT_EQ(status.code().value(), 0);
  EXPECT_FALSE(status.signal().has_value());
  EXPECT_EQ(status.native(), 42u);
}

TEST(StatusTest, ExitedCodesAreNotCorrected) {
  auto status = ExitStatus::exited(3);
  EXPECT_FALSE(status.success());
  EXPECT_EQ(status.raw_code(), 3);
  EXPECT_EQ(status.sign_corrected_code(), 3);
}

TEST(StatusTest, SignaledCodesAreSignCorrected) {
  auto status = ExitStatus::signaled(SIGKILL);
  EXPECT_FALSE(status.success());
  EXPECT_FALSE(status.code().has_value());
  ASSERT_TRUE(status.signal().has_value());
  EXPECT_EQ(status.signal().value(), SIGKILL);
  EXPECT_EQ(status.raw_code(), -SIGKILL);
  EXPECT_EQ(status.sign_corrected_code(), ExitStatus::kSignalExitBase + SIGKILL);
}

}  // namespace procsup
