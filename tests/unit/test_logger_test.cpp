#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "tests/common/fakes.hpp"
#include "testbridge/common/test_logger.hpp"

namespace testbridge::common {
namespace {

class TestLoggerTest : public ::testing::Test {
 protected:
  test::LogCapture log_;
};

TEST_F(TestLoggerTest, DefaultVerbosityKeepsWarningsAndErrors) {
  auto& logger = log_.Logger();
  logger.SetVerbosity(0);

  logger.SendDebugMessage("debug");
  logger.SendInformationalMessage("info");
  logger.SendWarningMessage("careful");
  logger.SendErrorMessage("broken");

  EXPECT_EQ(
      log_.Lines(), (std::vector<std::string>{"warning|careful", "error|broken"}));
}

TEST_F(TestLoggerTest, HigherVerbosityAddsDetail) {
  auto& logger = log_.Logger();
  logger.SetVerbosity(1);
  logger.SendDebugMessage("hidden");
  logger.SendInformationalMessage("shown");

  logger.SetVerbosity(2);
  logger.SendDebugMessage("now shown");

  EXPECT_EQ(
      log_.Lines(), (std::vector<std::string>{"info|shown", "debug|now shown"}));
}

TEST_F(TestLoggerTest, ErrorWithExceptionAppendsWhat) {
  log_.Logger().SendErrorMessage(
      "Exception converting a.B", std::runtime_error("bad line table"));
  EXPECT_EQ(
      log_.Lines(),
      (std::vector<std::string>{"error|Exception converting a.B: bad line table"}));
}

TEST_F(TestLoggerTest, CannedWarnings) {
  log_.Logger().NoTestsFoundIn("/build/a");
  log_.Logger().LoadingAssemblyFailedWarning("/build/b", "truncated");
  EXPECT_EQ(
      log_.Lines(), (std::vector<std::string>{
                        "warning|No tests found in /build/a",
                        "warning|Loading /build/b failed: truncated"}));
}

}  // namespace
}  // namespace testbridge::common
