#include <optional>
#include <string>
#include <tuple>

#include <gtest/gtest.h>

#include "testbridge/model/test_descriptor.hpp"
#include "testbridge/model/test_identity.hpp"
#include "testbridge/translation/outcome_translator.hpp"

namespace testbridge::translation {
namespace {

using model::ResultState;
using model::TestOutcome;

// =============================================================================
// OutcomeOf
// =============================================================================

class OutcomeOfTest
    : public ::testing::TestWithParam<std::tuple<ResultState, TestOutcome>> {};

TEST_P(OutcomeOfTest, MapsResultState) {
  auto [state, expected] = GetParam();
  EXPECT_EQ(OutcomeOf(state), expected);
}

INSTANTIATE_TEST_SUITE_P(
    AllStates, OutcomeOfTest,
    ::testing::Values(
        std::make_tuple(ResultState::kSuccess, TestOutcome::kPassed),
        std::make_tuple(ResultState::kFailure, TestOutcome::kFailed),
        std::make_tuple(ResultState::kError, TestOutcome::kFailed),
        std::make_tuple(ResultState::kNotRunnable, TestOutcome::kFailed),
        std::make_tuple(ResultState::kIgnored, TestOutcome::kSkipped),
        std::make_tuple(ResultState::kSkipped, TestOutcome::kSkipped),
        std::make_tuple(ResultState::kCancelled, TestOutcome::kNone),
        std::make_tuple(ResultState::kInconclusive, TestOutcome::kNone)));

// =============================================================================
// NormalizeOutputChunk
// =============================================================================

struct OutputCase {
  std::string input;
  std::string expected;
};

class NormalizeOutputChunkTest : public ::testing::TestWithParam<OutputCase> {};

TEST_P(NormalizeOutputChunkTest, StripsOneTrailingLineEnding) {
  EXPECT_EQ(NormalizeOutputChunk(GetParam().input), GetParam().expected);
}

INSTANTIATE_TEST_SUITE_P(
    LineEndings, NormalizeOutputChunkTest,
    ::testing::Values(
        OutputCase{"MESSAGE", "MESSAGE"},
        OutputCase{"MESSAGE\n", "MESSAGE"},
        OutputCase{"MESSAGE\r\n", "MESSAGE"},
        OutputCase{"MESSAGE\r", "MESSAGE"},
        OutputCase{"LINE#1\n\tLINE#2", "LINE#1\n\tLINE#2"},
        OutputCase{"LINE#1\r\n\tLINE#2", "LINE#1\r\n\tLINE#2"},
        OutputCase{"LINE#1\r\tLINE#2", "LINE#1\r\tLINE#2"},
        OutputCase{"LINE#1\r\n\tLINE#2\r\n", "LINE#1\r\n\tLINE#2"},
        OutputCase{"MESSAGE\n\n", "MESSAGE\n"},
        OutputCase{"MESSAGE\r\n\r\n", "MESSAGE\r\n"},
        OutputCase{"MESSAGE\r\r", "MESSAGE\r"},
        OutputCase{"", ""},
        OutputCase{"\n", ""},
        OutputCase{"\r\n", ""}));

// =============================================================================
// NormalizeMessage
// =============================================================================

TEST(NormalizeMessageTest, AbsentMessageStaysAbsent) {
  EXPECT_EQ(
      NormalizeMessage(std::nullopt, ResultState::kFailure, true),
      std::nullopt);
}

TEST(NormalizeMessageTest, PassesThroughOutsideInteractiveHost) {
  std::string message = "Expected: 1\n  ---^\nBut was: 2";
  EXPECT_EQ(
      NormalizeMessage(message, ResultState::kFailure, false),
      std::optional<std::string>(message));
}

TEST(NormalizeMessageTest, StripsCaretLineForFailure) {
  EXPECT_EQ(
      NormalizeMessage(
          "Expected: \"abc\"\n  But was:  \"abd\"\n  ----------------^\n",
          ResultState::kFailure, true),
      std::optional<std::string>(
          "Expected: \"abc\"\n  But was:  \"abd\"\n"));
}

TEST(NormalizeMessageTest, StripsCaretLineForInconclusive) {
  EXPECT_EQ(
      NormalizeMessage("A\n  --^\nB", ResultState::kInconclusive, true),
      std::optional<std::string>("A\nB"));
}

TEST(NormalizeMessageTest, IsLineEndingAgnostic) {
  EXPECT_EQ(
      NormalizeMessage("A\r\n  --^\r\nB", ResultState::kFailure, true),
      std::optional<std::string>("A\r\nB"));
  EXPECT_EQ(
      NormalizeMessage("A\r  --^\rB", ResultState::kFailure, true),
      std::optional<std::string>("A\rB"));
}

TEST(NormalizeMessageTest, KeepsCaretLineForOtherStates) {
  std::string message = "A\n  --^\nB";
  EXPECT_EQ(
      NormalizeMessage(message, ResultState::kError, true),
      std::optional<std::string>(message));
  EXPECT_EQ(
      NormalizeMessage(message, ResultState::kSuccess, true),
      std::optional<std::string>(message));
}

TEST(NormalizeMessageTest, KeepsCaretLineWithoutBothSeparators) {
  EXPECT_EQ(
      NormalizeMessage("A\n  --^", ResultState::kFailure, true),
      std::optional<std::string>("A\n  --^"));
  EXPECT_EQ(
      NormalizeMessage("  --^\nB", ResultState::kFailure, true),
      std::optional<std::string>("  --^\nB"));
}

TEST(NormalizeMessageTest, LeavesOtherLinesAlone) {
  std::string message = "A\n  -- x^\nB\n--\n^^\n";
  EXPECT_EQ(
      NormalizeMessage(message, ResultState::kFailure, true),
      std::optional<std::string>(message));
}

TEST(NormalizeMessageTest, AcceptsEmptyMessage) {
  EXPECT_EQ(
      NormalizeMessage(std::string(), ResultState::kFailure, true),
      std::optional<std::string>(""));
}

}  // namespace
}  // namespace testbridge::translation
