#include <string>

#include <fmt/core.h>

#include "testbridge/model/test_descriptor.hpp"
#include "testbridge/model/test_identity.hpp"

namespace testbridge::model {

auto TestId::ToString() const -> std::string {
  const auto& b = bytes;
  return fmt::format(
      "{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
      "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
      b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9], b[10], b[11],
      b[12], b[13], b[14], b[15]);
}

auto ToString(TestOutcome outcome) -> const char* {
  switch (outcome) {
    case TestOutcome::kNone:
      return "None";
    case TestOutcome::kPassed:
      return "Passed";
    case TestOutcome::kFailed:
      return "Failed";
    case TestOutcome::kSkipped:
      return "Skipped";
  }
  return "Unknown";
}

auto ToString(ResultState state) -> const char* {
  switch (state) {
    case ResultState::kSuccess:
      return "Success";
    case ResultState::kFailure:
      return "Failure";
    case ResultState::kError:
      return "Error";
    case ResultState::kCancelled:
      return "Cancelled";
    case ResultState::kInconclusive:
      return "Inconclusive";
    case ResultState::kNotRunnable:
      return "NotRunnable";
    case ResultState::kSkipped:
      return "Skipped";
    case ResultState::kIgnored:
      return "Ignored";
  }
  return "Unknown";
}

}  // namespace testbridge::model
