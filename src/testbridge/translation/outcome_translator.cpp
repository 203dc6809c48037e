#include "testbridge/translation/outcome_translator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "testbridge/model/test_descriptor.hpp"
#include "testbridge/model/test_identity.hpp"

namespace testbridge::translation {

namespace {

using model::ResultState;
using model::TestOutcome;

// Length of the line separator starting at pos (CRLF = 2), 0 if none.
auto SeparatorLength(std::string_view text, std::size_t pos) -> std::size_t {
  if (pos >= text.size()) {
    return 0;
  }
  if (text[pos] == '\r') {
    return pos + 1 < text.size() && text[pos + 1] == '\n' ? 2 : 1;
  }
  return text[pos] == '\n' ? 1 : 0;
}

// Position just past a caret line ("  ---^") starting at line_start,
// excluding its terminating separator. nullopt if the line is anything else.
auto CaretLineEnd(std::string_view text, std::size_t line_start)
    -> std::optional<std::size_t> {
  std::size_t cursor = line_start;
  while (cursor < text.size() && text[cursor] == ' ') {
    ++cursor;
  }
  while (cursor < text.size() && text[cursor] == '-') {
    ++cursor;
  }
  if (cursor < text.size() && text[cursor] == '^') {
    return cursor + 1;
  }
  return std::nullopt;
}

auto StripCaretLines(std::string_view message) -> std::string {
  std::string result;
  result.reserve(message.size());

  std::size_t pos = 0;
  while (pos < message.size()) {
    std::size_t sep = SeparatorLength(message, pos);
    if (sep == 0) {
      result += message[pos];
      ++pos;
      continue;
    }

    result.append(message.substr(pos, sep));
    pos += sep;

    auto caret_end = CaretLineEnd(message, pos);
    if (!caret_end) {
      continue;
    }
    std::size_t trailing = SeparatorLength(message, *caret_end);
    if (trailing != 0) {
      // Separator + caret line + separator collapse to the first separator
      pos = *caret_end + trailing;
    }
  }
  return result;
}

}  // namespace

auto OutcomeOf(ResultState state) -> TestOutcome {
  switch (state) {
    case ResultState::kSuccess:
      return TestOutcome::kPassed;
    case ResultState::kFailure:
      return TestOutcome::kFailed;
    case ResultState::kError:
      return TestOutcome::kFailed;
    case ResultState::kNotRunnable:
      return TestOutcome::kFailed;
    case ResultState::kIgnored:
      return TestOutcome::kSkipped;
    case ResultState::kSkipped:
      return TestOutcome::kSkipped;
    case ResultState::kCancelled:
      return TestOutcome::kNone;
    case ResultState::kInconclusive:
      return TestOutcome::kNone;
  }
  return TestOutcome::kNone;
}

auto NormalizeMessage(
    const std::optional<std::string>& message, ResultState state,
    bool interactive_host) -> std::optional<std::string> {
  if (!message) {
    return std::nullopt;
  }
  if (interactive_host &&
      (state == ResultState::kFailure || state == ResultState::kInconclusive)) {
    return StripCaretLines(*message);
  }
  return message;
}

auto NormalizeOutputChunk(std::string_view text) -> std::string {
  std::size_t drop = 0;
  if (text.ends_with("\r\n")) {
    drop = 2;
  } else if (text.ends_with('\n') || text.ends_with('\r')) {
    drop = 1;
  }
  return std::string(text.substr(0, text.size() - drop));
}

}  // namespace testbridge::translation
