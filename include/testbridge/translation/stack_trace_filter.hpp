#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace testbridge::translation {

// Removes test-framework frames from a captured stack trace so the first
// frame shown is user code.
class StackTraceFilter {
 public:
  explicit StackTraceFilter(std::vector<std::string> patterns)
      : patterns_(std::move(patterns)) {
  }

  // Drops every line containing one of the patterns. Kept lines retain their
  // own separators except after the last kept line.
  [[nodiscard]] auto Filter(std::string_view stack_trace) const -> std::string;

 private:
  [[nodiscard]] auto IsFiltered(std::string_view line) const -> bool;

  std::vector<std::string> patterns_;
};

}  // namespace testbridge::translation
