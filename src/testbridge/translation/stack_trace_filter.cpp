#include "testbridge/translation/stack_trace_filter.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace testbridge::translation {

auto StackTraceFilter::IsFiltered(std::string_view line) const -> bool {
  return std::ranges::any_of(patterns_, [&](const std::string& pattern) {
    return !pattern.empty() && line.find(pattern) != std::string_view::npos;
  });
}

auto StackTraceFilter::Filter(std::string_view stack_trace) const
    -> std::string {
  std::string result;
  std::size_t pos = 0;
  while (pos < stack_trace.size()) {
    std::size_t line_end = stack_trace.find_first_of("\r\n", pos);
    if (line_end == std::string_view::npos) {
      line_end = stack_trace.size();
    }
    std::size_t next = line_end;
    if (next < stack_trace.size() && stack_trace[next] == '\r') {
      ++next;
    }
    if (next < stack_trace.size() && stack_trace[next] == '\n') {
      ++next;
    }

    if (!IsFiltered(stack_trace.substr(pos, line_end - pos))) {
      result.append(stack_trace.substr(pos, next - pos));
    }
    pos = next;
  }

  while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
    result.pop_back();
  }
  return result;
}

}  // namespace testbridge::translation
