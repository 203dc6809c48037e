#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace testbridge::navigation {

// Source location of a test method. Invalid() means no data was found,
// which is not an error.
struct NavigationData {
  bool is_valid = false;
  std::string file_path;
  uint32_t line_number = 0;

  static auto Invalid() -> NavigationData {
    return NavigationData{};
  }

  auto operator==(const NavigationData&) const -> bool = default;
};

inline void PrintTo(const NavigationData& data, std::ostream* os) {
  if (!data.is_valid) {
    *os << "<invalid>";
    return;
  }
  *os << data.file_path << ":" << data.line_number;
}

}  // namespace testbridge::navigation
