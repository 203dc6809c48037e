#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace testbridge {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Invalid input for the bridge
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
};

// Single diagnostic item
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic
struct Diagnostic {
  DiagItem primary;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: host error (settings file unreadable, bad value type, ...)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
    };
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace testbridge
