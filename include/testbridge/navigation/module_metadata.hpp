#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace testbridge::navigation {

// Line value marking a sequence point with no user-visible source line.
// DWARF line tables use line 0 for compiler-generated code.
inline constexpr uint32_t kHiddenLine = 0;

// Name of the continuation method of a compiler-generated state machine.
inline constexpr const char* kStateMachineResumeMethod = "resume";

struct SequencePoint {
  std::string document;
  uint32_t start_line = kHiddenLine;

  auto operator==(const SequencePoint&) const -> bool = default;
};

struct MethodDefinition {
  std::string name;
  std::string linkage_name;
  // Set when the method body was split into a coroutine state machine.
  // Names the TypeDefinition that holds the continuation.
  std::optional<std::string> state_machine_type;
  // Instruction order; empty when the method has no compiled body.
  std::vector<SequencePoint> sequence_points;
};

struct TypeDefinition {
  // Qualified with "::" for both namespaces and enclosing types
  std::string full_name;
  std::optional<std::string> base_type;
  std::vector<MethodDefinition> methods;
};

// Everything the navigator needs from one compiled binary.
struct ModuleMetadata {
  std::vector<TypeDefinition> types;
};

}  // namespace testbridge::navigation
