#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "testbridge/navigation/metadata_reader.hpp"
#include "testbridge/navigation/module_metadata.hpp"
#include "testbridge/navigation/navigation_data.hpp"

namespace testbridge::navigation {

// Canonical qualified type name -> definition
using TypeIndex = std::unordered_map<std::string, TypeDefinition>;

// Resolves (class, method) pairs of one binary to source locations.
//
// The binary is read once, on the first request, and the resulting index
// lives as long as the navigator. The binary is assumed not to change
// during that time. Not thread-safe.
class SymbolNavigator {
 public:
  // Reads DWARF debug information from binary_path.
  explicit SymbolNavigator(std::string binary_path);
  SymbolNavigator(
      std::string binary_path, std::unique_ptr<MetadataReader> reader);

  SymbolNavigator(const SymbolNavigator&) = delete;
  auto operator=(const SymbolNavigator&) -> SymbolNavigator& = delete;
  SymbolNavigator(SymbolNavigator&&) = delete;
  auto operator=(SymbolNavigator&&) -> SymbolNavigator& = delete;
  virtual ~SymbolNavigator() = default;

  // Throws AssemblyLoadError if the index cannot be built. Every other
  // failure yields NavigationData::Invalid().
  virtual auto GetNavigationData(
      std::string_view class_name, std::string_view method_name)
      -> NavigationData;

  [[nodiscard]] auto BinaryPath() const -> const std::string& {
    return binary_path_;
  }

 private:
  auto Index() -> const TypeIndex&;

  std::string binary_path_;
  std::unique_ptr<MetadataReader> reader_;
  std::optional<TypeIndex> type_defs_;
  std::exception_ptr load_error_;
};

// Rewrites nested-type separators ("+" or "/") to "::".
auto StandardizeTypeName(std::string_view class_name) -> std::string;

// Builds the index from raw metadata. A type defined more than once (one
// copy per translation unit) is merged: methods keep their first
// declaration order and take the first copy that has a compiled body.
auto BuildTypeIndex(ModuleMetadata metadata) -> TypeIndex;

// Finds method_name on the type or the nearest base that declares it.
// The walk is bounded by the index size so cyclic metadata terminates.
auto FindMethod(
    const TypeIndex& index, const TypeDefinition& type,
    std::string_view method_name) -> const MethodDefinition*;

// Maps a declared method to the method holding its executable code: the
// state machine's continuation for coroutines, the method itself otherwise.
auto EffectiveMethod(const TypeIndex& index, const MethodDefinition& declared)
    -> const MethodDefinition&;

// First sequence point whose line is not kHiddenLine, or null.
auto FirstUnhiddenSequencePoint(const MethodDefinition& method)
    -> const SequencePoint*;

}  // namespace testbridge::navigation
