#include "testbridge/navigation/symbol_navigator.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "testbridge/navigation/dwarf_metadata_reader.hpp"
#include "testbridge/navigation/metadata_reader.hpp"
#include "testbridge/navigation/module_metadata.hpp"
#include "testbridge/navigation/navigation_data.hpp"

namespace testbridge::navigation {

namespace {

void MergeType(TypeDefinition& existing, TypeDefinition&& incoming) {
  if (!existing.base_type && incoming.base_type) {
    existing.base_type = std::move(incoming.base_type);
  }
  for (auto& method : incoming.methods) {
    auto it = std::ranges::find_if(
        existing.methods, [&](const MethodDefinition& m) {
          return m.name == method.name && m.linkage_name == method.linkage_name;
        });
    if (it == existing.methods.end()) {
      existing.methods.push_back(std::move(method));
      continue;
    }
    if (it->sequence_points.empty() && !method.sequence_points.empty()) {
      it->sequence_points = std::move(method.sequence_points);
    }
    if (!it->state_machine_type && method.state_machine_type) {
      it->state_machine_type = std::move(method.state_machine_type);
    }
  }
}

}  // namespace

SymbolNavigator::SymbolNavigator(std::string binary_path)
    : SymbolNavigator(
          std::move(binary_path), std::make_unique<DwarfMetadataReader>()) {
}

SymbolNavigator::SymbolNavigator(
    std::string binary_path, std::unique_ptr<MetadataReader> reader)
    : binary_path_(std::move(binary_path)), reader_(std::move(reader)) {
}

auto SymbolNavigator::Index() -> const TypeIndex& {
  if (load_error_) {
    std::rethrow_exception(load_error_);
  }
  if (!type_defs_) {
    try {
      type_defs_ = BuildTypeIndex(reader_->Read(binary_path_));
    } catch (const AssemblyLoadError&) {
      load_error_ = std::current_exception();
      throw;
    }
    // The index owns everything it needs from here on
    reader_.reset();
  }
  return *type_defs_;
}

auto SymbolNavigator::GetNavigationData(
    std::string_view class_name, std::string_view method_name)
    -> NavigationData {
  const TypeIndex& index = Index();

  auto type_it = index.find(StandardizeTypeName(class_name));
  if (type_it == index.end()) {
    return NavigationData::Invalid();
  }

  // The framework may report the most-derived fixture even when the test
  // method is declared on one of its bases.
  const MethodDefinition* declared =
      FindMethod(index, type_it->second, method_name);
  if (declared == nullptr) {
    return NavigationData::Invalid();
  }

  const SequencePoint* point =
      FirstUnhiddenSequencePoint(EffectiveMethod(index, *declared));
  if (point == nullptr) {
    return NavigationData::Invalid();
  }
  return NavigationData{
      .is_valid = true,
      .file_path = point->document,
      .line_number = point->start_line,
  };
}

auto StandardizeTypeName(std::string_view class_name) -> std::string {
  std::string result;
  result.reserve(class_name.size());
  for (char c : class_name) {
    if (c == '+' || c == '/') {
      result += "::";
    } else {
      result += c;
    }
  }
  return result;
}

auto BuildTypeIndex(ModuleMetadata metadata) -> TypeIndex {
  TypeIndex index;
  for (auto& type : metadata.types) {
    auto it = index.find(type.full_name);
    if (it == index.end()) {
      std::string key = type.full_name;
      index.emplace(std::move(key), std::move(type));
    } else {
      MergeType(it->second, std::move(type));
    }
  }
  return index;
}

auto FindMethod(
    const TypeIndex& index, const TypeDefinition& type,
    std::string_view method_name) -> const MethodDefinition* {
  const TypeDefinition* current = &type;
  for (std::size_t depth = 0; depth <= index.size(); ++depth) {
    auto method_it = std::ranges::find_if(
        current->methods,
        [&](const MethodDefinition& m) { return m.name == method_name; });
    if (method_it != current->methods.end()) {
      return &*method_it;
    }

    if (!current->base_type) {
      return nullptr;
    }
    auto base_it = index.find(*current->base_type);
    if (base_it == index.end()) {
      return nullptr;
    }
    current = &base_it->second;
  }
  return nullptr;
}

auto EffectiveMethod(const TypeIndex& index, const MethodDefinition& declared)
    -> const MethodDefinition& {
  if (!declared.state_machine_type) {
    return declared;
  }
  auto it = index.find(*declared.state_machine_type);
  if (it == index.end()) {
    return declared;
  }
  auto resume = std::ranges::find_if(
      it->second.methods, [](const MethodDefinition& m) {
        return m.name == kStateMachineResumeMethod;
      });
  if (resume == it->second.methods.end()) {
    return declared;
  }
  return *resume;
}

auto FirstUnhiddenSequencePoint(const MethodDefinition& method)
    -> const SequencePoint* {
  auto it = std::ranges::find_if(
      method.sequence_points,
      [](const SequencePoint& sp) { return sp.start_line != kHiddenLine; });
  if (it == method.sequence_points.end()) {
    return nullptr;
  }
  return &*it;
}

}  // namespace testbridge::navigation
