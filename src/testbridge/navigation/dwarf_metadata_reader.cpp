#include "testbridge/navigation/dwarf_metadata_reader.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/DebugInfo/DIContext.h>
#include <llvm/DebugInfo/DWARF/DWARFContext.h>
#include <llvm/DebugInfo/DWARF/DWARFDebugLine.h>
#include <llvm/DebugInfo/DWARF/DWARFDie.h>
#include <llvm/DebugInfo/DWARF/DWARFUnit.h>
#include <llvm/Object/ObjectFile.h>
#include <llvm/Object/SymbolSize.h>
#include <llvm/Support/Error.h>

#include "testbridge/navigation/metadata_reader.hpp"
#include "testbridge/navigation/module_metadata.hpp"

namespace testbridge::navigation {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 2> kContinuationSuffixes = {
    ".resume",  // Clang CoroSplit
    ".actor",   // GCC coroutine lowering
};

// Every function a coroutine is split into besides its ramp
constexpr std::array<std::string_view, 5> kSplitFunctionSuffixes = {
    ".resume", ".destroy", ".cleanup", ".actor", ".destroyer",
};

constexpr std::string_view kCompanionDebugSuffix = ".debug";

// DW_AT_specification / DW_AT_abstract_origin chains are short in practice
constexpr int kMaxDeclarationHops = 4;

template <typename T>
auto Unwrap(llvm::Expected<T> value, const std::string& path) -> T {
  if (!value) {
    throw AssemblyLoadError(path, llvm::toString(value.takeError()));
  }
  return std::move(*value);
}

auto IsTypeTag(llvm::dwarf::Tag tag) -> bool {
  return tag == llvm::dwarf::DW_TAG_class_type ||
         tag == llvm::dwarf::DW_TAG_structure_type ||
         tag == llvm::dwarf::DW_TAG_union_type;
}

auto IsDeclaration(const llvm::DWARFDie& die) -> bool {
  return die.find(llvm::dwarf::DW_AT_declaration).hasValue();
}

auto IsSplitFunction(std::string_view linkage_name) -> bool {
  return std::ranges::any_of(kSplitFunctionSuffixes, [&](std::string_view s) {
    return linkage_name.ends_with(s);
  });
}

// Qualified name from the enclosing namespaces and types.
// Empty for anonymous types, which cannot be named by a caller.
auto QualifiedName(llvm::DWARFDie die) -> std::string {
  std::vector<std::string> parts;
  for (llvm::DWARFDie current = die; current && !current.isNULL();
       current = current.getParent()) {
    auto tag = current.getTag();
    if (tag == llvm::dwarf::DW_TAG_compile_unit ||
        tag == llvm::dwarf::DW_TAG_partial_unit ||
        tag == llvm::dwarf::DW_TAG_type_unit) {
      break;
    }
    if (tag != llvm::dwarf::DW_TAG_namespace && !IsTypeTag(tag)) {
      continue;
    }
    const char* name = current.getShortName();
    if (name == nullptr) {
      if (tag != llvm::dwarf::DW_TAG_namespace) {
        return {};
      }
      parts.emplace_back("(anonymous namespace)");
    } else {
      parts.emplace_back(name);
    }
  }

  std::string result;
  for (const auto& part : std::views::reverse(parts)) {
    if (!result.empty()) {
      result += "::";
    }
    result += part;
  }
  return result;
}

// Follows typedefs and cv-qualifiers down to the named class type.
auto StripToClassType(llvm::DWARFDie die) -> llvm::DWARFDie {
  while (die) {
    auto tag = die.getTag();
    if (tag != llvm::dwarf::DW_TAG_typedef &&
        tag != llvm::dwarf::DW_TAG_const_type &&
        tag != llvm::dwarf::DW_TAG_volatile_type) {
      return die;
    }
    die = die.getAttributeValueAsReferencedDie(llvm::dwarf::DW_AT_type);
  }
  return die;
}

// Like StripToClassType, but also looks through pointers and references.
auto StripToPointee(llvm::DWARFDie die) -> llvm::DWARFDie {
  die = StripToClassType(die);
  while (die && (die.getTag() == llvm::dwarf::DW_TAG_pointer_type ||
                 die.getTag() == llvm::dwarf::DW_TAG_reference_type ||
                 die.getTag() == llvm::dwarf::DW_TAG_rvalue_reference_type)) {
    die = StripToClassType(
        die.getAttributeValueAsReferencedDie(llvm::dwarf::DW_AT_type));
  }
  return die;
}

struct MethodSlot {
  std::size_t type_index;
  std::size_t method_index;
};

struct Continuation {
  std::string symbol_name;
  // The ramp's declaration, when the debug info links the two
  std::optional<MethodSlot> owner;
  // Symbol name minus its suffix; Clang keeps the ramp's linkage name there
  std::string ramp_linkage_name;
  std::vector<SequencePoint> sequence_points;
};

class DwarfWalker {
 public:
  DwarfWalker(llvm::DWARFContext& context, std::string path)
      : context_(context), path_(std::move(path)) {
  }

  void Walk() {
    for (const auto& unit : context_.compile_units()) {
      VisitChildren(unit->getUnitDIE(false));
    }
    AttachDefinitions();
  }

  void AddContinuations(const llvm::object::ObjectFile& object) {
    for (const auto& [symbol, size] : llvm::object::computeSymbolSizes(object)) {
      auto type = Unwrap(symbol.getType(), path_);
      if (type != llvm::object::SymbolRef::ST_Function || size == 0) {
        continue;
      }
      std::string name = Unwrap(symbol.getName(), path_).str();
      auto suffix = std::ranges::find_if(
          kContinuationSuffixes,
          [&](std::string_view s) { return std::string_view(name).ends_with(s); });
      if (suffix == kContinuationSuffixes.end()) {
        continue;
      }

      uint64_t address = Unwrap(symbol.getAddress(), path_);
      auto section = Unwrap(symbol.getSection(), path_);
      uint64_t section_index = section == object.section_end()
                                   ? llvm::object::SectionedAddress::UndefSection
                                   : section->getIndex();

      auto dies = context_.getDIEsForAddress(address);
      std::optional<MethodSlot> owner;
      if (dies && dies.FunctionDIE) {
        owner = FindRamp(dies.FunctionDIE);
      }

      continuations_.push_back(
          Continuation{
              .symbol_name = name,
              .owner = owner,
              .ramp_linkage_name = name.substr(0, name.size() - suffix->size()),
              .sequence_points = ReadAddressRange(
                  dies.CompileUnit != nullptr
                      ? dies.CompileUnit
                      : context_.getCompileUnitForAddress(address),
                  llvm::object::SectionedAddress{address, section_index},
                  size),
          });
    }
  }

  auto TakeMetadata() -> ModuleMetadata {
    for (const auto& continuation : continuations_) {
      MethodDefinition* ramp = nullptr;
      if (continuation.owner) {
        ramp = &metadata_.types[continuation.owner->type_index]
                    .methods[continuation.owner->method_index];
      } else {
        ramp = FindByLinkageName(continuation.ramp_linkage_name);
      }
      if (ramp != nullptr) {
        ramp->state_machine_type = continuation.symbol_name;
      }
    }

    // GCC declares the split functions as member overloads of the ramp
    for (auto& type : metadata_.types) {
      std::erase_if(type.methods, [](const MethodDefinition& method) {
        return IsSplitFunction(method.linkage_name);
      });
    }

    for (auto& continuation : continuations_) {
      metadata_.types.push_back(
          TypeDefinition{
              .full_name = continuation.symbol_name,
              .base_type = std::nullopt,
              .methods = {MethodDefinition{
                  .name = kStateMachineResumeMethod,
                  .linkage_name = continuation.symbol_name,
                  .state_machine_type = std::nullopt,
                  .sequence_points = std::move(continuation.sequence_points),
              }},
          });
    }
    continuations_.clear();
    return std::move(metadata_);
  }

 private:
  void VisitChildren(const llvm::DWARFDie& parent) {
    for (const llvm::DWARFDie& child : parent.children()) {
      Visit(child);
    }
  }

  void Visit(const llvm::DWARFDie& die) {
    auto tag = die.getTag();
    if (tag == llvm::dwarf::DW_TAG_namespace) {
      VisitChildren(die);
    } else if (IsTypeTag(tag)) {
      VisitType(die);
    } else if (tag == llvm::dwarf::DW_TAG_subprogram && !IsDeclaration(die)) {
      pending_definitions_.push_back(die);
    }
  }

  void VisitType(const llvm::DWARFDie& die) {
    if (IsDeclaration(die)) {
      return;
    }
    std::string name = QualifiedName(die);
    if (name.empty()) {
      return;
    }

    std::size_t type_index = metadata_.types.size();
    metadata_.types.push_back(TypeDefinition{.full_name = std::move(name)});

    for (const llvm::DWARFDie& child : die.children()) {
      auto tag = child.getTag();
      if (tag == llvm::dwarf::DW_TAG_inheritance) {
        // The primary base comes first
        if (metadata_.types[type_index].base_type) {
          continue;
        }
        auto base = StripToClassType(
            child.getAttributeValueAsReferencedDie(llvm::dwarf::DW_AT_type));
        if (base) {
          std::string base_name = QualifiedName(base);
          if (!base_name.empty()) {
            metadata_.types[type_index].base_type = std::move(base_name);
          }
        }
      } else if (tag == llvm::dwarf::DW_TAG_subprogram) {
        AddMethod(type_index, child);
      } else if (IsTypeTag(tag)) {
        VisitType(child);
      }
    }
  }

  void AddMethod(std::size_t type_index, const llvm::DWARFDie& die) {
    const char* name = die.getShortName();
    if (name == nullptr) {
      return;
    }
    const char* linkage = die.getLinkageName();

    auto& methods = metadata_.types[type_index].methods;
    declarations_[die.getOffset()] =
        MethodSlot{.type_index = type_index, .method_index = methods.size()};
    methods.push_back(
        MethodDefinition{
            .name = name,
            .linkage_name = linkage != nullptr ? linkage : "",
            .state_machine_type = std::nullopt,
            .sequence_points = {},
        });

    // Rare: a declaration that carries its own code
    if (!IsDeclaration(die)) {
      methods.back().sequence_points = ReadSequencePoints(die);
    }
  }

  void AttachDefinitions() {
    for (const llvm::DWARFDie& definition : pending_definitions_) {
      auto slot = FindDeclaration(definition);
      if (!slot) {
        continue;
      }
      auto& method =
          metadata_.types[slot->type_index].methods[slot->method_index];
      if (!method.sequence_points.empty()) {
        continue;
      }
      method.sequence_points = ReadSequencePoints(definition);
      if (method.linkage_name.empty()) {
        if (const char* linkage = definition.getLinkageName()) {
          method.linkage_name = linkage;
        }
      }
    }
    pending_definitions_.clear();
  }

  auto FindDeclaration(llvm::DWARFDie die) const -> std::optional<MethodSlot> {
    for (int hop = 0; hop < kMaxDeclarationHops && die; ++hop) {
      auto it = declarations_.find(die.getOffset());
      if (it != declarations_.end()) {
        return it->second;
      }
      llvm::DWARFDie next =
          die.getAttributeValueAsReferencedDie(llvm::dwarf::DW_AT_specification);
      if (!next) {
        next = die.getAttributeValueAsReferencedDie(
            llvm::dwarf::DW_AT_abstract_origin);
      }
      die = next;
    }
    return std::nullopt;
  }

  // Maps the subprogram of a continuation to the declaration of its ramp.
  //
  // Clang's continuation keeps the ramp's DW_AT_specification. GCC's actor is
  // a member overload of its own, taking a pointer to a frame type that is
  // local to the ramp's definition.
  auto FindRamp(const llvm::DWARFDie& function) const
      -> std::optional<MethodSlot> {
    auto slot = FindDeclaration(function);
    if (slot && !IsSplitFunction(LinkageOf(*slot))) {
      return slot;
    }

    if (auto owner = FindFrameOwner(function)) {
      return owner;
    }
    if (slot) {
      return FindSiblingRamp(*slot);
    }
    return std::nullopt;
  }

  auto LinkageOf(const MethodSlot& slot) const -> const std::string& {
    return metadata_.types[slot.type_index]
        .methods[slot.method_index]
        .linkage_name;
  }

  auto FindFrameOwner(const llvm::DWARFDie& function) const
      -> std::optional<MethodSlot> {
    for (const llvm::DWARFDie& child : function.children()) {
      if (child.getTag() != llvm::dwarf::DW_TAG_formal_parameter) {
        continue;
      }
      auto frame = StripToPointee(
          child.getAttributeValueAsReferencedDie(llvm::dwarf::DW_AT_type));
      if (!frame || !IsTypeTag(frame.getTag())) {
        continue;
      }
      llvm::DWARFDie scope = frame.getParent();
      while (scope && scope.getTag() == llvm::dwarf::DW_TAG_lexical_block) {
        scope = scope.getParent();
      }
      if (scope && scope.getTag() == llvm::dwarf::DW_TAG_subprogram) {
        if (auto slot = FindDeclaration(scope)) {
          return slot;
        }
      }
    }
    return std::nullopt;
  }

  // The declared overload with the same name that is not itself split off.
  auto FindSiblingRamp(const MethodSlot& slot) const
      -> std::optional<MethodSlot> {
    const auto& methods = metadata_.types[slot.type_index].methods;
    const auto& name = methods[slot.method_index].name;
    for (std::size_t i = 0; i < methods.size(); ++i) {
      if (i != slot.method_index && methods[i].name == name &&
          !IsSplitFunction(methods[i].linkage_name)) {
        return MethodSlot{.type_index = slot.type_index, .method_index = i};
      }
    }
    return std::nullopt;
  }

  auto FindByLinkageName(std::string_view linkage_name) -> MethodDefinition* {
    for (auto& type : metadata_.types) {
      for (auto& method : type.methods) {
        if (!method.linkage_name.empty() && method.linkage_name == linkage_name) {
          return &method;
        }
      }
    }
    return nullptr;
  }

  auto ReadSequencePoints(const llvm::DWARFDie& die)
      -> std::vector<SequencePoint> {
    auto ranges = Unwrap(die.getAddressRanges(), path_);
    std::vector<SequencePoint> points;
    for (const auto& range : ranges) {
      if (!range.valid() || range.HighPC == range.LowPC) {
        continue;
      }
      auto range_points = ReadAddressRange(
          die.getDwarfUnit(),
          llvm::object::SectionedAddress{range.LowPC, range.SectionIndex},
          range.HighPC - range.LowPC);
      points.insert(
          points.end(), std::make_move_iterator(range_points.begin()),
          std::make_move_iterator(range_points.end()));
    }
    return points;
  }

  auto ReadAddressRange(
      llvm::DWARFUnit* unit, llvm::object::SectionedAddress address,
      uint64_t size) -> std::vector<SequencePoint> {
    std::vector<SequencePoint> points;
    if (unit == nullptr) {
      return points;
    }
    const auto* line_table = context_.getLineTableForUnit(unit);
    if (line_table == nullptr) {
      return points;
    }

    std::vector<uint32_t> rows;
    if (!line_table->lookupAddressRange(address, size, rows)) {
      return points;
    }

    const char* comp_dir = unit->getCompilationDir();
    for (uint32_t row_index : rows) {
      const auto& row = line_table->Rows[row_index];
      if (row.EndSequence) {
        continue;
      }
      std::string file;
      if (!line_table->getFileNameByIndex(
              row.File, comp_dir != nullptr ? comp_dir : "",
              llvm::DILineInfoSpecifier::FileLineInfoKind::AbsoluteFilePath,
              file)) {
        continue;
      }
      points.push_back(
          SequencePoint{.document = std::move(file), .start_line = row.Line});
    }
    return points;
  }

  llvm::DWARFContext& context_;
  std::string path_;
  ModuleMetadata metadata_;
  std::unordered_map<uint64_t, MethodSlot> declarations_;
  std::vector<llvm::DWARFDie> pending_definitions_;
  std::vector<Continuation> continuations_;
};

auto OpenObject(const std::string& path)
    -> llvm::object::OwningBinary<llvm::object::ObjectFile> {
  return Unwrap(llvm::object::ObjectFile::createObjectFile(path), path);
}

}  // namespace

auto DwarfMetadataReader::Read(const std::string& path) -> ModuleMetadata {
  auto binary = OpenObject(path);
  std::string debug_path = path;
  std::unique_ptr<llvm::DWARFContext> context =
      llvm::DWARFContext::create(*binary.getBinary());

  if (context->getNumCompileUnits() == 0) {
    debug_path = path + std::string(kCompanionDebugSuffix);
    if (!fs::exists(debug_path)) {
      throw AssemblyLoadError(path, "no DWARF debug information");
    }
    // Stripped binary: the companion carries both DWARF and the symbol table
    context.reset();
    binary = OpenObject(debug_path);
    context = llvm::DWARFContext::create(*binary.getBinary());
    if (context->getNumCompileUnits() == 0) {
      throw AssemblyLoadError(
          debug_path, "no DWARF debug information in companion file");
    }
  }

  DwarfWalker walker(*context, debug_path);
  walker.Walk();
  walker.AddContinuations(*binary.getBinary());
  return walker.TakeMetadata();
}

}  // namespace testbridge::navigation
