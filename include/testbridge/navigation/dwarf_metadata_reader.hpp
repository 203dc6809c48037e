#pragma once

#include <string>

#include "testbridge/navigation/metadata_reader.hpp"
#include "testbridge/navigation/module_metadata.hpp"

namespace testbridge::navigation {

// Reads types, member functions and line tables from the DWARF debug
// information of a native binary (or of its companion "<binary>.debug").
//
// Coroutines are recognised from their split continuation symbols
// ("<linkage>.resume" for Clang, "<linkage>.actor" for GCC). Each one becomes
// a state machine type named after the symbol with a single "resume" method.
class DwarfMetadataReader : public MetadataReader {
 public:
  auto Read(const std::string& path) -> ModuleMetadata override;
};

}  // namespace testbridge::navigation
