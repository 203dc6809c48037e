#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "testbridge/navigation/module_metadata.hpp"

namespace testbridge::navigation {

// The binary or its debug information could not be read.
class AssemblyLoadError : public std::runtime_error {
 public:
  AssemblyLoadError(const std::string& path, const std::string& detail)
      : std::runtime_error(
            fmt::format("cannot read debug metadata of {}: {}", path, detail)),
        path_(path) {
  }

  [[nodiscard]] auto Path() const -> const std::string& {
    return path_;
  }

 private:
  std::string path_;
};

// Source of type and method metadata for one compiled binary.
class MetadataReader {
 public:
  MetadataReader() = default;
  virtual ~MetadataReader() = default;

  MetadataReader(const MetadataReader&) = delete;
  auto operator=(const MetadataReader&) -> MetadataReader& = delete;
  MetadataReader(MetadataReader&&) = delete;
  auto operator=(MetadataReader&&) -> MetadataReader& = delete;

  // Throws AssemblyLoadError if the binary or its symbols are unreadable.
  virtual auto Read(const std::string& path) -> ModuleMetadata = 0;
};

}  // namespace testbridge::navigation
