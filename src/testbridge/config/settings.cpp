#include "testbridge/config/settings.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "testbridge/common/diagnostic.hpp"

namespace testbridge::config {

namespace fs = std::filesystem;

auto FindSettings(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path settings_path = dir / kSettingsFileName;
    if (fs::exists(settings_path)) {
      return settings_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadSettings(const fs::path& settings_path) -> Result<BridgeSettings> {
  BridgeSettings settings;
  settings.root_dir = settings_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(settings_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", settings_path.string(),
                e.description())));
  }

  // [adapter] section (optional)
  if (auto adapter = tbl["adapter"]) {
    if (auto node = adapter["executor_uri"]) {
      auto uri = node.value<std::string>();
      if (!uri || uri->empty()) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'adapter.executor_uri' must be a non-empty string",
                    settings_path.string())));
      }
      settings.executor_uri = *uri;
    }
    if (auto node = adapter["interactive_host"]) {
      auto interactive = node.value<bool>();
      if (!interactive) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'adapter.interactive_host' must be a boolean",
                    settings_path.string())));
      }
      settings.interactive_host = *interactive;
    }
  }

  // [logging] section (optional)
  if (auto logging = tbl["logging"]) {
    if (auto node = logging["verbosity"]) {
      auto verbosity = node.value<int64_t>();
      if (!verbosity || *verbosity < 0) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'logging.verbosity' must be a non-negative integer",
                    settings_path.string())));
      }
      settings.verbosity = static_cast<int>(*verbosity);
    }
  }

  // [stack_trace] section (optional); an explicit list replaces the defaults
  if (auto stack_trace = tbl["stack_trace"]) {
    if (auto node = stack_trace["filters"]) {
      auto* filters_arr = node.as_array();
      if (filters_arr == nullptr) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'stack_trace.filters' must be an array of strings",
                    settings_path.string())));
      }
      std::vector<std::string> filters;
      for (const auto& elem : *filters_arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: 'stack_trace.filters' must be an array of strings",
                      settings_path.string())));
        }
        filters.push_back(*str);
      }
      settings.stack_trace_filters = std::move(filters);
    }
  }

  return settings;
}

}  // namespace testbridge::config
