#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "testbridge/common/diagnostic.hpp"

namespace testbridge::config {

inline constexpr const char* kDefaultExecutorUri = "executor://testbridge/v1";
inline constexpr const char* kSettingsFileName = "testbridge.toml";

struct BridgeSettings {
  // Identifies the executor that owns every descriptor we produce
  std::string executor_uri = kDefaultExecutorUri;

  // Host renders messages in a variable-width font (caret lines stripped)
  bool interactive_host = false;

  int verbosity = 0;

  // Stack trace lines containing any of these are dropped
  std::vector<std::string> stack_trace_filters = {
      "testing::internal::",  "testing::Test::Run",
      "testing::TestInfo::Run", "testing::TestSuite::Run",
      "testing::UnitTest::Run",
  };

  // Directory where testbridge.toml was found (empty for defaults)
  std::filesystem::path root_dir;
};

// Search for testbridge.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindSettings(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse testbridge.toml. Every key is optional; a key with the wrong value
// type is an error.
auto LoadSettings(const std::filesystem::path& settings_path)
    -> Result<BridgeSettings>;

}  // namespace testbridge::config
