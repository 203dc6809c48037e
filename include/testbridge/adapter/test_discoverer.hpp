#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "testbridge/adapter/framework_handle.hpp"
#include "testbridge/adapter/test_converter.hpp"
#include "testbridge/common/test_logger.hpp"
#include "testbridge/config/settings.hpp"
#include "testbridge/model/test_identity.hpp"
#include "testbridge/navigation/symbol_navigator.hpp"

namespace testbridge::adapter {

// Loads the framework's test tree of one binary.
class TestAssemblyLoader {
 public:
  TestAssemblyLoader() = default;
  virtual ~TestAssemblyLoader() = default;

  TestAssemblyLoader(const TestAssemblyLoader&) = delete;
  auto operator=(const TestAssemblyLoader&) -> TestAssemblyLoader& = delete;
  TestAssemblyLoader(TestAssemblyLoader&&) = delete;
  auto operator=(TestAssemblyLoader&&) -> TestAssemblyLoader& = delete;

  // nullopt when the binary holds no tests of this framework.
  virtual auto Load(const std::string& source)
      -> std::optional<model::TestNode> = 0;
};

using NavigatorFactory =
    std::function<std::unique_ptr<navigation::SymbolNavigator>(
        const std::string& source)>;

// Navigators reading each binary's own DWARF information.
auto DwarfNavigatorFactory() -> NavigatorFactory;

class TestDiscoverer {
 public:
  TestDiscoverer(
      common::TestLogger& logger, const config::BridgeSettings& settings,
      NavigatorFactory navigator_factory = DwarfNavigatorFactory())
      : logger_(logger),
        settings_(settings),
        navigator_factory_(std::move(navigator_factory)) {
  }

  // Sends every test case of every source to the sink, in framework order.
  // A binary that fails to load is reported and skipped; a test case that
  // fails to convert is reported and skipped. Returns the number of cases
  // sent.
  auto DiscoverTests(
      const std::vector<std::string>& sources, TestAssemblyLoader& loader,
      TestCaseDiscoverySink& sink) -> int;

 private:
  auto ProcessTestCases(
      const model::TestNode& test, TestCaseDiscoverySink& sink,
      TestConverter& converter) -> int;

  common::TestLogger& logger_;
  const config::BridgeSettings& settings_;
  NavigatorFactory navigator_factory_;
};

}  // namespace testbridge::adapter
