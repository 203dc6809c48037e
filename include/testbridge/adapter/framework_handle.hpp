#pragma once

#include <cstdint>
#include <string>

#include "testbridge/model/test_descriptor.hpp"

namespace testbridge::adapter {

enum class MessageLevel : uint8_t { kInformational, kWarning, kError };

// Receives execution events on behalf of the external runner.
class FrameworkHandle {
 public:
  FrameworkHandle() = default;
  virtual ~FrameworkHandle() = default;

  FrameworkHandle(const FrameworkHandle&) = delete;
  auto operator=(const FrameworkHandle&) -> FrameworkHandle& = delete;
  FrameworkHandle(FrameworkHandle&&) = delete;
  auto operator=(FrameworkHandle&&) -> FrameworkHandle& = delete;

  virtual void RecordStart(const model::TestDescriptor& test_case) = 0;
  virtual void RecordEnd(
      const model::TestDescriptor& test_case, model::TestOutcome outcome) = 0;
  virtual void RecordResult(const model::TestResultRecord& result) = 0;
  virtual void SendMessage(MessageLevel level, const std::string& message) = 0;
};

// Receives test cases found during discovery.
class TestCaseDiscoverySink {
 public:
  TestCaseDiscoverySink() = default;
  virtual ~TestCaseDiscoverySink() = default;

  TestCaseDiscoverySink(const TestCaseDiscoverySink&) = delete;
  auto operator=(const TestCaseDiscoverySink&)
      -> TestCaseDiscoverySink& = delete;
  TestCaseDiscoverySink(TestCaseDiscoverySink&&) = delete;
  auto operator=(TestCaseDiscoverySink&&) -> TestCaseDiscoverySink& = delete;

  virtual void SendTestCase(const model::TestDescriptor& test_case) = 0;
};

}  // namespace testbridge::adapter
