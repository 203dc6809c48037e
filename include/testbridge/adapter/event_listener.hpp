#pragma once

#include <cstdint>
#include <string_view>

#include "testbridge/adapter/framework_handle.hpp"
#include "testbridge/adapter/test_converter.hpp"
#include "testbridge/model/test_identity.hpp"

namespace testbridge::adapter {

enum class OutputStream : uint8_t { kOut, kError, kLog, kTrace };

// Forwards framework execution callbacks to the runner's handle, translating
// tests and results through the converter.
class EventListener {
 public:
  EventListener(FrameworkHandle& handle, const TestConverter& converter)
      : handle_(handle), converter_(converter) {
  }

  void TestStarted(std::string_view unique_name);

  // RecordEnd, then RecordResult
  void TestFinished(const model::TestRunResult& result);

  void TestOutput(std::string_view text, OutputStream stream);

  void UnhandledException(std::string_view message);

 private:
  FrameworkHandle& handle_;
  const TestConverter& converter_;
};

}  // namespace testbridge::adapter
