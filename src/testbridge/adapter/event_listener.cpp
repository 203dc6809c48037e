#include "testbridge/adapter/event_listener.hpp"

#include <string>
#include <string_view>

#include <fmt/core.h>

#include "testbridge/adapter/framework_handle.hpp"
#include "testbridge/model/test_descriptor.hpp"
#include "testbridge/model/test_identity.hpp"
#include "testbridge/translation/outcome_translator.hpp"

namespace testbridge::adapter {

void EventListener::TestStarted(std::string_view unique_name) {
  const model::TestDescriptor* test_case =
      converter_.GetCachedTestCase(unique_name);
  if (test_case != nullptr) {
    handle_.RecordStart(*test_case);
  }
}

void EventListener::TestFinished(const model::TestRunResult& result) {
  auto record = converter_.ConvertTestResult(result);
  if (!record) {
    return;
  }
  handle_.RecordEnd(record->test_case, record->outcome);
  handle_.RecordResult(*record);
}

void EventListener::TestOutput(std::string_view text, OutputStream /*stream*/) {
  std::string message = translation::NormalizeOutputChunk(text);
  if (!message.empty()) {
    handle_.SendMessage(MessageLevel::kInformational, message);
  }
}

void EventListener::UnhandledException(std::string_view message) {
  handle_.SendMessage(
      MessageLevel::kError, fmt::format("Unhandled exception: {}", message));
}

}  // namespace testbridge::adapter
