#include "tests/fixtures/navigation_fixtures.hpp"

#include <coroutine>
#include <cstdint>

// Every line constant names the line that follows it. Keep each definition
// header on a single line.
namespace testbridge::fixtures {

const char* const kFixtureFile = __FILE__;

const uint32_t kInheritedTestLine = __LINE__ + 1;
auto BaseFixture::InheritedTest() -> int { return 1; }

const uint32_t kOwnTestLine = __LINE__ + 1;
auto DerivedFixture::OwnTest() -> int { return 2; }

const uint32_t kNestedTestLine = __LINE__ + 1;
auto DerivedFixture::Nested::NestedTest() -> int { return 3; }

const uint32_t kAsyncTestFirstLine = __LINE__ + 1;
auto CoroutineFixture::AsyncTest(int* out) -> FireAndForget {
  co_await std::suspend_never{};
  *out = 4;
}
const uint32_t kAsyncTestLastLine = __LINE__ - 1;

auto ExerciseFixtures() -> int {
  DerivedFixture derived;
  DerivedFixture::Nested nested;
  CoroutineFixture coroutine;
  int async_result = 0;
  coroutine.AsyncTest(&async_result);
  return derived.InheritedTest() + derived.OwnTest() + nested.NestedTest() +
         async_result;
}

}  // namespace testbridge::fixtures
