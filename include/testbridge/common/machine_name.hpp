#pragma once

#include <string>

namespace testbridge::common {

// Host name of the machine running the tests, as reported in results.
// Returns "localhost" when the host name cannot be determined.
auto GetMachineName() -> std::string;

}  // namespace testbridge::common
