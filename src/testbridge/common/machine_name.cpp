#include "testbridge/common/machine_name.hpp"

#include <array>
#include <string>

#include <unistd.h>

namespace testbridge::common {

auto GetMachineName() -> std::string {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return "localhost";
  }
  std::string name(buffer.data());
  if (name.empty()) {
    return "localhost";
  }
  return name;
}

}  // namespace testbridge::common
