#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace arx::common {

// Exception type for internal arx errors (compiler bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "internal error in {}: {}\n"
                "This is a bug in arx, not in the program being compiled.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace arx::common
