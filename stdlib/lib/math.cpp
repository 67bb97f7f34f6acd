#include "math.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

extern "C" {

// Integer results wrap like the language's own arithmetic.
auto math_abs_int(int32_t value) -> int32_t {
  auto magnitude = static_cast<uint32_t>(value);
  if (value < 0) {
    magnitude = 0U - magnitude;
  }
  return static_cast<int32_t>(magnitude);
}

auto math_abs_float(double value) -> double {
  return std::fabs(value);
}

auto math_min_int(int32_t lhs, int32_t rhs) -> int32_t {
  return lhs < rhs ? lhs : rhs;
}

auto math_min_float(double lhs, double rhs) -> double {
  return std::fmin(lhs, rhs);
}

auto math_max_int(int32_t lhs, int32_t rhs) -> int32_t {
  return lhs > rhs ? lhs : rhs;
}

auto math_max_float(double lhs, double rhs) -> double {
  return std::fmax(lhs, rhs);
}

auto math_sqrt(double value) -> double {
  return std::sqrt(value);
}

auto math_pow(double base, double exponent) -> double {
  return std::pow(base, exponent);
}

// Negative exponents yield 0 (integer division semantics).
auto math_pow_int(int32_t base, int32_t exponent) -> int32_t {
  if (exponent < 0) {
    return 0;
  }
  uint32_t result = 1;
  auto factor = static_cast<uint32_t>(base);
  while (true) {
    if ((exponent & 1) != 0) {
      result *= factor;
    }
    exponent >>= 1;
    if (exponent == 0) {
      break;
    }
    factor *= factor;
  }
  return static_cast<int32_t>(result);
}

auto math_to_float(int32_t value) -> double {
  return static_cast<double>(value);
}

auto math_to_int(double value) -> int32_t {
  using Limits = std::numeric_limits<int32_t>;
  if (std::isnan(value)) {
    return 0;
  }
  if (value <= static_cast<double>(Limits::min())) {
    return Limits::min();
  }
  if (value >= static_cast<double>(Limits::max())) {
    return Limits::max();
  }
  return static_cast<int32_t>(value);
}

}  // extern "C"
