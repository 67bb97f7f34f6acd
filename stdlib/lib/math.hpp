#pragma once

#include <cstdint>

extern "C" {

// abs(INT32_MIN) wraps to INT32_MIN
auto math_abs_int(int32_t value) -> int32_t;
auto math_abs_float(double value) -> double;
auto math_min_int(int32_t lhs, int32_t rhs) -> int32_t;
auto math_min_float(double lhs, double rhs) -> double;
auto math_max_int(int32_t lhs, int32_t rhs) -> int32_t;
auto math_max_float(double lhs, double rhs) -> double;
auto math_sqrt(double value) -> double;
auto math_pow(double base, double exponent) -> double;
// Wraps modulo 2^32 on overflow
auto math_pow_int(int32_t base, int32_t exponent) -> int32_t;
auto math_to_float(int32_t value) -> double;
// Truncates toward zero, saturating at the int range; NaN becomes 0
auto math_to_int(double value) -> int32_t;
}
