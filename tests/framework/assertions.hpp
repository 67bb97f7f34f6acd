#pragma once

#include <string>

#include "tests/framework/test_case.hpp"

namespace arx::test {

// Normalize line endings to Unix style (\n)
auto NormalizeNewlines(std::string input) -> std::string;

// Assert output matches expected (exact or contains/not_contains)
void AssertOutput(const std::string& actual, const ExpectedOutput& expected);

}  // namespace arx::test
