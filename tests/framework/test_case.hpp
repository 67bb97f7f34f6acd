#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace arx::test {

struct ExpectedOutput {
  std::optional<std::string> exact;
  std::vector<std::string> contains;
  std::vector<std::string> not_contains;

  [[nodiscard]] auto IsExact() const -> bool {
    return exact.has_value();
  }
};

// Either the program runs (exit code and/or stdout) or it is rejected with a
// diagnostic of the given category ("type mismatch", "structural error", ...).
struct TestCase {
  std::string name;
  std::string feature;
  std::string source_yaml;  // Path to YAML file for error reporting
  std::string program;      // AST interchange document, as text
  std::string entry = "main";
  std::optional<int> expected_exit_code;
  std::optional<ExpectedOutput> expected_output;
  std::optional<std::string> expected_error;
  std::vector<std::string> expected_error_contains;

  [[nodiscard]] auto ExpectsError() const -> bool {
    return expected_error.has_value();
  }
};

// GTest printer for readable test names
inline void PrintTo(const TestCase& test_case, std::ostream* os) {
  *os << test_case.feature << "/" << test_case.name;
}

}  // namespace arx::test
