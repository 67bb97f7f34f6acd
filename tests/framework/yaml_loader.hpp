#pragma once

#include <string>
#include <vector>

#include "tests/framework/test_case.hpp"

namespace arx::test {

auto LoadTestCasesFromYaml(const std::string& path) -> std::vector<TestCase>;

}  // namespace arx::test
