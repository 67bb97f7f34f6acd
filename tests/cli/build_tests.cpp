#include <gtest/gtest.h>
#include <string>

#include "arx/common/subprocess.hpp"
#include "arx/toolchain/toolchain.hpp"
#include "tests/cli/cli_test_fixture.hpp"

namespace arx::test {
namespace {

class BuildTest : public CliTestFixture {
 protected:
  void SetUp() override {
    CliTestFixture::SetUp();
    auto status = toolchain::CheckToolchain("llc", "c++");
    if (!status.ok) {
      GTEST_SKIP() << "llc or c++ not available";
    }
  }
};

TEST_F(BuildTest, BuildsAndRunsExecutable) {
  WriteProgram("hello.ast.yaml", "Hello, native!", 3);

  auto result = Run({"build", "hello.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("[lib] (core)"), std::string::npos);
  EXPECT_NE(result.output.find("Built at"), std::string::npos);
  ASSERT_TRUE(FileExists("out/bin/hello"));
  EXPECT_TRUE(FileExists("out/build/hello.ll"));
  EXPECT_TRUE(FileExists("out/build/hello.o"));

  auto run = common::RunSubprocess({(TestDir() / "out/bin/hello").string()});
  EXPECT_EQ(run.exit_code, 3);
  EXPECT_EQ(run.output, "Hello, native!\n");
}

TEST_F(BuildTest, InitThenBuild) {
  ASSERT_TRUE(Run({"init", "app"}).Success());

  auto result = RunIn(TestDir() / "app", {"build"});

  ASSERT_TRUE(result.Success()) << result.output;
  auto run =
      common::RunSubprocess({(TestDir() / "app/out/bin/app").string()});
  EXPECT_EQ(run.exit_code, 0);
  EXPECT_EQ(run.output, "Hello from app!\n");
}

TEST_F(BuildTest, MissingLibrarySourceFailsBeforeCompiling) {
  WriteFile(
      "maps/ghost.map",
      "[meta]\nname = ghost\n\n[functions]\nboo = ghost_boo > int\n");
  WriteFile(
      "main.ast.yaml",
      "uses: [ghost]\n"
      "functions:\n"
      "  - name: main\n"
      "    return: int\n"
      "    body:\n"
      "      - return: {method: {object: ghost, name: boo}}\n");

  auto result = Run({"build", "-M", "maps", "main.ast.yaml"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("ghost.cpp"), std::string::npos)
      << result.output;
  EXPECT_FALSE(FileExists("out/bin/main"));
}

TEST_F(BuildTest, VerboseShowsPhaseSummary) {
  WriteProgram("p.ast.yaml", "v", 0);

  auto result = Run({"build", "-v", "p.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("lower"), std::string::npos);
  EXPECT_NE(result.output.find("llc"), std::string::npos);
}

}  // namespace
}  // namespace arx::test
