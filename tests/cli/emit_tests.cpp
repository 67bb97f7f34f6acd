#include <gtest/gtest.h>
#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace arx::test {
namespace {

class EmitTest : public CliTestFixture {};

TEST_F(EmitTest, PrintsIrToStdout) {
  WriteProgram("hello.ast.yaml", "hi", 0);

  auto result = Run({"emit", "hello.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("define i32 @main()"), std::string::npos);
  EXPECT_NE(result.output.find("declare void @core_print_str"),
            std::string::npos);
  EXPECT_NE(result.output.find("c\"hi\\00\""), std::string::npos);
}

TEST_F(EmitTest, WritesIrToFile) {
  WriteProgram("hello.ast.yaml", "hi", 0);

  auto result = Run({"emit", "-o", "hello.ll", "hello.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  ASSERT_TRUE(FileExists("hello.ll"));
  EXPECT_NE(ReadFile("hello.ll").find("@main"), std::string::npos);
}

TEST_F(EmitTest, ModuleIsNamedAfterFileStem) {
  WriteProgram("demo.ast.yaml", "x", 0);

  auto result = Run({"emit", "demo.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("ModuleID = 'demo'"), std::string::npos);
}

TEST_F(EmitTest, ExtraMapDirectoryAddsModule) {
  WriteFile(
      "maps/greet.map",
      "[meta]\nname = greet\n\n[functions]\nhello:str = greet_hello > void\n");
  WriteFile(
      "prog.ast.yaml",
      "uses: [greet]\n"
      "functions:\n"
      "  - name: main\n"
      "    return: int\n"
      "    body:\n"
      "      - expr: {method: {object: greet, name: hello, args: [{str: a}]}}\n"
      "      - return: {int: 0}\n");

  auto result = Run({"emit", "-M", "maps", "prog.ast.yaml"});

  ASSERT_TRUE(result.Success()) << result.output;
  EXPECT_NE(result.output.find("declare void @greet_hello"), std::string::npos);
}

TEST_F(EmitTest, CheckReportsLocationAndCategory) {
  WriteFile(
      "bad.ast.yaml",
      "functions:\n"
      "  - name: main\n"
      "    return: int\n"
      "    body:\n"
      "      - return: {var: missing}\n");

  auto result = Run({"check", "bad.ast.yaml"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("bad.ast.yaml:5"), std::string::npos)
      << result.output;
  EXPECT_NE(result.output.find("undefined variable 'missing'"),
            std::string::npos);
  EXPECT_NE(result.output.find("[unresolved reference]"), std::string::npos);
}

TEST_F(EmitTest, MissingInputFile) {
  auto result = Run({"check", "nope.ast.yaml"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("input file not found"), std::string::npos);
}

TEST_F(EmitTest, NoInputAndNoConfig) {
  auto result = Run({"emit"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("no input file"), std::string::npos);
}

TEST_F(EmitTest, MalformedAstIsAnInputError) {
  WriteFile("bad.ast.yaml", "functions: [\n");

  auto result = Run({"check", "bad.ast.yaml"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.output.find("[input error]"), std::string::npos);
}

}  // namespace
}  // namespace arx::test
