#include <gtest/gtest.h>
#include <string_view>

#include "tests/framework/jit_runner.hpp"

auto main(int argc, char** argv) -> int {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

namespace {

auto Run(std::string_view yaml) -> arx::test::RunResult {
  auto result = arx::test::RunYaml(yaml);
  EXPECT_TRUE(result.has_value()) << result.error();
  return result.value_or(arx::test::RunResult{.exit_code = -1, .output = {}});
}

}  // namespace

TEST(LoopTest, ForInVisitsElementsInOrder) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare_list: {type: int, name: xs, value: {list: [{int: 3}, {int: 1}, {int: 2}]}}
      - for:
          type: int
          var: x
          in: {var: xs}
          body:
            - expr: {method: {object: core, name: print, args: [{var: x}]}}
      - return: {int: 0}
)");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "3\n1\n2\n");
}

TEST(LoopTest, ForInSumsList) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: total, value: {int: 0}}
      - for:
          type: int
          var: x
          in: {list: [{int: 10}, {int: 20}, {int: 12}]}
          body:
            - assign:
                name: total
                value: {binop: {op: "+", lhs: {var: total}, rhs: {var: x}}}
      - return: {var: total}
)");
  EXPECT_EQ(result.exit_code, 42);
}

TEST(LoopTest, ForInOverEmptyListSkipsBody) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare_list: {type: int, name: xs, value: {list: []}}
      - declare: {type: int, name: n, value: {int: 7}}
      - for:
          type: int
          var: x
          in: {var: xs}
          body:
            - assign: {name: n, value: {int: 0}}
      - return: {var: n}
)");
  EXPECT_EQ(result.exit_code, 7);
}

TEST(LoopTest, ForInOverStrings) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare_list: {type: str, name: names, value: {list: [{str: ada}, {str: bob}]}}
      - for:
          type: str
          var: name
          in: {var: names}
          body:
            - expr:
                method:
                  object: core
                  name: print
                  args: [{binop: {op: "+", lhs: {str: "hi "}, rhs: {var: name}}}]
      - return: {method: {object: core, name: len, args: [{var: names}]}}
)");
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_EQ(result.output, "hi ada\nhi bob\n");
}

TEST(LoopTest, ForInOverFloats) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - for:
          type: float
          var: f
          in: {list: [{float: 0.5}, {float: 2.25}]}
          body:
            - expr: {method: {object: core, name: print, args: [{var: f}]}}
      - return: {int: 0}
)");
  EXPECT_EQ(result.output, "0.5\n2.25\n");
}

TEST(LoopTest, BreakLeavesOnlyInnerLoop) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: count, value: {int: 0}}
      - for:
          type: int
          var: i
          in: {list: [{int: 1}, {int: 2}, {int: 3}]}
          body:
            - for:
                type: int
                var: j
                in: {list: [{int: 1}, {int: 2}, {int: 3}]}
                body:
                  - if:
                      - cond: {binop: {op: "==", lhs: {var: j}, rhs: {int: 2}}}
                        body: [break]
                  - assign:
                      name: count
                      value: {binop: {op: "+", lhs: {var: count}, rhs: {int: 1}}}
            - expr: {method: {object: core, name: print, args: [{var: i}]}}
      - return: {var: count}
)");
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.output, "1\n2\n3\n");
}

TEST(LoopTest, ContinueSkipsRestOfBody) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: sum, value: {int: 0}}
      - for:
          type: int
          var: x
          in: {list: [{int: 1}, {int: 2}, {int: 3}, {int: 4}]}
          body:
            - if:
                - cond: {binop: {op: "==", lhs: {binop: {op: "%", lhs: {var: x}, rhs: {int: 2}}}, rhs: {int: 0}}}
                  body: [continue]
            - assign:
                name: sum
                value: {binop: {op: "+", lhs: {var: sum}, rhs: {var: x}}}
      - return: {var: sum}
)");
  EXPECT_EQ(result.exit_code, 4);
}

TEST(LoopTest, WhileCounter) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: i, value: {int: 0}}
      - declare: {type: int, name: sum, value: {int: 0}}
      - while:
          cond: {binop: {op: "<", lhs: {var: i}, rhs: {int: 5}}}
          body:
            - assign:
                name: sum
                value: {binop: {op: "+", lhs: {var: sum}, rhs: {var: i}}}
            - assign:
                name: i
                value: {binop: {op: "+", lhs: {var: i}, rhs: {int: 1}}}
      - return: {var: sum}
)");
  EXPECT_EQ(result.exit_code, 10);
}

TEST(LoopTest, WhileWithFalseConditionNeverRuns) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: x, value: {int: 10}}
      - while:
          cond: {bool: false}
          body:
            - assign: {name: x, value: {int: 20}}
      - return: {var: x}
)");
  EXPECT_EQ(result.exit_code, 10);
}

TEST(LoopTest, WhileTrueWithBreak) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: n, value: {int: 1}}
      - while:
          cond: {bool: true}
          body:
            - if:
                - cond: {binop: {op: ">", lhs: {var: n}, rhs: {int: 50}}}
                  body: [break]
            - assign:
                name: n
                value: {binop: {op: "*", lhs: {var: n}, rhs: {int: 2}}}
      - return: {var: n}
)");
  EXPECT_EQ(result.exit_code, 64);
}

TEST(LoopTest, WhileContinueReevaluatesCondition) {
  auto result = ::Run(R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: i, value: {int: 0}}
      - declare: {type: int, name: odd, value: {int: 0}}
      - while:
          cond: {binop: {op: "<", lhs: {var: i}, rhs: {int: 6}}}
          body:
            - assign:
                name: i
                value: {binop: {op: "+", lhs: {var: i}, rhs: {int: 1}}}
            - if:
                - cond: {binop: {op: "==", lhs: {binop: {op: "%", lhs: {var: i}, rhs: {int: 2}}}, rhs: {int: 0}}}
                  body: [continue]
            - assign:
                name: odd
                value: {binop: {op: "+", lhs: {var: odd}, rhs: {int: 1}}}
      - return: {var: odd}
)");
  EXPECT_EQ(result.exit_code, 3);
}

TEST(LoopTest, ReturnFromInsideLoop) {
  auto result = ::Run(R"(
functions:
  - name: find
    return: int
    params: [{type: int, name: target}]
    body:
      - declare: {type: int, name: pos, value: {int: 0}}
      - for:
          type: int
          var: x
          in: {list: [{int: 4}, {int: 8}, {int: 15}]}
          body:
            - if:
                - cond: {binop: {op: "==", lhs: {var: x}, rhs: {var: target}}}
                  body: [{return: {var: pos}}]
            - assign:
                name: pos
                value: {binop: {op: "+", lhs: {var: pos}, rhs: {int: 1}}}
      - return: {int: -1}
  - name: main
    return: int
    body:
      - expr: {method: {object: core, name: print, args: [{call: {name: find, args: [{int: 99}]}}]}}
      - return: {call: {name: find, args: [{int: 15}]}}
)");
  EXPECT_EQ(result.exit_code, 2);
  EXPECT_EQ(result.output, "-1\n");
}
