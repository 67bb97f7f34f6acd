#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/resolver.hpp"
#include "arx/lowering/ast_to_llvm/lower.hpp"
#include "llvm/IR/Attributes.h"
#include "llvm/IR/BasicBlock.h"
#include "llvm/IR/CFG.h"
#include "llvm/IR/Constants.h"
#include "llvm/IR/Function.h"
#include "llvm/IR/GlobalVariable.h"
#include "llvm/IR/Instruction.h"
#include "llvm/IR/Instructions.h"
#include "llvm/IR/Module.h"
#include "llvm/IR/Verifier.h"
#include "llvm/Support/raw_ostream.h"
#include "tests/framework/jit_runner.hpp"

namespace arx::lowering::ast_to_llvm {
namespace {

using extern_link::ExternTarget;
using extern_link::TypeTag;

auto MakeTable() -> extern_link::OverloadTable {
  extern_link::OverloadTable table;
  table.Insert(
      "m.f", {TypeTag::kInt, TypeTag::kInt},
      ExternTarget{.symbol = "sym_ii", .return_tag = TypeTag::kInt});
  table.Insert(
      "m.f", {TypeTag::kFloat, TypeTag::kFloat},
      ExternTarget{.symbol = "sym_ff", .return_tag = TypeTag::kFloat});
  table.Insert(
      "core.print", {TypeTag::kInt},
      ExternTarget{.symbol = "core_print_int", .return_tag = TypeTag::kVoid});
  table.Insert(
      "m.make", {},
      ExternTarget{.symbol = "sym_make", .return_tag = TypeTag::kList});
  return table;
}

auto Lower(std::string_view yaml) -> Result<LoweringResult> {
  auto table = MakeTable();
  return test::LowerYaml(yaml, table);
}

auto ExpectError(std::string_view yaml, ErrorCategory category)
    -> Diagnostic {
  auto result = Lower(yaml);
  EXPECT_FALSE(result.has_value()) << "lowering unexpectedly succeeded";
  if (result.has_value()) {
    return Diagnostic::Warning("unexpected success");
  }
  EXPECT_EQ(result.error().Category(), category) << result.error().Message();
  return result.error();
}

auto FindBlock(llvm::Function& fn, std::string_view name)
    -> llvm::BasicBlock* {
  for (auto& bb : fn) {
    if (bb.getName() == llvm::StringRef(name)) {
      return &bb;
    }
  }
  return nullptr;
}

auto CountInstructions(llvm::Function& fn, unsigned opcode) -> std::size_t {
  std::size_t count = 0;
  for (auto& bb : fn) {
    for (auto& inst : bb) {
      if (inst.getOpcode() == opcode) {
        ++count;
      }
    }
  }
  return count;
}

void ExpectWellFormed(llvm::Module& module) {
  std::string errors;
  llvm::raw_string_ostream os(errors);
  EXPECT_FALSE(llvm::verifyModule(module, &os)) << os.str();
  for (auto& fn : module) {
    for (auto& bb : fn) {
      std::size_t terminators = 0;
      for (auto& inst : bb) {
        if (inst.isTerminator()) {
          ++terminators;
        }
      }
      EXPECT_EQ(terminators, 1U)
          << fn.getName().str() << ":" << bb.getName().str();
      EXPECT_EQ(bb.getTerminator(), &bb.back());
    }
  }
}

constexpr std::string_view kThreshold = R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: x, value: {int: 5}}
      - if:
          - cond: {binop: {op: ">", lhs: {var: x}, rhs: {int: 3}}}
            body: [{return: {int: 1}}]
          - body: [{return: {int: 0}}]
)";

TEST(LoweringTest, IfElseBothReturningLeavesNoJoinBlock) {
  auto result = Lower(kThreshold);
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);

  llvm::Function* main = result->module->getFunction("main");
  ASSERT_NE(main, nullptr);
  EXPECT_EQ(CountInstructions(*main, llvm::Instruction::Ret), 2U);
  EXPECT_EQ(FindBlock(*main, "if0.end"), nullptr);
}

TEST(LoweringTest, LoweringIsDeterministic) {
  constexpr std::string_view kProgram = R"(
functions:
  - name: greet
    return: str
    body:
      - return: {str: "hi"}
  - name: main
    return: int
    body:
      - declare_list: {type: int, name: xs, value: {list: [{int: 1}, {int: 2}]}}
      - declare: {type: int, name: total, value: {int: 0}}
      - for:
          type: int
          var: x
          in: {var: xs}
          body:
            - assign:
                name: total
                value: {binop: {op: "+", lhs: {var: total}, rhs: {var: x}}}
      - expr: {call: {name: greet}}
      - return: {var: total}
)";
  auto first = Lower(kProgram);
  auto second = Lower(kProgram);
  ASSERT_TRUE(first.has_value()) << first.error().Message();
  ASSERT_TRUE(second.has_value()) << second.error().Message();
  ExpectWellFormed(*first->module);
  EXPECT_EQ(DumpLlvmIr(*first), DumpLlvmIr(*second));
}

TEST(LoweringTest, IfChainJoinHasOnlyFallthroughPredecessor) {
  auto result = Lower(R"(
functions:
  - name: classify
    return: int
    params: [{type: int, name: n}]
    body:
      - if:
          - cond: {binop: {op: "<", lhs: {var: n}, rhs: {int: 0}}}
            body: [{return: {int: -1}}]
          - cond: {binop: {op: "==", lhs: {var: n}, rhs: {int: 0}}}
            body: [{declare: {type: int, name: z, value: {int: 0}}}]
          - body: [{return: {int: 1}}]
      - return: {int: 0}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);

  llvm::Function* fn = result->module->getFunction("classify");
  ASSERT_NE(fn, nullptr);
  llvm::BasicBlock* end = FindBlock(*fn, "if0.end");
  ASSERT_NE(end, nullptr);
  ASSERT_EQ(llvm::pred_size(end), 1U);
  EXPECT_EQ((*llvm::pred_begin(end))->getName(), "if0.then1");
}

TEST(LoweringTest, LastConditionalBranchFallsToJoin) {
  auto result = Lower(R"(
functions:
  - name: f
    return: int
    params: [{type: bool, name: c}]
    body:
      - if:
          - cond: {var: c}
            body: [{return: {int: 1}}]
      - return: {int: 0}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);
  llvm::Function* fn = result->module->getFunction("f");
  llvm::BasicBlock* end = FindBlock(*fn, "if0.end");
  ASSERT_NE(end, nullptr);
  EXPECT_EQ(llvm::pred_size(end), 1U);
  EXPECT_EQ((*llvm::pred_begin(end))->getName(), "entry");
}

TEST(LoweringTest, BlocksAppearInSourceOrder) {
  auto result = Lower(R"(
functions:
  - name: f
    return: int
    params: [{type: bool, name: c}, {type: int, name: n}]
    body:
      - if:
          - cond: {var: c}
            body:
              - if:
                  - cond: {binop: {op: ">", lhs: {var: n}, rhs: {int: 0}}}
                    body: [{assign: {name: n, value: {int: 0}}}]
          - body: [{assign: {name: n, value: {int: 1}}}]
      - while:
          cond: {binop: {op: ">", lhs: {var: n}, rhs: {int: 0}}}
          body:
            - if:
                - cond: {binop: {op: "==", lhs: {var: n}, rhs: {int: 5}}}
                  body: [break]
            - assign:
                name: n
                value: {binop: {op: "-", lhs: {var: n}, rhs: {int: 1}}}
      - return: {var: n}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);

  llvm::Function* fn = result->module->getFunction("f");
  ASSERT_NE(fn, nullptr);
  std::vector<std::string> names;
  for (auto& bb : *fn) {
    names.push_back(bb.getName().str());
  }
  const std::vector<std::string> expected = {
      "entry",       "if0.then0",      "if1.then0",  "if1.end",
      "if0.next0",   "if0.then1",      "if0.end",    "while0.cond",
      "while0.body", "if2.then0",      "if2.end",    "while0.continue",
      "while0.end",
  };
  EXPECT_EQ(names, expected);
}

TEST(LoweringTest, BoolsAcrossExternBoundaryAreZeroExtended) {
  auto result = Lower(R"(
functions:
  - name: check
    return: bool
    params: [{type: str, name: a}]
    body:
      - declare_list: {type: bool, name: flags, value: {list: [{bool: true}]}}
      - return: {binop: {op: "==", lhs: {var: a}, rhs: {str: "x"}}}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();

  llvm::Function* create = result->module->getFunction("core_list_create");
  ASSERT_NE(create, nullptr);
  ASSERT_EQ(create->arg_size(), 4U);
  EXPECT_TRUE(create->hasParamAttribute(3, llvm::Attribute::ZExt));
  EXPECT_FALSE(create->hasParamAttribute(0, llvm::Attribute::ZExt));

  llvm::Function* equal = result->module->getFunction("core_string_equal");
  ASSERT_NE(equal, nullptr);
  EXPECT_TRUE(equal->hasRetAttribute(llvm::Attribute::ZExt));

  // Program functions keep plain i1 signatures.
  llvm::Function* check = result->module->getFunction("check");
  ASSERT_NE(check, nullptr);
  EXPECT_FALSE(check->hasRetAttribute(llvm::Attribute::ZExt));

  EXPECT_NE(
      DumpLlvmIr(*result).find("declare zeroext i1 @core_string_equal"),
      std::string::npos);
}

TEST(LoweringTest, RedeclarationTakesFreshSlotOfNewType) {
  auto result = Lower(R"(
functions:
  - name: f
    return: str
    body:
      - declare: {type: int, name: y, value: {int: 5}}
      - declare: {type: str, name: y, value: {str: a}}
      - assign: {name: y, value: {str: b}}
      - return: {var: y}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);

  llvm::Function* fn = result->module->getFunction("f");
  ASSERT_NE(fn, nullptr);
  std::vector<llvm::AllocaInst*> slots;
  for (auto& inst : fn->getEntryBlock()) {
    if (auto* slot = llvm::dyn_cast<llvm::AllocaInst>(&inst)) {
      slots.push_back(slot);
    }
  }
  ASSERT_EQ(slots.size(), 2U);
  EXPECT_TRUE(slots[0]->getAllocatedType()->isIntegerTy(32));
  EXPECT_TRUE(slots[1]->getAllocatedType()->isPointerTy());
  EXPECT_NE(slots[0]->getName(), slots[1]->getName());
}

TEST(LoweringTest, OverloadSelectionUsesArgumentTags) {
  auto result = Lower(R"(
functions:
  - name: main
    return: int
    body:
      - return: {method: {object: m, name: f, args: [{int: 2}, {int: 3}]}}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  llvm::Function* sym = result->module->getFunction("sym_ii");
  ASSERT_NE(sym, nullptr);
  EXPECT_TRUE(sym->isDeclaration());
  EXPECT_TRUE(sym->getReturnType()->isIntegerTy(32));
  EXPECT_EQ(result->module->getFunction("sym_ff"), nullptr);
}

TEST(LoweringTest, FloatOverloadReturnsFloat) {
  auto result = Lower(R"(
functions:
  - name: main
    return: float
    body:
      - return:
          method: {object: m, name: f, args: [{float: 1.5}, {float: 2.0}]}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  llvm::Function* sym = result->module->getFunction("sym_ff");
  ASSERT_NE(sym, nullptr);
  EXPECT_TRUE(sym->getReturnType()->isDoubleTy());
}

TEST(LoweringTest, OverloadMismatchListsCandidates) {
  auto diag = ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {method: {object: m, name: f, args: [{int: 2}, {str: x}]}}
)",
      ErrorCategory::kOverloadMismatch);
  EXPECT_NE(diag.Message().find("m.f(int,str)"), std::string::npos);
  EXPECT_EQ(diag.notes.size(), 2U);
  const auto* span = std::get_if<SourceSpan>(&diag.primary.span);
  ASSERT_NE(span, nullptr);
  EXPECT_EQ(span->line, 6U);
}

TEST(LoweringTest, ExternDeclarationsAreMemoized) {
  auto result = Lower(R"(
functions:
  - name: main
    return: int
    body:
      - expr: {method: {object: core, name: print, args: [{int: 1}]}}
      - expr: {method: {object: core, name: print, args: [{int: 2}]}}
      - return: {int: 0}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  std::size_t declarations = 0;
  for (auto& fn : *result->module) {
    if (fn.getName() == "core_print_int") {
      ++declarations;
      EXPECT_EQ(fn.getNumUses(), 2U);
    }
  }
  EXPECT_EQ(declarations, 1U);
}

TEST(LoweringTest, ListReturningExternBindsAsList) {
  auto result = Lower(R"(
functions:
  - name: main
    return: int
    body:
      - declare_list: {type: int, name: xs, value: {method: {object: m, name: make}}}
      - declare: {type: int, name: n, value: {int: 0}}
      - for:
          type: int
          var: x
          in: {var: xs}
          body:
            - assign: {name: n, value: {var: x}}
      - return: {var: n}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);
  llvm::Function* make = result->module->getFunction("sym_make");
  ASSERT_NE(make, nullptr);
  EXPECT_TRUE(make->getReturnType()->isPointerTy());
}

TEST(LoweringTest, StringLiteralsBecomePrivateConstants) {
  auto result = Lower(R"(
functions:
  - name: main
    return: str
    body:
      - return: {str: "hello"}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  auto* global = result->module->getNamedGlobal("str.0");
  ASSERT_NE(global, nullptr);
  EXPECT_TRUE(global->isConstant());
  EXPECT_TRUE(global->hasPrivateLinkage());
  auto* data =
      llvm::dyn_cast<llvm::ConstantDataArray>(global->getInitializer());
  ASSERT_NE(data, nullptr);
  EXPECT_TRUE(data->isCString());
  EXPECT_EQ(data->getAsCString(), "hello");
}

TEST(LoweringTest, StringEqualityAndConcatCallRuntime) {
  auto result = Lower(R"(
functions:
  - name: main
    return: bool
    params: [{type: str, name: a}, {type: str, name: b}]
    body:
      - declare:
          type: str
          name: both
          value: {binop: {op: "+", lhs: {var: a}, rhs: {var: b}}}
      - return: {binop: {op: "==", lhs: {var: both}, rhs: {var: a}}}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  EXPECT_NE(result->module->getFunction("core_string_concat"), nullptr);
  EXPECT_NE(result->module->getFunction("core_string_equal"), nullptr);
}

TEST(LoweringTest, ForeignCallDeclaresFromFirstCallSite) {
  auto result = Lower(R"(
functions:
  - name: main
    return: int
    body:
      - return: {call: {name: puts, args: [{str: "hi"}]}}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  llvm::Function* puts = result->module->getFunction("puts");
  ASSERT_NE(puts, nullptr);
  EXPECT_TRUE(puts->isDeclaration());
  EXPECT_TRUE(puts->getReturnType()->isIntegerTy(32));
  ASSERT_EQ(puts->arg_size(), 1U);
  EXPECT_TRUE(puts->getArg(0)->getType()->isPointerTy());
}

TEST(LoweringTest, ExecEntryGetsMainWrapper) {
  auto result = Lower(R"(
functions:
  - name: _exec
    return: int
    body:
      - return: {int: 7}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);
  llvm::Function* main = result->module->getFunction("main");
  ASSERT_NE(main, nullptr);
  EXPECT_FALSE(main->isDeclaration());
}

TEST(LoweringTest, DeadCodeAfterReturnIsDropped) {
  auto result = Lower(R"(
functions:
  - name: main
    return: int
    body:
      - return: {int: 1}
      - declare: {type: int, name: unused, value: {int: 2}}
)");
  ASSERT_TRUE(result.has_value()) << result.error().Message();
  ExpectWellFormed(*result->module);
  llvm::Function* main = result->module->getFunction("main");
  EXPECT_EQ(main->size(), 1U);
}

TEST(LoweringErrorTest, UndefinedVariable) {
  auto diag = ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {var: missing}
)",
      ErrorCategory::kUnresolvedReference);
  EXPECT_NE(diag.Message().find("missing"), std::string::npos);
}

TEST(LoweringErrorTest, UnknownExternFunction) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {method: {object: m, name: nope}}
)",
      ErrorCategory::kUnresolvedReference);
}

TEST(LoweringErrorTest, AssignToUndeclared) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - assign: {name: y, value: {int: 1}}
      - return: {int: 0}
)",
      ErrorCategory::kUnresolvedReference);
}

TEST(LoweringErrorTest, DeclarationTypeMismatch) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: x, value: {bool: true}}
      - return: {var: x}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, AssignmentTypeMismatch) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: x, value: {int: 1}}
      - assign: {name: x, value: {float: 1.0}}
      - return: {var: x}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, ReturnTypeMismatch) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {str: oops}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, VoidReturnInValueFunction) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, VoidLocalIsUnsupportedType) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: void, name: x, value: {int: 1}}
      - return: {int: 0}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, NonBoolCondition) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - while:
          cond: {int: 1}
          body: [break]
      - return: {int: 0}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, ForInOverNonList) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - for: {type: int, var: x, in: {int: 3}, body: []}
      - return: {int: 0}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, BreakOutsideLoop) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - break
      - return: {int: 0}
)",
      ErrorCategory::kStructural);
}

TEST(LoweringErrorTest, ContinueOutsideLoop) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - continue
)",
      ErrorCategory::kStructural);
}

TEST(LoweringErrorTest, FallingOffTheEnd) {
  auto diag = ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - declare: {type: int, name: x, value: {int: 5}}
)",
      ErrorCategory::kStructural);
  EXPECT_NE(diag.Message().find("main"), std::string::npos);
}

TEST(LoweringErrorTest, VoidFunctionMustReturnExplicitly) {
  ExpectError(
      R"(
functions:
  - name: noop
    body: []
)",
      ErrorCategory::kStructural);
}

TEST(LoweringErrorTest, DuplicateFunction) {
  ExpectError(
      R"(
functions:
  - name: f
    body: [return]
  - name: f
    body: [return]
)",
      ErrorCategory::kStructural);
}

TEST(LoweringErrorTest, UnimplementedOperators) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {binop: {op: "<<", lhs: {int: 1}, rhs: {int: 2}}}
)",
      ErrorCategory::kUnsupported);
  ExpectError(
      R"(
functions:
  - name: main
    return: str
    body:
      - return: {binop: {op: "-", lhs: {str: a}, rhs: {str: b}}}
)",
      ErrorCategory::kUnsupported);
}

TEST(LoweringErrorTest, MixedOperandTypes) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - return: {binop: {op: "+", lhs: {int: 1}, rhs: {float: 2.0}}}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, ProgramCallArgumentMismatch) {
  ExpectError(
      R"(
functions:
  - name: twice
    return: int
    params: [{type: int, name: n}]
    body:
      - return: {binop: {op: "*", lhs: {var: n}, rhs: {int: 2}}}
  - name: main
    return: int
    body:
      - return: {call: {name: twice, args: [{bool: true}]}}
)",
      ErrorCategory::kTypeMismatch);
}

TEST(LoweringErrorTest, EmptyListLiteralNeedsElementType) {
  ExpectError(
      R"(
functions:
  - name: main
    return: int
    body:
      - for: {type: int, var: x, in: {list: []}, body: []}
      - return: {int: 0}
)",
      ErrorCategory::kTypeMismatch);
}

}  // namespace
}  // namespace arx::lowering::ast_to_llvm
