#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/emit/byte_writer.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/emit/image_format.hpp"
#include "strata/emit/method_compiler.hpp"
#include "strata/emit/module_build_state.hpp"
#include "tests/common/test_units.hpp"

namespace strata::emit {
namespace {

using image::OpCode;

auto Op(OpCode op) -> uint8_t {
  return static_cast<uint8_t>(op);
}

class MethodCompilerTest : public ::testing::Test {
 protected:
  auto Compile(
      const CompilationOptions& options, const EmitOptions& emit = {},
      EmitPolicy policy = EmitPolicy::kFailClosed) -> MethodCompilation {
    auto sources = src_.Build(options);
    (void)sources->GetBoundState();
    return CompileMethods(sources, emit, policy);
  }

  auto Compile(
      const EmitOptions& emit = {},
      EmitPolicy policy = EmitPolicy::kFailClosed) -> MethodCompilation {
    return Compile(test::TestOptions(), emit, policy);
  }

  test::TestSources src_;
};

// ============================================================================
// Lowering
// ============================================================================

TEST_F(MethodCompilerTest, LowersArithmetic) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: Calc
    methods:
      - name: Three
        returns: int
        body: [push 1, push 2, add, ret]
)");
  auto result = Compile();
  ASSERT_TRUE(result.success);
  const CompiledMethod* body = result.module->MethodBody(0);
  ASSERT_NE(body, nullptr);

  ByteWriter expected;
  expected.U8(Op(OpCode::kPushInt));
  expected.I64(1);
  expected.U8(Op(OpCode::kPushInt));
  expected.I64(2);
  expected.U8(Op(OpCode::kAdd));
  expected.U8(Op(OpCode::kRet));
  EXPECT_EQ(body->code, expected.Data());
  EXPECT_EQ(body->max_stack, 2);
  EXPECT_EQ(body->local_count, 0);

  ASSERT_EQ(body->sequence_points.size(), 4U);
  EXPECT_EQ(body->sequence_points[0].offset, 0U);
  EXPECT_EQ(body->sequence_points[1].offset, 9U);
  EXPECT_EQ(body->sequence_points[2].offset, 18U);
  EXPECT_EQ(body->sequence_points[3].offset, 19U);
}

TEST_F(MethodCompilerTest, ParametersComeBeforeLocals) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: Calc
    methods:
      - name: Copy
        returns: int
        params: [{name: a, type: int}]
        body: [load a, store t, load t, ret]
)");
  auto result = Compile();
  ASSERT_TRUE(result.success);
  const CompiledMethod* body = result.module->MethodBody(0);
  ASSERT_NE(body, nullptr);

  ByteWriter expected;
  expected.U8(Op(OpCode::kLoad));
  expected.U16(0);
  expected.U8(Op(OpCode::kStore));
  expected.U16(1);
  expected.U8(Op(OpCode::kLoad));
  expected.U16(1);
  expected.U8(Op(OpCode::kRet));
  EXPECT_EQ(body->code, expected.Data());
  EXPECT_EQ(body->local_count, 1);
  EXPECT_EQ(body->max_stack, 1);
}

TEST_F(MethodCompilerTest, RepeatedParameterNameKeepsBothSlots) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: Calc
    methods:
      - name: First
        returns: int
        params: [{name: a, type: int}, {name: a, type: int}]
        body: [load a, store t, load t, ret]
)");
  auto result = Compile(EmitOptions{}, EmitPolicy::kEmitAnyway);
  EXPECT_FALSE(result.success);
  const CompiledMethod* body = result.module->MethodBody(0);
  ASSERT_NE(body, nullptr);

  ByteWriter expected;
  expected.U8(Op(OpCode::kLoad));
  expected.U16(0);
  expected.U8(Op(OpCode::kStore));
  expected.U16(2);
  expected.U8(Op(OpCode::kLoad));
  expected.U16(2);
  expected.U8(Op(OpCode::kRet));
  EXPECT_EQ(body->code, expected.Data());
  EXPECT_EQ(body->local_count, 1);
}

TEST_F(MethodCompilerTest, VoidMethodGetsImplicitReturn) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: A
    methods:
      - {name: Run, body: [nop]}
      - {name: Empty}
)");
  auto result = Compile();
  ASSERT_TRUE(result.success);
  EXPECT_EQ(
      result.module->MethodBody(0)->code,
      (std::vector<uint8_t>{Op(OpCode::kNop), Op(OpCode::kRet)}));
  EXPECT_EQ(
      result.module->MethodBody(1)->code,
      (std::vector<uint8_t>{Op(OpCode::kRet)}));
}

TEST_F(MethodCompilerTest, CallsWithinTypeAndAcrossTypes) {
  src_.AddUnit("a.yaml", R"(
namespace: App
types:
  - name: Math
    methods:
      - name: Twice
        returns: int
        params: [{name: x, type: int}]
        body: [load x, load x, add, ret]
      - name: Four
        returns: int
        body: [push 2, call Twice, ret]
  - name: User
    methods:
      - name: Use
        body: [push 3, call Math.Twice, pop, ret]
)");
  auto result = Compile();
  ASSERT_TRUE(result.success);

  ByteWriter four;
  four.U8(Op(OpCode::kPushInt));
  four.I64(2);
  four.U8(Op(OpCode::kCall));
  four.U32(0);
  four.U8(Op(OpCode::kRet));
  EXPECT_EQ(result.module->MethodBody(1)->code, four.Data());
  EXPECT_EQ(result.module->MethodBody(2)->max_stack, 1);
}

TEST_F(MethodCompilerTest, ReferencedCallUsesMemberRefToken) {
  src_.AddReference(R"(
reference: System
types:
  - name: Sys.Console
    methods: [{name: Write, params: 1}]
)");
  src_.AddUnit("a.yaml", R"(
imports: [Sys]
types:
  - name: A
    methods:
      - {name: Print, body: [push 5, call Console.Write, ret]}
)");
  auto result = Compile();
  ASSERT_TRUE(result.success);

  ByteWriter expected;
  expected.U8(Op(OpCode::kPushInt));
  expected.I64(5);
  expected.U8(Op(OpCode::kCall));
  expected.U32(0 | image::kMemberRefTokenBit);
  expected.U8(Op(OpCode::kRet));
  EXPECT_EQ(result.module->MethodBody(0)->code, expected.Data());
  EXPECT_TRUE(result.module->IsImportUsed(0, 0));
}

// ============================================================================
// Method errors
// ============================================================================

TEST_F(MethodCompilerTest, FailingMethodDoesNotStopSiblings) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: A
    methods:
      - {name: First, body: [nop]}
      - {name: Second, body: [load missing, pop]}
      - {name: Third, body: [nop]}
)");
  auto result = Compile();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0301"}));
  EXPECT_TRUE(result.module->MethodsCompiled());
  EXPECT_NE(result.module->MethodBody(0), nullptr);
  EXPECT_EQ(result.module->MethodBody(1), nullptr);
  EXPECT_NE(result.module->MethodBody(2), nullptr);
  EXPECT_EQ(result.module->MethodBodyCount(), 2U);
}

TEST_F(MethodCompilerTest, ReportsEveryBodyError) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: A
    methods:
      - {name: Under, body: [add]}
      - {name: Literal, body: [push 12abc, pop]}
      - {name: Unknown, body: [jump]}
      - {name: Operand, body: [pop 3, push]}
      - {name: NoReturn, returns: int, body: [push 1]}
      - {name: Missing, body: [call Nowhere]}
)");
  auto result = Compile();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(
      test::Codes(result.diagnostics),
      (std::vector<std::string>{
          "STR0303", "STR0305", "STR0304", "STR0304", "STR0303", "STR0304",
          "STR0306", "STR0302"}));
  EXPECT_EQ(result.module->MethodBodyCount(), 0U);
}

TEST_F(MethodCompilerTest, MissingReturnValueMessage) {
  src_.AddUnit("a.yaml", R"(
namespace: App
types:
  - name: A
    methods:
      - {name: Value, returns: int, body: [push 1]}
)");
  auto result = Compile();
  ASSERT_EQ(result.diagnostics.Size(), 1U);
  EXPECT_EQ(
      result.diagnostics.GetDiagnostics()[0].primary.message,
      "not all code paths return a value in 'App.A.Value'");
}

TEST_F(MethodCompilerTest, PrivateMethodOfOtherType) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: Vault
    methods:
      - {name: Secret, visibility: private}
      - {name: Open, body: [call Secret]}
  - name: Thief
    methods:
      - {name: Steal, body: [call Vault.Secret]}
)");
  auto result = Compile();
  ASSERT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0307"}));
  const Diagnostic& diag = result.diagnostics.GetDiagnostics()[0];
  ASSERT_EQ(diag.notes.size(), 1U);
  EXPECT_EQ(diag.notes[0].message, "declared private here");
  // The owner may call its own private method.
  EXPECT_NE(result.module->MethodBody(1), nullptr);
}

TEST_F(MethodCompilerTest, MethodDiagnosticsAreSortedByLocation) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: A
    methods:
      - {name: One, body: [load a]}
      - {name: Two, body: [load b]}
      - {name: Three, body: [load c]}
)");
  auto result = Compile(test::TestOptions(true));
  std::vector<std::string> messages;
  for (const auto& diag : result.diagnostics.GetDiagnostics()) {
    messages.push_back(diag.primary.message);
  }
  EXPECT_EQ(
      messages,
      (std::vector<std::string>{
          "undeclared identifier 'a'",
          "undeclared identifier 'b'",
          "undeclared identifier 'c'",
      }));
}

TEST_F(MethodCompilerTest, ConcurrentMatchesSequential) {
  for (int u = 0; u < 4; ++u) {
    std::string yaml = "namespace: N" + std::to_string(u) + "\ntypes:\n";
    for (int t = 0; t < 5; ++t) {
      yaml += "  - name: T" + std::to_string(t) + "\n    methods:\n";
      yaml += "      - {name: Ok, returns: int, body: [push 1, push 2, mul, "
              "ret]}\n";
      yaml += "      - {name: Bad, body: [load nope, sub]}\n";
    }
    src_.AddUnit("u" + std::to_string(u) + ".yaml", yaml);
  }
  EmitOptions emit{.emit_test_coverage = true};
  auto sequential = Compile(test::TestOptions(false), emit);
  auto concurrent = Compile(test::TestOptions(true), emit);

  EXPECT_EQ(sequential.diagnostics, concurrent.diagnostics);
  ASSERT_EQ(
      sequential.module->MethodBodyCount(),
      concurrent.module->MethodBodyCount());
  for (uint32_t token = 0; token < 40; ++token) {
    const auto* a = sequential.module->MethodBody(token);
    const auto* b = concurrent.module->MethodBody(token);
    ASSERT_EQ(a == nullptr, b == nullptr);
    if (a != nullptr) {
      EXPECT_EQ(a->code, b->code);
      EXPECT_EQ(a->first_probe, b->first_probe);
    }
  }
}

// ============================================================================
// Policies and emit options
// ============================================================================

constexpr const char* kDeclarationError = R"(
types:
  - name: A
    fields: [{name: f, type: Undeclared}]
    methods:
      - {name: Run, body: [nop]}
)";

TEST_F(MethodCompilerTest, FailClosedStopsOnDeclarationErrors) {
  src_.AddUnit("a.yaml", kDeclarationError);
  auto result = Compile({}, EmitPolicy::kFailClosed);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0103"}));
  ASSERT_NE(result.module, nullptr);
  EXPECT_FALSE(result.module->MethodsCompiled());
  EXPECT_EQ(result.module->MethodBodyCount(), 0U);
}

TEST_F(MethodCompilerTest, EmitAnywayCompilesButFails) {
  src_.AddUnit("a.yaml", kDeclarationError);
  auto result = Compile({}, EmitPolicy::kEmitAnyway);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0103"}));
  EXPECT_TRUE(result.module->MethodsCompiled());
  EXPECT_EQ(result.module->MethodBodyCount(), 1U);
}

TEST_F(MethodCompilerTest, MetadataOnlyProducesNoBodies) {
  src_.AddUnit("a.yaml", "types: [{name: A, methods: [{name: Run, body: [add]}]}]\n");
  auto result = Compile(EmitOptions{.emit_metadata_only = true});
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.module->MethodsCompiled());
  EXPECT_EQ(result.module->MethodBodyCount(), 0U);
}

TEST_F(MethodCompilerTest, CoverageProbesAreUniqueAcrossMethods) {
  src_.AddUnit("a.yaml", R"(
types:
  - name: A
    methods:
      - {name: Two, body: [nop, nop]}
      - {name: One, body: [nop]}
)");
  auto result = Compile(EmitOptions{.emit_test_coverage = true});
  ASSERT_TRUE(result.success);
  const CompiledMethod* two = result.module->MethodBody(0);
  const CompiledMethod* one = result.module->MethodBody(1);
  EXPECT_EQ(two->first_probe, 0U);
  EXPECT_EQ(two->probe_count, 3U);
  EXPECT_EQ(one->first_probe, 3U);
  EXPECT_EQ(one->probe_count, 2U);
  EXPECT_EQ(result.module->ProbeCount(), 5U);

  ByteWriter expected;
  expected.U8(Op(OpCode::kProbe));
  expected.U32(3);
  expected.U8(Op(OpCode::kProbe));
  expected.U32(4);
  expected.U8(Op(OpCode::kNop));
  expected.U8(Op(OpCode::kRet));
  EXPECT_EQ(one->code, expected.Data());
}

TEST_F(MethodCompilerTest, InvalidEmitOptions) {
  src_.AddUnit("a.yaml", "types: [{name: A}]\n");

  auto no_private = Compile(EmitOptions{.include_private_members = false});
  EXPECT_EQ(no_private.module, nullptr);
  EXPECT_EQ(test::Codes(no_private.diagnostics),
            (std::vector<std::string>{"STR0201"}));

  auto embedded = Compile(EmitOptions{
      .debug_info = DebugInfoMode::kEmbedded, .emit_metadata_only = true});
  EXPECT_EQ(test::Codes(embedded.diagnostics),
            (std::vector<std::string>{"STR0202"}));

  auto coverage = Compile(
      EmitOptions{.emit_metadata_only = true, .emit_test_coverage = true});
  EXPECT_EQ(test::Codes(coverage.diagnostics),
            (std::vector<std::string>{"STR0203"}));

  for (const char* name : {".hidden", "a/b", "a b", "c:d"}) {
    auto bad = Compile(EmitOptions{.output_name_override = name});
    EXPECT_EQ(test::Codes(bad.diagnostics),
              (std::vector<std::string>{"STR0204"}))
        << name;
    EXPECT_FALSE(bad.success);
  }
}

TEST_F(MethodCompilerTest, OutputNameOverrideRenamesModule) {
  src_.AddUnit("a.yaml", "types: [{name: A}]\n");
  auto result = Compile(EmitOptions{.output_name_override = "Renamed"});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.module->ModuleName(), "Renamed");
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(MethodCompilerTest, RequiresCompletedBinding) {
  src_.AddUnit("a.yaml", "types: [{name: A}]\n");
  auto sources = src_.Build(test::TestOptions());
  DiagnosticSet diagnostics;
  EXPECT_THROW(
      (void)CreateModuleBuildState(sources, {}, diagnostics),
      common::InvalidStateError);
}

TEST_F(MethodCompilerTest, CompilingTwiceIsInvalidState) {
  src_.AddUnit("a.yaml", "types: [{name: A, methods: [{name: Run}]}]\n");
  auto result = Compile();
  ASSERT_TRUE(result.success);
  DiagnosticSet diagnostics;
  EXPECT_THROW(
      CompileMethods(*result.module, EmitPolicy::kFailClosed, diagnostics),
      common::InvalidStateError);
}

TEST_F(MethodCompilerTest, AddingToSealedModuleIsInvalidState) {
  src_.AddUnit("a.yaml", "types: [{name: A, methods: [{name: Run}]}]\n");
  auto result = Compile();
  result.module->Seal();
  EXPECT_THROW(
      result.module->AddResource(ManifestResource{.name = "late"}),
      common::InvalidStateError);
  EXPECT_THROW(result.module->Seal(), common::InvalidStateError);
}

}  // namespace
}  // namespace strata::emit
