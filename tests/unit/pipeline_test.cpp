#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

#include "strata/analysis/analyzer.hpp"
#include "strata/analysis/diagnostics_engine.hpp"
#include "strata/common/verbose_logger.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/emit/serializer.hpp"
#include "strata/pipeline/pipeline.hpp"
#include "tests/common/test_units.hpp"

namespace strata::pipeline {
namespace {

constexpr const char* kUndeclared = R"(
types:
  - name: A
    fields: [{name: f, type: Undeclared}]
    methods:
      - {name: Run, body: [nop]}
)";

class PipelineTest : public ::testing::Test {
 protected:
  common::VerboseLogger vlog_{0};
  test::TestSources src_;
};

// ============================================================================
// Undeclared identifier, both policies
// ============================================================================

TEST_F(PipelineTest, CheckReportsDeclarationDiagnostic) {
  src_.AddUnit("a.yaml", kUndeclared);
  auto diagnostics = Check(src_.Build(test::TestOptions()), vlog_);
  EXPECT_EQ(test::Codes(diagnostics), (std::vector<std::string>{"STR0103"}));
}

TEST_F(PipelineTest, FailClosedWritesNothing) {
  src_.AddUnit("a.yaml", kUndeclared);
  std::ostringstream image;
  EmitRequest request{
      .policy = emit::EmitPolicy::kFailClosed,
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0103"}));
  EXPECT_EQ(result.written, emit::StreamsWritten{});
  EXPECT_TRUE(image.str().empty());
  EXPECT_GE(vlog_.PhaseDuration("compile_methods"), 0.0);
  EXPECT_LT(vlog_.PhaseDuration("finalize"), 0.0);
  EXPECT_LT(vlog_.PhaseDuration("serialize"), 0.0);
}

TEST_F(PipelineTest, EmitAnywayWritesAndStillFails) {
  src_.AddUnit("a.yaml", kUndeclared);
  std::ostringstream image;
  EmitRequest request{
      .policy = emit::EmitPolicy::kEmitAnyway,
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0103"}));
  EXPECT_TRUE(result.written.image);
  EXPECT_EQ(image.str().substr(0, 4), "STRM");
  EXPECT_GE(vlog_.PhaseDuration("serialize"), 0.0);
}

// ============================================================================
// Method-body error, both policies
// ============================================================================

constexpr const char* kBadCall = R"(
types:
  - name: A
    methods:
      - {name: Good, body: [ret]}
      - {name: Bad, body: [call Nowhere]}
)";

TEST_F(PipelineTest, FailClosedStopsOnMethodBodyError) {
  src_.AddUnit("a.yaml", kBadCall);
  std::ostringstream image;
  EmitRequest request{
      .policy = emit::EmitPolicy::kFailClosed,
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0302"}));
  EXPECT_FALSE(result.written.image);
  EXPECT_TRUE(image.str().empty());
  EXPECT_LT(vlog_.PhaseDuration("finalize"), 0.0);
  EXPECT_LT(vlog_.PhaseDuration("serialize"), 0.0);
}

TEST_F(PipelineTest, EmitAnywayWritesDespiteMethodBodyError) {
  src_.AddUnit("a.yaml", kBadCall);
  std::ostringstream image;
  EmitRequest request{
      .policy = emit::EmitPolicy::kEmitAnyway,
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0302"}));
  EXPECT_TRUE(result.written.image);
  EXPECT_EQ(image.str().substr(0, 4), "STRM");
}

// ============================================================================
// Other runs
// ============================================================================

TEST_F(PipelineTest, CleanRunSucceeds) {
  src_.AddUnit("a.yaml", R"(
namespace: App
types:
  - name: Program
    methods:
      - {name: Main, body: [push 1, pop, ret]}
)");
  auto options = test::TestOptions(true);
  options.output_kind = OutputKind::kExecutable;

  std::ostringstream image;
  std::ostringstream debug;
  EmitRequest request{
      .options = {.debug_info = emit::DebugInfoMode::kSeparate},
      .streams = {.image = &image, .debug = &debug},
  };
  auto result = Emit(src_.Build(options), request, vlog_);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.Empty());
  EXPECT_EQ(
      result.written, (emit::StreamsWritten{.image = true, .debug = true}));
  for (const char* phase : {"bind", "compile_methods", "finalize", "serialize"}) {
    EXPECT_GE(vlog_.PhaseDuration(phase), 0.0) << phase;
  }
}

TEST_F(PipelineTest, InvalidOptionsStopBeforeCompiling) {
  src_.AddUnit("a.yaml", "types: [{name: A}]\n");
  std::ostringstream image;
  EmitRequest request{
      .options = {.include_private_members = false},
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(test::Codes(result.diagnostics),
            (std::vector<std::string>{"STR0201"}));
  EXPECT_TRUE(image.str().empty());
}

TEST_F(PipelineTest, StageDiagnosticsInStageOrder) {
  src_.AddUnit("util.yaml", "namespace: Util\ntypes: [{name: C}]\n");
  src_.AddUnit("a.yaml", R"(
imports: [Util, Util]
types:
  - name: A
    methods:
      - {name: Bad, body: [pop]}
)");
  std::ostringstream image;
  EmitRequest request{
      .policy = emit::EmitPolicy::kEmitAnyway,
      .resources = {{.name = ""}},
      .streams = {.image = &image},
  };
  auto result = Emit(src_.Build(test::TestOptions()), request, vlog_);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(
      test::Codes(result.diagnostics),
      (std::vector<std::string>{"STR0109", "STR0303", "STR0401", "STR0403"}));
  EXPECT_TRUE(result.written.image);
}

TEST_F(PipelineTest, CancelledAnalysisKeepsBoundState) {
  src_.AddUnit("a.yaml", "types: [{name: a}]\n");
  auto sources = src_.Build(test::TestOptions());
  analysis::DiagnosticsEngine engine(
      sources, {analysis::MakeBuiltinAnalyzer("naming")}, {});

  std::stop_source stop;
  stop.request_stop();
  EXPECT_FALSE(Analyze(engine, stop.get_token(), vlog_).has_value());
  EXPECT_TRUE(sources->IsBound());

  auto again = Analyze(engine, {}, vlog_);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(test::Codes(*again), (std::vector<std::string>{"STR1001"}));
}

TEST_F(PipelineTest, VerboseLoggingGoesToSink) {
  src_.AddUnit("a.yaml", "types: [{name: A}]\n");
  std::FILE* sink = std::tmpfile();
  ASSERT_NE(sink, nullptr);
  {
    common::VerboseLogger vlog(2, sink);
    (void)Check(src_.Build(test::TestOptions()), vlog);
  }
  std::rewind(sink);
  std::string text;
  char buffer[256];
  while (std::fgets(buffer, sizeof(buffer), sink) != nullptr) {
    text += buffer;
  }
  std::fclose(sink);
  EXPECT_NE(text.find("bind"), std::string::npos);
  EXPECT_NE(text.find("1 units, 1 types, 0 methods"), std::string::npos);
}

}  // namespace
}  // namespace strata::pipeline
