#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/source_manager.hpp"
#include "strata/source/syntax_unit.hpp"
#include "strata/source/unit_loader.hpp"

namespace strata {
namespace {

using ::testing::HasSubstr;

TEST(UnitLoaderTest, ParsesTypesFieldsAndMethods) {
  SourceManager mgr;
  auto unit = ParseUnit("geo.yaml", R"(namespace: Geo
imports: [Util]
types:
  - name: Point
    doc: A point.
    fields:
      - {name: x, type: int, visibility: public}
      - {name: y, type: int}
    methods:
      - name: Sum
        returns: int
        params:
          - {name: bias, type: int}
        body:
          - load bias
          - ret
)",
                        mgr);
  ASSERT_TRUE(unit.has_value()) << unit.error().primary.message;

  EXPECT_EQ(unit->path, "geo.yaml");
  EXPECT_EQ(unit->file_id, FileId{.value = 1});
  EXPECT_EQ(unit->namespace_name, "Geo");
  ASSERT_EQ(unit->imports.size(), 1U);
  EXPECT_EQ(unit->imports[0].name, "Util");

  ASSERT_EQ(unit->types.size(), 1U);
  const TypeDecl& type = unit->types[0];
  EXPECT_EQ(type.name, "Point");
  EXPECT_EQ(type.doc, "A point.");
  EXPECT_EQ(type.visibility, Visibility::kPublic);
  ASSERT_EQ(type.fields.size(), 2U);
  EXPECT_EQ(type.fields[0].visibility, Visibility::kPublic);
  // Fields default to private.
  EXPECT_EQ(type.fields[1].visibility, Visibility::kPrivate);

  ASSERT_EQ(type.methods.size(), 1U);
  const MethodDecl& method = type.methods[0];
  EXPECT_EQ(method.return_type, "int");
  ASSERT_EQ(method.parameters.size(), 1U);
  EXPECT_EQ(method.parameters[0].type_name, "int");
  ASSERT_EQ(method.body.size(), 2U);
  EXPECT_EQ(method.body[0].op, "load");
  EXPECT_EQ(method.body[0].operand, "bias");
  EXPECT_EQ(method.body[1].op, "ret");
  EXPECT_TRUE(method.body[1].operand.empty());
}

TEST(UnitLoaderTest, SpansAreOneBased) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", "types:\n  - name: A\n", mgr);
  ASSERT_TRUE(unit.has_value());
  const SourceSpan& span = unit->types[0].span;
  EXPECT_EQ(span.file_id, unit->file_id);
  EXPECT_EQ(span.line, 2U);
  EXPECT_EQ(span.column, 5U);
}

TEST(UnitLoaderTest, MethodDefaultsToVoidAndPublic) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", R"(types:
  - name: A
    methods:
      - name: Run
)",
                        mgr);
  ASSERT_TRUE(unit.has_value());
  const MethodDecl& method = unit->types[0].methods[0];
  EXPECT_EQ(method.return_type, "void");
  EXPECT_EQ(method.visibility, Visibility::kPublic);
  EXPECT_TRUE(method.body.empty());
}

TEST(UnitLoaderTest, UnknownFieldIsHostError) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", R"(types:
  - name: A
    colour: red
)",
                        mgr);
  ASSERT_FALSE(unit.has_value());
  EXPECT_EQ(unit.error().primary.kind, DiagKind::kHostError);
  EXPECT_THAT(
      unit.error().primary.message,
      HasSubstr("a.yaml:3: unknown field 'colour' in type"));
}

TEST(UnitLoaderTest, MissingNameIsHostError) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", "types:\n  - doc: nameless\n", mgr);
  ASSERT_FALSE(unit.has_value());
  EXPECT_THAT(
      unit.error().primary.message,
      HasSubstr("missing required field 'name' in type"));
}

TEST(UnitLoaderTest, UnknownVisibilityIsHostError) {
  SourceManager mgr;
  auto unit =
      ParseUnit("a.yaml", "types:\n  - {name: A, visibility: hidden}\n", mgr);
  ASSERT_FALSE(unit.has_value());
  EXPECT_THAT(
      unit.error().primary.message, HasSubstr("unknown visibility 'hidden'"));
}

TEST(UnitLoaderTest, MalformedYamlIsHostError) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", "types: [unclosed\n", mgr);
  ASSERT_FALSE(unit.has_value());
  EXPECT_EQ(unit.error().primary.kind, DiagKind::kHostError);
  EXPECT_THAT(unit.error().primary.message, HasSubstr("a.yaml:"));
}

TEST(UnitLoaderTest, FileTextIsRegisteredForDiagnostics) {
  SourceManager mgr;
  auto unit = ParseUnit("a.yaml", "namespace: A\ntypes: []\n", mgr);
  ASSERT_TRUE(unit.has_value());
  EXPECT_EQ(mgr.GetLine(unit->file_id, 2), "types: []");
}

TEST(UnitLoaderTest, ParsesReference) {
  auto reference = ParseReference("sys.yaml", R"(reference: System
types:
  - name: System.Console
    methods:
      - {name: Write, params: 1}
      - {name: Read, returns: true}
)");
  ASSERT_TRUE(reference.has_value()) << reference.error().primary.message;
  EXPECT_EQ(reference->name, "System");
  ASSERT_EQ(reference->types.size(), 1U);
  const ReferencedType& type = reference->types[0];
  EXPECT_EQ(type.qualified_name, "System.Console");
  ASSERT_EQ(type.methods.size(), 2U);
  EXPECT_EQ(type.methods[0].param_count, 1U);
  EXPECT_FALSE(type.methods[0].returns_value);
  EXPECT_EQ(type.methods[1].param_count, 0U);
  EXPECT_TRUE(type.methods[1].returns_value);
}

TEST(UnitLoaderTest, ReferenceWithoutNameIsHostError) {
  auto reference = ParseReference("sys.yaml", "types: []\n");
  ASSERT_FALSE(reference.has_value());
  EXPECT_THAT(
      reference.error().primary.message,
      HasSubstr("missing required field 'reference'"));
}

TEST(UnitLoaderTest, MissingFileIsHostError) {
  SourceManager mgr;
  auto unit = LoadUnit("/nonexistent/strata/unit.yaml", mgr);
  ASSERT_FALSE(unit.has_value());
  EXPECT_THAT(unit.error().primary.message, HasSubstr("cannot read"));
}

}  // namespace
}  // namespace strata
