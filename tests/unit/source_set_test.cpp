#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/source/source_set.hpp"
#include "tests/common/test_units.hpp"

namespace strata {
namespace {

constexpr const char* kShapes = R"(
namespace: Shapes
types:
  - name: Point
    fields:
      - {name: x, type: int}
)";

TEST(SourceSetTest, BindingIsComputedLazily) {
  test::TestSources src;
  src.AddUnit("shapes.yaml", kShapes);
  auto sources = src.Build(test::TestOptions());

  EXPECT_FALSE(sources->IsBound());
  const auto& bound = sources->GetBoundState();
  EXPECT_TRUE(sources->IsBound());
  EXPECT_EQ(bound.Types().size(), 1U);
}

TEST(SourceSetTest, BoundStateIsMemoized) {
  test::TestSources src;
  src.AddUnit("shapes.yaml", kShapes);
  auto sources = src.Build(test::TestOptions());

  const auto* first = &sources->GetBoundState();
  const auto* second = &sources->GetBoundState();
  EXPECT_EQ(first, second);
}

TEST(SourceSetTest, ConcurrentFirstUseBindsOnce) {
  test::TestSources src;
  src.AddUnit("shapes.yaml", kShapes);
  auto sources = src.Build(test::TestOptions(true));

  constexpr int kThreads = 8;
  std::vector<const binding::BoundDeclarationState*> seen(kThreads);
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back(
          [&, i] { seen[static_cast<size_t>(i)] = &sources->GetBoundState(); });
    }
  }
  for (const auto* state : seen) {
    EXPECT_EQ(state, seen.front());
  }
}

TEST(SourceSetTest, WithOptionsStartsWithEmptyCache) {
  test::TestSources src;
  src.AddUnit("shapes.yaml", kShapes);
  auto sources = src.Build(test::TestOptions());
  (void)sources->GetBoundState();

  auto options = test::TestOptions();
  options.warnings_as_errors = true;
  auto changed = sources->WithOptions(options);

  EXPECT_TRUE(sources->IsBound());
  EXPECT_FALSE(changed->IsBound());
  EXPECT_TRUE(changed->Options().warnings_as_errors);
  EXPECT_FALSE(sources->Options().warnings_as_errors);
  // Unit storage is shared, not copied.
  EXPECT_EQ(changed->Units().data(), sources->Units().data());
}

TEST(SourceSetTest, EmptyModuleNameIsMisuse) {
  test::TestSources src;
  src.AddUnit("shapes.yaml", kShapes);
  auto options = test::TestOptions();
  options.module_name.clear();
  EXPECT_THROW(src.Build(options), common::InternalError);
}

TEST(SourceSetTest, SharedFileIdIsMisuse) {
  SyntaxUnit a{.path = "a.yaml", .file_id = FileId{.value = 1}};
  SyntaxUnit b{.path = "b.yaml", .file_id = FileId{.value = 1}};
  EXPECT_THROW(
      SourceSet::Create({a, b}, {}, test::TestOptions()),
      common::InternalError);
}

TEST(SourceSetTest, UnitWithoutPathIsMisuse) {
  SyntaxUnit unit{.path = "", .file_id = FileId{.value = 1}};
  EXPECT_THROW(
      SourceSet::Create({unit}, {}, test::TestOptions()),
      common::InternalError);
}

}  // namespace
}  // namespace strata
