#include <filesystem>
#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace strata::test {
namespace {

class InitTest : public CliTestFixture {};

// Test: strata init <name> creates a new project directory
TEST_F(InitTest, CreatesProjectDirectory) {
  auto result = Run({"init", "myproj"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("myproj/strata.toml"));
  EXPECT_TRUE(FileExists("myproj/myproj.yaml"));
}

// Test: strata init <name> creates correct strata.toml content
TEST_F(InitTest, CreatesCorrectTomlContent) {
  auto result = Run({"init", "hello"});

  EXPECT_TRUE(result.Success()) << result.combined_output;

  auto toml = ReadFile("hello/strata.toml");
  EXPECT_NE(toml.find("name = \"hello\""), std::string::npos);
  EXPECT_NE(toml.find("kind = \"executable\""), std::string::npos);
  EXPECT_NE(toml.find("hello.yaml"), std::string::npos);
}

// Test: strata init <name> creates a sample unit with an entry point
TEST_F(InitTest, CreatesSampleUnit) {
  auto result = Run({"init", "sample"});

  EXPECT_TRUE(result.Success()) << result.combined_output;

  auto unit = ReadFile("sample/sample.yaml");
  EXPECT_NE(unit.find("namespace: sample"), std::string::npos);
  EXPECT_NE(unit.find("name: Main"), std::string::npos);
}

// Test: the generated project checks and emits cleanly
TEST_F(InitTest, GeneratedProjectBuilds) {
  ASSERT_TRUE(Run({"init", "demo"}).Success());

  auto check = RunIn(TestDir() / "demo", {"check"});
  EXPECT_TRUE(check.Success()) << check.combined_output;

  auto emit = RunIn(TestDir() / "demo", {"emit"});
  EXPECT_TRUE(emit.Success()) << emit.combined_output;
  EXPECT_TRUE(FileExists("demo/out/demo.strm"));
}

// Test: strata init fails if directory already exists
TEST_F(InitTest, FailsIfDirectoryExists) {
  std::filesystem::create_directories(TestDir() / "existing");

  auto result = Run({"init", "existing"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("already exists")) << result.combined_output;
}

// Test: strata init (no args) initializes in current directory
TEST_F(InitTest, InitializesCurrentDirectory) {
  auto result = Run({"init"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("strata.toml"));
  EXPECT_TRUE(result.Contains("Initialized project")) << result.combined_output;
}

// Test: strata init keeps an existing unit file
TEST_F(InitTest, KeepsExistingUnit) {
  auto name = TestDir().filename().string();
  WriteFile(name + ".yaml", "types: []\n");

  auto result = Run({"init"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(ReadFile(name + ".yaml"), "types: []\n");
}

// Test: strata init (no args) fails if strata.toml already exists
TEST_F(InitTest, FailsIfTomlExistsWithoutForce) {
  WriteFile("strata.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("already exists")) << result.combined_output;
}

// Test: strata init --force overwrites existing strata.toml
TEST_F(InitTest, ForceOverwritesToml) {
  WriteFile("strata.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init", "--force"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  auto toml = ReadFile("strata.toml");
  EXPECT_EQ(toml.find("name = \"old\""), std::string::npos);
}

// Test: strata init -f (short flag) works
TEST_F(InitTest, ShortForceFlagWorks) {
  WriteFile("strata.toml", "[package]\nname = \"old\"\n");

  auto result = Run({"init", "-f"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: Output message for new project
TEST_F(InitTest, OutputMessageForNewProject) {
  auto result = Run({"init", "newproj"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("Created project 'newproj'"))
      << result.combined_output;
}

}  // namespace
}  // namespace strata::test
