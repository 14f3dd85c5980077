#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata::driver {

struct ProjectConfig {
  // [package]
  std::string name;
  std::string kind = "library";

  // [sources]
  std::vector<std::string> files;
  std::vector<std::string> references;

  // [build]
  std::string out_dir = "out";
  bool concurrent = true;
  uint32_t max_parallelism = 0;
  std::string policy = "fail-closed";
  std::string debug = "none";
  bool metadata_only = false;
  bool include_private = true;
  bool coverage = false;
  bool documentation = false;
  std::string output_name;
  std::vector<std::string> resources;

  // [diagnostics]
  bool warnings_as_errors = false;
  std::vector<std::string> suppress;

  // [analyzers]
  std::vector<std::string> analyzers;
  std::map<std::string, std::string> analyzer_options;

  // Directory where strata.toml was found
  std::filesystem::path root_dir;
};

// Search for strata.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse strata.toml file. Relative paths are resolved against its directory.
// Returns error Diagnostic on parse errors or missing required fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> strata::Result<ProjectConfig>;

// strata.toml is optional for every command: nullopt when none is found.
auto LoadOptionalConfig() -> strata::Result<std::optional<ProjectConfig>>;

}  // namespace strata::driver
