#include "config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/common/diagnostic/diagnostic.hpp"
#include "toml.hpp"

namespace strata::driver {

namespace fs = std::filesystem;

namespace {

auto ReadStringArray(
    const toml::node_view<toml::node>& node, std::string_view key,
    const fs::path& config_path, std::vector<std::string>& out)
    -> strata::Result<void> {
  if (!node) {
    return {};
  }
  const auto* arr = node.as_array();
  if (arr == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: '{}' must be an array of strings", config_path.string(),
                key)));
  }
  for (const auto& elem : *arr) {
    auto str = elem.value<std::string>();
    if (!str) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: '{}' must be an array of strings",
                  config_path.string(), key)));
    }
    out.push_back(*str);
  }
  return {};
}

auto ResolvePath(const fs::path& root, const std::string& path) -> std::string {
  fs::path resolved = path;
  if (resolved.is_relative()) {
    resolved = root / resolved;
  }
  return resolved.lexically_normal().string();
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "strata.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> strata::Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(), e.what())));
  }

  // [package] section
  auto package = tbl["package"];
  if (!package) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: missing [package] section", config_path.string())));
  }

  auto name = package["name"].value<std::string>();
  if (!name) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: missing required field 'package.name'",
                config_path.string())));
  }
  config.name = *name;
  config.kind = package["kind"].value_or(config.kind);

  // [sources] section
  auto sources = tbl["sources"];
  if (!sources) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: missing [sources] section", config_path.string())));
  }

  std::vector<std::string> files;
  if (auto r = ReadStringArray(
          sources["files"], "sources.files", config_path, files);
      !r) {
    return std::unexpected(r.error());
  }
  if (files.empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: missing or empty 'sources.files'", config_path.string())));
  }
  for (const auto& file : files) {
    auto resolved = ResolvePath(config.root_dir, file);
    if (!fs::exists(resolved)) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "source file not found: {} (listed in strata.toml)", file)));
    }
    config.files.push_back(resolved);
  }

  std::vector<std::string> references;
  if (auto r = ReadStringArray(
          sources["references"], "sources.references", config_path,
          references);
      !r) {
    return std::unexpected(r.error());
  }
  for (const auto& reference : references) {
    config.references.push_back(ResolvePath(config.root_dir, reference));
  }

  // [build] section (optional)
  if (auto build = tbl["build"]) {
    config.out_dir = build["out_dir"].value_or(config.out_dir);
    config.concurrent = build["concurrent"].value_or(config.concurrent);
    if (auto max = build["max_parallelism"].value<int64_t>()) {
      if (*max < 0) {
        return std::unexpected(
            Diagnostic::HostError(
                std::format(
                    "{}: 'build.max_parallelism' must not be negative",
                    config_path.string())));
      }
      config.max_parallelism = static_cast<uint32_t>(*max);
    }
    config.policy = build["policy"].value_or(config.policy);
    config.debug = build["debug"].value_or(config.debug);
    config.metadata_only = build["metadata_only"].value_or(config.metadata_only);
    config.include_private =
        build["include_private"].value_or(config.include_private);
    config.coverage = build["coverage"].value_or(config.coverage);
    config.documentation = build["documentation"].value_or(config.documentation);
    config.output_name = build["output_name"].value_or(config.output_name);

    std::vector<std::string> resources;
    if (auto r = ReadStringArray(
            build["resources"], "build.resources", config_path, resources);
        !r) {
      return std::unexpected(r.error());
    }
    for (const auto& resource : resources) {
      config.resources.push_back(ResolvePath(config.root_dir, resource));
    }
  }

  // [diagnostics] section (optional)
  if (auto diagnostics = tbl["diagnostics"]) {
    config.warnings_as_errors =
        diagnostics["warnings_as_errors"].value_or(config.warnings_as_errors);
    if (auto r = ReadStringArray(
            diagnostics["suppress"], "diagnostics.suppress", config_path,
            config.suppress);
        !r) {
      return std::unexpected(r.error());
    }
  }

  // [analyzers] section (optional)
  if (auto analyzers = tbl["analyzers"]) {
    if (auto r = ReadStringArray(
            analyzers["enabled"], "analyzers.enabled", config_path,
            config.analyzers);
        !r) {
      return std::unexpected(r.error());
    }
    if (auto* options = analyzers["options"].as_table()) {
      for (const auto& [key, value] : *options) {
        std::string text;
        if (auto str = value.value<std::string>()) {
          text = *str;
        } else if (auto flag = value.value<bool>()) {
          text = *flag ? "true" : "false";
        } else {
          return std::unexpected(
              Diagnostic::HostError(
                  std::format(
                      "{}: analyzer option '{}' must be a string or boolean",
                      config_path.string(), key.str())));
        }
        config.analyzer_options.insert_or_assign(std::string(key.str()), text);
      }
    }
  }

  return config;
}

auto LoadOptionalConfig() -> strata::Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<ProjectConfig>(std::move(*config));
}

}  // namespace strata::driver
