#include "commands.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "argparse/argparse.hpp"
#include "config.hpp"
#include "input.hpp"
#include "print.hpp"
#include "strata/analysis/analyzer.hpp"
#include "strata/analysis/diagnostics_engine.hpp"
#include "strata/common/source_manager.hpp"
#include "strata/common/verbose_logger.hpp"
#include "strata/emit/emit_options.hpp"
#include "strata/pipeline/pipeline.hpp"

namespace strata::driver {
namespace {

namespace fs = std::filesystem;

// Config, flags and unit files of one command.
struct PreparedRun {
  CompilationInput input;
  SourceManager source_manager;
  std::shared_ptr<const SourceSet> sources;
};

auto PrepareInput(const argparse::ArgumentParser& cmd, int verbosity)
    -> strata::Result<CompilationInput> {
  auto config_result = LoadOptionalConfig();
  if (!config_result) {
    return std::unexpected(config_result.error());
  }
  return BuildInput(cmd, *config_result, verbosity);
}

auto LoadRun(CompilationInput input) -> strata::Result<std::unique_ptr<PreparedRun>> {
  auto run = std::make_unique<PreparedRun>();
  run->input = std::move(input);
  auto sources = LoadSources(run->input, run->source_manager);
  if (!sources) {
    return std::unexpected(sources.error());
  }
  run->sources = std::move(*sources);
  return run;
}

auto Finish(
    const PreparedRun& run, const DiagnosticSet& diagnostics,
    const common::VerboseLogger& vlog, bool success) -> int {
  PrintDiagnostics(diagnostics, &run.source_manager);
  if (run.input.stats) {
    vlog.PrintPhaseSummary();
  }
  return success ? 0 : 1;
}

auto WriteFile(const fs::path& path, const std::string& bytes)
    -> strata::Result<void> {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "cannot create directory '{}': {}",
                  path.parent_path().string(), ec.message())));
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot write '{}'", path.string())));
  }
  return {};
}

}  // namespace

auto CheckCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int {
  auto input = PrepareInput(cmd, verbosity);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  auto run = LoadRun(std::move(*input));
  if (!run) {
    PrintDiagnostic(run.error());
    return 1;
  }

  common::VerboseLogger vlog((*run)->input.verbose);
  DiagnosticSet diagnostics = pipeline::Check((*run)->sources, vlog);
  return Finish(**run, diagnostics, vlog, !diagnostics.HasErrors());
}

auto AnalyzeCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int {
  auto input = PrepareInput(cmd, verbosity);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  if (auto r = ApplyAnalyzerFlags(cmd, *input); !r) {
    PrintDiagnostic(r.error());
    return 1;
  }

  std::vector<std::shared_ptr<const analysis::Analyzer>> analyzers;
  for (const auto& name : input->analyzers) {
    auto analyzer = analysis::MakeBuiltinAnalyzer(name);
    if (analyzer == nullptr) {
      PrintError(
          std::format(
              "unknown analyzer '{}', use 'naming', 'documentation' or "
              "'empty-body'",
              name));
      return 1;
    }
    analyzers.push_back(std::move(analyzer));
  }
  if (analyzers.empty()) {
    PrintWarning("no analyzers enabled; reporting declaration diagnostics");
  }

  auto run = LoadRun(std::move(*input));
  if (!run) {
    PrintDiagnostic(run.error());
    return 1;
  }

  common::VerboseLogger vlog((*run)->input.verbose);
  analysis::DiagnosticsEngine engine(
      (*run)->sources, std::move(analyzers),
      analysis::AnalyzerOptions((*run)->input.analyzer_options));
  auto result = pipeline::Analyze(engine, {}, vlog);
  if (!result) {
    PrintError("analysis was cancelled");
    return 1;
  }
  return Finish(**run, *result, vlog, !result->HasErrors());
}

auto EmitCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int {
  auto input = PrepareInput(cmd, verbosity);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  if (auto r = ApplyEmitFlags(cmd, *input); !r) {
    PrintDiagnostic(r.error());
    return 1;
  }
  auto resources = LoadResources(*input);
  if (!resources) {
    PrintDiagnostic(resources.error());
    return 1;
  }

  auto run = LoadRun(std::move(*input));
  if (!run) {
    PrintDiagnostic(run.error());
    return 1;
  }
  const CompilationInput& in = (*run)->input;

  const std::string& name = in.emit.output_name_override.empty()
                                ? in.options.module_name
                                : in.emit.output_name_override;
  fs::path image_path = in.image_path.empty()
                            ? fs::path(in.out_dir) / (name + ".strm")
                            : fs::path(in.image_path);

  // Streams are buffered so a failed run leaves no partial files behind.
  std::ostringstream image;
  std::ostringstream metadata;
  std::ostringstream debug;
  std::ostringstream documentation;
  pipeline::EmitRequest request{
      .options = in.emit,
      .policy = in.policy,
      .resources = std::move(*resources),
      .streams =
          {
              .image = &image,
              .metadata = in.metadata_path.empty() ? nullptr : &metadata,
              .debug = &debug,
              .documentation = &documentation,
          },
  };

  common::VerboseLogger vlog(in.verbose);
  auto result = pipeline::Emit((*run)->sources, request, vlog);

  std::vector<std::pair<fs::path, const std::ostringstream*>> outputs;
  if (result.written.image) {
    outputs.emplace_back(image_path, &image);
  }
  if (result.written.metadata) {
    outputs.emplace_back(in.metadata_path, &metadata);
  }
  if (result.written.debug) {
    outputs.emplace_back(
        fs::path(image_path).replace_extension(".strd"), &debug);
  }
  if (result.written.documentation) {
    outputs.emplace_back(
        fs::path(image_path).replace_extension(".json"), &documentation);
  }
  for (const auto& [path, stream] : outputs) {
    if (auto r = WriteFile(path, stream->str()); !r) {
      result.diagnostics.Report(r.error());
      result.success = false;
      continue;
    }
    vlog.Detail("serialize", std::format("wrote {}", path.string()));
  }

  return Finish(**run, result.diagnostics, vlog, result.success);
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  std::optional<std::string> name;
  if (auto n = cmd.present<std::string>("name")) {
    name = *n;
  }
  bool force = cmd.get<bool>("--force");

  fs::path project_dir;
  std::string project_name;
  bool create_directory = false;

  if (name) {
    project_dir = fs::path(*name);
    if (project_dir.is_relative()) {
      project_dir = fs::current_path() / project_dir;
    }
    project_name = project_dir.filename().string();
    create_directory = true;

    if (fs::exists(project_dir)) {
      PrintError(
          std::format("directory '{}' already exists", project_dir.string()));
      return 1;
    }
  } else {
    project_dir = fs::current_path();
    project_name = project_dir.filename().string();

    if (fs::exists(project_dir / "strata.toml") && !force) {
      PrintError("strata.toml already exists (use --force to overwrite)");
      return 1;
    }
  }

  std::error_code ec;
  if (create_directory) {
    fs::create_directories(project_dir, ec);
    if (ec) {
      PrintError(
          std::format(
              "cannot create directory '{}': {}", project_dir.string(),
              ec.message()));
      return 1;
    }
  }

  fs::path unit_path = project_dir / (project_name + ".yaml");
  if (!fs::exists(unit_path)) {
    std::ofstream unit_file(unit_path);
    unit_file << std::format(
        "namespace: {}\n"
        "types:\n"
        "  - name: Program\n"
        "    doc: Entry point of {}.\n"
        "    methods:\n"
        "      - name: Main\n"
        "        doc: Computes a value and discards it.\n"
        "        body: [\"push 1\", \"push 2\", \"add\", \"pop\", \"ret\"]\n",
        project_name, project_name);
  }

  std::ofstream toml_file(project_dir / "strata.toml");
  toml_file << std::format(
      "[package]\n"
      "name = \"{}\"\n"
      "kind = \"executable\"\n"
      "\n"
      "[sources]\n"
      "files = [\"{}.yaml\"]\n"
      "\n"
      "[build]\n"
      "out_dir = \"out\"\n",
      project_name, project_name);
  if (!toml_file) {
    PrintError(
        std::format(
            "cannot write '{}'", (project_dir / "strata.toml").string()));
    return 1;
  }

  if (create_directory) {
    std::cout << std::format("Created project '{}'\n", project_name);
  } else {
    std::cout << std::format("Initialized project '{}'\n", project_name);
  }
  return 0;
}

}  // namespace strata::driver
