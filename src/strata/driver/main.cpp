#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "commands.hpp"
#include "print.hpp"
#include "strata/common/internal_error.hpp"

namespace {

namespace fs = std::filesystem;

auto Dispatch(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& check_cmd,
    const argparse::ArgumentParser& analyze_cmd,
    const argparse::ArgumentParser& emit_cmd,
    const argparse::ArgumentParser& init_cmd, int verbosity) -> int {
  if (program.is_subcommand_used("check")) {
    return strata::driver::CheckCommand(check_cmd, verbosity);
  }
  if (program.is_subcommand_used("analyze")) {
    return strata::driver::AnalyzeCommand(analyze_cmd, verbosity);
  }
  if (program.is_subcommand_used("emit")) {
    return strata::driver::EmitCommand(emit_cmd, verbosity);
  }
  if (program.is_subcommand_used("init")) {
    return strata::driver::InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  std::span<char*> raw(argv, static_cast<size_t>(argc));
  std::vector<std::string> args(raw.begin(), raw.end());
  int verbosity = 0;

  argparse::ArgumentParser program("strata", "0.1.0");
  program.add_description("Staged compiler for Strata units");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Bind declarations and report diagnostics");
  strata::driver::AddCompilationFlags(check_cmd, verbosity);

  // Subcommand: analyze
  argparse::ArgumentParser analyze_cmd("analyze");
  analyze_cmd.add_description(
      "Report declaration and analyzer diagnostics");
  strata::driver::AddAnalyzerFlags(analyze_cmd);
  strata::driver::AddCompilationFlags(analyze_cmd, verbosity);

  // Subcommand: emit
  argparse::ArgumentParser emit_cmd("emit");
  emit_cmd.add_description("Compile method bodies and write the module image");
  strata::driver::AddEmitFlags(emit_cmd);
  strata::driver::AddCompilationFlags(emit_cmd, verbosity);

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a new Strata project");
  init_cmd.add_argument("name").nargs(0, 1).help("Project name");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing strata.toml");

  program.add_subparser(check_cmd);
  program.add_subparser(analyze_cmd);
  program.add_subparser(emit_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    strata::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      strata::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    return Dispatch(
        program, check_cmd, analyze_cmd, emit_cmd, init_cmd, verbosity);
  } catch (const strata::common::InternalError& e) {
    strata::driver::PrintError(e.what());
    return 2;
  }
}
