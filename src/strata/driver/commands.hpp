#pragma once

#include <argparse/argparse.hpp>

namespace strata::driver {

// `verbosity` is the number of -v flags seen while parsing `cmd`.
auto CheckCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto AnalyzeCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto EmitCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace strata::driver
