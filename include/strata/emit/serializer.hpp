#pragma once

#include <ostream>

#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/emit/module_build_state.hpp"

namespace strata::emit {

// Destinations of one serialize call. Only `image` is required; the others
// are written when non-null and the module's options call for them.
struct EmitStreams {
  std::ostream* image = nullptr;
  std::ostream* metadata = nullptr;
  std::ostream* debug = nullptr;  // Used with DebugInfoMode::kSeparate
  std::ostream* documentation = nullptr;
};

struct StreamsWritten {
  bool image = false;
  bool metadata = false;
  bool debug = false;
  bool documentation = false;

  auto operator==(const StreamsWritten&) const -> bool = default;
};

struct SerializationResult {
  bool success = false;
  DiagnosticSet diagnostics;
  StreamsWritten written;
};

// Writes a finalized module to `streams`, using the EmitOptions the module
// captured when it was created.
//
// Every call is a full, independent write starting at each stream's current
// position: rewinding a buffer and serializing again reproduces the same
// bytes. A failed stream write reports STR0501 and clears `success`.
//
// Throws common::InvalidStateError (before writing anything) unless the
// module is Finalized or Serialized, and common::InternalError if
// `streams.image` is null.
auto Serialize(ModuleBuildState& module, const EmitStreams& streams)
    -> SerializationResult;

}  // namespace strata::emit
