#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strata::common {

// Exception type for internal Strata errors (orchestration bugs, not user
// errors). Source-level problems are reported as diagnostics instead.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

// A pipeline stage was invoked while its precondition state does not hold,
// e.g. serializing an Open module or finalizing twice.
class InvalidStateError : public InternalError {
 public:
  InvalidStateError(const char* operation, const std::string& precondition)
      : InternalError(operation, "invalid state: " + precondition),
        operation_(operation) {
  }

  [[nodiscard]] auto Operation() const -> std::string_view {
    return operation_;
  }

 private:
  const char* operation_;
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

[[noreturn]] inline void ThrowInvalidState(
    const char* operation, const std::string& precondition) {
  throw InvalidStateError(operation, precondition);
}

}  // namespace strata::common
