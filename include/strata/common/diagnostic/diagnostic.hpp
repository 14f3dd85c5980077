#pragma once

#include <compare>
#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "strata/common/source_span.hpp"

namespace strata {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Semantic error in a source unit or invalid options
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string code;  // Message id, e.g. "STR0103". Empty for notes.
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind == DiagKind::kError ||
           primary.kind == DiagKind::kHostError;
  }

  // Factory: semantic error in a source unit
  static auto Error(SourceSpan span, std::string code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .code = std::move(code),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: error without a source location (options, whole-module checks)
  static auto Error(std::string code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = UnknownSpan{},
             .code = std::move(code),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .code = {},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error with a message id (stream failures during emit)
  static auto HostError(std::string code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .code = std::move(code),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(SourceSpan span, std::string code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = span,
             .code = std::move(code),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning without source location
  static auto Warning(std::string code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = UnknownSpan{},
             .code = std::move(code),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .code = {},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .code = {},
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace strata
