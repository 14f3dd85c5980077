#include "strata/emit/method_compiler.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/diagnostic/diagnostic_set.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/common/parallel.hpp"
#include "strata/emit/byte_writer.hpp"
#include "strata/emit/image_format.hpp"

namespace strata::emit {

namespace {

using binding::BoundDeclarationState;
using binding::CallTarget;
using binding::CallTargetKind;
using binding::MethodSymbol;
using binding::TypeLookup;
using binding::TypeRef;
using binding::TypeRefKind;
using image::OpCode;

constexpr uint32_t kMaxSlots = 0xFFFF;

struct ImportUse {
  uint32_t unit_index;
  uint32_t import_index;
};

// Output of one method, produced in isolation and merged after the join.
struct MethodResult {
  std::optional<CompiledMethod> body;
  DiagnosticSet diagnostics;
  std::vector<ImportUse> used_imports;
};

auto IsValidOutputName(std::string_view name) -> bool {
  if (name.empty() || name.front() == '.') {
    return false;
  }
  return std::ranges::none_of(name, [](char c) {
    return c == '/' || c == '\\' || c == ':' || c == ' ' || c == '\t';
  });
}

auto ProbesFor(const MethodSymbol& method) -> uint32_t {
  return static_cast<uint32_t>(method.decl->body.size()) + 1;
}

// Lowers the statement list of one method into stack-machine code.
class MethodLowerer {
 public:
  MethodLowerer(
      const BoundDeclarationState& bound, const MethodSymbol& method,
      bool coverage, uint32_t first_probe)
      : bound_(bound),
        method_(method),
        coverage_(coverage),
        next_probe_(first_probe) {
    body_.token = method.token;
    body_.first_probe = first_probe;
    // Every declared parameter owns its positional slot. A repeated name was
    // reported by the binder and resolves to its first occurrence.
    const auto& params = method.decl->parameters;
    for (size_t i = 0; i < params.size(); ++i) {
      slots_.try_emplace(params[i].name, static_cast<uint16_t>(i));
    }
    param_slots_ = static_cast<uint32_t>(params.size());
    next_slot_ = param_slots_;
  }

  auto Lower() -> MethodResult {
    EmitProbe();
    bool ends_with_ret = false;
    for (const Statement& stmt : method_.decl->body) {
      EmitProbe();
      body_.sequence_points.push_back(
          SequencePoint{
              .offset = static_cast<uint32_t>(code_.Size()),
              .line = stmt.span.line,
              .column = stmt.span.column,
          });
      LowerStatement(stmt);
      ends_with_ret = stmt.op == "ret";
    }

    if (!ends_with_ret) {
      if (method_.return_type.IsVoid()) {
        Emit(OpCode::kRet);
      } else {
        result_.diagnostics.Error(
            method_.decl->span, "STR0306",
            std::format(
                "not all code paths return a value in '{}'",
                method_.qualified_name));
      }
    }

    if (!result_.diagnostics.HasErrors()) {
      body_.code = code_.Take();
      body_.max_stack = static_cast<uint16_t>(std::min<uint32_t>(max_, 0xFFFF));
      body_.local_count = static_cast<uint16_t>(next_slot_ - param_slots_);
      body_.probe_count = coverage_ ? ProbesFor(method_) : 0;
      result_.body = std::move(body_);
    }
    return std::move(result_);
  }

 private:
  void LowerStatement(const Statement& stmt) {
    const std::string& op = stmt.op;
    if (op == "push") {
      if (!RequireOperand(stmt)) {
        return;
      }
      int64_t value = 0;
      const char* first = stmt.operand.data();
      const char* last = first + stmt.operand.size();
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc{} || ptr != last) {
        result_.diagnostics.Error(
            stmt.span, "STR0305",
            std::format("invalid integer literal '{}'", stmt.operand));
      }
      Emit(OpCode::kPushInt);
      code_.I64(value);
      Push(1);
    } else if (op == "load") {
      if (!RequireOperand(stmt)) {
        return;
      }
      auto it = slots_.find(stmt.operand);
      if (it == slots_.end()) {
        result_.diagnostics.Error(
            stmt.span, "STR0301",
            std::format("undeclared identifier '{}'", stmt.operand));
      }
      Emit(OpCode::kLoad);
      code_.U16(it == slots_.end() ? 0 : it->second);
      Push(1);
    } else if (op == "store") {
      if (!RequireOperand(stmt)) {
        return;
      }
      Pop(1, stmt);
      Emit(OpCode::kStore);
      code_.U16(SlotFor(stmt));
    } else if (op == "add" || op == "sub" || op == "mul") {
      RejectOperand(stmt);
      Pop(2, stmt);
      if (op == "add") {
        Emit(OpCode::kAdd);
      } else if (op == "sub") {
        Emit(OpCode::kSub);
      } else {
        Emit(OpCode::kMul);
      }
      Push(1);
    } else if (op == "pop") {
      RejectOperand(stmt);
      Pop(1, stmt);
      Emit(OpCode::kPop);
    } else if (op == "nop") {
      RejectOperand(stmt);
      Emit(OpCode::kNop);
    } else if (op == "call") {
      if (!RequireOperand(stmt)) {
        return;
      }
      LowerCall(stmt);
    } else if (op == "ret") {
      RejectOperand(stmt);
      if (!method_.return_type.IsVoid()) {
        Pop(1, stmt);
      }
      Emit(OpCode::kRet);
    } else {
      result_.diagnostics.Error(
          stmt.span, "STR0304", std::format("unknown instruction '{}'", op));
    }
  }

  void LowerCall(const Statement& stmt) {
    auto target = ResolveCall(stmt);
    if (!target) {
      return;
    }

    Pop(target->param_count, stmt);
    Emit(OpCode::kCall);
    code_.U32(
        target->kind == CallTargetKind::kReferenced
            ? (target->index | image::kMemberRefTokenBit)
            : target->index);
    if (target->returns_value) {
      Push(1);
    }
  }

  auto ResolveCall(const Statement& stmt) -> std::optional<CallTarget> {
    std::string_view operand = stmt.operand;
    auto dot = operand.rfind('.');

    TypeRef owner{.kind = TypeRefKind::kSource, .index = method_.owner};
    std::string_view method_name = operand;
    if (dot != std::string_view::npos) {
      std::string_view type_name = operand.substr(0, dot);
      method_name = operand.substr(dot + 1);
      TypeLookup lookup = bound_.LookupType(method_.unit_index, type_name);
      if (lookup.ambiguous) {
        result_.diagnostics.Error(
            stmt.span, "STR0302",
            std::format(
                "call target '{}' is ambiguous between imported namespaces",
                operand));
        return std::nullopt;
      }
      owner = lookup.type;
      if (lookup.import_index) {
        result_.used_imports.push_back(
            ImportUse{
                .unit_index = method_.unit_index,
                .import_index = *lookup.import_index,
            });
      }
    }

    std::optional<CallTarget> target;
    if (owner.kind == TypeRefKind::kSource ||
        owner.kind == TypeRefKind::kReferenced) {
      target = bound_.FindMethod(owner, method_name);
    }
    if (!target) {
      result_.diagnostics.Error(
          stmt.span, "STR0302",
          std::format("call target '{}' not found", operand));
      return std::nullopt;
    }

    if (target->kind == CallTargetKind::kSource &&
        target->visibility == Visibility::kPrivate) {
      const MethodSymbol& callee = bound_.Methods()[target->index];
      if (callee.owner != method_.owner) {
        result_.diagnostics.Report(
            Diagnostic::Error(
                stmt.span, "STR0307",
                std::format(
                    "'{}' is private and cannot be called from '{}'",
                    callee.qualified_name, method_.qualified_name))
                .WithNote(callee.decl->span, "declared private here"));
        return std::nullopt;
      }
    }
    return target;
  }

  auto SlotFor(const Statement& stmt) -> uint16_t {
    auto it = slots_.find(stmt.operand);
    if (it != slots_.end()) {
      return it->second;
    }
    if (next_slot_ >= kMaxSlots) {
      result_.diagnostics.Error(
          stmt.span, "STR0304",
          std::format("too many locals in '{}'", method_.qualified_name));
      return 0;
    }
    auto slot = static_cast<uint16_t>(next_slot_++);
    slots_.emplace(stmt.operand, slot);
    return slot;
  }

  auto RequireOperand(const Statement& stmt) -> bool {
    if (!stmt.operand.empty()) {
      return true;
    }
    result_.diagnostics.Error(
        stmt.span, "STR0304",
        std::format("instruction '{}' requires an operand", stmt.op));
    return false;
  }

  void RejectOperand(const Statement& stmt) {
    if (!stmt.operand.empty()) {
      result_.diagnostics.Error(
          stmt.span, "STR0304",
          std::format("instruction '{}' takes no operand", stmt.op));
    }
  }

  void Push(uint32_t count) {
    depth_ += count;
    max_ = std::max(max_, depth_);
  }

  // Underflow is reported once per statement; the stack is clamped at zero
  // so later statements are still checked.
  void Pop(uint32_t count, const Statement& stmt) {
    if (depth_ < count) {
      result_.diagnostics.Error(
          stmt.span, "STR0303",
          std::format(
              "evaluation stack underflow at '{}': needs {}, has {}", stmt.op,
              count, depth_));
      depth_ = 0;
      return;
    }
    depth_ -= count;
  }

  void Emit(OpCode op) {
    code_.U8(static_cast<uint8_t>(op));
  }

  void EmitProbe() {
    if (!coverage_) {
      return;
    }
    Emit(OpCode::kProbe);
    code_.U32(next_probe_++);
  }

  const BoundDeclarationState& bound_;
  const MethodSymbol& method_;
  bool coverage_;
  uint32_t next_probe_;

  std::unordered_map<std::string, uint16_t> slots_;
  uint32_t param_slots_ = 0;
  uint32_t next_slot_ = 0;
  uint32_t depth_ = 0;
  uint32_t max_ = 0;
  ByteWriter code_;
  CompiledMethod body_;
  MethodResult result_;
};

}  // namespace

auto CreateModuleBuildState(
    std::shared_ptr<const SourceSet> sources, const EmitOptions& options,
    DiagnosticSet& diagnostics) -> std::unique_ptr<ModuleBuildState> {
  if (sources == nullptr) {
    common::ThrowInternalError("CreateModuleBuildState", "null source set");
  }
  if (!sources->IsBound()) {
    common::ThrowInvalidState(
        "CreateModuleBuildState",
        "declaration binding has not completed; request diagnostics first");
  }

  DiagnosticSet errors;
  if (!options.include_private_members && !options.emit_metadata_only) {
    errors.Report(
        Diagnostic::Error(
            "STR0201",
            "private members can only be omitted from metadata-only output")
            .WithNote("enable metadata-only output or include private members"));
  }
  if (options.emit_metadata_only &&
      options.debug_info == DebugInfoMode::kEmbedded) {
    errors.Report(
        Diagnostic::Error(
            "STR0202", "embedded debug information requires method bodies")
            .WithNote("use separate debug information or disable it"));
  }
  if (options.emit_metadata_only && options.emit_test_coverage) {
    errors.Report(
        Diagnostic::Error(
            "STR0203", "test coverage cannot be emitted for metadata-only output"));
  }
  if (!options.output_name_override.empty() &&
      !IsValidOutputName(options.output_name_override)) {
    errors.Report(
        Diagnostic::Error(
            "STR0204",
            std::format(
                "invalid output name '{}'", options.output_name_override)));
  }

  if (errors.HasErrors()) {
    diagnostics.Append(std::move(errors));
    return nullptr;
  }
  return std::make_unique<ModuleBuildState>(std::move(sources), options);
}

auto CompileMethods(
    ModuleBuildState& module, EmitPolicy policy, DiagnosticSet& diagnostics)
    -> bool {
  if (!module.Sources().IsBound()) {
    common::ThrowInvalidState(
        "CompileMethods", "declaration binding has not completed");
  }
  if (module.Stage() != ModuleStage::kOpen) {
    common::ThrowInvalidState(
        "CompileMethods",
        std::format(
            "module '{}' is {}; methods compile only while Open",
            module.ModuleName(), ToString(module.Stage())));
  }
  if (module.MethodsCompiled()) {
    common::ThrowInvalidState(
        "CompileMethods",
        std::format(
            "methods of module '{}' were already compiled",
            module.ModuleName()));
  }

  const BoundDeclarationState& bound = module.Bound();
  diagnostics.Append(bound.Diagnostics());
  bool success = !bound.Diagnostics().HasErrors();
  if (!success && policy == EmitPolicy::kFailClosed) {
    return false;
  }

  const EmitOptions& options = module.Options();
  if (options.emit_metadata_only) {
    module.MarkMethodsCompiled(0);
    return success;
  }

  const auto& methods = bound.Methods();
  const bool coverage = options.emit_test_coverage;

  std::vector<uint32_t> first_probe(methods.size(), 0);
  uint32_t probe_count = 0;
  if (coverage) {
    for (size_t i = 0; i < methods.size(); ++i) {
      first_probe[i] = probe_count;
      probe_count += ProbesFor(methods[i]);
    }
  }

  std::vector<MethodResult> results(methods.size());
  common::ParallelFor(
      methods.size(), module.Sources().Options().Parallelism(), [&](size_t i) {
        MethodLowerer lowerer(bound, methods[i], coverage, first_probe[i]);
        results[i] = lowerer.Lower();
      });

  DiagnosticSet method_diagnostics;
  for (MethodResult& result : results) {
    if (result.body) {
      module.AddMethodBody(std::move(*result.body));
    }
    for (const ImportUse& use : result.used_imports) {
      module.MarkImportUsed(use.unit_index, use.import_index);
    }
    method_diagnostics.Append(std::move(result.diagnostics));
  }
  method_diagnostics.SortByLocation();

  const auto& compilation = module.Sources().Options();
  method_diagnostics.ApplyOptions(
      compilation.suppressed_codes, compilation.warnings_as_errors);

  success = success && !method_diagnostics.HasErrors();
  diagnostics.Append(std::move(method_diagnostics));
  module.MarkMethodsCompiled(probe_count);
  return success;
}

auto CompileMethods(
    std::shared_ptr<const SourceSet> sources, const EmitOptions& options,
    EmitPolicy policy) -> MethodCompilation {
  MethodCompilation compilation;
  compilation.module =
      CreateModuleBuildState(std::move(sources), options, compilation.diagnostics);
  if (compilation.module == nullptr) {
    return compilation;
  }
  compilation.success =
      CompileMethods(*compilation.module, policy, compilation.diagnostics);
  return compilation;
}

}  // namespace strata::emit
