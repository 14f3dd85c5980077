#include "strata/emit/serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "strata/binding/bound_state.hpp"
#include "strata/common/diagnostic/diagnostic.hpp"
#include "strata/common/internal_error.hpp"
#include "strata/emit/byte_writer.hpp"
#include "strata/emit/image_format.hpp"

namespace strata::emit {

namespace {

using binding::BoundDeclarationState;
using binding::MethodSymbol;
using binding::TypeSymbol;

// What one rendering of the module contains. The primary image follows the
// module's options; the metadata stream is always the public, body-less
// subset.
struct ImageView {
  bool metadata_only = false;
  bool include_private = true;
  bool embed_debug = false;
  bool coverage = false;
};

// Interned strings in first-use order; ids are indices.
class StringHeap {
 public:
  auto Intern(std::string_view text) -> uint32_t {
    auto it = ids_.find(std::string(text));
    if (it != ids_.end()) {
      return it->second;
    }
    auto id = static_cast<uint32_t>(strings_.size());
    strings_.emplace_back(text);
    ids_.emplace(strings_.back(), id);
    return id;
  }

  void WriteTo(ByteWriter& out) const {
    out.U32(static_cast<uint32_t>(strings_.size()));
    for (const std::string& text : strings_) {
      out.String(text);
    }
  }

 private:
  std::vector<std::string> strings_;
  std::unordered_map<std::string, uint32_t> ids_;
};

struct Section {
  uint32_t tag;
  std::vector<uint8_t> payload;
};

class ImageRenderer {
 public:
  ImageRenderer(const ModuleBuildState& module, ImageView view)
      : module_(module), bound_(module.Bound()), view_(view) {
  }

  auto Render() -> std::vector<uint8_t> {
    // Sections that intern strings are built before the heap is written.
    heap_.Intern(module_.ModuleName());
    std::vector<Section> sections;
    sections.push_back({image::kSectionTypes, RenderTypes()});
    std::vector<uint8_t> code;
    sections.push_back({image::kSectionMethods, RenderMethods(code)});
    sections.push_back({image::kSectionImports, RenderImports()});
    if (!view_.metadata_only) {
      sections.push_back({image::kSectionCode, std::move(code)});
    }
    sections.push_back({image::kSectionResources, RenderResources()});
    if (view_.coverage && !view_.metadata_only) {
      sections.push_back({image::kSectionCoverage, RenderCoverage()});
    }
    if (view_.embed_debug && !view_.metadata_only) {
      sections.push_back({image::kSectionDebug, RenderDebug()});
    }

    ByteWriter strings;
    heap_.WriteTo(strings);
    sections.insert(
        sections.begin(),
        Section{.tag = image::kSectionStrings, .payload = strings.Take()});

    ByteWriter out;
    out.Chars({image::kImageMagic.data(), image::kImageMagic.size()});
    out.U16(image::kFormatVersion);
    out.U16(Flags());
    out.U32(EntryToken());
    out.U32(static_cast<uint32_t>(sections.size()));
    for (const Section& section : sections) {
      out.U32(section.tag);
      out.U32(static_cast<uint32_t>(section.payload.size()));
      out.Bytes(section.payload);
    }
    return out.Take();
  }

 private:
  auto Flags() const -> uint16_t {
    uint16_t flags = 0;
    if (view_.metadata_only) {
      flags |= image::kFlagMetadataOnly;
    }
    if (view_.embed_debug && !view_.metadata_only) {
      flags |= image::kFlagEmbeddedDebug;
    }
    if (view_.coverage && !view_.metadata_only) {
      flags |= image::kFlagCoverage;
    }
    if (module_.Sources().Options().output_kind == OutputKind::kExecutable) {
      flags |= image::kFlagExecutable;
    }
    return flags;
  }

  auto EntryToken() const -> uint32_t {
    auto entry = bound_.EntryPoint();
    return entry ? *entry : image::kNoToken;
  }

  auto Visible(Visibility visibility) const -> bool {
    return view_.include_private || visibility == Visibility::kPublic;
  }

  auto VisibleMethod(const MethodSymbol& method) const -> bool {
    return Visible(bound_.Types()[method.owner].visibility) &&
           Visible(method.visibility);
  }

  auto RenderTypes() -> std::vector<uint8_t> {
    ByteWriter out;
    uint32_t count = 0;
    const size_t count_offset = out.Size();
    out.U32(0);
    for (const TypeSymbol& type : bound_.Types()) {
      if (!Visible(type.visibility)) {
        continue;
      }
      ++count;
      out.U32(heap_.Intern(type.qualified_name));
      out.U8(static_cast<uint8_t>(type.visibility));

      std::vector<const binding::FieldSymbol*> fields;
      for (const binding::FieldSymbol& field : type.fields) {
        if (Visible(field.visibility)) {
          fields.push_back(&field);
        }
      }
      out.U32(static_cast<uint32_t>(fields.size()));
      for (const binding::FieldSymbol* field : fields) {
        out.U32(heap_.Intern(field->name));
        out.U32(heap_.Intern(bound_.TypeName(field->type)));
        out.U8(static_cast<uint8_t>(field->visibility));
      }

      std::vector<uint32_t> methods;
      for (uint32_t token : type.methods) {
        if (Visible(bound_.Methods()[token].visibility)) {
          methods.push_back(token);
        }
      }
      out.U32(static_cast<uint32_t>(methods.size()));
      for (uint32_t token : methods) {
        out.U32(token);
      }
    }
    out.PatchU32(count_offset, count);
    return out.Take();
  }

  // Appends every emitted body to `code`; each row records its slice.
  auto RenderMethods(std::vector<uint8_t>& code) -> std::vector<uint8_t> {
    ByteWriter out;
    uint32_t count = 0;
    const size_t count_offset = out.Size();
    out.U32(0);
    for (const MethodSymbol& method : bound_.Methods()) {
      if (!VisibleMethod(method)) {
        continue;
      }
      ++count;
      out.U32(method.token);
      out.U32(heap_.Intern(method.qualified_name));
      out.U8(static_cast<uint8_t>(method.visibility));
      out.U32(heap_.Intern(bound_.TypeName(method.return_type)));
      out.U32(static_cast<uint32_t>(method.parameters.size()));
      for (size_t i = 0; i < method.parameters.size(); ++i) {
        out.U32(heap_.Intern(method.decl->parameters[i].name));
        out.U32(heap_.Intern(bound_.TypeName(method.parameters[i])));
      }

      const CompiledMethod* body =
          view_.metadata_only ? nullptr : module_.MethodBody(method.token);
      if (body == nullptr) {
        out.U32(image::kNoToken);
        out.U32(0);
        out.U16(0);
        out.U16(0);
        continue;
      }
      out.U32(static_cast<uint32_t>(code.size()));
      out.U32(static_cast<uint32_t>(body->code.size()));
      out.U16(body->max_stack);
      out.U16(body->local_count);
      code.insert(code.end(), body->code.begin(), body->code.end());
    }
    out.PatchU32(count_offset, count);
    return out.Take();
  }

  // Every referenced method, so member-reference tokens stay valid.
  auto RenderImports() -> std::vector<uint8_t> {
    ByteWriter out;
    const auto& methods = bound_.ReferencedMethods();
    out.U32(static_cast<uint32_t>(methods.size()));
    for (const binding::ReferencedMethodSymbol& method : methods) {
      const auto& owner = bound_.ReferencedTypes()[method.owner];
      out.U32(heap_.Intern(owner.reference));
      out.U32(heap_.Intern(owner.qualified_name));
      out.U32(heap_.Intern(method.name));
      out.U32(method.param_count);
      out.U8(method.returns_value ? 1 : 0);
    }
    return out.Take();
  }

  auto RenderResources() -> std::vector<uint8_t> {
    ByteWriter out;
    uint32_t count = 0;
    const size_t count_offset = out.Size();
    out.U32(0);
    for (const ManifestResource& resource : module_.Resources()) {
      if (!view_.include_private && !resource.is_public) {
        continue;
      }
      ++count;
      out.U32(heap_.Intern(resource.name));
      out.U8(resource.is_public ? 1 : 0);
      out.U32(static_cast<uint32_t>(resource.data.size()));
      out.Bytes(resource.data);
    }
    out.PatchU32(count_offset, count);
    return out.Take();
  }

  auto RenderCoverage() -> std::vector<uint8_t> {
    ByteWriter out;
    out.U32(module_.ProbeCount());
    uint32_t count = 0;
    const size_t count_offset = out.Size();
    out.U32(0);
    for (const MethodSymbol& method : bound_.Methods()) {
      const CompiledMethod* body = module_.MethodBody(method.token);
      if (body == nullptr) {
        continue;
      }
      ++count;
      out.U32(body->token);
      out.U32(body->first_probe);
      out.U32(body->probe_count);
    }
    out.PatchU32(count_offset, count);
    return out.Take();
  }

  auto RenderDebug() -> std::vector<uint8_t> {
    ByteWriter out;
    uint32_t count = 0;
    const size_t count_offset = out.Size();
    out.U32(0);
    for (const MethodSymbol& method : bound_.Methods()) {
      const CompiledMethod* body = module_.MethodBody(method.token);
      if (body == nullptr) {
        continue;
      }
      ++count;
      out.U32(body->token);
      out.U32(heap_.Intern(module_.Sources().Units()[method.unit_index].path));
      out.U32(static_cast<uint32_t>(body->sequence_points.size()));
      for (const SequencePoint& point : body->sequence_points) {
        out.U32(point.offset);
        out.U32(point.line);
        out.U32(point.column);
      }
    }
    out.PatchU32(count_offset, count);
    return out.Take();
  }

  const ModuleBuildState& module_;
  const BoundDeclarationState& bound_;
  ImageView view_;
  StringHeap heap_;
};

auto RenderDebugStream(const ModuleBuildState& module) -> std::vector<uint8_t> {
  ByteWriter out;
  out.Chars({image::kDebugMagic.data(), image::kDebugMagic.size()});
  out.U16(image::kFormatVersion);

  const auto& bound = module.Bound();
  uint32_t count = 0;
  const size_t count_offset = out.Size();
  out.U32(0);
  for (const MethodSymbol& method : bound.Methods()) {
    const CompiledMethod* body = module.MethodBody(method.token);
    if (body == nullptr) {
      continue;
    }
    ++count;
    out.U32(body->token);
    out.String(module.Sources().Units()[method.unit_index].path);
    out.U32(static_cast<uint32_t>(body->sequence_points.size()));
    for (const SequencePoint& point : body->sequence_points) {
      out.U32(point.offset);
      out.U32(point.line);
      out.U32(point.column);
    }
  }
  out.PatchU32(count_offset, count);
  return out.Take();
}

auto WriteAll(std::ostream& out, std::span<const uint8_t> bytes) -> bool {
  out.write(
      reinterpret_cast<const char*>(bytes.data()),
      static_cast<std::streamsize>(bytes.size()));
  out.flush();
  return static_cast<bool>(out);
}

auto WriteAll(std::ostream& out, std::string_view text) -> bool {
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.flush();
  return static_cast<bool>(out);
}

}  // namespace

auto Serialize(ModuleBuildState& module, const EmitStreams& streams)
    -> SerializationResult {
  if (module.Stage() == ModuleStage::kOpen) {
    common::ThrowInvalidState(
        "Serialize",
        std::format(
            "module '{}' is Open; finalize it before serializing",
            module.ModuleName()));
  }
  if (streams.image == nullptr) {
    common::ThrowInternalError("Serialize", "no primary image stream");
  }

  const EmitOptions& options = module.Options();
  SerializationResult result;
  auto write = [&](std::ostream& out, auto bytes, std::string_view stream,
                   bool& written) {
    if (WriteAll(out, bytes)) {
      written = true;
      return;
    }
    result.diagnostics.Report(
        Diagnostic::HostError(
            "STR0501",
            std::format(
                "failed writing {} stream of module '{}'", stream,
                module.ModuleName())));
  };

  ImageRenderer primary(
      module, ImageView{
                  .metadata_only = options.emit_metadata_only,
                  .include_private = options.include_private_members,
                  .embed_debug = options.debug_info == DebugInfoMode::kEmbedded,
                  .coverage = options.emit_test_coverage,
              });
  write(*streams.image, primary.Render(), "image", result.written.image);

  if (streams.metadata != nullptr) {
    ImageRenderer metadata(
        module, ImageView{
                    .metadata_only = true,
                    .include_private = false,
                    .embed_debug = false,
                    .coverage = false,
                });
    write(
        *streams.metadata, metadata.Render(), "metadata",
        result.written.metadata);
  }

  if (streams.debug != nullptr &&
      options.debug_info == DebugInfoMode::kSeparate) {
    write(*streams.debug, RenderDebugStream(module), "debug", result.written.debug);
  }

  if (streams.documentation != nullptr && module.HasDocumentation()) {
    write(
        *streams.documentation, std::string_view(module.Documentation()),
        "documentation", result.written.documentation);
  }

  module.MarkSerialized();
  result.success = !result.diagnostics.HasErrors();
  return result;
}

}  // namespace strata::emit
