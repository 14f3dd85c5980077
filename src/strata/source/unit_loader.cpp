#include "strata/source/unit_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "strata/common/diagnostic/diagnostic.hpp"

namespace strata {

namespace {

class DocumentReader {
 public:
  DocumentReader(std::string path, FileId file_id)
      : path_(std::move(path)), file_id_(file_id) {
  }

  [[noreturn]] void Fail(const YAML::Node& node, std::string_view message)
      const {
    throw DiagnosticException(
        Diagnostic::HostError(
            std::format("{}:{}: {}", path_, node.Mark().line + 1, message)));
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    if (!node.IsMap()) {
      Fail(node, std::format("expected a mapping for {}", context));
    }
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      if (std::ranges::find(allowed, key) == allowed.end()) {
        Fail(pair.first, std::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  auto Required(const YAML::Node& node, const char* key,
                std::string_view context) const -> std::string {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
      Fail(node, std::format("missing required field '{}' in {}", key, context));
    }
    return value.as<std::string>();
  }

  auto SpanOf(const YAML::Node& node) const -> SourceSpan {
    auto mark = node.Mark();
    return SourceSpan{
        .file_id = file_id_,
        .line = static_cast<uint32_t>(mark.line + 1),
        .column = static_cast<uint32_t>(mark.column + 1),
    };
  }

  auto ReadVisibility(const YAML::Node& node, Visibility fallback) const
      -> Visibility {
    const YAML::Node value = node["visibility"];
    if (!value) {
      return fallback;
    }
    auto text = value.as<std::string>();
    if (text == "public") {
      return Visibility::kPublic;
    }
    if (text == "private") {
      return Visibility::kPrivate;
    }
    Fail(value, std::format("unknown visibility '{}'", text));
  }

  auto ReadStatement(const YAML::Node& node) const -> Statement {
    if (!node.IsScalar()) {
      Fail(node, "statement must be a string such as 'load x'");
    }
    auto text = node.as<std::string>();
    Statement stmt{.op = {}, .operand = {}, .span = SpanOf(node)};
    std::istringstream words(text);
    words >> stmt.op;
    std::string rest;
    std::getline(words >> std::ws, rest);
    stmt.operand = rest;
    if (stmt.op.empty()) {
      Fail(node, "empty statement");
    }
    return stmt;
  }

  auto ReadMethod(const YAML::Node& node) const -> MethodDecl {
    ValidateKeys(
        node, {"name", "visibility", "doc", "params", "returns", "body"},
        "method");
    MethodDecl method;
    method.name = Required(node, "name", "method");
    method.visibility = ReadVisibility(node, Visibility::kPublic);
    method.doc = node["doc"].as<std::string>("");
    method.return_type = node["returns"].as<std::string>("void");
    method.span = SpanOf(node);

    for (const auto& param : node["params"]) {
      ValidateKeys(param, {"name", "type"}, "parameter");
      method.parameters.push_back(
          ParameterDecl{
              .name = Required(param, "name", "parameter"),
              .type_name = Required(param, "type", "parameter"),
              .span = SpanOf(param),
          });
    }
    for (const auto& stmt : node["body"]) {
      method.body.push_back(ReadStatement(stmt));
    }
    return method;
  }

  auto ReadType(const YAML::Node& node) const -> TypeDecl {
    ValidateKeys(
        node, {"name", "visibility", "doc", "fields", "methods"}, "type");
    TypeDecl type;
    type.name = Required(node, "name", "type");
    type.visibility = ReadVisibility(node, Visibility::kPublic);
    type.doc = node["doc"].as<std::string>("");
    type.span = SpanOf(node);

    for (const auto& field : node["fields"]) {
      ValidateKeys(field, {"name", "type", "visibility", "doc"}, "field");
      type.fields.push_back(
          FieldDecl{
              .name = Required(field, "name", "field"),
              .type_name = Required(field, "type", "field"),
              .visibility = ReadVisibility(field, Visibility::kPrivate),
              .doc = field["doc"].as<std::string>(""),
              .span = SpanOf(field),
          });
    }
    for (const auto& method : node["methods"]) {
      type.methods.push_back(ReadMethod(method));
    }
    return type;
  }

  auto ReadUnit(const YAML::Node& root) const -> SyntaxUnit {
    ValidateKeys(root, {"namespace", "imports", "types"}, "unit");
    SyntaxUnit unit;
    unit.path = path_;
    unit.file_id = file_id_;
    unit.namespace_name = root["namespace"].as<std::string>("");

    for (const auto& import : root["imports"]) {
      unit.imports.push_back(
          ImportDecl{.name = import.as<std::string>(), .span = SpanOf(import)});
    }
    for (const auto& type : root["types"]) {
      unit.types.push_back(ReadType(type));
    }
    return unit;
  }

  auto ReadReference(const YAML::Node& root) const -> MetadataReference {
    ValidateKeys(root, {"reference", "types"}, "reference");
    MetadataReference reference;
    reference.name = Required(root, "reference", "reference");

    for (const auto& type_node : root["types"]) {
      ValidateKeys(type_node, {"name", "methods"}, "referenced type");
      ReferencedType type;
      type.qualified_name = Required(type_node, "name", "referenced type");
      for (const auto& method : type_node["methods"]) {
        ValidateKeys(method, {"name", "params", "returns"}, "referenced method");
        type.methods.push_back(
            ReferencedMethod{
                .name = Required(method, "name", "referenced method"),
                .param_count = method["params"].as<uint32_t>(0),
                .returns_value = method["returns"].as<bool>(false),
            });
      }
      reference.types.push_back(std::move(type));
    }
    return reference;
  }

 private:
  std::string path_;
  FileId file_id_;
};

auto ReadFileText(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(std::format("cannot read '{}'", path.string())));
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

auto FromYamlError(const std::string& path, const YAML::Exception& e)
    -> Diagnostic {
  return Diagnostic::HostError(
      std::format("{}:{}: {}", path, e.mark.line + 1, e.msg));
}

}  // namespace

auto ParseUnit(std::string path, std::string content, SourceManager& mgr)
    -> Result<SyntaxUnit> {
  FileId file_id = mgr.AddFile(path, content);
  DocumentReader reader(path, file_id);
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): Load is provided by yaml.h
    auto root = YAML::Load(content);
    return reader.ReadUnit(root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FromYamlError(path, e));
  }
}

auto LoadUnit(const std::filesystem::path& path, SourceManager& mgr)
    -> Result<SyntaxUnit> {
  auto content = ReadFileText(path);
  if (!content) {
    return std::unexpected(content.error());
  }
  return ParseUnit(path.string(), std::move(*content), mgr);
}

auto ParseReference(const std::string& path, const std::string& content)
    -> Result<MetadataReference> {
  DocumentReader reader(path, kInvalidFileId);
  try {
    auto root = YAML::Load(content);
    return reader.ReadReference(root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    return std::unexpected(FromYamlError(path, e));
  }
}

auto LoadReference(const std::filesystem::path& path)
    -> Result<MetadataReference> {
  auto content = ReadFileText(path);
  if (!content) {
    return std::unexpected(content.error());
  }
  return ParseReference(path.string(), *content);
}

}  // namespace strata
