#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "strata/common/source_manager.hpp"
#include "strata/common/source_span.hpp"

namespace strata {

// In-memory form of an already-parsed source unit. The pipeline treats these
// as read-only input; how they were produced (the YAML loader, a test
// builder) is not its concern.

enum class Visibility : uint8_t {
  kPublic,
  kPrivate,
};

// One stack-machine statement of a method body, e.g. {"load", "x"}.
struct Statement {
  std::string op;
  std::string operand;
  SourceSpan span;
};

struct ParameterDecl {
  std::string name;
  std::string type_name;
  SourceSpan span;
};

struct FieldDecl {
  std::string name;
  std::string type_name;
  Visibility visibility = Visibility::kPrivate;
  std::string doc;
  SourceSpan span;
};

struct MethodDecl {
  std::string name;
  Visibility visibility = Visibility::kPublic;
  std::string doc;
  std::vector<ParameterDecl> parameters;
  std::string return_type = "void";
  std::vector<Statement> body;
  SourceSpan span;
};

struct TypeDecl {
  std::string name;
  Visibility visibility = Visibility::kPublic;
  std::string doc;
  std::vector<FieldDecl> fields;
  std::vector<MethodDecl> methods;
  SourceSpan span;
};

struct ImportDecl {
  std::string name;
  SourceSpan span;
};

struct SyntaxUnit {
  std::string path;
  FileId file_id;
  std::string namespace_name;
  std::vector<ImportDecl> imports;
  std::vector<TypeDecl> types;
};

// External metadata: types a referenced module makes available to calls.
struct ReferencedMethod {
  std::string name;
  uint32_t param_count = 0;
  bool returns_value = false;
};

struct ReferencedType {
  std::string qualified_name;  // "Namespace.Type"
  std::vector<ReferencedMethod> methods;
};

struct MetadataReference {
  std::string name;
  std::vector<ReferencedType> types;
};

}  // namespace strata
