#include "strata/common/source_span.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "strata/common/source_manager.hpp"

namespace strata {

auto SourceManager::GetLine(FileId id, uint32_t line) const
    -> std::string_view {
  const FileInfo* file = GetFile(id);
  if (file == nullptr || line == 0) {
    return {};
  }

  std::string_view content = file->content;
  uint32_t current = 1;
  size_t pos = 0;
  while (current < line) {
    pos = content.find('\n', pos);
    if (pos == std::string_view::npos) {
      return {};
    }
    ++pos;
    ++current;
  }

  size_t end = content.find('\n', pos);
  if (end == std::string_view::npos) {
    end = content.size();
  }
  std::string_view result = content.substr(pos, end - pos);
  if (!result.empty() && result.back() == '\r') {
    result.remove_suffix(1);
  }
  return result;
}

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string {
  if (!span.file_id) {
    return "";
  }

  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return "";
  }

  if (span.line == 0) {
    return file->path;
  }
  return std::format("{}:{}:{}", file->path, span.line, span.column);
}

}  // namespace strata
