#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

struct FileId {
  uint32_t value = 0;

  explicit operator bool() const {
    return value != 0;
  }
  auto operator==(const FileId&) const -> bool = default;
  auto operator<=>(const FileId&) const = default;
};

inline constexpr FileId kInvalidFileId{};

struct FileInfo {
  std::string path;
  std::string content;
};

// Owns the text of every loaded unit file so diagnostics can be printed with
// source context. Ids are 1-based; FileId{} is never issued.
class SourceManager {
 public:
  auto AddFile(std::string path, std::string content) -> FileId {
    auto value = static_cast<uint32_t>(files_.size() + 1);
    files_.push_back(
        FileInfo{.path = std::move(path), .content = std::move(content)});
    return FileId{.value = value};
  }

  [[nodiscard]] auto GetFile(FileId id) const -> const FileInfo* {
    if (!id || id.value > files_.size()) {
      return nullptr;
    }
    return &files_[id.value - 1];
  }

  // Returns the text of a 1-based line, without the line terminator.
  [[nodiscard]] auto GetLine(FileId id, uint32_t line) const
      -> std::string_view;

 private:
  std::vector<FileInfo> files_;
};

}  // namespace strata
