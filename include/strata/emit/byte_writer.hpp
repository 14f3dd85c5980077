#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::emit {

// Append-only little-endian byte buffer used for method bodies, image
// sections and the debug stream.
class ByteWriter {
 public:
  void U8(uint8_t value) {
    bytes_.push_back(value);
  }

  void U16(uint16_t value) {
    for (int shift = 0; shift < 16; shift += 8) {
      bytes_.push_back(static_cast<uint8_t>(value >> shift));
    }
  }

  void U32(uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
      bytes_.push_back(static_cast<uint8_t>(value >> shift));
    }
  }

  void I64(int64_t value) {
    auto bits = static_cast<uint64_t>(value);
    for (int shift = 0; shift < 64; shift += 8) {
      bytes_.push_back(static_cast<uint8_t>(bits >> shift));
    }
  }

  void Bytes(std::span<const uint8_t> data) {
    bytes_.insert(bytes_.end(), data.begin(), data.end());
  }

  void Chars(std::string_view text) {
    bytes_.insert(bytes_.end(), text.begin(), text.end());
  }

  // u32 length followed by the raw bytes.
  void String(std::string_view text) {
    U32(static_cast<uint32_t>(text.size()));
    Chars(text);
  }

  // Overwrites a previously written u32 (section sizes, counts).
  void PatchU32(size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
      bytes_[offset + i] = static_cast<uint8_t>(value >> (8 * i));
    }
  }

  [[nodiscard]] auto Size() const -> size_t {
    return bytes_.size();
  }
  [[nodiscard]] auto Data() const -> const std::vector<uint8_t>& {
    return bytes_;
  }
  auto Take() -> std::vector<uint8_t> {
    return std::move(bytes_);
  }

 private:
  std::vector<uint8_t> bytes_;
};

}  // namespace strata::emit
