#pragma once

#include <array>
#include <cstdint>

// Layout constants of the module image and the separate debug stream.
// All integers are little-endian.
//
// Image:   "STRM" u16 version, u16 flags, u32 entry token, u32 section count,
//          then sections { u32 tag, u32 payload size, payload }.
// Debug:   "STRD" u16 version, u32 method count, then per method
//          { u32 token, string path, u32 count, { u32 offset, line, col }* }.
namespace strata::emit::image {

inline constexpr std::array<char, 4> kImageMagic = {'S', 'T', 'R', 'M'};
inline constexpr std::array<char, 4> kDebugMagic = {'S', 'T', 'R', 'D'};
inline constexpr uint16_t kFormatVersion = 1;

inline constexpr uint32_t kNoToken = 0xFFFF'FFFF;

// Call operands with this bit set index the member-reference table (IMPT)
// instead of the method table.
inline constexpr uint32_t kMemberRefTokenBit = 0x8000'0000;

enum ImageFlags : uint16_t {
  kFlagMetadataOnly = 1U << 0,
  kFlagEmbeddedDebug = 1U << 1,
  kFlagCoverage = 1U << 2,
  kFlagExecutable = 1U << 3,
};

constexpr auto Tag(char a, char b, char c, char d) -> uint32_t {
  return static_cast<uint32_t>(static_cast<uint8_t>(a)) |
         (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 24);
}

inline constexpr uint32_t kSectionStrings = Tag('S', 'T', 'R', 'S');
inline constexpr uint32_t kSectionTypes = Tag('T', 'Y', 'P', 'E');
inline constexpr uint32_t kSectionMethods = Tag('M', 'T', 'H', 'D');
inline constexpr uint32_t kSectionImports = Tag('I', 'M', 'P', 'T');
inline constexpr uint32_t kSectionCode = Tag('C', 'O', 'D', 'E');
inline constexpr uint32_t kSectionResources = Tag('R', 'S', 'R', 'C');
inline constexpr uint32_t kSectionCoverage = Tag('C', 'O', 'V', 'R');
inline constexpr uint32_t kSectionDebug = Tag('D', 'B', 'U', 'G');

// Stack-machine instruction set of compiled bodies.
enum class OpCode : uint8_t {
  kNop = 0x00,
  kPushInt = 0x01,  // i64 immediate
  kLoad = 0x02,     // u16 slot (parameters first, then locals)
  kStore = 0x03,    // u16 slot
  kAdd = 0x04,
  kSub = 0x05,
  kMul = 0x06,
  kPop = 0x07,
  kCall = 0x08,   // u32 token
  kRet = 0x09,
  kProbe = 0x0A,  // u32 coverage probe index
};

}  // namespace strata::emit::image
