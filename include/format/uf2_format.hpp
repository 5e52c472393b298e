#pragma once

#include <cstdint>

namespace uf2pack {

// IMPORTANT:
// Do NOT write/read this struct by dumping raw memory or using sizeof(Uf2BlockHeader).
// Struct padding/alignment is compiler-dependent. Always serialize field-by-field.
inline constexpr uint32_t kUf2BlockBytes = 512;
inline constexpr uint32_t kUf2HeaderBytes = 32;   // eight u32 fields
inline constexpr uint32_t kUf2DataAreaBytes = 476;
inline constexpr uint32_t kUf2FooterBytes = 4;
static_assert(kUf2HeaderBytes + kUf2DataAreaBytes + kUf2FooterBytes == kUf2BlockBytes,
              "UF2 block layout must total 512 bytes");

inline constexpr uint32_t kUf2MagicStart0 = 0x0A324655; // "UF2\n"
inline constexpr uint32_t kUf2MagicStart1 = 0x9E5D5157;
inline constexpr uint32_t kUf2MagicEnd = 0x0AB16F30;
inline constexpr uint32_t kUf2FlagFamilyIdPresent = 0x00002000;

inline constexpr uint32_t kPayloadBytes = 256;     // one flash page
inline constexpr uint32_t kFlashBase = 0x10000000; // XIP base on RP2040/RP2350

// .uf2 file layout:
// [Block 0][Block 1]...[Block N-1], each block:
// [Header 32][Data area 476 = payload + zero fill][Magic end 4]
//
// All fields are little-endian.
struct Uf2BlockHeader {
    uint32_t magic_start0;
    uint32_t magic_start1;
    uint32_t flags;
    uint32_t target_addr;
    uint32_t payload_size;
    uint32_t block_no;
    uint32_t num_blocks;
    uint32_t family_id;       // "fileSize" when the family flag is clear
};

} // namespace uf2pack
