#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace uf2pack {

inline constexpr uint32_t kRp2040FamilyId = 0xE48BFF56;
inline constexpr uint32_t kAbsoluteFamilyId = 0xE48BFF57;
inline constexpr uint32_t kDataFamilyId = 0xE48BFF58;
inline constexpr uint32_t kRp2350ArmSFamilyId = 0xE48BFF59;
inline constexpr uint32_t kRp2350RiscvFamilyId = 0xE48BFF5A;
inline constexpr uint32_t kRp2350ArmNsFamilyId = 0xE48BFF5B;

inline constexpr uint32_t kDefaultFamilyId = kRp2350ArmSFamilyId;

// Accepts a known family name ("rp2040", "rp2350-arm-s", ...), a 0x-prefixed
// hex value or a decimal value. Returns nullopt for anything that is not a
// 32-bit number or a known name.
std::optional<uint32_t> parse_family_id(const std::string& text);

// Parse a 32-bit number written as 0x-hex or decimal (used for addresses too).
std::optional<uint32_t> parse_u32(const std::string& text);

// Known name for a family id, or "0x%08x" when unknown.
std::string family_name(uint32_t family_id);

} // namespace uf2pack
