#include "format/family_id.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace uf2pack {

namespace {
struct NamedFamily {
    const char* name;
    uint32_t id;
};

static constexpr std::array<NamedFamily, 6> kFamilies{{
    {"rp2040", kRp2040FamilyId},
    {"absolute", kAbsoluteFamilyId},
    {"data", kDataFamilyId},
    {"rp2350-arm-s", kRp2350ArmSFamilyId},
    {"rp2350-riscv", kRp2350RiscvFamilyId},
    {"rp2350-arm-ns", kRp2350ArmNsFamilyId},
}};
} // namespace

std::optional<uint32_t> parse_u32(const std::string& text) {
    if (text.empty()) return std::nullopt;

    std::string digits = text;
    int base = 10;
    if (digits.rfind("0x", 0) == 0 || digits.rfind("0X", 0) == 0) {
        digits = digits.substr(2);
        base = 16;
    }
    if (digits.empty()) return std::nullopt;
    // stoull skips leading whitespace and accepts a sign; neither is a valid address
    if (!std::isxdigit(static_cast<unsigned char>(digits[0]))) return std::nullopt;

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(digits, &pos, base);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != digits.size()) return std::nullopt;
    if (value > 0xFFFFFFFFull) return std::nullopt;
    return static_cast<uint32_t>(value);
}

std::optional<uint32_t> parse_family_id(const std::string& text) {
    for (const auto& f : kFamilies) {
        if (text == f.name) return f.id;
    }
    return parse_u32(text);
}

std::string family_name(uint32_t family_id) {
    for (const auto& f : kFamilies) {
        if (family_id == f.id) return f.name;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", family_id);
    return buf;
}

} // namespace uf2pack
