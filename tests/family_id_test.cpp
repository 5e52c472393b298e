/**
 * @file family_id_test.cpp
 * @brief Unit tests for family-ID names and 32-bit number parsing
 */

#include "format/family_id.hpp"
#include "gtest/gtest.h"

using namespace uf2pack;

// ============================================================================
// NAMED FAMILIES
// ============================================================================

TEST(FamilyIdTest, KnownNamesResolve) {
  EXPECT_EQ(0xE48BFF56u, parse_family_id("rp2040").value());
  EXPECT_EQ(0xE48BFF57u, parse_family_id("absolute").value());
  EXPECT_EQ(0xE48BFF58u, parse_family_id("data").value());
  EXPECT_EQ(0xE48BFF59u, parse_family_id("rp2350-arm-s").value());
  EXPECT_EQ(0xE48BFF5Au, parse_family_id("rp2350-riscv").value());
  EXPECT_EQ(0xE48BFF5Bu, parse_family_id("rp2350-arm-ns").value());
}

TEST(FamilyIdTest, DefaultIsRp2350ArmSecure) {
  EXPECT_EQ(0xE48BFF59u, kDefaultFamilyId);
}

TEST(FamilyIdTest, NamesAreCaseSensitive) {
  EXPECT_FALSE(parse_family_id("RP2040").has_value());
  EXPECT_FALSE(parse_family_id("stm32").has_value());
}

TEST(FamilyIdTest, NumericIdsAreAccepted) {
  EXPECT_EQ(0xDEADBEEFu, parse_family_id("0xdeadbeef").value());
  EXPECT_EQ(0xE48BFF56u, parse_family_id("0XE48BFF56").value());
  EXPECT_EQ(42u, parse_family_id("42").value());
}

TEST(FamilyIdTest, NameForIdRoundTrips) {
  EXPECT_EQ("rp2040", family_name(kRp2040FamilyId));
  EXPECT_EQ("rp2350-arm-ns", family_name(kRp2350ArmNsFamilyId));
  EXPECT_EQ("0x12345678", family_name(0x12345678));
  EXPECT_EQ("0x00000000", family_name(0));
}

// ============================================================================
// NUMBER PARSING
// ============================================================================

TEST(ParseU32Test, HexAndDecimal) {
  EXPECT_EQ(0x10000000u, parse_u32("0x10000000").value());
  EXPECT_EQ(268435456u, parse_u32("268435456").value());
  EXPECT_EQ(0xFFFFFFFFu, parse_u32("0xffffffff").value());
  EXPECT_EQ(0u, parse_u32("0").value());
}

TEST(ParseU32Test, RejectsGarbageAndOverflow) {
  EXPECT_FALSE(parse_u32("").has_value());
  EXPECT_FALSE(parse_u32("0x").has_value());
  EXPECT_FALSE(parse_u32("0x1g").has_value());
  EXPECT_FALSE(parse_u32("12abc").has_value());
  EXPECT_FALSE(parse_u32("-1").has_value());
  EXPECT_FALSE(parse_u32(" 1").has_value());
  EXPECT_FALSE(parse_u32("0x100000000").has_value());
  EXPECT_FALSE(parse_u32("4294967296").has_value());
}
