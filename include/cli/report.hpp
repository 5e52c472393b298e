#pragma once

#include <cstdint>
#include <string>

namespace uf2pack {

struct ConversionSummary {
    uint64_t input_bytes = 0;
    uint32_t block_count = 0;
    uint64_t output_bytes = 0;
    uint32_t base_addr = 0;
    uint32_t family_id = 0;
};

// Two report lines, each terminated by '\n':
//   Converted <L> bytes -> <K> UF2 blocks (<B> bytes)
//   Base address: 0x%08x, Family ID: 0x%08x [(<name>) for known families]
std::string format_summary(const ConversionSummary& s);

} // namespace uf2pack
