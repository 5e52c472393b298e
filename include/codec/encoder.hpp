#pragma once

#include <cstdint>
#include <vector>

#include "format/family_id.hpp"
#include "format/uf2_format.hpp"

namespace uf2pack {

struct EncodeConfig {
    uint32_t base_addr = kFlashBase;
    uint32_t payload_size = kPayloadBytes; // 1..476; the CLI always uses 256
    uint32_t family_id = kDefaultFamilyId;
};

// One 512-byte UF2 block, serialized.
using Uf2Block = std::vector<uint8_t>;

// ceil(length / payload_size); 0 for an empty image.
uint32_t block_count(size_t length, uint32_t payload_size);

// Build block `index` of `num_blocks` from a chunk of at most payload_size bytes.
// Short chunks are zero-padded. Throws std::logic_error if the assembled block
// is not exactly kUf2BlockBytes.
Uf2Block make_block(const EncodeConfig& cfg,
                    uint32_t index,
                    uint32_t num_blocks,
                    const uint8_t* chunk,
                    size_t chunk_len);

// Split an image into UF2 blocks, index 0 first.
std::vector<Uf2Block> encode_blocks(const std::vector<uint8_t>& image, const EncodeConfig& cfg = {});

// Same as encode_blocks, concatenated into the .uf2 byte stream.
std::vector<uint8_t> encode_to_uf2(const std::vector<uint8_t>& image, const EncodeConfig& cfg = {});

} // namespace uf2pack
