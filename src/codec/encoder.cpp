#include "codec/encoder.hpp"

#include "format/byte_stream.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

namespace uf2pack {

namespace {
static void check_payload_size(uint32_t payload_size) {
    if (payload_size == 0 || payload_size > kUf2DataAreaBytes) {
        throw std::invalid_argument("encode: payload_size must be 1.." +
                                    std::to_string(kUf2DataAreaBytes) + ", got " +
                                    std::to_string(payload_size));
    }
}
} // namespace

uint32_t block_count(size_t length, uint32_t payload_size) {
    check_payload_size(payload_size);
    const unsigned long long n =
        (static_cast<unsigned long long>(length) + payload_size - 1) / payload_size;
    if (n > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("encode: image too large for 32-bit block numbers");
    }
    return static_cast<uint32_t>(n);
}

Uf2Block make_block(const EncodeConfig& cfg,
                    uint32_t index,
                    uint32_t num_blocks,
                    const uint8_t* chunk,
                    size_t chunk_len) {
    check_payload_size(cfg.payload_size);
    if (chunk_len > cfg.payload_size) throw std::invalid_argument("encode: chunk larger than payload_size");
    if (!chunk && chunk_len != 0) throw std::invalid_argument("encode: null chunk");

    Uf2BlockHeader hdr{};
    hdr.magic_start0 = kUf2MagicStart0;
    hdr.magic_start1 = kUf2MagicStart1;
    hdr.flags = kUf2FlagFamilyIdPresent;
    hdr.target_addr = cfg.base_addr + index * cfg.payload_size; // wraps mod 2^32
    hdr.payload_size = cfg.payload_size;
    hdr.block_no = index;
    hdr.num_blocks = num_blocks;
    hdr.family_id = cfg.family_id;

    ByteWriter w;
    w.reserve(kUf2BlockBytes);
    write_block_header(w, hdr);

    // payload, zero-padded to payload_size, then the rest of the 476-byte data area
    w.write_bytes(chunk, chunk_len);
    w.write_zeros(cfg.payload_size - chunk_len);
    w.write_zeros(kUf2DataAreaBytes - cfg.payload_size);

    w.write_u32_le(kUf2MagicEnd);

    if (w.size() != kUf2BlockBytes) {
        throw std::logic_error("encode: block " + std::to_string(index) + " is " +
                               std::to_string(w.size()) + " bytes, expected " +
                               std::to_string(kUf2BlockBytes));
    }
    return w.take();
}

std::vector<Uf2Block> encode_blocks(const std::vector<uint8_t>& image, const EncodeConfig& cfg) {
    const uint32_t num_blocks = block_count(image.size(), cfg.payload_size);

    std::vector<Uf2Block> blocks;
    blocks.reserve(num_blocks);
    for (uint32_t i = 0; i < num_blocks; ++i) {
        const size_t off = static_cast<size_t>(i) * cfg.payload_size;
        const size_t len = std::min<size_t>(cfg.payload_size, image.size() - off);
        blocks.push_back(make_block(cfg, i, num_blocks, image.data() + off, len));
    }

#ifndef NDEBUG
    std::fprintf(stderr, "encode: %zu bytes -> %u blocks (payload %u, base 0x%08x, family 0x%08x)\n",
                 image.size(), num_blocks, cfg.payload_size, cfg.base_addr, cfg.family_id);
    if (!blocks.empty()) {
        std::fprintf(stderr, "First block header:\n");
        for (uint32_t i = 0; i < kUf2HeaderBytes; ++i) {
            std::fprintf(stderr, "%02x ", blocks.front()[i]);
            if ((i + 1) % 16 == 0) std::fprintf(stderr, "\n");
        }
    }
#endif
    return blocks;
}

std::vector<uint8_t> encode_to_uf2(const std::vector<uint8_t>& image, const EncodeConfig& cfg) {
    std::vector<Uf2Block> blocks = encode_blocks(image, cfg);

    std::vector<uint8_t> out;
    out.reserve(blocks.size() * kUf2BlockBytes);
    for (const auto& b : blocks) {
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}


// Debug self-test: a two-block image must lay out header, payload and footer at fixed offsets.
#ifndef NDEBUG
namespace {
struct EncoderSelfTest {
    EncoderSelfTest() {
        std::vector<uint8_t> img(kPayloadBytes + 1, 0xA5);
        EncodeConfig cfg;
        auto blocks = encode_blocks(img, cfg);
        if (blocks.size() != 2) {
            throw std::runtime_error("encoder self-test: block count mismatch");
        }
        const Uf2BlockHeader h1 = read_block_header(blocks[1]);
        if (h1.target_addr != kFlashBase + kPayloadBytes || h1.block_no != 1 || h1.num_blocks != 2) {
            throw std::runtime_error("encoder self-test: header mismatch");
        }
        if (blocks[1][kUf2HeaderBytes] != 0xA5 || blocks[1][kUf2HeaderBytes + 1] != 0x00) {
            throw std::runtime_error("encoder self-test: payload padding mismatch");
        }
        ByteReader r(blocks[1]);
        r.skip(kUf2BlockBytes - kUf2FooterBytes);
        if (r.read_u32_le() != kUf2MagicEnd) {
            throw std::runtime_error("encoder self-test: magic end mismatch");
        }
    }
};
static EncoderSelfTest _encoder_self_test{};
} // namespace
#endif

} // namespace uf2pack
