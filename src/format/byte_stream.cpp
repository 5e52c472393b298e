#include "format/byte_stream.hpp"

namespace uf2pack {

void write_block_header(ByteWriter& w, const Uf2BlockHeader& hdr) {
    w.write_u32_le(hdr.magic_start0);
    w.write_u32_le(hdr.magic_start1);
    w.write_u32_le(hdr.flags);
    w.write_u32_le(hdr.target_addr);
    w.write_u32_le(hdr.payload_size);
    w.write_u32_le(hdr.block_no);
    w.write_u32_le(hdr.num_blocks);
    w.write_u32_le(hdr.family_id);
}

Uf2BlockHeader read_block_header(const std::vector<uint8_t>& bytes, size_t offset) {
    if (offset > bytes.size() || bytes.size() - offset < kUf2HeaderBytes) {
        throw std::runtime_error("read_block_header: buffer too small for header");
    }
    ByteReader r(bytes.data() + offset, bytes.size() - offset);

    Uf2BlockHeader hdr{};
    hdr.magic_start0 = r.read_u32_le();
    hdr.magic_start1 = r.read_u32_le();
    hdr.flags = r.read_u32_le();
    hdr.target_addr = r.read_u32_le();
    hdr.payload_size = r.read_u32_le();
    hdr.block_no = r.read_u32_le();
    hdr.num_blocks = r.read_u32_le();
    hdr.family_id = r.read_u32_le();
    return hdr;
}

} // namespace uf2pack
