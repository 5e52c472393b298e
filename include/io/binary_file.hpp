#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "codec/encoder.hpp"

namespace uf2pack {

// Read the whole file as an opaque byte sequence.
std::vector<uint8_t> read_binary_file(const std::string& path);

// Write blocks to the sink in index order. Throws on a failed write.
void write_uf2_stream(std::ostream& os, const std::vector<Uf2Block>& blocks);

// Create/truncate `path` and write all blocks. An empty sequence leaves an empty file.
void write_uf2_file(const std::string& path, const std::vector<Uf2Block>& blocks);

} // namespace uf2pack
