#include "io/binary_file.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace uf2pack {

std::vector<uint8_t> read_binary_file(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw std::runtime_error("Cannot open file: " + path + " (is a directory)");
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Cannot open file: " + path);

    // read to EOF so pipes and FIFOs work as well as regular files
    std::vector<uint8_t> buf;
    char chunk[4096];
    while (ifs.read(chunk, sizeof(chunk)) || ifs.gcount() > 0) {
        buf.insert(buf.end(), chunk, chunk + ifs.gcount());
    }
    if (ifs.bad()) throw std::runtime_error("Cannot read file: " + path);
    return buf;
}

void write_uf2_stream(std::ostream& os, const std::vector<Uf2Block>& blocks) {
    for (size_t i = 0; i < blocks.size(); ++i) {
        const Uf2Block& b = blocks[i];
        if (b.size() != kUf2BlockBytes) {
            throw std::logic_error("write_uf2: block " + std::to_string(i) + " is not " +
                                   std::to_string(kUf2BlockBytes) + " bytes");
        }
        os.write(reinterpret_cast<const char*>(b.data()), static_cast<std::streamsize>(b.size()));
        if (!os.good()) throw std::runtime_error("write_uf2: write failed at block " + std::to_string(i));
    }
}

void write_uf2_file(const std::string& path, const std::vector<Uf2Block>& blocks) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    write_uf2_stream(ofs, blocks);
    ofs.flush();
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
}

} // namespace uf2pack
