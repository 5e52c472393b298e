#include "cli/run.hpp"

#include "cli/cli_parser.hpp"
#include "cli/report.hpp"
#include "codec/encoder.hpp"
#include "format/family_id.hpp"
#include "io/binary_file.hpp"

#include <ostream>
#include <stdexcept>

namespace uf2pack {

namespace {
static const char* kUsage =
    "Usage: bin2uf2 <input.bin> <output.uf2> [--base <addr>] [--family <name|id>]\n"
    "       bin2uf2 --in <input.bin> --out <output.uf2> [--base <addr>] [--family <name|id>]\n"
    "  --base    target address of the first block (default 0x10000000)\n"
    "  --family  rp2040 | rp2350-arm-s | rp2350-arm-ns | rp2350-riscv | absolute | data | 0x<id>\n"
    "            (default rp2350-arm-s)\n";
} // namespace

int run(int argc, char** argv, std::ostream& out, std::ostream& err) {
    try {
        CliParser cli;
        cli.parse(argc, argv);
        if (cli.has("help")) {
            out << kUsage;
            return 0;
        }
        const std::string in = cli.get_or_positional("in", 0);
        // with --in given, the first positional (if any) is the output
        const std::string dst = cli.get_or_positional("out", cli.has("in") ? 0 : 1);
        if (in.empty() || dst.empty()) {
            err << kUsage;
            return 1;
        }

        EncodeConfig cfg;
        if (cli.has("base")) {
            auto base = parse_u32(cli.get("base"));
            if (!base) {
                err << "Invalid base address: " << cli.get("base") << "\n" << kUsage;
                return 1;
            }
            cfg.base_addr = *base;
        }
        if (cli.has("family")) {
            auto family = parse_family_id(cli.get("family"));
            if (!family) {
                err << "Invalid family ID: " << cli.get("family") << "\n" << kUsage;
                return 1;
            }
            cfg.family_id = *family;
        }

        const auto image = read_binary_file(in);
        const auto blocks = encode_blocks(image, cfg);
        write_uf2_file(dst, blocks);

        ConversionSummary summary;
        summary.input_bytes = image.size();
        summary.block_count = static_cast<uint32_t>(blocks.size());
        summary.output_bytes = static_cast<uint64_t>(blocks.size()) * kUf2BlockBytes;
        summary.base_addr = cfg.base_addr;
        summary.family_id = cfg.family_id;
        out << format_summary(summary);
        out << "Wrote: " << dst << "\n";
        return 0;
    } catch (const std::exception& e) {
        err << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}

} // namespace uf2pack
