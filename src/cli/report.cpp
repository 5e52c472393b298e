#include "cli/report.hpp"

#include "format/family_id.hpp"

#include <iomanip>
#include <sstream>

namespace uf2pack {

std::string format_summary(const ConversionSummary& s) {
    std::ostringstream os;
    os << "Converted " << s.input_bytes << " bytes -> " << s.block_count
       << " UF2 blocks (" << s.output_bytes << " bytes)\n";
    os << std::hex << std::setfill('0')
       << "Base address: 0x" << std::setw(8) << s.base_addr
       << ", Family ID: 0x" << std::setw(8) << s.family_id;
    const std::string name = family_name(s.family_id);
    if (name.rfind("0x", 0) != 0) os << " (" << name << ")";
    os << "\n";
    return os.str();
}

} // namespace uf2pack
