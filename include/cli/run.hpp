#pragma once

#include <iosfwd>

namespace uf2pack {

// Whole bin2uf2 command: parse, read, encode, write, report.
// Returns 0 on success or --help, 1 on a usage error, 2 after printing "[ERROR] ..." to err.
int run(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace uf2pack
