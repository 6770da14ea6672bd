#pragma once
#include "fs/FileSystem.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace PK::CLI {

/**
 * Runs one pathkit command against fs.
 *
 * args excludes the program name. Results go to out; usage text goes to out
 * for --help and to err otherwise; parse errors and describeError output go
 * to err. Returns 0 on success, 1 when the command fails, and 2 for usage
 * errors. The logger switch is left to PATHKIT_LOG.
 */
auto runPathKit(std::vector<std::string> const& args, std::ostream& out, std::ostream& err, FileSystem& fs) -> int;

} // namespace PK::CLI
