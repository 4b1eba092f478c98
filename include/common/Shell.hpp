#pragma once

#include <string>

namespace fleet::common {

/// Wrap s in single quotes for a POSIX shell.
std::string shellQuote(const std::string& s);

}  // namespace fleet::common
