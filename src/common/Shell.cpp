#include "common/Shell.hpp"

namespace fleet::common {

std::string shellQuote(const std::string& s) {
  std::string sQuoted = "'";
  for (char c : s) {
    if (c == '\'') {
      sQuoted += "'\\''";
    } else {
      sQuoted += c;
    }
  }
  sQuoted += "'";
  return sQuoted;
}

}  // namespace fleet::common
