#pragma once

#include <string>
#include <vector>

namespace hextactics {

std::string to_lower(std::string s);

// Splits on every occurrence of sep. Empty pieces are kept, surrounding
// whitespace is trimmed from each piece.
std::vector<std::string> split_trimmed(const std::string& s, char sep);

std::string trim(const std::string& s);

} // namespace hextactics
