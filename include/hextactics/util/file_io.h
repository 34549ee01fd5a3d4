#pragma once

#include <string>

namespace hextactics {

// Reads an entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist under the current directory are retried
// against the source tree (HEXTACTICS_SOURCE_DIR) and the parents of the
// current directory, so tests and tools find data/ from a build directory.
std::string read_text_file(const std::string& path);

// Same lookup as read_text_file, without reading. Returns the input unchanged
// when nothing matches.
std::string resolve_data_path(const std::string& path);

} // namespace hextactics
