#include "hextactics/util/file_io.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hextactics {
namespace {

bool exists_quiet(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec) && !ec;
}

std::filesystem::path resolve_existing_read_path(const std::filesystem::path& requested) {
  if (requested.empty() || requested.is_absolute()) return requested;
  if (exists_quiet(requested)) return requested;

  std::vector<std::filesystem::path> roots;
#ifdef HEXTACTICS_SOURCE_DIR
  roots.emplace_back(HEXTACTICS_SOURCE_DIR);
#endif

  std::error_code ec;
  std::filesystem::path cur = std::filesystem::current_path(ec);
  if (!ec && !cur.empty()) {
    for (int depth = 0; depth < 8; ++depth) {
      const auto parent = cur.parent_path();
      if (parent.empty() || parent == cur) break;
      cur = parent;
      roots.push_back(cur);
    }
  }

  for (const auto& root : roots) {
    const auto candidate = root / requested;
    if (exists_quiet(candidate)) return candidate;
  }
  return requested;
}

} // namespace

std::string resolve_data_path(const std::string& path) {
  return resolve_existing_read_path(std::filesystem::path(path)).string();
}

std::string read_text_file(const std::string& path) {
  const std::filesystem::path requested(path);
  const std::filesystem::path resolved = resolve_existing_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path + " (resolved to: " +
                               resolved.string() + ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + resolved.string());
  return ss.str();
}

} // namespace hextactics
