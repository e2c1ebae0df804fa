#pragma once

#include <string>

namespace slingnet {

// Reads an entire file. Relative paths that do not exist from the working
// directory are also looked up from SLINGNET_SOURCE_DIR (when defined) and the
// parent directories, so tests and tools work from a build tree.
// Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes via a temporary sibling + rename so a crash never leaves a truncated
// file behind. Creates parent directories. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace slingnet
