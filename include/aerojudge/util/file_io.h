#pragma once

#include <string>

namespace aerojudge {

// Reads entire file into a string. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Writes go through a temporary sibling file + rename, so a crash mid-write
// never leaves a truncated trust checkpoint behind.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

} // namespace aerojudge
