#pragma once

#include <string>

namespace gradostroi {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also tried
// against the source tree and its parents, so the shipped data/ files resolve
// when binaries run from a build directory.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// The contents go to a temporary sibling first and are renamed into place, so
// a crash mid-write leaves the previous file intact.
void write_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

} // namespace gradostroi
