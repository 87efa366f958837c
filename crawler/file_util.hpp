#pragma once

#include <string>

namespace prefixcrawl {

bool file_exists(const std::string& path);

// Creates every missing directory above `path` (the last component is a file name).
void mkdirs_for_path(const std::string& path);

// All of these return empty string on success; otherwise an error message.
std::string read_text_file(const std::string& path, std::string& out);

// Writes `<path>.tmp` and renames it over `path`, so readers only ever see a
// complete file. Paths ending in ".gz" are gzip-compressed.
std::string write_text_file_atomic(const std::string& path, const std::string& text);

}  // namespace prefixcrawl
