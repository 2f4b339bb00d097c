#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace toolgate {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII upper-case copy
std::string to_upper(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

// Match a '/'-separated relative path against a glob pattern. Segments use
// fnmatch(3) rules (*, ?, [...]); a "**" segment matches zero or more
// directories. Wildcards never match a leading '.' in a segment.
bool glob_match(const std::string& pattern, const std::string& path);

// Cut s to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max_bytes);

} // namespace toolgate
