#pragma once
#include <string>
#include <vector>
#include <map>

namespace cronrepo {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of spaces and tabs, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Expand $VAR and ${VAR}; unset variables expand to nothing
std::string expand_env(const std::string& s);

// Quote a word for a POSIX shell; safe words are returned unchanged
std::string shell_quote(const std::string& word);

// Write via a temp file + rename so readers never see partial content
bool atomic_write_file(const std::string& path, const std::string& content);

// Read the whole file; false if it cannot be opened
bool read_file(const std::string& path, std::string& out);

// Short host name (up to the first dot)
std::string short_hostname();

// Snapshot of the process environment
std::map<std::string, std::string> environment_snapshot();

// Parse a non-negative decimal integer; false on junk or overflow
bool parse_uint(const std::string& s, int& out);

} // namespace cronrepo
