#pragma once
#include <string>
#include <vector>

namespace toolbelt {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split a command line into arguments. Single and double quotes group,
// backslash escapes the next character, unquoted spaces/tabs separate.
// Empty quoted arguments ("" or '') are kept.
std::vector<std::string> split_shell_args(const std::string& input);

// Join arguments into one line for sh -c, single-quoting any that need it
std::string join_shell_args(const std::vector<std::string>& args);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace toolbelt
