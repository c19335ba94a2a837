#pragma once
#include <string>
#include <cstdint>

namespace agentmem {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// ASCII uppercase copy
std::string to_upper(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename. Creates parent directories.
// Returns false if the file could not be written.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace agentmem
