#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chatpace {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Lower-case ASCII copy
std::string to_lower(const std::string& s);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& s);
size_t utf8_length(const std::string& s, size_t begin, size_t end);

// Byte offset reached after advancing `count` code points from `begin`
// (clamped to s.size())
size_t utf8_advance(const std::string& s, size_t begin, size_t count);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chatpace
