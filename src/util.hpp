#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace sift {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Canonical form used for exact-duplicate matching: lowercase, whitespace
// runs collapsed to one space, everything but [A-Za-z0-9_] and whitespace
// removed, then trimmed.
std::string normalize_content(const std::string& content);

// Length of UTF-8 text in UTF-16 code units: one per code point, two for
// code points outside the BMP.
size_t utf16_length(const std::string& text);

// Longest prefix of UTF-8 text that is at most max_units UTF-16 code units.
// Never ends inside a multibyte sequence.
std::string utf8_prefix(const std::string& text, size_t max_units);

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace sift
