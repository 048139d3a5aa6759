#pragma once

#include <cstddef>
#include <string>

namespace shroud {
namespace utils {

// ASCII-only lowercasing; byte length is preserved so offsets stay valid.
std::string asciiLower(const std::string& s);

std::string trim(const std::string& s);

// True for empty or whitespace-only strings
bool isBlank(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8Length(const std::string& s);

// Converts a code point offset into a byte offset; clamps to s.size()
size_t utf8ByteOffset(const std::string& s, size_t char_offset);

} // namespace utils
} // namespace shroud
