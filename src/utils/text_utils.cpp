#include "utils/text_utils.h"

#include <cctype>

namespace shroud {
namespace utils {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string asciiLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (char c : s) {
        if (!isContinuationByte(static_cast<unsigned char>(c))) ++n;
    }
    return n;
}

size_t utf8ByteOffset(const std::string& s, size_t char_offset) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(s[i]))) continue;
        if (chars == char_offset) return i;
        ++chars;
    }
    return s.size();
}

} // namespace utils
} // namespace shroud
