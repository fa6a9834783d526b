#pragma once
#include <cstddef>
#include <string>

namespace FootprintDistance {

// Unit-cost edit distance counted over the code points of two UTF-8
// strings. Bytes that do not form valid UTF-8 count as one unit each.
std::size_t levenshtein(const std::string& a, const std::string& b);

std::size_t levenshtein(const std::u32string& a, const std::u32string& b);

// Code points of a UTF-8 string. A malformed byte b becomes 0x110000 + b.
std::u32string decodeUtf8(const std::string& text);

} // namespace FootprintDistance
