#include "thematic_distance.hpp"
#include <algorithm>
#include <numeric>
#include <vector>

namespace FootprintDistance {

// Malformed bytes decode above the Unicode range so they never equal a
// real code point.
static constexpr char32_t kMalformedBase = 0x110000;

std::u32string decodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);

        size_t len = 0;
        char32_t cp = 0;
        if (lead < 0x80)                { len = 1; cp = lead; }
        else if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }

        bool valid = len > 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            const unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(kMalformedBase + lead);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::size_t levenshtein(const std::u32string& a, const std::u32string& b) {
    // two rows of the (|a|+1) x (|b|+1) table
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    std::iota(prev.begin(), prev.end(), size_t{0});

    for (size_t x = 1; x <= a.size(); ++x) {
        curr[0] = x;
        for (size_t y = 1; y <= b.size(); ++y) {
            const size_t substitution = prev[y - 1] + (a[x - 1] == b[y - 1] ? 0 : 1);
            curr[y] = std::min({ prev[y] + 1, curr[y - 1] + 1, substitution });
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

std::size_t levenshtein(const std::string& a, const std::string& b) {
    return levenshtein(decodeUtf8(a), decodeUtf8(b));
}

} // namespace FootprintDistance
