//! # Case Folding Implementation
//!
//! UTF-8 decoding plus a range table of simple lowercase mappings.

#include "text/case_fold.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>

namespace argschema::text {

namespace {

/// A run of uppercase letters sharing one mapping.
///
/// With `alternating` set, only every second code point starting at `first`
/// is uppercase and maps to the code point after it.
struct FoldRange {
    char32_t first;
    char32_t last;
    int32_t delta;
    bool alternating;
};

// Sorted by `first`; ranges never overlap.
constexpr std::array<FoldRange, 40> FOLD_TABLE = {{
    {0x0041, 0x005A, 32, false},     // Basic Latin
    {0x00C0, 0x00D6, 32, false},     // Latin-1
    {0x00D8, 0x00DE, 32, false},
    {0x0100, 0x012F, 1, true},       // Latin Extended-A
    {0x0132, 0x0137, 1, true},
    {0x0139, 0x0148, 1, true},
    {0x014A, 0x0177, 1, true},
    {0x0178, 0x0178, -121, false},   // Y with diaeresis
    {0x0179, 0x017E, 1, true},
    {0x01CD, 0x01DC, 1, true},       // Latin Extended-B
    {0x01DE, 0x01EF, 1, true},
    {0x01F8, 0x021F, 1, true},
    {0x0222, 0x0233, 1, true},
    {0x0246, 0x024F, 1, true},
    {0x0370, 0x0373, 1, true},       // Greek
    {0x0376, 0x0377, 1, true},
    {0x0386, 0x0386, 38, false},
    {0x0388, 0x038A, 37, false},
    {0x038C, 0x038C, 64, false},
    {0x038E, 0x038F, 63, false},
    {0x0391, 0x03A1, 32, false},
    {0x03A3, 0x03AB, 32, false},
    {0x03C2, 0x03C2, 1, false},      // final sigma
    {0x03D8, 0x03EF, 1, true},
    {0x0400, 0x040F, 80, false},     // Cyrillic
    {0x0410, 0x042F, 32, false},
    {0x0460, 0x0481, 1, true},
    {0x048A, 0x04BF, 1, true},
    {0x04C0, 0x04C0, 15, false},
    {0x04C1, 0x04CE, 1, true},
    {0x04D0, 0x052F, 1, true},
    {0x0531, 0x0556, 48, false},     // Armenian
    {0x10A0, 0x10C5, 7264, false},   // Georgian
    {0x1E00, 0x1E95, 1, true},       // Latin Extended Additional
    {0x1EA0, 0x1EFF, 1, true},
    {0x2160, 0x216F, 16, false},     // Roman numerals
    {0x24B6, 0x24CF, 26, false},     // Circled letters
    {0x2C00, 0x2C2F, 48, false},     // Glagolitic
    {0xFF21, 0xFF3A, 32, false},     // Fullwidth Latin
    {0x10400, 0x10427, 40, false},   // Deseret
}};

constexpr char32_t INVALID_BYTE_BASE = 0xDC00;

auto is_continuation(unsigned char byte) -> bool {
    return (byte & 0xC0) == 0x80;
}

} // namespace

auto decode_utf8(std::string_view s, size_t& pos) -> char32_t {
    auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    size_t length = 0;
    char32_t cp = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        cp = lead & 0x07;
    }

    bool valid = length != 0 && pos + length <= s.size();
    for (size_t i = 1; valid && i < length; ++i) {
        auto byte = static_cast<unsigned char>(s[pos + i]);
        if (!is_continuation(byte)) {
            valid = false;
            break;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF.
    if (valid) {
        if ((length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            valid = false;
        }
    }

    if (!valid) {
        ++pos;
        return INVALID_BYTE_BASE + lead;
    }
    pos += length;
    return cp;
}

void encode_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto fold_code_point(char32_t cp) -> char32_t {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
    }

    auto it = std::upper_bound(FOLD_TABLE.begin(), FOLD_TABLE.end(), cp,
                               [](char32_t value, const FoldRange& range) {
                                   return value < range.first;
                               });
    if (it == FOLD_TABLE.begin()) {
        return cp;
    }
    const auto& range = *std::prev(it);
    if (cp > range.last) {
        return cp;
    }
    if (range.alternating && (cp - range.first) % 2 != 0) {
        return cp;
    }
    return static_cast<char32_t>(static_cast<int32_t>(cp) + range.delta);
}

auto fold_case(std::string_view s) -> std::string {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        encode_utf8(out, fold_code_point(decode_utf8(s, pos)));
    }
    return out;
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (fold_code_point(decode_utf8(a, i)) != fold_code_point(decode_utf8(b, j))) {
            return false;
        }
    }
    return i == a.size() && j == b.size();
}

} // namespace argschema::text
