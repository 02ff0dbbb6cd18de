#include "util/utf8.hpp"

#include <cstddef>
#include <cstdint>

static const char kReplacement[] = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at i, or 0
static std::size_t sequenceLength(const std::string& s, std::size_t i, std::uint32_t* cp) {
    const auto b0 = (unsigned char)s[i];
    std::size_t len = 0;
    std::uint32_t value = 0;

    if (b0 < 0x80) {
        *cp = b0;
        return 1;
    } else if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        value = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        value = b0 & 0x0F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        value = b0 & 0x07;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = (unsigned char)s[i + k];
        if ((b & 0xC0) != 0x80) return 0;
        value = (value << 6) | (b & 0x3F);
    }

    // Overlong forms, surrogates, out of range
    if ((len == 3 && value < 0x800) || (len == 4 && value < 0x10000) ||
        (value >= 0xD800 && value <= 0xDFFF) || value > 0x10FFFF) {
        return 0;
    }

    *cp = value;
    return len;
}

std::string sanitizeUtf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        std::uint32_t cp = 0;
        const std::size_t len = sequenceLength(text, i, &cp);
        if (len == 0) {
            out += kReplacement;
            ++i;
        } else {
            out.append(text, i, len);
            i += len;
        }
    }
    return out;
}

bool containsHebrew(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        std::uint32_t cp = 0;
        const std::size_t len = sequenceLength(text, i, &cp);
        if (len == 0) {
            ++i;
            continue;
        }
        if (cp >= 0x0590 && cp <= 0x05FF) return true;
        i += len;
    }
    return false;
}
