#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>

// Replaces every malformed UTF-8 sequence with U+FFFD. Segment text can end
// mid-character when the engine splits a token across segments.
std::string sanitizeUtf8(const std::string& text);

// True if any code point falls in the Hebrew block (U+0590..U+05FF)
bool containsHebrew(const std::string& text);

#endif
