#pragma once
#include <string>

#include "canvas.hpp"

namespace labelsheet {

/* UTF-8 to single-byte WinAnsi: ASCII and U+00A0..U+00FF map directly,
 * anything else (or malformed input) becomes '?' */
std::string to_winansi(const std::string& utf8);

/* advance width in points of UTF-8 `text` set in one of the standard 14 Helvetica faces */
double string_width(Font font, double size, const std::string& text);

}
