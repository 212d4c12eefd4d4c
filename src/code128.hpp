#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace labelsheet {

/* Encoded Code 128 symbol, without quiet zones.
 * widths alternate bar, space, bar, ... in modules, starting with a bar. */
struct Code128Symbol {
  std::string text;
  std::vector<int> codewords;     // start, data, checksum, stop
  std::vector<uint8_t> widths;
  unsigned modules = 0;
};

/* Code set B, with code set C for long digit runs. Throws EncodingError for
 * empty input or any byte outside printable ASCII (32..126). */
Code128Symbol encode_code128(const std::string& text);

}
