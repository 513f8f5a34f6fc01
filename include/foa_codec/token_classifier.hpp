#pragma once
#include <cstddef>
#include <string_view>
#include "foa_codec/entity.hpp"

namespace foa {

class TextCodec;

struct ClassifyOptions {
  bool escape = true;                // unescape %XX codes in data values
  const TextCodec* codec = nullptr;  // nullptr -> utf8_codec()
};

// Strip Unicode whitespace from both ends of UTF-8 text (ASCII space and
// \t..\r, NBSP, the U+2000 spaces, ideographic space, line/paragraph separators).
std::string_view trim(std::string_view s) noexcept;

// Turn one raw record (no terminator) into an Entity. Pure; copies all text out.
Entity decode_span(std::string_view raw, std::size_t line, const ClassifyOptions& opt);

}
