#include "foa_codec/token_classifier.hpp"
#include "foa_codec/escape.hpp"
#include "foa_codec/text_codec.hpp"
#include <string>

namespace foa {

// Byte length of the UTF-8 whitespace code point at `p`, or 0. Covers ASCII
// \t..\r and space, U+0085, U+00A0, U+1680, U+2000..U+200A, U+2028, U+2029,
// U+202F, U+205F and U+3000.
static std::size_t space_width(const unsigned char* p, std::size_t n) noexcept {
  if (n == 0) return 0;
  if (p[0] == ' ' || (p[0] >= '\t' && p[0] <= '\r')) return 1;
  if (n >= 2 && p[0] == 0xC2 && (p[1] == 0x85 || p[1] == 0xA0)) return 2;
  if (n < 3) return 0;
  if (p[0] == 0xE1 && p[1] == 0x9A && p[2] == 0x80) return 3;
  if (p[0] == 0xE2 && p[1] == 0x80 &&
      ((p[2] >= 0x80 && p[2] <= 0x8A) || p[2] == 0xA8 || p[2] == 0xA9 || p[2] == 0xAF)) return 3;
  if (p[0] == 0xE2 && p[1] == 0x81 && p[2] == 0x9F) return 3;
  if (p[0] == 0xE3 && p[1] == 0x80 && p[2] == 0x80) return 3;
  return 0;
}

std::string_view trim(std::string_view s) noexcept {
  auto bytes = [&s]{ return reinterpret_cast<const unsigned char*>(s.data()); };
  while (std::size_t w = space_width(bytes(), s.size())) s.remove_prefix(w);
  while (!s.empty()) {
    std::size_t w = 0;
    for (std::size_t k = 1; k <= 3 && k <= s.size() && !w; ++k) {
      if (space_width(bytes() + s.size() - k, k) == k) w = k;
    }
    if (!w) break;
    s.remove_suffix(w);
  }
  return s;
}

Entity decode_span(std::string_view raw, std::size_t line, const ClassifyOptions& opt) {
  const TextCodec& codec = opt.codec ? *opt.codec : utf8_codec();
  const std::string text = codec.decode(raw);
  const std::string_view str = trim(text);

  Entity e;
  e.line = line;

  std::string_view value = str;
  const auto eq = str.find('=');
  if (eq != std::string_view::npos) {
    e.name = std::string(trim(str.substr(0, eq)));
    value = trim(str.substr(eq + 1));
  }

  if (value.size() == 1) {
    if (auto k = kind_from_char(value.front())) {
      e.kind = *k;
      e.data.assign(value.data(), value.size());
      return e;
    }
  }

  e.kind = EntityKind::Data;
  e.data = opt.escape ? unescape(value) : std::string(value);
  return e;
}

}
