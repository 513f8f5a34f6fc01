#include "foa_codec/text_codec.hpp"
#include <cctype>
#include <cstdint>

namespace foa {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Length of the well-formed UTF-8 sequence at s[i], or 0 if malformed.
std::size_t utf8_sequence(std::string_view s, std::size_t i, std::uint32_t* cp_out) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  std::size_t len;
  std::uint32_t cp;
  std::uint32_t min;
  if (b0 < 0x80)             { *cp_out = b0; return 1; }
  else if ((b0 >> 5) == 0x6) { len = 2; cp = b0 & 0x1F; min = 0x80; }
  else if ((b0 >> 4) == 0xE) { len = 3; cp = b0 & 0x0F; min = 0x800; }
  else if ((b0 >> 3) == 0x1E){ len = 4; cp = b0 & 0x07; min = 0x10000; }
  else return 0;

  if (i + len > s.size()) return 0;
  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0) != 0x80) return 0;
    cp = (cp << 6) | (b & 0x3F);
  }
  if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0; // overlong/surrogate
  *cp_out = cp;
  return len;
}

class Utf8Codec final : public TextCodec {
public:
  const char* name() const noexcept override { return "utf-8"; }

  std::string decode(std::string_view bytes) const override {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
      std::uint32_t cp = 0;
      const std::size_t n = utf8_sequence(bytes, i, &cp);
      if (n == 0) { out += kReplacement; ++i; continue; }
      out.append(bytes.data() + i, n);
      i += n;
    }
    return out;
  }

  std::string encode(std::string_view text) const override { return std::string(text); }
};

class Latin1Codec final : public TextCodec {
public:
  const char* name() const noexcept override { return "latin1"; }

  std::string decode(std::string_view bytes) const override {
    std::string out;
    out.reserve(bytes.size());
    for (unsigned char c : bytes) append_utf8(out, c);
    return out;
  }

  std::string encode(std::string_view text) const override {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
      std::uint32_t cp = 0;
      const std::size_t n = utf8_sequence(text, i, &cp);
      if (n == 0) { out.push_back('?'); ++i; continue; }
      out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
      i += n;
    }
    return out;
  }
};

bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

}

const TextCodec& utf8_codec() {
  static const Utf8Codec codec;
  return codec;
}

const TextCodec& latin1_codec() {
  static const Latin1Codec codec;
  return codec;
}

const TextCodec* codec_by_name(std::string_view name) {
  if (ieq(name, "utf-8") || ieq(name, "utf8")) return &utf8_codec();
  if (ieq(name, "latin1") || ieq(name, "iso-8859-1")) return &latin1_codec();
  return nullptr;
}

}
