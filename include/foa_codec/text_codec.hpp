#pragma once
#include <string>
#include <string_view>

namespace foa {

// Pluggable byte <-> text conversion. Text on the C++ side is always UTF-8.
// Codecs must be ASCII-compatible: framing scans raw bytes for '\n'.
class TextCodec {
public:
  virtual ~TextCodec() = default;
  virtual const char* name() const noexcept = 0;
  virtual std::string decode(std::string_view bytes) const = 0;
  virtual std::string encode(std::string_view text) const = 0;
};

// UTF-8 passthrough; malformed sequences decode to U+FFFD.
const TextCodec& utf8_codec();

// ISO-8859-1; code points above U+00FF encode as '?'.
const TextCodec& latin1_codec();

// "utf-8", "utf8", "latin1", "iso-8859-1" (case-insensitive); nullptr if unknown.
const TextCodec* codec_by_name(std::string_view name);

}
