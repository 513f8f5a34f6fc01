#include "foa_codec/escape.hpp"

namespace foa {

static constexpr char kHex[] = "0123456789ABCDEF";

static int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1; // codes are written uppercase only
}

bool is_reserved(char c) noexcept {
  return c == '(' || c == '[' || c == ']' || c == ')' || c == '=';
}

std::string escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (is_reserved(c)) {
      const auto u = static_cast<unsigned char>(c);
      out.push_back('%');
      out.push_back(kHex[u >> 4]);
      out.push_back(kHex[u & 0xF]);
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string unescape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      const int hi = hex_value(s[i + 1]);
      const int lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        const char c = static_cast<char>((hi << 4) | lo);
        if (is_reserved(c)) {
          out.push_back(c);
          i += 2;
          continue;
        }
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

}
