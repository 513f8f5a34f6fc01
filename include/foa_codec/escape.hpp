#pragma once
#include <string>
#include <string_view>

namespace foa {

// Reserved characters of the wire format: ( [ ] ) =
bool is_reserved(char c) noexcept;

// Replace each reserved character with its %XX code (uppercase hex).
std::string escape(std::string_view s);

// Replace %28 %5B %5D %29 %3D with the literal characters. Other '%' sequences
// are left as they are.
std::string unescape(std::string_view s);

}
