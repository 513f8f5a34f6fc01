#include "foa_codec/entity.hpp"
#include <charconv>
#include <system_error>
#include <fast_float/fast_float.h>

namespace foa {

std::optional<double> Entity::as_number() const {
  if (kind != EntityKind::Data || data.empty()) return std::nullopt;
  double out;
  const char* first = data.data();
  const char* last = first + data.size();
  auto [ptr, ec] = fast_float::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return out;
}

std::optional<std::int64_t> Entity::as_integer() const {
  if (kind != EntityKind::Data || data.empty()) return std::nullopt;
  std::int64_t out = 0;
  const char* first = data.data();
  const char* last = first + data.size();
  if (*first == '+') ++first; // from_chars rejects a leading '+'
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc() || ptr != last) return std::nullopt;
  return out;
}

const char* to_string(EntityKind k) noexcept {
  switch (k) {
    case EntityKind::StartObject: return "StartObject";
    case EntityKind::StartArray:  return "StartArray";
    case EntityKind::EndObject:   return "EndObject";
    case EntityKind::EndArray:    return "EndArray";
    case EntityKind::Data:        return "Data";
  }
  return "Unknown";
}

char structural_char(EntityKind k) noexcept {
  switch (k) {
    case EntityKind::StartObject: return '(';
    case EntityKind::StartArray:  return '[';
    case EntityKind::EndObject:   return ')';
    case EntityKind::EndArray:    return ']';
    case EntityKind::Data:        break;
  }
  return '\0';
}

std::optional<EntityKind> kind_from_char(char c) noexcept {
  switch (c) {
    case '(': return EntityKind::StartObject;
    case '[': return EntityKind::StartArray;
    case ')': return EntityKind::EndObject;
    case ']': return EntityKind::EndArray;
    default:  return std::nullopt;
  }
}

bool operator==(const Entity& a, const Entity& b) {
  return a.name == b.name && a.data == b.data && a.kind == b.kind && a.line == b.line;
}

bool operator!=(const Entity& a, const Entity& b) { return !(a == b); }

}
