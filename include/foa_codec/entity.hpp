#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace foa {

enum class EntityKind { StartObject, StartArray, EndObject, EndArray, Data };

// One decoded token. Text is always an owned copy, never a view into the scan buffer.
struct Entity {
  std::optional<std::string> name;  // set iff the line was `<name> = <value>`
  std::string data;                 // value text, or the structural char
  EntityKind kind = EntityKind::Data;
  std::size_t line = 0;             // 1-based source line

  bool is_structural() const noexcept { return kind != EntityKind::Data; }

  // Full-span numeric views of `data` (fast_float / from_chars in .cpp).
  std::optional<double> as_number() const;
  std::optional<std::int64_t> as_integer() const;
};

// "StartObject", "Data", ...
const char* to_string(EntityKind k) noexcept;

// '(' '[' ')' ']' for structural kinds, '\0' for Data.
char structural_char(EntityKind k) noexcept;

// Inverse of structural_char; nullopt for anything else.
std::optional<EntityKind> kind_from_char(char c) noexcept;

bool operator==(const Entity& a, const Entity& b);
bool operator!=(const Entity& a, const Entity& b);

}
