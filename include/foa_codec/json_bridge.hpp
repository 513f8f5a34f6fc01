#pragma once
#include <ostream>
#include <string>
#include <string_view>

namespace foa {

class Decoder;
class Encoder;

struct JsonExportConfig {
  bool infer_scalars = true; // bare numbers/true/false/null instead of strings
};

// JSON document -> FOA entities written through `enc` (simdjson On-Demand).
bool json_to_foa(std::string_view json, Encoder& enc, std::string* err_out = nullptr);

// Drain `dec` and write the equivalent JSON to `out`. Nesting must balance and
// object members must be named. Several top-level values become one JSON array.
// Decode errors are reported through `err_out`; a SourceError from the host propagates.
bool foa_to_json(Decoder& dec, std::ostream& out,
                 const JsonExportConfig& cfg = {}, std::string* err_out = nullptr);

// JSON string literal for `s`, quotes included.
std::string json_quote(std::string_view s);

// True if `s` matches the JSON number grammar exactly.
bool is_json_number(std::string_view s) noexcept;

}
