#include "foa_codec/encoder.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/escape.hpp"
#include "foa_codec/text_codec.hpp"
#include <cmath>
#include <cstdio>
#include <system_error>
#include <fast_float/fast_float.h>

namespace foa {

std::string format_double(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v < 0 ? "-inf" : "inf";
  char tmp[64];
  int n = 0;
  for (int prec = 1; prec <= 17; ++prec) {
    n = std::snprintf(tmp, sizeof(tmp), "%.*g", prec, v);
    double back = 0.0;
    auto [ptr, ec] = fast_float::from_chars(tmp, tmp + n, back);
    if (ec == std::errc() && ptr == tmp + n && back == v) break;
  }
  return std::string(tmp, (n > 0) ? static_cast<std::size_t>(n) : 0);
}

Encoder::Encoder(EncoderConfig cfg) : cfg_(cfg) {}

Encoder::Encoder(std::ostream& out, EncoderConfig cfg) : cfg_(cfg), out_(&out) {}

void Encoder::emit(std::string_view name, bool named, std::string_view value) {
  if (named) {
    if (name.find('\n') != std::string_view::npos || name.find('=') != std::string_view::npos)
      throw EncodeError("entity name may not contain '=' or a newline: " + std::string(name));
  }
  if (value.find('\n') != std::string_view::npos)
    throw EncodeError("entity value may not contain a newline");
  // A bare "\n" is a blank line, which decoders skip.
  if (!named && value.empty())
    throw EncodeError("unnamed entity value may not be empty");

  std::string line;
  line.reserve(name.size() + value.size() + 4);
  if (named) {
    line.append(name.data(), name.size());
    line.append(" = ");
  }
  line.append(value.data(), value.size());
  line.push_back('\n');

  const TextCodec& codec = cfg_.codec ? *cfg_.codec : utf8_codec();
  last_ = codec.encode(line);
  ++lines_;
  if (out_) out_->write(last_.data(), static_cast<std::streamsize>(last_.size()));
}

void Encoder::write_structural(EntityKind kind) {
  const char c = structural_char(kind);
  if (!c) throw EncodeError("write_structural: Data is not a structural kind");
  emit({}, false, std::string_view(&c, 1));
}

void Encoder::write_structural(std::string_view name, EntityKind kind) {
  const char c = structural_char(kind);
  if (!c) throw EncodeError("write_structural: Data is not a structural kind");
  emit(name, true, std::string_view(&c, 1));
}

void Encoder::write_data(std::string_view value) {
  if (cfg_.escape) emit({}, false, escape(value));
  else emit({}, false, value);
}

void Encoder::write_data(std::string_view name, std::string_view value) {
  if (cfg_.escape) emit(name, true, escape(value));
  else emit(name, true, value);
}

void Encoder::write_integer(std::string_view name, std::int64_t value) {
  emit(name, true, std::to_string(value));
}

void Encoder::write_number(std::string_view name, double value) {
  emit(name, true, format_double(value));
}

void Encoder::write(const Entity& e) {
  if (e.kind != EntityKind::Data) {
    if (e.name) write_structural(*e.name, e.kind);
    else write_structural(e.kind);
  } else if (e.name) {
    write_data(*e.name, e.data);
  } else {
    write_data(e.data);
  }
}

}
