#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include "foa_codec/entity.hpp"

namespace foa {

class TextCodec;

struct EncoderConfig {
  bool escape = true;                // write reserved chars in values as %XX
  const TextCodec* codec = nullptr;  // nullptr -> utf8_codec()
};

// Writes one FOA entity per line. Without a stream the encoder has no backing
// store, but last_line() still holds the bytes of the most recent write.
class Encoder {
public:
  explicit Encoder(EncoderConfig cfg = {});
  explicit Encoder(std::ostream& out, EncoderConfig cfg = {});

  void write_structural(EntityKind kind);
  void write_structural(std::string_view name, EntityKind kind);

  void write_data(std::string_view value);
  void write_data(std::string_view name, std::string_view value);
  void write_integer(std::string_view name, std::int64_t value);
  void write_number(std::string_view name, double value);

  // Re-encode a decoded entity (name, data and kind; line is ignored).
  void write(const Entity& e);

  const std::string& last_line() const noexcept { return last_; }
  std::uint64_t lines_written() const noexcept { return lines_; }
  const EncoderConfig& config() const noexcept { return cfg_; }

private:
  void emit(std::string_view name, bool named, std::string_view value);

  EncoderConfig cfg_;
  std::ostream* out_{nullptr};
  std::string last_;
  std::uint64_t lines_{0};
};

// Shortest decimal text that parses back to exactly `v`.
std::string format_double(double v);

}
