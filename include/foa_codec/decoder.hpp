#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include "foa_codec/byte_source.hpp"
#include "foa_codec/entity.hpp"
#include "foa_codec/frame_source.hpp"
#include "foa_codec/growth_policy.hpp"
#include "foa_codec/scan_buffer.hpp"

namespace foa {

class TextCodec;

struct DecoderConfig {
  GrowthPolicy policy{};             // owned-buffer sizing
  bool escape = true;                // unescape %XX codes in values
  const TextCodec* codec = nullptr;  // nullptr -> utf8_codec()
};

// Pull-based FOA decoder. Not thread-safe; one caller at a time.
//
// A borrowed buffer is scanned in place and never refilled or grown. A byte
// source is read into an owned buffer that grows by policy().step_size() up to
// policy().max_size(); needing more throws BufferLimitExceeded, after which the
// decoder keeps rethrowing until a new source is attached.
class Decoder {
public:
  explicit Decoder(DecoderConfig cfg = {});                          // empty input
  explicit Decoder(std::string_view buffer, DecoderConfig cfg = {});  // borrowed
  explicit Decoder(ByteSource& source, DecoderConfig cfg = {});       // caller keeps `source` alive
  explicit Decoder(std::unique_ptr<ByteSource> source, DecoderConfig cfg = {});
  ~Decoder();

  Decoder(const Decoder&) = delete;
  Decoder& operator=(const Decoder&) = delete;

  void attach(std::string_view buffer);
  void attach(ByteSource& source);
  void attach(std::unique_ptr<ByteSource> source);

  // Fill `out` with the next entity. False at end of input.
  bool next(Entity& out);

  using EntityCallback = std::function<void(const Entity&)>;
  // Drain the input; returns the number of entities delivered.
  std::size_t for_each_entity(const EntityCallback& cb);

  // Swap sizing rules. A cap below the pending bytes is raised to fit them.
  void set_policy(const GrowthPolicy& policy);
  const GrowthPolicy& policy() const noexcept;
  const DecoderConfig& config() const noexcept;

  ScanBuffer::Mode mode() const noexcept;
  const char* buffer_data() const noexcept;
  std::size_t buffer_capacity() const noexcept;
  std::size_t line() const noexcept;
  DecoderStats stats() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
