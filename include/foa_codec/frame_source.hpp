#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include "foa_codec/scan_buffer.hpp"

namespace foa {

class ByteSource;
class GrowthPolicy;

struct DecoderStats {
  std::uint64_t bytes_read = 0;   // bytes taken from the host (or the borrowed region size)
  std::uint64_t entities = 0;
  std::uint64_t grows = 0;
  std::uint64_t compactions = 0;
  std::size_t capacity = 0;       // current scan buffer size
  std::size_t high_water = 0;     // largest scan buffer size seen
};

// How a Decoder obtains framed records: chosen once per attached source.
class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual ScanBuffer::Mode mode() const noexcept = 0;
  // Frame the next record in `buf`. False means end of input.
  virtual bool advance(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats) = 0;
};

// Borrowed region: scanned in place, never refilled, never grown.
class FixedSource final : public FrameSource {
public:
  ScanBuffer::Mode mode() const noexcept override { return ScanBuffer::Mode::Borrowed; }
  bool advance(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats) override;
};

// Owned buffer refilled from a host ByteSource and grown per policy.
class GrowableSource final : public FrameSource {
public:
  explicit GrowableSource(ByteSource& host);
  explicit GrowableSource(std::unique_ptr<ByteSource> host);
  ~GrowableSource() override;

  ScanBuffer::Mode mode() const noexcept override { return ScanBuffer::Mode::Owned; }
  bool advance(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats) override;

  ByteSource& host() noexcept { return *host_; }

private:
  void grow_step(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats);

  std::unique_ptr<ByteSource> owned_;
  ByteSource* host_;
};

}
