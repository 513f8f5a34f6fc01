#include "foa_codec/frame_source.hpp"
#include "foa_codec/byte_source.hpp"
#include "foa_codec/growth_policy.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace foa {

bool FixedSource::advance(ScanBuffer& buf, const GrowthPolicy&, DecoderStats&) {
  return buf.find_next();
}

GrowableSource::GrowableSource(ByteSource& host) : host_(&host) {}

GrowableSource::GrowableSource(std::unique_ptr<ByteSource> host)
  : owned_(std::move(host)), host_(owned_.get()) {
  if (!host_) throw std::invalid_argument("GrowableSource: null byte source");
}

GrowableSource::~GrowableSource() = default;

void GrowableSource::grow_step(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats) {
  buf.grow(buf.capacity() + policy.step_size(), policy);
  ++stats.grows;
  stats.capacity = buf.capacity();
  stats.high_water = std::max(stats.high_water, stats.capacity);
}

bool GrowableSource::advance(ScanBuffer& buf, const GrowthPolicy& policy, DecoderStats& stats) {
  if (buf.find_next()) return true;

  if (buf.capacity() == 0) {
    buf.grow(policy.first_allocation(), policy);
    stats.capacity = buf.capacity();
    stats.high_water = std::max(stats.high_water, stats.capacity);
  } else if (buf.end() > 0) {
    buf.compact();
    ++stats.compactions;
  }

  while (true) {
    // Full after compaction with no terminator in sight: only growth can help.
    if (buf.free_space() == 0) grow_step(buf, policy, stats);

    const std::size_t want = buf.free_space();
    const std::size_t got = host_->fill(buf.free_data(), want);
    if (got == 0) return false;
    buf.commit(got);
    stats.bytes_read += got;

    if (buf.find_next()) return true;

    // The whole free region was filled and still no terminator.
    if (got == want) grow_step(buf, policy, stats);
  }
}

}
