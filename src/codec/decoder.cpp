#include "foa_codec/decoder.hpp"
#include "foa_codec/byte_source.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/token_classifier.hpp"
#include <exception>
#include <utility>

namespace foa {

struct Decoder::Impl {
  DecoderConfig cfg;
  ClassifyOptions opts;
  ScanBuffer buf;
  std::unique_ptr<FrameSource> frames;
  DecoderStats stats;
  std::exception_ptr fatal; // sticky until the next attach()

  explicit Impl(DecoderConfig c) : cfg(std::move(c)) {
    opts.escape = cfg.escape;
    opts.codec = cfg.codec;
  }

  void reset_borrowed(std::string_view region) {
    buf.reset_borrowed(region);
    frames.reset(new FixedSource());
    stats = DecoderStats{};
    stats.bytes_read = region.size();
    stats.capacity = stats.high_water = region.size();
    fatal = nullptr;
  }

  void reset_owned(std::unique_ptr<FrameSource> src) {
    buf.reset_owned();
    frames = std::move(src);
    stats = DecoderStats{};
    stats.capacity = stats.high_water = buf.capacity();
    fatal = nullptr;
  }
};

Decoder::Decoder(DecoderConfig cfg) : p_(new Impl(std::move(cfg))) {
  p_->reset_borrowed(std::string_view{});
}

Decoder::Decoder(std::string_view buffer, DecoderConfig cfg) : p_(new Impl(std::move(cfg))) {
  p_->reset_borrowed(buffer);
}

Decoder::Decoder(ByteSource& source, DecoderConfig cfg) : p_(new Impl(std::move(cfg))) {
  p_->reset_owned(std::unique_ptr<FrameSource>(new GrowableSource(source)));
}

Decoder::Decoder(std::unique_ptr<ByteSource> source, DecoderConfig cfg) : p_(nullptr) {
  std::unique_ptr<FrameSource> frames(new GrowableSource(std::move(source))); // may throw
  p_ = new Impl(std::move(cfg));
  p_->reset_owned(std::move(frames));
}

Decoder::~Decoder() { delete p_; }

void Decoder::attach(std::string_view buffer) { p_->reset_borrowed(buffer); }

void Decoder::attach(ByteSource& source) {
  p_->reset_owned(std::unique_ptr<FrameSource>(new GrowableSource(source)));
}

void Decoder::attach(std::unique_ptr<ByteSource> source) {
  p_->reset_owned(std::unique_ptr<FrameSource>(new GrowableSource(std::move(source))));
}

bool Decoder::next(Entity& out) {
  if (p_->fatal) std::rethrow_exception(p_->fatal);
  try {
    if (!p_->frames->advance(p_->buf, p_->cfg.policy, p_->stats)) return false;
  } catch (const Error&) {
    p_->fatal = std::current_exception();
    throw;
  }
  out = decode_span(p_->buf.current(), p_->buf.line(), p_->opts);
  ++p_->stats.entities;
  return true;
}

std::size_t Decoder::for_each_entity(const EntityCallback& cb) {
  std::size_t n = 0;
  Entity e;
  while (next(e)) {
    if (cb) cb(e);
    ++n;
  }
  return n;
}

void Decoder::set_policy(const GrowthPolicy& policy) {
  GrowthPolicy eff = policy;
  ScanBuffer& b = p_->buf;
  if (b.mode() == ScanBuffer::Mode::Owned && b.capacity() > 0 &&
      !policy.is_unlimited() && policy.max_size() < b.capacity()) {
    // Shrink to the new cap, but never below the bytes still waiting to be framed.
    if (b.end() > 0) {
      b.compact();
      ++p_->stats.compactions;
    }
    eff = policy.with_max_at_least(b.fill());
    b.resize(eff.max_size());
    p_->stats.capacity = b.capacity();
  }
  p_->cfg.policy = eff;
}

const GrowthPolicy& Decoder::policy() const noexcept { return p_->cfg.policy; }
const DecoderConfig& Decoder::config() const noexcept { return p_->cfg; }
ScanBuffer::Mode Decoder::mode() const noexcept { return p_->buf.mode(); }
const char* Decoder::buffer_data() const noexcept { return p_->buf.data(); }
std::size_t Decoder::buffer_capacity() const noexcept { return p_->buf.capacity(); }
std::size_t Decoder::line() const noexcept { return p_->buf.line(); }

DecoderStats Decoder::stats() const noexcept {
  DecoderStats s = p_->stats;
  s.capacity = p_->buf.capacity();
  return s;
}

}
