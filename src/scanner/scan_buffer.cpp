#include "foa_codec/scan_buffer.hpp"
#include "foa_codec/errors.hpp"
#include "foa_codec/growth_policy.hpp"
#include <cstring>
#include <stdexcept>

namespace foa {

void ScanBuffer::reset_owned() {
  if (mode_ != Mode::Owned) {
    ext_ = nullptr;
    ext_size_ = 0;
    mode_ = Mode::Owned;
  }
  start_ = end_ = fill_ = line_ = 0;
}

void ScanBuffer::reset_borrowed(std::string_view region) {
  if (mode_ != Mode::Borrowed) {
    std::vector<char>().swap(own_); // release owned storage
    mode_ = Mode::Borrowed;
  }
  ext_ = region.data();
  ext_size_ = region.size();
  start_ = end_ = line_ = 0;
  fill_ = ext_size_;
}

const char* ScanBuffer::data() const noexcept {
  return mode_ == Mode::Borrowed ? ext_ : own_.data();
}

std::size_t ScanBuffer::capacity() const noexcept {
  return mode_ == Mode::Borrowed ? ext_size_ : own_.size();
}

bool ScanBuffer::find_next() {
  const char* b = data();
  std::size_t pos = end_;

  while (pos < fill_ && b[pos] == '\n') ++pos;
  if (pos >= fill_) return false;

  const std::size_t first = pos;
  const void* nl = std::memchr(b + pos, '\n', fill_ - pos);
  if (!nl) return false; // unterminated; retried after the next fill
  pos = static_cast<std::size_t>(static_cast<const char*>(nl) - b);

  ++line_;
  start_ = first;
  end_ = pos;
  return true;
}

void ScanBuffer::compact() {
  if (mode_ != Mode::Owned || end_ == 0) return;
  const std::size_t length = fill_ - end_;
  if (length) std::memmove(own_.data(), own_.data() + end_, length);
  fill_ = length;
  start_ = end_ = 0;
}

void ScanBuffer::grow(std::size_t new_size, const GrowthPolicy& policy) {
  if (!policy.allows(new_size)) throw BufferLimitExceeded(new_size, policy.max_size());
  resize(new_size);
}

void ScanBuffer::resize(std::size_t new_size) {
  if (mode_ != Mode::Owned) throw std::logic_error("scan buffer: borrowed region cannot be resized");
  if (new_size < fill_) throw std::logic_error("scan buffer: resize would drop buffered bytes");
  if (new_size < own_.size()) {
    own_.resize(new_size);
    own_.shrink_to_fit();
  } else {
    own_.reserve(new_size); // exact; resize() alone may over-allocate
    own_.resize(new_size);
  }
}

char* ScanBuffer::free_data() {
  if (mode_ != Mode::Owned) throw std::logic_error("scan buffer: borrowed region cannot be refilled");
  return own_.data() + fill_;
}

void ScanBuffer::commit(std::size_t n) {
  if (n > free_space()) throw std::out_of_range("scan buffer: commit past capacity");
  fill_ += n;
}

std::string_view ScanBuffer::current() const {
  if (start_ > end_ || end_ > fill_) throw std::out_of_range("scan buffer: cursor invariant broken");
  return std::string_view(data() + start_, end_ - start_);
}

}
