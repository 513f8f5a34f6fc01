#include "foa_codec/byte_source.hpp"
#include "foa_codec/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace foa {

FileSource::FileSource(const std::string& path)
  : f_(std::fopen(path.c_str(), "rb")), owns_(true) {
  if (!f_) {
    last_errno_ = errno;
    throw SourceError("cannot open " + path + ": " + std::strerror(last_errno_), last_errno_);
  }
}

FileSource::FileSource(std::FILE* f, bool owns) : f_(f), owns_(owns) {}

FileSource::~FileSource() {
  if (f_ && owns_) std::fclose(f_);
}

std::size_t FileSource::fill(char* dst, std::size_t cap) {
  if (!f_ || cap == 0) return 0;
  std::size_t n = std::fread(dst, 1, cap, f_);
  if (n == 0 && std::ferror(f_)) {
    last_errno_ = errno;
    throw SourceError(std::string("read failed: ") + std::strerror(last_errno_), last_errno_);
  }
  bytes_ += n;
  return n;
}

std::size_t StreamSource::fill(char* dst, std::size_t cap) {
  if (cap == 0 || in_.eof()) return 0;
  in_.read(dst, static_cast<std::streamsize>(cap));
  const auto n = static_cast<std::size_t>(in_.gcount());
  if (in_.bad()) throw SourceError("stream read failed", errno);
  return n;
}

std::size_t MemorySource::fill(char* dst, std::size_t cap) {
  ++calls_;
  std::size_t n = std::min(cap, remaining());
  if (chunk_) n = std::min(n, chunk_);
  if (n) std::memcpy(dst, bytes_.data() + pos_, n);
  pos_ += n;
  return n;
}

}
