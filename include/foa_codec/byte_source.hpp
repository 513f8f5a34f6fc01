#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <utility>

namespace foa {

// Host collaborator: supplies bytes into a region on request.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  // Write up to `cap` bytes to `dst` and return the count; 0 signals exhaustion.
  virtual std::size_t fill(char* dst, std::size_t cap) = 0;
};

// stdio-backed source. Read failures throw SourceError carrying errno.
class FileSource final : public ByteSource {
public:
  explicit FileSource(const std::string& path);          // opens "rb"; throws SourceError
  explicit FileSource(std::FILE* f, bool owns = false);  // e.g. stdin
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::size_t fill(char* dst, std::size_t cap) override;
  int last_error() const noexcept { return last_errno_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  std::FILE* f_;
  bool owns_;
  int last_errno_{0};
  std::uint64_t bytes_{0};
};

// std::istream adapter (blocking reads).
class StreamSource final : public ByteSource {
public:
  explicit StreamSource(std::istream& in) : in_(in) {}
  std::size_t fill(char* dst, std::size_t cap) override;

private:
  std::istream& in_;
};

// In-memory bytes handed out at most `chunk` bytes per fill (0 = no limit).
class MemorySource final : public ByteSource {
public:
  explicit MemorySource(std::string bytes, std::size_t chunk = 0)
    : bytes_(std::move(bytes)), chunk_(chunk) {}
  std::size_t fill(char* dst, std::size_t cap) override;

  std::size_t remaining() const noexcept { return bytes_.size() - pos_; }
  std::size_t fill_calls() const noexcept { return calls_; }

private:
  std::string bytes_;
  std::size_t chunk_;
  std::size_t pos_{0};
  std::size_t calls_{0};
};

// Wraps any callable with the fill() signature.
class CallbackSource final : public ByteSource {
public:
  using FillFn = std::function<std::size_t(char*, std::size_t)>;
  explicit CallbackSource(FillFn fn) : fn_(std::move(fn)) {}
  std::size_t fill(char* dst, std::size_t cap) override { return fn_ ? fn_(dst, cap) : 0; }

private:
  FillFn fn_;
};

}
