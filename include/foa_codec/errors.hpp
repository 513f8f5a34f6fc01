#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace foa {

// Base for everything the codec throws.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Invalid growth policy values; raised at construction, never mid-decode.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Owned scan buffer would have to grow past the policy max to make progress.
class BufferLimitExceeded : public Error {
public:
  BufferLimitExceeded(std::size_t requested, std::size_t max_size)
    : Error("maximum decoder buffer size exceeded (requested " +
            std::to_string(requested) + " > max " + std::to_string(max_size) + ")"),
      requested_(requested), max_size_(max_size) {}

  std::size_t requested() const noexcept { return requested_; }
  std::size_t max_size() const noexcept { return max_size_; }

private:
  std::size_t requested_;
  std::size_t max_size_;
};

// Host byte source failed to read.
class SourceError : public Error {
public:
  SourceError(const std::string& what, int err) : Error(what), errno_(err) {}
  int error_code() const noexcept { return errno_; }

private:
  int errno_;
};

// Encoder refused text that would break line framing.
class EncodeError : public Error {
public:
  explicit EncodeError(const std::string& what) : Error(what) {}
};

}
