#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace foa {

class GrowthPolicy;

// Line-framing state over either a borrowed, fixed region or an owned, growable one.
// Invariant: start <= end <= fill <= capacity.
class ScanBuffer {
public:
  enum class Mode { Borrowed, Owned };

  ScanBuffer() = default;

  // Zero the cursors and switch to owned storage (kept if already owned).
  void reset_owned();
  // Zero the cursors and scan `region` in place; the caller keeps it alive.
  void reset_borrowed(std::string_view region);

  // Frame the next '\n'-terminated record as [start, end). Blank lines are skipped.
  // Returns false, with every cursor untouched, if no terminated record is buffered.
  bool find_next();

  // Move the unconsumed bytes [end, fill) to offset 0.
  void compact();

  // Resize owned storage to `new_size`; throws BufferLimitExceeded past the policy max.
  void grow(std::size_t new_size, const GrowthPolicy& policy);
  // Resize owned storage without a policy check; `new_size` must hold [0, fill).
  void resize(std::size_t new_size);

  // Refill window for the host (owned mode only).
  char* free_data();
  std::size_t free_space() const noexcept { return capacity() - fill_; }
  void commit(std::size_t n);

  // Raw text of the record framed by the last successful find_next().
  std::string_view current() const;

  Mode mode() const noexcept { return mode_; }
  const char* data() const noexcept;
  std::size_t capacity() const noexcept;
  std::size_t start() const noexcept { return start_; }
  std::size_t end() const noexcept { return end_; }
  std::size_t fill() const noexcept { return fill_; }
  std::size_t line() const noexcept { return line_; }  // records framed so far
  std::size_t pending() const noexcept { return fill_ - end_; }

private:
  std::vector<char> own_;
  const char* ext_{nullptr};
  std::size_t ext_size_{0};
  Mode mode_{Mode::Owned};

  std::size_t start_{0};
  std::size_t end_{0};
  std::size_t fill_{0};
  std::size_t line_{0};
};

}
