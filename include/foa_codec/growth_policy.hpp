#pragma once
#include <cstddef>

namespace foa {

// Sizing rules for an engine-owned scan buffer. Immutable once built.
class GrowthPolicy {
public:
  static constexpr std::size_t kDefaultInitSize = 128;
  static constexpr std::size_t kDefaultStepSize = 256;
  static constexpr std::size_t kDefaultMaxSize  = 8 * 1024 * 1024; // 8 MiB
  static constexpr std::size_t kUnlimited       = 0;

  GrowthPolicy();                                   // defaults above
  GrowthPolicy(std::size_t initial_size, std::size_t step_size,
               std::size_t max_size = kUnlimited);  // throws ConfigurationError

  static GrowthPolicy unlimited(std::size_t initial_size = kDefaultInitSize,
                                std::size_t step_size = kDefaultStepSize);

  std::size_t initial_size() const noexcept { return init_; }
  std::size_t step_size() const noexcept { return step_; }
  std::size_t max_size() const noexcept { return max_; }
  bool is_unlimited() const noexcept { return max_ == kUnlimited; }

  // Size of the first owned buffer: initial_size, clipped to a smaller cap.
  std::size_t first_allocation() const noexcept;

  // True when a buffer of `size` bytes is allowed.
  bool allows(std::size_t size) const noexcept { return is_unlimited() || size <= max_; }

  // Same policy with a larger cap; used when a swap would strand pending bytes.
  GrowthPolicy with_max_at_least(std::size_t size) const;

private:
  std::size_t init_;
  std::size_t step_;
  std::size_t max_;
};

}
