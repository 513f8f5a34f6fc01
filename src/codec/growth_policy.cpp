#include "foa_codec/growth_policy.hpp"
#include "foa_codec/errors.hpp"

namespace foa {

GrowthPolicy::GrowthPolicy()
  : init_(kDefaultInitSize), step_(kDefaultStepSize), max_(kDefaultMaxSize) {}

GrowthPolicy::GrowthPolicy(std::size_t initial_size, std::size_t step_size, std::size_t max_size)
  : init_(initial_size), step_(step_size), max_(max_size) {
  if (init_ == 0) throw ConfigurationError("growth policy: initial_size must be > 0");
  if (step_ == 0) throw ConfigurationError("growth policy: step_size must be > 0");
}

GrowthPolicy GrowthPolicy::unlimited(std::size_t initial_size, std::size_t step_size) {
  return GrowthPolicy(initial_size, step_size, kUnlimited);
}

std::size_t GrowthPolicy::first_allocation() const noexcept {
  return (!is_unlimited() && max_ < init_) ? max_ : init_;
}

GrowthPolicy GrowthPolicy::with_max_at_least(std::size_t size) const {
  if (is_unlimited() || max_ >= size) return *this;
  GrowthPolicy p(*this);
  p.max_ = size;
  return p;
}

}
