#pragma once

#include <cstdint>
#include <random>

namespace scalarnet {

// Seedable source for weight initialization. Passed explicitly to every
// constructor that draws weights, so identical seeds build identical networks.
class RandomSource {
public:
  explicit RandomSource(uint32_t seed = 42u);

  double uniform(double lo, double hi);
  uint32_t seed() const noexcept { return seed_; }
  void reseed(uint32_t seed);

private:
  uint32_t seed_;
  std::mt19937 engine_;
};

} // namespace scalarnet
