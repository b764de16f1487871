#include "random.hpp"

#include <cmath>
#include <limits>

namespace scalarnet {

RandomSource::RandomSource(uint32_t seed) : seed_(seed), engine_(seed) {}

double RandomSource::uniform(double lo, double hi) {
  // Closed range [lo, hi]: the distribution itself excludes its upper bound.
  std::uniform_real_distribution<double> dist(
      lo, std::nextafter(hi, std::numeric_limits<double>::max()));
  return dist(engine_);
}

void RandomSource::reseed(uint32_t seed) {
  seed_ = seed;
  engine_.seed(seed);
}

} // namespace scalarnet
