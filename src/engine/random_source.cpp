#include "engine/random_source.hpp"

#include <chrono>

MersenneRandomSource::MersenneRandomSource()
  : MersenneRandomSource(static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count())) {}

MersenneRandomSource::MersenneRandomSource(uint64_t seed) : rng_(seed) {}

int32_t MersenneRandomSource::uniform_int(int32_t lo, int32_t hi) {
  std::uniform_int_distribution<int32_t> dist(lo, hi);
  std::lock_guard<std::mutex> lk(mu_);
  return dist(rng_);
}

double MersenneRandomSource::uniform_real(double lo, double hi) {
  if (lo >= hi) return lo;
  std::uniform_real_distribution<double> dist(lo, hi);
  std::lock_guard<std::mutex> lk(mu_);
  return dist(rng_);
}
