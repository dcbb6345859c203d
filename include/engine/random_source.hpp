#pragma once
#include <cstdint>
#include <mutex>
#include <random>

// Source of every random draw in the dispatch core (ratings, simulated
// requests). Tests substitute a scripted implementation.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Closed range [lo, hi].
  virtual int32_t uniform_int(int32_t lo, int32_t hi) = 0;
  virtual double  uniform_real(double lo, double hi) = 0;
};

// Thread-safe mt19937_64 backed source.
class MersenneRandomSource final : public RandomSource {
public:
  MersenneRandomSource();
  explicit MersenneRandomSource(uint64_t seed);

  int32_t uniform_int(int32_t lo, int32_t hi) override;
  double  uniform_real(double lo, double hi) override;

private:
  std::mutex      mu_;
  std::mt19937_64 rng_;
};
