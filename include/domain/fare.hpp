#pragma once
#include <optional>
#include <stdexcept>

// Two exclusive pricing modes. When a smaller-unit rate (per meter) is
// configured it wins over the per-unit rate (per km) for every trip.
struct FarePolicy {
  double                per_unit = 2.5;
  std::optional<double> per_smaller_unit;
  double                smaller_units_per_unit = 1000.0;

  bool uses_smaller_unit() const { return per_smaller_unit.has_value(); }

  double rate_per_unit() const {
    return uses_smaller_unit() ? *per_smaller_unit * smaller_units_per_unit : per_unit;
  }
};

inline double compute_fare(double distance, const FarePolicy& policy) {
  if (distance < 0.0) throw std::invalid_argument("distance must be >= 0");
  if (policy.uses_smaller_unit()) {
    return distance * policy.smaller_units_per_unit * *policy.per_smaller_unit;
  }
  return distance * policy.per_unit;
}
