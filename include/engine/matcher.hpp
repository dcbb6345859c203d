#pragma once
#include "domain/geo.hpp"
#include "domain/vehicle.hpp"
#include "engine/entity_store.hpp"

#include <mutex>
#include <optional>
#include <vector>

// Nearest available vehicle strictly inside radius; exact distance ties go to
// the higher rating average. nullptr when nothing qualifies.
const Vehicle* pick_nearest(const std::vector<Vehicle>& vehicles,
                            const Coord& origin,
                            double search_radius,
                            double initial_rating_average);

class Matcher {
public:
  explicit Matcher(EntityStore& store);

  Matcher(const Matcher&)            = delete;
  Matcher& operator=(const Matcher&) = delete;

  // Selects and reserves in one critical section: no other caller can see
  // the chosen vehicle as available in between. nullopt is a normal outcome.
  std::optional<Vehicle> find_and_reserve(PersonId rider, const Coord& origin, double search_radius);

private:
  EntityStore& store_;
  std::mutex   match_mu_;   // always taken before the store's vehicle lock
};
