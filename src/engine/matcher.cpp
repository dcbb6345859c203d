#include "engine/matcher.hpp"

#include <iostream>

const Vehicle* pick_nearest(const std::vector<Vehicle>& vehicles,
                            const Coord& origin,
                            double search_radius,
                            double initial_rating_average) {
  const Vehicle* best = nullptr;
  double best_distance = search_radius;

  for (const auto& v : vehicles) {
    if (!v.available) continue;

    const double d = planar_distance(origin, v.location);
    if (d < best_distance) {
      best_distance = d;
      best = &v;
    } else if (best && d == best_distance &&
               v.rating_average(initial_rating_average) > best->rating_average(initial_rating_average)) {
      best = &v;
    }
  }
  return best;
}

Matcher::Matcher(EntityStore& store) : store_(store) {}

std::optional<Vehicle> Matcher::find_and_reserve(PersonId rider, const Coord& origin, double search_radius) {
  const double initial = store_.config().initial_rating_average;

  std::optional<Vehicle> reserved;
  {
    std::lock_guard<std::mutex> lk(match_mu_);
    reserved = store_.reserve_vehicle(rider, [&](const std::vector<Vehicle>& vehicles) {
      return pick_nearest(vehicles, origin, search_radius, initial);
    });
  }

  if (!reserved) {
    std::cout << "[MATCH] rider=" << rider << " outcome=no_vehicle radius=" << search_radius << "\n";
    return std::nullopt;
  }

  if (!store_.assign_rider(rider, reserved->id)) {
    store_.release(reserved->id, rider, std::nullopt);
    std::cerr << "[MATCH][error] rider=" << rider << " outcome=rider_not_assignable vehicle=" << reserved->id << "\n";
    return std::nullopt;
  }

  const double pickup = planar_distance(reserved->location, origin);
  const double eta_min = (pickup / reserved->speed_kmh) * 60.0;
  std::cout << "[MATCH] rider=" << rider << " vehicle=" << reserved->id
            << " plate=" << reserved->plate
            << " pickup_distance=" << pickup
            << " eta_min=" << eta_min << "\n";
  return reserved;
}
