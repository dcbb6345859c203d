#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"

#include <optional>
#include <string>

struct Vehicle {
  VehicleId   id = kNoVehicle;
  PersonId    driver_id = 0;
  std::string first_name;
  std::string last_name;
  std::string plate;
  std::string make;
  std::string model;
  int32_t     speed_kmh = 0;

  Coord                   location;
  bool                    available = true;
  std::optional<PersonId> current_rider;   // set iff !available

  double  rating_total = 0.0;
  int64_t trip_count   = 0;

  double period_earnings = 0.0;  // since the last settlement
  double total_earnings  = 0.0;

  // initial_average is reported until the first rating arrives
  double rating_average(double initial_average) const {
    if (trip_count == 0) return initial_average;
    return rating_total / static_cast<double>(trip_count);
  }

  double commission_on_total(double fraction) const { return total_earnings * fraction; }
  double net_total(double fraction) const { return total_earnings * (1.0 - fraction); }

  std::string driver_name() const { return first_name + " " + last_name; }
};
