#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct VehicleView {
  VehicleId               id = kNoVehicle;
  std::string             plate;
  std::string             driver_name;
  Coord                   location;
  bool                    available = true;
  std::optional<PersonId> current_rider;
};

struct RiderView {
  PersonId                 id = kNoRider;
  std::string              name;
  Coord                    location;
  Coord                    destination;
  std::optional<VehicleId> assigned_vehicle;
};

// Read-only picture of the fleet and of riders currently in a trip.
struct LiveSnapshot {
  int64_t                  generated_ms = 0;
  std::vector<VehicleView> vehicles;
  std::vector<RiderView>   riders_in_trip;
};

bool operator==(const VehicleView& a, const VehicleView& b);
bool operator==(const RiderView& a, const RiderView& b);

// Equal content, generated_ms ignored.
bool same_state(const LiveSnapshot& a, const LiveSnapshot& b);
