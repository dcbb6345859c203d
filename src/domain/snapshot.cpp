#include "domain/snapshot.hpp"

bool operator==(const VehicleView& a, const VehicleView& b) {
  return a.id == b.id && a.plate == b.plate && a.driver_name == b.driver_name &&
         a.location == b.location && a.available == b.available &&
         a.current_rider == b.current_rider;
}

bool operator==(const RiderView& a, const RiderView& b) {
  return a.id == b.id && a.name == b.name && a.location == b.location &&
         a.destination == b.destination && a.assigned_vehicle == b.assigned_vehicle;
}

bool same_state(const LiveSnapshot& a, const LiveSnapshot& b) {
  return a.vehicles == b.vehicles && a.riders_in_trip == b.riders_in_trip;
}
