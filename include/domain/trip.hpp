#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"

#include <cstdint>

struct Trip {
  TripId    id = 0;
  VehicleId vehicle_id = kNoVehicle;
  PersonId  rider_id   = kNoRider;
  Coord     origin;
  Coord     destination;
  double    distance = 0.0;
  double    fare     = 0.0;
  int32_t   rating   = 0;       // 0 until completion
  int32_t   day      = 0;
  bool      completed = false;
  bool      tracked   = false;  // member of the day's report sample
  int64_t   started_ms   = 0;   // epoch ms
  int64_t   completed_ms = 0;

  double commission(double fraction) const { return fare * fraction; }
  double driver_share(double fraction) const { return fare * (1.0 - fraction); }
};
