#pragma once
#include <cstdint>

using VehicleId = int64_t;   // assigned 1, 2, 3... at affiliation
using PersonId  = int64_t;   // national identity number of a rider or driver
using TripId    = uint64_t;

inline constexpr VehicleId kNoVehicle = 0;
inline constexpr PersonId  kNoRider   = 0;
