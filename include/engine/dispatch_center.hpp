#pragma once
#include "config/dispatch_config.hpp"
#include "domain/affiliation.hpp"
#include "domain/snapshot.hpp"
#include "engine/day_controller.hpp"
#include "engine/entity_store.hpp"
#include "engine/matcher.hpp"
#include "engine/random_source.hpp"
#include "engine/trip_pipeline.hpp"

#include <memory>

// Wires store, matcher, pipeline and day controller together and runs one
// rider request through admission, matching and execution.
class DispatchCenter {
public:
  // Validates cfg (std::invalid_argument) and uses a seeded mt19937 with real sleeps.
  explicit DispatchCenter(DispatchConfig cfg);
  // random must outlive the center.
  DispatchCenter(DispatchConfig cfg, RandomSource& random, TransitHook transit);
  ~DispatchCenter();

  DispatchCenter(const DispatchCenter&)            = delete;
  DispatchCenter& operator=(const DispatchCenter&) = delete;

  Affiliation affiliate_vehicle(const VehicleRegistration& reg);
  Affiliation affiliate_rider(const RiderRegistration& reg);

  // Rejected once the day is ending, NoVehicle when nothing is in range,
  // Failed for unknown / busy riders or a transit fault.
  TripResult request_trip(PersonId rider, const Coord& origin, const Coord& destination);

  LiveSnapshot snapshot() const;

  const DispatchConfig& config() const;
  EntityStore&   store();
  Matcher&       matcher();
  TripPipeline&  pipeline();
  DayController& days();

private:
  struct Impl;
  std::unique_ptr<Impl> d_;
};
