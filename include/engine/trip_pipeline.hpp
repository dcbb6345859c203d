#pragma once
#include "domain/rider.hpp"
#include "domain/trip.hpp"
#include "domain/vehicle.hpp"
#include "engine/entity_store.hpp"
#include "engine/random_source.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class TripOutcome { Completed, NoVehicle, Rejected, Failed };

const char* to_string(TripOutcome outcome);

struct TripResult {
  TripOutcome outcome = TripOutcome::Failed;
  Trip        trip;
  std::string error_message;

  bool ok() const { return outcome == TripOutcome::Completed; }
};

enum class TripEvent { Started, Completed, Failed };

// Simulated travel. Receives the trip being driven and the real-time delay
// the configured acceleration asks for. May throw to simulate a fault.
using TransitHook   = std::function<void(const Trip&, std::chrono::microseconds)>;
using TripListener  = std::function<void(TripEvent, const Trip&)>;

TransitHook sleeping_transit();

class TripPipeline {
public:
  TripPipeline(EntityStore& store, RandomSource& random, TransitHook transit = sleeping_transit());

  TripPipeline(const TripPipeline&)            = delete;
  TripPipeline& operator=(const TripPipeline&) = delete;

  // Runs a reserved (rider, vehicle) pair to completion. The reservation is
  // released on every path; faults come back as TripOutcome::Failed.
  TripResult execute(const Rider& rider, const Vehicle& vehicle, int32_t day);

  // Real-time delay for distance at speed_kmh under the configured acceleration.
  std::chrono::microseconds transit_delay(double distance, int32_t speed_kmh) const;

  void register_trip_listener(TripListener listener);

private:
  void notify_(TripEvent event, const Trip& trip);

  EntityStore&  store_;
  RandomSource& random_;
  TransitHook   transit_;

  std::mutex                listeners_mu_;
  std::vector<TripListener> listeners_;
};
