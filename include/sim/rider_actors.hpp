#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"
#include "engine/dispatch_center.hpp"
#include "engine/random_source.hpp"
#include "sim/actor_pool.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

struct SimulationStats {
  int64_t requests   = 0;
  int64_t completed  = 0;
  int64_t no_vehicle = 0;
  int64_t rejected   = 0;
  int64_t failed     = 0;
};

// Simulated riders. Each actor is one rider issuing a few sequential trip
// requests from random points of the service area.
class RiderActors {
public:
  RiderActors(DispatchCenter& center, RandomSource& random, ActorPool& pool);

  RiderActors(const RiderActors&)            = delete;
  RiderActors& operator=(const RiderActors&) = delete;

  // Queues one actor per registered rider; returns how many were queued.
  std::size_t launch_wave();

  // Body of a single actor. Ends early when admission is refused or on stop.
  void run_actor(PersonId rider, int32_t requests);

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  SimulationStats stats() const;

private:
  Coord random_point_();

  DispatchCenter& center_;
  RandomSource&   random_;
  ActorPool&      pool_;

  std::atomic<bool>    stop_{false};
  std::atomic<int64_t> requests_{0};
  std::atomic<int64_t> completed_{0};
  std::atomic<int64_t> no_vehicle_{0};
  std::atomic<int64_t> rejected_{0};
  std::atomic<int64_t> failed_{0};
};
