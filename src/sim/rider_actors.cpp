#include "sim/rider_actors.hpp"

#include <chrono>
#include <iostream>
#include <thread>

RiderActors::RiderActors(DispatchCenter& center, RandomSource& random, ActorPool& pool)
  : center_(center), random_(random), pool_(pool) {}

std::size_t RiderActors::launch_wave() {
  const auto& cfg = center_.config();
  std::size_t queued = 0;

  for (const auto& r : center_.store().riders()) {
    const int32_t requests = random_.uniform_int(cfg.min_requests_per_rider, cfg.max_requests_per_rider);
    const PersonId id = r.id;
    if (!pool_.submit([this, id, requests] { run_actor(id, requests); })) break;
    ++queued;
  }

  std::cout << "[SIM] queued " << queued << " rider actors on " << pool_.size() << " workers\n";
  return queued;
}

void RiderActors::run_actor(PersonId rider, int32_t requests) {
  const auto& cfg = center_.config();

  for (int32_t i = 0; i < requests && !stop_.load(std::memory_order_relaxed); ++i) {
    const Coord origin      = random_point_();
    const Coord destination = random_point_();

    const TripResult result = center_.request_trip(rider, origin, destination);
    requests_.fetch_add(1, std::memory_order_relaxed);

    switch (result.outcome) {
      case TripOutcome::Completed: completed_.fetch_add(1, std::memory_order_relaxed);  break;
      case TripOutcome::NoVehicle: no_vehicle_.fetch_add(1, std::memory_order_relaxed); break;
      case TripOutcome::Rejected:  rejected_.fetch_add(1, std::memory_order_relaxed);   return;
      case TripOutcome::Failed:
        failed_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[SIM] rider=" << rider << " request failed: " << result.error_message << "\n";
        break;
    }

    const auto pause = static_cast<int64_t>(
        random_.uniform_real(static_cast<double>(cfg.min_request_pause_ms),
                             static_cast<double>(cfg.max_request_pause_ms)));
    if (pause > 0) std::this_thread::sleep_for(std::chrono::milliseconds(pause));
  }
}

SimulationStats RiderActors::stats() const {
  SimulationStats s;
  s.requests   = requests_.load(std::memory_order_relaxed);
  s.completed  = completed_.load(std::memory_order_relaxed);
  s.no_vehicle = no_vehicle_.load(std::memory_order_relaxed);
  s.rejected   = rejected_.load(std::memory_order_relaxed);
  s.failed     = failed_.load(std::memory_order_relaxed);
  return s;
}

Coord RiderActors::random_point_() {
  const auto& area = center_.config().service_area;
  return Coord{random_.uniform_real(area.min_lat, area.max_lat),
               random_.uniform_real(area.min_lng, area.max_lng)};
}
