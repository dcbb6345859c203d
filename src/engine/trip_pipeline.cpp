#include "engine/trip_pipeline.hpp"
#include "domain/fare.hpp"
#include "utils/clock.hpp"
#include "utils/strings.hpp"

#include <iostream>
#include <optional>
#include <thread>

namespace {

// Gives the vehicle and rider back when the trip scope ends, whatever the exit path.
class ReservationGuard {
public:
  ReservationGuard(EntityStore& store, VehicleId vehicle, PersonId rider)
    : store_(store), vehicle_(vehicle), rider_(rider) {}

  ~ReservationGuard() { store_.release(vehicle_, rider_, arrived_at_); }

  ReservationGuard(const ReservationGuard&)            = delete;
  ReservationGuard& operator=(const ReservationGuard&) = delete;

  void arrived(const Coord& where) { arrived_at_ = where; }

private:
  EntityStore&         store_;
  VehicleId            vehicle_;
  PersonId             rider_;
  std::optional<Coord> arrived_at_;
};

} // namespace

const char* to_string(TripOutcome outcome) {
  switch (outcome) {
    case TripOutcome::Completed: return "completed";
    case TripOutcome::NoVehicle: return "no_vehicle";
    case TripOutcome::Rejected:  return "rejected";
    case TripOutcome::Failed:    return "failed";
  }
  return "unknown";
}

TransitHook sleeping_transit() {
  return [](const Trip&, std::chrono::microseconds delay) {
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
  };
}

TripPipeline::TripPipeline(EntityStore& store, RandomSource& random, TransitHook transit)
  : store_(store), random_(random), transit_(std::move(transit)) {
  if (!transit_) transit_ = sleeping_transit();
}

std::chrono::microseconds TripPipeline::transit_delay(double distance, int32_t speed_kmh) const {
  const double acceleration = store_.config().transit_acceleration;
  if (acceleration <= 0.0 || speed_kmh <= 0 || distance <= 0.0) return std::chrono::microseconds{0};
  const double simulated_s = (distance / speed_kmh) * 3600.0;
  return std::chrono::microseconds{static_cast<int64_t>(simulated_s / acceleration * 1e6)};
}

TripResult TripPipeline::execute(const Rider& rider, const Vehicle& vehicle, int32_t day) {
  const auto& cfg = store_.config();
  const auto t0 = std::chrono::steady_clock::now();

  TripResult result;
  Trip& trip = result.trip;
  trip.vehicle_id  = vehicle.id;
  trip.rider_id    = rider.id;
  trip.origin      = rider.location;
  trip.destination = rider.destination;
  trip.day         = day;

  {
    ReservationGuard guard(store_, vehicle.id, rider.id);
    try {
      // --- pricing ---------------------------------------------------------
      trip.distance   = planar_distance(trip.origin, trip.destination);
      trip.fare       = compute_fare(trip.distance, cfg.fare);
      trip.id         = store_.next_trip_id();
      trip.started_ms = now_epoch_ms();

      std::cout << "[TRIP] trip=" << trip.id << " start"
                << " rider=" << rider.id << " vehicle=" << vehicle.id
                << " day=" << day
                << " distance=" << trip.distance
                << " fare=" << format_money(trip.fare) << "\n";
      notify_(TripEvent::Started, trip);

      // --- transit ---------------------------------------------------------
      transit_(trip, transit_delay(trip.distance, vehicle.speed_kmh));

      // --- completion ------------------------------------------------------
      trip.rating = random_.uniform_int(cfg.rating.min, cfg.rating.max);
      const Vehicle updated = store_.complete_trip(vehicle.id, trip.destination, trip.rating, trip.fare);
      trip.completed    = true;
      trip.completed_ms = now_epoch_ms();

      if (store_.track_trip(trip)) {
        std::cout << "[TRIP] trip=" << trip.id << " tracked for day " << day << "\n";
      }
      store_.append_completed(trip);
      guard.arrived(trip.destination);

      result.outcome = TripOutcome::Completed;
      std::cout << "[TRIP] trip=" << trip.id << " completed"
                << " rating=" << trip.rating
                << " vehicle_average=" << updated.rating_average(cfg.initial_rating_average) << "\n";
    } catch (const std::exception& e) {
      result.outcome       = TripOutcome::Failed;
      result.error_message = e.what();
      std::cerr << "[TRIP][error] trip=" << trip.id << " rider=" << rider.id
                << " vehicle=" << vehicle.id << " reason=" << e.what() << "\n";
    } catch (...) {
      result.outcome       = TripOutcome::Failed;
      result.error_message = "unknown fault";
      std::cerr << "[TRIP][error] trip=" << trip.id << " rider=" << rider.id
                << " vehicle=" << vehicle.id << " reason=unknown fault\n";
    }
  }

  notify_(result.ok() ? TripEvent::Completed : TripEvent::Failed, trip);

  const auto dur_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0).count();
  std::cout << "[TRIP] trip=" << trip.id << " done in " << dur_us << "us\n";
  return result;
}

void TripPipeline::register_trip_listener(TripListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.push_back(std::move(listener));
}

void TripPipeline::notify_(TripEvent event, const Trip& trip) {
  std::vector<TripListener> copy;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (listeners_.empty()) return;
    copy = listeners_;
  }

  for (auto& listener : copy) {
    try {
      listener(event, trip);
    } catch (const std::exception& e) {
      std::cerr << "[TRIP][error] trip=" << trip.id << " listener failed: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[TRIP][error] trip=" << trip.id << " listener failed: unknown fault\n";
    }
  }
}
