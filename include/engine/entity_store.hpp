#pragma once
#include "config/dispatch_config.hpp"
#include "domain/affiliation.hpp"
#include "domain/report.hpp"
#include "domain/rider.hpp"
#include "domain/trip.hpp"
#include "domain/vehicle.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Owns vehicles, riders, the completed-trip ledger and the day's tracking
// sample. Each collection has its own mutex; callers only ever see copies.
//
// Lock order: the matcher's lock may be held while reserve_vehicle() takes
// vehicles_mu_. No other method takes two store locks at once.
class EntityStore {
public:
  explicit EntityStore(DispatchConfig cfg);

  EntityStore(const EntityStore&)            = delete;
  EntityStore& operator=(const EntityStore&) = delete;

  // --- affiliation ---
  Affiliation affiliate_vehicle(const VehicleRegistration& reg);
  Affiliation affiliate_rider(const RiderRegistration& reg);

  // --- snapshots ---
  std::vector<Vehicle>   vehicles() const;
  std::vector<Rider>     riders() const;
  std::optional<Vehicle> vehicle(VehicleId id) const;
  std::optional<Rider>   rider(PersonId id) const;
  std::vector<Trip>      completed_trips() const;
  std::vector<Trip>      tracking_sample() const;
  std::size_t            vehicle_count() const;
  std::size_t            completed_count() const;

  // Claims an idle rider for one request and places it at origin with a new
  // destination. False when the rider is unknown, in a trip, or already
  // claimed by a request still being matched. A claim ends with
  // unclaim_rider() when no vehicle was reserved, or with release().
  bool claim_rider(PersonId rider, const Coord& origin, const Coord& destination);
  void unclaim_rider(PersonId rider);

  // --- matching ---
  using VehiclePicker = std::function<const Vehicle*(const std::vector<Vehicle>&)>;

  // Runs pick over the vehicle table and reserves the returned vehicle for
  // rider, all under vehicles_mu_. Returns the reserved vehicle.
  std::optional<Vehicle> reserve_vehicle(PersonId rider, const VehiclePicker& pick);

  // Second half of a reservation: links a claimed rider to its vehicle.
  // False when the rider is unknown, unclaimed or already in a trip.
  bool assign_rider(PersonId rider, VehicleId vehicle);

  // --- trip pipeline ---
  TripId next_trip_id();
  void   seed_trip_ids(TripId next);

  // Moves the vehicle to destination and books rating and fare.
  // Throws std::out_of_range for a rating outside the configured bounds.
  Vehicle complete_trip(VehicleId id, const Coord& destination, int32_t rating, double fare);

  // Adds the trip to the day's sample if there is room left; sets trip.tracked.
  bool track_trip(Trip& trip);
  void append_completed(const Trip& trip);

  // Ends a reservation and the rider's claim. rider_arrived_at moves the
  // rider when the trip completed. Runs from ReservationGuard's destructor,
  // where a failed lock() is fatal.
  void release(VehicleId vehicle, PersonId rider, const std::optional<Coord>& rider_arrived_at);

  // Puts back what stored trips earned a restored vehicle: ratings, trip
  // count, lifetime earnings and its last drop-off point.
  bool restore_history(VehicleId id, const Coord& location, double rating_total,
                       int64_t trip_count, double total_earnings);

  // --- day close ---
  std::vector<SettlementLine> settle_period(double commission_fraction);
  std::vector<Trip>           drain_tracking();

  const DispatchConfig& config() const { return cfg_; }

private:
  Vehicle*       find_vehicle_(VehicleId id);        // vehicles_mu_ held
  const Vehicle* find_vehicle_(VehicleId id) const;  // vehicles_mu_ held
  Rider*         find_rider_(PersonId id);           // riders_mu_ held

private:
  const DispatchConfig cfg_;

  mutable std::mutex   vehicles_mu_;
  std::vector<Vehicle> vehicles_;

  mutable std::mutex                        riders_mu_;
  std::vector<Rider>                        riders_;
  std::unordered_map<PersonId, std::size_t> rider_index_;
  std::unordered_set<PersonId>              claimed_;   // requests between claim and release

  mutable std::mutex ledger_mu_;
  std::vector<Trip>  completed_;

  mutable std::mutex tracking_mu_;
  std::vector<Trip>  tracking_;

  std::mutex id_mu_;
  TripId     next_trip_id_ = 1;
};
