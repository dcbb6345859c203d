#include "engine/entity_store.hpp"
#include "utils/strings.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

// -------------------- ctor --------------------

EntityStore::EntityStore(DispatchConfig cfg) : cfg_(std::move(cfg)) {}

// -------------------- affiliation --------------------

Affiliation EntityStore::affiliate_vehicle(const VehicleRegistration& reg) {
  std::string why = check_vehicle_registration(reg, cfg_.affiliation);
  Affiliation result;
  Coord placed{};

  if (why.empty()) {
    std::lock_guard<std::mutex> lk(vehicles_mu_);
    const std::string plate = to_upper_ascii(trim(reg.plate));
    for (const auto& v : vehicles_) {
      if (v.driver_id == reg.driver_id) { why = "driver already registered"; break; }
      if (v.plate == plate)             { why = "plate already registered";  break; }
    }

    if (why.empty()) {
      Vehicle v;
      v.id         = static_cast<VehicleId>(vehicles_.size()) + 1;
      v.driver_id  = reg.driver_id;
      v.first_name = trim(reg.first_name);
      v.last_name  = trim(reg.last_name);
      v.plate      = plate;
      v.make       = reg.make;
      v.model      = reg.model;
      v.speed_kmh  = reg.speed_kmh;
      v.location   = reg.location
                       ? *reg.location
                       : cfg_.starting_points[static_cast<std::size_t>(v.id - 1) % cfg_.starting_points.size()];
      placed = v.location;
      vehicles_.push_back(std::move(v));
      result = Affiliation::accepted(vehicles_.back().id);
    }
  }

  if (!why.empty()) {
    std::cerr << "[STORE] [AffiliateVehicle][reject] driver=" << reg.driver_id
              << " plate=" << reg.plate << " reason=" << why << "\n";
    return Affiliation::rejected(std::move(why));
  }

  std::cout << "[STORE] [AffiliateVehicle][ok] vehicle=" << result.id
            << " plate=" << to_upper_ascii(trim(reg.plate))
            << " at=(" << placed.lat << "," << placed.lng << ")\n";
  return result;
}

Affiliation EntityStore::affiliate_rider(const RiderRegistration& reg) {
  std::string why = check_rider_registration(reg, cfg_.affiliation);

  if (why.empty()) {
    std::lock_guard<std::mutex> lk(riders_mu_);
    if (rider_index_.count(reg.id) != 0) {
      why = "rider already registered";
    } else {
      Rider r;
      r.id         = reg.id;
      r.first_name = trim(reg.first_name);
      r.last_name  = trim(reg.last_name);
      r.card       = normalize_card(reg.card, cfg_.affiliation);
      if (reg.location) {
        r.location    = *reg.location;
        r.destination = *reg.location;
      }
      rider_index_.emplace(r.id, riders_.size());
      riders_.push_back(std::move(r));
    }
  }

  if (!why.empty()) {
    std::cerr << "[STORE] [AffiliateRider][reject] rider=" << reg.id << " reason=" << why << "\n";
    return Affiliation::rejected(std::move(why));
  }

  std::cout << "[STORE] [AffiliateRider][ok] rider=" << reg.id << "\n";
  return Affiliation::accepted(reg.id);
}

// -------------------- snapshots --------------------

std::vector<Vehicle> EntityStore::vehicles() const {
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  return vehicles_;
}

std::vector<Rider> EntityStore::riders() const {
  std::lock_guard<std::mutex> lk(riders_mu_);
  return riders_;
}

std::optional<Vehicle> EntityStore::vehicle(VehicleId id) const {
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  if (const Vehicle* v = find_vehicle_(id)) return *v;
  return std::nullopt;
}

std::optional<Rider> EntityStore::rider(PersonId id) const {
  std::lock_guard<std::mutex> lk(riders_mu_);
  auto it = rider_index_.find(id);
  if (it == rider_index_.end()) return std::nullopt;
  return riders_[it->second];
}

std::vector<Trip> EntityStore::completed_trips() const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  return completed_;
}

std::vector<Trip> EntityStore::tracking_sample() const {
  std::lock_guard<std::mutex> lk(tracking_mu_);
  return tracking_;
}

std::size_t EntityStore::vehicle_count() const {
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  return vehicles_.size();
}

std::size_t EntityStore::completed_count() const {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  return completed_.size();
}

bool EntityStore::claim_rider(PersonId rider, const Coord& origin, const Coord& destination) {
  std::lock_guard<std::mutex> lk(riders_mu_);
  Rider* r = find_rider_(rider);
  if (!r || r->in_trip || claimed_.count(rider) != 0) return false;
  claimed_.insert(rider);
  r->location    = origin;
  r->destination = destination;
  return true;
}

void EntityStore::unclaim_rider(PersonId rider) {
  std::lock_guard<std::mutex> lk(riders_mu_);
  claimed_.erase(rider);
}

// -------------------- matching --------------------

std::optional<Vehicle> EntityStore::reserve_vehicle(PersonId rider, const VehiclePicker& pick) {
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  const Vehicle* chosen = pick(vehicles_);
  if (!chosen) return std::nullopt;

  // The picker must hand back an element of vehicles_ that is still free.
  if (chosen < vehicles_.data() || chosen >= vehicles_.data() + vehicles_.size()) return std::nullopt;
  Vehicle& v = vehicles_[static_cast<std::size_t>(chosen - vehicles_.data())];
  if (!v.available) return std::nullopt;

  v.available     = false;
  v.current_rider = rider;
  return v;
}

bool EntityStore::assign_rider(PersonId rider, VehicleId vehicle) {
  std::lock_guard<std::mutex> lk(riders_mu_);
  Rider* r = find_rider_(rider);
  if (!r || r->in_trip || claimed_.count(rider) == 0) return false;
  r->assigned_vehicle = vehicle;
  r->in_trip          = true;
  return true;
}

// -------------------- trip pipeline --------------------

TripId EntityStore::next_trip_id() {
  std::lock_guard<std::mutex> lk(id_mu_);
  return next_trip_id_++;
}

void EntityStore::seed_trip_ids(TripId next) {
  std::lock_guard<std::mutex> lk(id_mu_);
  next_trip_id_ = std::max(next_trip_id_, next);
}

Vehicle EntityStore::complete_trip(VehicleId id, const Coord& destination, int32_t rating, double fare) {
  if (rating < cfg_.rating.min || rating > cfg_.rating.max) {
    throw std::out_of_range("rating " + std::to_string(rating) + " outside [" +
                            std::to_string(cfg_.rating.min) + "," + std::to_string(cfg_.rating.max) + "]");
  }

  std::lock_guard<std::mutex> lk(vehicles_mu_);
  Vehicle* v = find_vehicle_(id);
  if (!v) throw std::out_of_range("unknown vehicle " + std::to_string(id));

  v->location      = destination;
  v->rating_total += rating;
  v->trip_count   += 1;
  if (fare > 0.0) {
    v->period_earnings += fare;
    v->total_earnings  += fare;
  }
  return *v;
}

bool EntityStore::track_trip(Trip& trip) {
  std::lock_guard<std::mutex> lk(tracking_mu_);
  if (tracking_.size() >= static_cast<std::size_t>(cfg_.daily_tracking_sample_size)) return false;
  trip.tracked = true;
  tracking_.push_back(trip);
  return true;
}

void EntityStore::append_completed(const Trip& trip) {
  std::lock_guard<std::mutex> lk(ledger_mu_);
  completed_.push_back(trip);
}

void EntityStore::release(VehicleId vehicle, PersonId rider, const std::optional<Coord>& rider_arrived_at) {
  {
    std::lock_guard<std::mutex> lk(vehicles_mu_);
    if (Vehicle* v = find_vehicle_(vehicle)) {
      v->available = true;
      v->current_rider.reset();
    }
  }
  {
    std::lock_guard<std::mutex> lk(riders_mu_);
    claimed_.erase(rider);
    if (Rider* r = find_rider_(rider)) {
      r->assigned_vehicle.reset();
      r->in_trip = false;
      if (rider_arrived_at) r->location = *rider_arrived_at;
    }
  }
}

bool EntityStore::restore_history(VehicleId id, const Coord& location, double rating_total,
                                  int64_t trip_count, double total_earnings) {
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  Vehicle* v = find_vehicle_(id);
  if (!v) return false;
  v->location       = location;
  v->rating_total   = rating_total;
  v->trip_count     = trip_count;
  v->total_earnings = total_earnings;
  return true;
}

// -------------------- day close --------------------

std::vector<SettlementLine> EntityStore::settle_period(double commission_fraction) {
  std::vector<SettlementLine> lines;
  std::lock_guard<std::mutex> lk(vehicles_mu_);
  for (auto& v : vehicles_) {
    if (v.period_earnings <= 0.0) continue;

    SettlementLine line;
    line.vehicle_id      = v.id;
    line.plate           = v.plate;
    line.driver_name     = v.driver_name();
    line.period_earnings = v.period_earnings;
    line.commission      = v.period_earnings * commission_fraction;
    line.driver_net      = v.period_earnings - line.commission;
    lines.push_back(std::move(line));

    v.period_earnings = 0.0;
  }
  return lines;
}

std::vector<Trip> EntityStore::drain_tracking() {
  std::lock_guard<std::mutex> lk(tracking_mu_);
  std::vector<Trip> out;
  out.swap(tracking_);
  return out;
}

// -------------------- helpers --------------------

Vehicle* EntityStore::find_vehicle_(VehicleId id) {
  if (id <= 0 || static_cast<std::size_t>(id) > vehicles_.size()) return nullptr;
  return &vehicles_[static_cast<std::size_t>(id - 1)];
}

const Vehicle* EntityStore::find_vehicle_(VehicleId id) const {
  if (id <= 0 || static_cast<std::size_t>(id) > vehicles_.size()) return nullptr;
  return &vehicles_[static_cast<std::size_t>(id - 1)];
}

Rider* EntityStore::find_rider_(PersonId id) {
  auto it = rider_index_.find(id);
  if (it == rider_index_.end()) return nullptr;
  return &riders_[it->second];
}
