#include "engine/dispatch_center.hpp"
#include "utils/clock.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

// Keeps the day controller's active-trip count balanced on every exit path.
class ActiveTrip {
public:
  explicit ActiveTrip(DayController& days) : days_(days) {}
  ~ActiveTrip() { days_.deactivate_trip(); }

  ActiveTrip(const ActiveTrip&)            = delete;
  ActiveTrip& operator=(const ActiveTrip&) = delete;

private:
  DayController& days_;
};

// Holds a rider's claim until a vehicle is reserved; the reservation's
// release() ends it from then on.
class RiderClaim {
public:
  RiderClaim(EntityStore& store, PersonId rider) : store_(store), rider_(rider) {}
  ~RiderClaim() { if (held_) store_.unclaim_rider(rider_); }

  RiderClaim(const RiderClaim&)            = delete;
  RiderClaim& operator=(const RiderClaim&) = delete;

  void handed_to_reservation() { held_ = false; }

private:
  EntityStore& store_;
  PersonId     rider_;
  bool         held_ = true;
};

TripResult refused(TripOutcome outcome, std::string why) {
  TripResult r;
  r.outcome       = outcome;
  r.error_message = std::move(why);
  return r;
}

const DispatchConfig& validated(const DispatchConfig& cfg) {
  cfg.validate();
  return cfg;
}

} // namespace

// ============================= Impl =============================
struct DispatchCenter::Impl {
  Impl(const DispatchConfig& cfg, std::unique_ptr<RandomSource> owned, RandomSource* external, TransitHook transit)
    : owned_random(std::move(owned)),
      random(external ? *external : *owned_random),
      store(validated(cfg)),
      matcher(store),
      pipeline(store, random, std::move(transit)),
      days(store) {}

  std::unique_ptr<RandomSource> owned_random;
  RandomSource&                 random;

  EntityStore   store;
  Matcher       matcher;
  TripPipeline  pipeline;
  DayController days;
};

// ========================== API surface =========================
DispatchCenter::DispatchCenter(DispatchConfig cfg)
  : d_(std::make_unique<Impl>(cfg, std::make_unique<MersenneRandomSource>(), nullptr, sleeping_transit())) {}

DispatchCenter::DispatchCenter(DispatchConfig cfg, RandomSource& random, TransitHook transit)
  : d_(std::make_unique<Impl>(cfg, nullptr, &random, std::move(transit))) {}

DispatchCenter::~DispatchCenter() = default;

Affiliation DispatchCenter::affiliate_vehicle(const VehicleRegistration& reg) {
  return d_->store.affiliate_vehicle(reg);
}

Affiliation DispatchCenter::affiliate_rider(const RiderRegistration& reg) {
  return d_->store.affiliate_rider(reg);
}

TripResult DispatchCenter::request_trip(PersonId rider, const Coord& origin, const Coord& destination) {
  // --- admission ----------------------------------------------------------
  if (!d_->days.activate_trip()) {
    std::cerr << "[DISPATCH] [RequestTrip][reject] rider=" << rider << " reason=day_ending\n";
    return refused(TripOutcome::Rejected, "day is closing; no new trips are admitted");
  }
  ActiveTrip active(d_->days);

  // --- route --------------------------------------------------------------
  if (!d_->store.claim_rider(rider, origin, destination)) {
    std::cerr << "[DISPATCH] [RequestTrip][reject] rider=" << rider << " reason=unknown_or_busy_rider\n";
    return refused(TripOutcome::Failed, "rider is not registered or is already in a trip");
  }
  RiderClaim claim(d_->store, rider);

  // --- match --------------------------------------------------------------
  auto vehicle = d_->matcher.find_and_reserve(rider, origin, d_->store.config().search_radius);
  if (!vehicle) {
    return refused(TripOutcome::NoVehicle, "no vehicle available within the search radius");
  }
  claim.handed_to_reservation();

  auto r = d_->store.rider(rider);
  if (!r) {
    d_->store.release(vehicle->id, rider, std::nullopt);
    return refused(TripOutcome::Failed, "rider disappeared during matching");
  }

  // --- execute ------------------------------------------------------------
  return d_->pipeline.execute(*r, *vehicle, d_->days.current_day());
}

LiveSnapshot DispatchCenter::snapshot() const {
  LiveSnapshot snap;
  snap.generated_ms = now_epoch_ms();

  for (const auto& v : d_->store.vehicles()) {
    VehicleView view;
    view.id            = v.id;
    view.plate         = v.plate;
    view.driver_name   = v.driver_name();
    view.location      = v.location;
    view.available     = v.available;
    view.current_rider = v.current_rider;
    snap.vehicles.push_back(std::move(view));
  }

  for (const auto& r : d_->store.riders()) {
    if (!r.in_trip) continue;
    RiderView view;
    view.id               = r.id;
    view.name             = r.full_name();
    view.location         = r.location;
    view.destination      = r.destination;
    view.assigned_vehicle = r.assigned_vehicle;
    snap.riders_in_trip.push_back(std::move(view));
  }
  return snap;
}

const DispatchConfig& DispatchCenter::config() const { return d_->store.config(); }
EntityStore&   DispatchCenter::store()    { return d_->store; }
Matcher&       DispatchCenter::matcher()  { return d_->matcher; }
TripPipeline&  DispatchCenter::pipeline() { return d_->pipeline; }
DayController& DispatchCenter::days()     { return d_->days; }
