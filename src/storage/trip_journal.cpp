#include "storage/trip_journal.hpp"

#include <iostream>
#include <map>

TripJournal::TripJournal(Storage& storage, DispatchCenter& center)
  : storage_(storage), center_(center) {}

void TripJournal::attach() {
  center_.pipeline().register_trip_listener(
      [this](TripEvent event, const Trip& trip) { on_trip_(event, trip); });
  center_.days().register_close_listener(
      [this](const DailyReport& report) { on_close_(report); });
}

std::size_t TripJournal::restore() {
  std::size_t restored = 0;

  for (const auto& reg : storage_.load_vehicle_registrations()) {
    if (center_.affiliate_vehicle(reg).ok) ++restored;
  }
  for (const auto& reg : storage_.load_rider_registrations()) {
    if (center_.affiliate_rider(reg).ok) ++restored;
  }

  const std::size_t vehicles = restore_vehicle_history_();

  const uint64_t next = storage_.load_next_trip_seq();
  center_.store().seed_trip_ids(next);

  std::cout << "[JOURNAL] restored " << restored << " registrations; "
            << vehicles << " vehicle histories; next trip id=" << next << "\n";
  return restored;
}

// Ratings, trip counts, lifetime earnings and position come back from the
// completed trips. Period earnings start at zero: an unsettled day is not
// resumed.
std::size_t TripJournal::restore_vehicle_history_() {
  struct History {
    Coord   location;
    double  rating_total   = 0.0;
    int64_t trip_count     = 0;
    double  total_earnings = 0.0;
  };

  std::map<VehicleId, History> by_vehicle;
  for (const auto& t : storage_.load_trips()) {    // ordered by trip id
    if (!t.completed) continue;
    History& h = by_vehicle[t.vehicle_id];
    h.location        = t.destination;
    h.rating_total   += t.rating;
    h.trip_count     += 1;
    h.total_earnings += t.fare;
  }

  std::size_t applied = 0;
  for (const auto& entry : by_vehicle) {
    const History& h = entry.second;
    if (center_.store().restore_history(entry.first, h.location, h.rating_total, h.trip_count, h.total_earnings)) {
      ++applied;
    } else {
      std::cerr << "[JOURNAL][error] vehicle=" << entry.first << " outcome=history_for_unknown_vehicle\n";
    }
  }
  return applied;
}

Affiliation TripJournal::affiliate_vehicle(const VehicleRegistration& reg) {
  Affiliation a = center_.affiliate_vehicle(reg);
  if (!a.ok) return a;

  auto v = center_.store().vehicle(a.id);
  bool ok = false;
  if (v) {
    std::lock_guard<std::mutex> lk(write_mu_);
    ok = storage_.insert_vehicle(*v);
  }
  if (!ok) std::cerr << "[JOURNAL][error] vehicle=" << a.id << " outcome=db_insert_failed\n";
  return a;
}

Affiliation TripJournal::affiliate_rider(const RiderRegistration& reg) {
  Affiliation a = center_.affiliate_rider(reg);
  if (!a.ok) return a;

  auto r = center_.store().rider(a.id);
  bool ok = false;
  if (r) {
    std::lock_guard<std::mutex> lk(write_mu_);
    ok = storage_.insert_rider(*r);
  }
  if (!ok) std::cerr << "[JOURNAL][error] rider=" << a.id << " outcome=db_insert_failed\n";
  return a;
}

bool TripJournal::refresh_snapshot() {
  std::lock_guard<std::mutex> lk(write_mu_);
  return storage_.write_snapshot(center_.snapshot());
}

// -------------------- listeners --------------------

void TripJournal::on_trip_(TripEvent event, const Trip& trip) {
  if (event != TripEvent::Started && trip.id != 0) {
    std::lock_guard<std::mutex> lk(write_mu_);
    if (!storage_.insert_trip(trip, center_.config().commission_fraction)) {
      std::cerr << "[JOURNAL][error] trip=" << trip.id << " outcome=db_insert_failed\n";
    }
  }
  refresh_snapshot();
}

void TripJournal::on_close_(const DailyReport& report) {
  bool ok = false;
  {
    std::lock_guard<std::mutex> lk(write_mu_);
    ok = storage_.insert_daily_report(report);
  }
  if (ok) {
    std::cout << "[JOURNAL] day=" << report.day << " report stored"
              << " settlements=" << report.settlements.size() << "\n";
  } else {
    std::cerr << "[JOURNAL][error] day=" << report.day << " outcome=db_insert_failed\n";
  }
  refresh_snapshot();
}
