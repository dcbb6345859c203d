#pragma once
#include "domain/affiliation.hpp"
#include "engine/dispatch_center.hpp"
#include "storage/storage.h"

#include <cstddef>
#include <mutex>

// Mirrors the dispatch center into SQLite: every finished trip, the live
// snapshot after each trip event, every daily report and every registration.
// Storage failures are logged and never reach the dispatch core.
class TripJournal {
public:
  // Both must outlive the journal.
  TripJournal(Storage& storage, DispatchCenter& center);

  TripJournal(const TripJournal&)            = delete;
  TripJournal& operator=(const TripJournal&) = delete;

  // Subscribes to trip and day-close events. Call once.
  void attach();

  // Re-affiliates stored vehicles and riders (without writing them again),
  // rebuilds each vehicle's ratings and earnings from its stored trips and
  // seeds the trip id counter past the stored ledger.
  // Returns the number of registrations restored.
  std::size_t restore();

  // Affiliate through the center and persist on success.
  Affiliation affiliate_vehicle(const VehicleRegistration& reg);
  Affiliation affiliate_rider(const RiderRegistration& reg);

  bool refresh_snapshot();

  Storage& storage() { return storage_; }

private:
  void on_trip_(TripEvent event, const Trip& trip);
  void on_close_(const DailyReport& report);
  std::size_t restore_vehicle_history_();

  Storage&        storage_;
  DispatchCenter& center_;
  std::mutex      write_mu_;   // serialize writes to SQLite
};
