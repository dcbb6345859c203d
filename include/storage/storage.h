#pragma once

#include "domain/affiliation.hpp"
#include "domain/report.hpp"
#include "domain/rider.hpp"
#include "domain/snapshot.hpp"
#include "domain/trip.hpp"
#include "domain/vehicle.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Persistence layer backed by SQLite (via SQLiteCpp).
// Notes:
//  - Call init() once after construction to set pragmas and create tables.
//  - All methods return bool / optional on failure; they never throw (exceptions are caught internally).
//  - Only the constructor and init() throw SQLite::Exception.
class Storage {
public:
  // Opens (or creates) the database file.
  // Thread-safe mode: OPEN_FULLMUTEX; you should still serialize writes at the app level.
  explicit Storage(const std::string& db_path);

  // PRAGMAs + schema creation.
  void init();

  // Next free trip id (MAX(id)+1, or 1 on an empty ledger).
  uint64_t load_next_trip_seq() const;

  // Append a completed (or failed) trip with its commission split.
  bool insert_trip(const Trip& t, double commission_fraction);

  // Replace the live snapshot tables in one transaction.
  bool write_snapshot(const LiveSnapshot& snap);

  // Daily report row plus one settlement row per vehicle, in one transaction.
  bool insert_daily_report(const DailyReport& r);

  // Registrations, reloaded at startup.
  bool insert_vehicle(const Vehicle& v);
  bool insert_rider(const Rider& r);
  std::vector<VehicleRegistration> load_vehicle_registrations() const;
  std::vector<RiderRegistration>   load_rider_registrations() const;

  // Reads
  std::vector<Trip>      load_trips(std::optional<int32_t> day = std::nullopt) const;
  std::optional<int64_t> snapshot_generated_ms() const;
  int64_t                count_rows(const std::string& table) const;

private:
  void create_schema_();

private:
  SQLite::Database db_;
};
