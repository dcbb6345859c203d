#include "storage/storage.h"

#include <iostream>
#include <set>
#include <stdexcept>

// -------------------- ctor / init --------------------

Storage::Storage(const std::string& db_path)
  : db_(db_path.c_str(),
        SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE | SQLite::OPEN_FULLMUTEX)
{
  // Simple contention handling for brief write-lock situations
  db_.setBusyTimeout(5000); // ms
}

void Storage::init() {
  db_.exec("PRAGMA journal_mode=WAL;");
  db_.exec("PRAGMA synchronous=NORMAL;");
  db_.exec("PRAGMA foreign_keys=ON;");

  create_schema_();
}

void Storage::create_schema_() {
  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS vehicles (
  vehicle_id          INTEGER PRIMARY KEY,
  driver_id           INTEGER NOT NULL UNIQUE,
  first_name          TEXT NOT NULL,
  last_name           TEXT NOT NULL,
  plate               TEXT NOT NULL UNIQUE,
  make                TEXT NOT NULL,
  model               TEXT NOT NULL,
  speed_kmh           INTEGER NOT NULL,
  lat                 REAL NOT NULL,           -- location at affiliation
  lng                 REAL NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS riders (
  rider_id            INTEGER PRIMARY KEY,
  first_name          TEXT NOT NULL,
  last_name           TEXT NOT NULL,
  card                TEXT NOT NULL,
  lat                 REAL NOT NULL,
  lng                 REAL NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS trips (
  trip_id             INTEGER PRIMARY KEY,
  vehicle_id          INTEGER NOT NULL,
  rider_id            INTEGER NOT NULL,
  origin_lat          REAL NOT NULL,
  origin_lng          REAL NOT NULL,
  dest_lat            REAL NOT NULL,
  dest_lng            REAL NOT NULL,
  distance            REAL NOT NULL,
  fare                REAL NOT NULL,
  commission          REAL NOT NULL,
  driver_share        REAL NOT NULL,
  rating              INTEGER NOT NULL,        -- 0 when not completed
  day                 INTEGER NOT NULL,
  completed           INTEGER NOT NULL,        -- 0/1
  tracked             INTEGER NOT NULL,        -- 0/1
  started_ts          INTEGER NOT NULL,        -- epoch ms
  completed_ts        INTEGER NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_trips_day
  ON trips(day);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_trips_vehicle
  ON trips(vehicle_id);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS vehicle_snapshot (
  vehicle_id          INTEGER PRIMARY KEY,
  plate               TEXT NOT NULL,
  driver_name         TEXT NOT NULL,
  lat                 REAL NOT NULL,
  lng                 REAL NOT NULL,
  available           INTEGER NOT NULL,
  current_rider       INTEGER                  -- nullable
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS rider_snapshot (
  rider_id            INTEGER PRIMARY KEY,
  name                TEXT NOT NULL,
  lat                 REAL NOT NULL,
  lng                 REAL NOT NULL,
  dest_lat            REAL NOT NULL,
  dest_lng            REAL NOT NULL,
  assigned_vehicle    INTEGER                  -- nullable
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS snapshot_meta (
  id                  INTEGER PRIMARY KEY CHECK (id = 1),
  generated_ts        INTEGER NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS daily_reports (
  day                 INTEGER PRIMARY KEY,
  tracked_trips       INTEGER NOT NULL,
  tracked_revenue     REAL NOT NULL,
  operator_day_total  REAL NOT NULL,
  operator_total      REAL NOT NULL,
  closed_ts           INTEGER NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS settlements (
  id                  INTEGER PRIMARY KEY AUTOINCREMENT,
  day                 INTEGER NOT NULL,
  vehicle_id          INTEGER NOT NULL,
  period_earnings     REAL NOT NULL,
  commission          REAL NOT NULL,
  driver_net          REAL NOT NULL,
  FOREIGN KEY(day) REFERENCES daily_reports(day)
);
)SQL");
}

// -------------------- writes --------------------

uint64_t Storage::load_next_trip_seq() const {
  try {
    SQLite::Statement q(db_, "SELECT COALESCE(MAX(trip_id), 0) + 1 FROM trips");
    if (q.executeStep()) return static_cast<uint64_t>(q.getColumn(0).getInt64());
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] load_next_trip_seq: " << e.what() << "\n";
    return 1;
  }
}

bool Storage::insert_trip(const Trip& t, double commission_fraction) {
  try {
    SQLite::Transaction txn(db_);
    SQLite::Statement stmt(db_,
      "INSERT INTO trips(trip_id, vehicle_id, rider_id, origin_lat, origin_lng, dest_lat, dest_lng, "
      "distance, fare, commission, driver_share, rating, day, completed, tracked, started_ts, completed_ts) "
      "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");

    stmt.bind(1,  static_cast<long long>(t.id));
    stmt.bind(2,  static_cast<long long>(t.vehicle_id));
    stmt.bind(3,  static_cast<long long>(t.rider_id));
    stmt.bind(4,  t.origin.lat);
    stmt.bind(5,  t.origin.lng);
    stmt.bind(6,  t.destination.lat);
    stmt.bind(7,  t.destination.lng);
    stmt.bind(8,  t.distance);
    stmt.bind(9,  t.fare);
    stmt.bind(10, t.commission(commission_fraction));
    stmt.bind(11, t.driver_share(commission_fraction));
    stmt.bind(12, t.rating);
    stmt.bind(13, t.day);
    stmt.bind(14, t.completed ? 1 : 0);
    stmt.bind(15, t.tracked ? 1 : 0);
    stmt.bind(16, static_cast<long long>(t.started_ms));
    stmt.bind(17, static_cast<long long>(t.completed_ms));

    stmt.exec();
    txn.commit();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] insert_trip trip=" << t.id << ": " << e.what() << "\n";
    return false;
  }
}

bool Storage::write_snapshot(const LiveSnapshot& snap) {
  try {
    SQLite::Transaction txn(db_);
    db_.exec("DELETE FROM vehicle_snapshot");
    db_.exec("DELETE FROM rider_snapshot");

    SQLite::Statement vs(db_,
      "INSERT INTO vehicle_snapshot(vehicle_id, plate, driver_name, lat, lng, available, current_rider) "
      "VALUES (?,?,?,?,?,?,?)");
    for (const auto& v : snap.vehicles) {
      vs.bind(1, static_cast<long long>(v.id));
      vs.bind(2, v.plate);
      vs.bind(3, v.driver_name);
      vs.bind(4, v.location.lat);
      vs.bind(5, v.location.lng);
      vs.bind(6, v.available ? 1 : 0);
      if (v.current_rider.has_value())
        vs.bind(7, static_cast<long long>(*v.current_rider));
      else
        vs.bind(7); // NULL
      vs.exec();
      vs.reset();
    }

    SQLite::Statement rs(db_,
      "INSERT INTO rider_snapshot(rider_id, name, lat, lng, dest_lat, dest_lng, assigned_vehicle) "
      "VALUES (?,?,?,?,?,?,?)");
    for (const auto& r : snap.riders_in_trip) {
      rs.bind(1, static_cast<long long>(r.id));
      rs.bind(2, r.name);
      rs.bind(3, r.location.lat);
      rs.bind(4, r.location.lng);
      rs.bind(5, r.destination.lat);
      rs.bind(6, r.destination.lng);
      if (r.assigned_vehicle.has_value())
        rs.bind(7, static_cast<long long>(*r.assigned_vehicle));
      else
        rs.bind(7);
      rs.exec();
      rs.reset();
    }

    SQLite::Statement meta(db_,
      "INSERT INTO snapshot_meta(id, generated_ts) VALUES (1, ?) "
      "ON CONFLICT(id) DO UPDATE SET generated_ts=excluded.generated_ts");
    meta.bind(1, static_cast<long long>(snap.generated_ms));
    meta.exec();

    txn.commit();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] write_snapshot: " << e.what() << "\n";
    return false;
  }
}

bool Storage::insert_daily_report(const DailyReport& r) {
  try {
    SQLite::Transaction txn(db_);

    SQLite::Statement rep(db_,
      "INSERT OR REPLACE INTO daily_reports(day, tracked_trips, tracked_revenue, operator_day_total, operator_total, closed_ts) "
      "VALUES (?,?,?,?,?,?)");
    rep.bind(1, r.day);
    rep.bind(2, static_cast<long long>(r.tracked_trips.size()));
    rep.bind(3, r.tracked_revenue);
    rep.bind(4, r.operator_day_total);
    rep.bind(5, r.operator_total);
    rep.bind(6, static_cast<long long>(r.closed_ms));
    rep.exec();

    SQLite::Statement line(db_,
      "INSERT INTO settlements(day, vehicle_id, period_earnings, commission, driver_net) "
      "VALUES (?,?,?,?,?)");
    for (const auto& s : r.settlements) {
      line.bind(1, r.day);
      line.bind(2, static_cast<long long>(s.vehicle_id));
      line.bind(3, s.period_earnings);
      line.bind(4, s.commission);
      line.bind(5, s.driver_net);
      line.exec();
      line.reset();
    }

    txn.commit();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] insert_daily_report day=" << r.day << ": " << e.what() << "\n";
    return false;
  }
}

bool Storage::insert_vehicle(const Vehicle& v) {
  try {
    SQLite::Statement stmt(db_,
      "INSERT INTO vehicles(vehicle_id, driver_id, first_name, last_name, plate, make, model, speed_kmh, lat, lng) "
      "VALUES (?,?,?,?,?,?,?,?,?,?)");
    stmt.bind(1,  static_cast<long long>(v.id));
    stmt.bind(2,  static_cast<long long>(v.driver_id));
    stmt.bind(3,  v.first_name);
    stmt.bind(4,  v.last_name);
    stmt.bind(5,  v.plate);
    stmt.bind(6,  v.make);
    stmt.bind(7,  v.model);
    stmt.bind(8,  v.speed_kmh);
    stmt.bind(9,  v.location.lat);
    stmt.bind(10, v.location.lng);
    stmt.exec();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] insert_vehicle vehicle=" << v.id << ": " << e.what() << "\n";
    return false;
  }
}

bool Storage::insert_rider(const Rider& r) {
  try {
    SQLite::Statement stmt(db_,
      "INSERT INTO riders(rider_id, first_name, last_name, card, lat, lng) VALUES (?,?,?,?,?,?)");
    stmt.bind(1, static_cast<long long>(r.id));
    stmt.bind(2, r.first_name);
    stmt.bind(3, r.last_name);
    stmt.bind(4, r.card);
    stmt.bind(5, r.location.lat);
    stmt.bind(6, r.location.lng);
    stmt.exec();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] insert_rider rider=" << r.id << ": " << e.what() << "\n";
    return false;
  }
}

// -------------------- reads --------------------

std::vector<VehicleRegistration> Storage::load_vehicle_registrations() const {
  std::vector<VehicleRegistration> out;
  try {
    SQLite::Statement q(db_,
      "SELECT driver_id, first_name, last_name, plate, make, model, speed_kmh, lat, lng "
      "FROM vehicles ORDER BY vehicle_id");
    while (q.executeStep()) {
      VehicleRegistration reg;
      reg.driver_id  = q.getColumn(0).getInt64();
      reg.first_name = q.getColumn(1).getString();
      reg.last_name  = q.getColumn(2).getString();
      reg.plate      = q.getColumn(3).getString();
      reg.make       = q.getColumn(4).getString();
      reg.model      = q.getColumn(5).getString();
      reg.speed_kmh  = q.getColumn(6).getInt();
      reg.location   = Coord{q.getColumn(7).getDouble(), q.getColumn(8).getDouble()};
      out.push_back(std::move(reg));
    }
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] load_vehicle_registrations: " << e.what() << "\n";
  }
  return out;
}

std::vector<RiderRegistration> Storage::load_rider_registrations() const {
  std::vector<RiderRegistration> out;
  try {
    SQLite::Statement q(db_,
      "SELECT rider_id, first_name, last_name, card, lat, lng FROM riders ORDER BY rider_id");
    while (q.executeStep()) {
      RiderRegistration reg;
      reg.id         = q.getColumn(0).getInt64();
      reg.first_name = q.getColumn(1).getString();
      reg.last_name  = q.getColumn(2).getString();
      reg.card       = q.getColumn(3).getString();
      reg.location   = Coord{q.getColumn(4).getDouble(), q.getColumn(5).getDouble()};
      out.push_back(std::move(reg));
    }
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] load_rider_registrations: " << e.what() << "\n";
  }
  return out;
}

std::vector<Trip> Storage::load_trips(std::optional<int32_t> day) const {
  std::vector<Trip> out;
  try {
    std::string sql =
      "SELECT trip_id, vehicle_id, rider_id, origin_lat, origin_lng, dest_lat, dest_lng, distance, fare, "
      "rating, day, completed, tracked, started_ts, completed_ts FROM trips";
    if (day.has_value()) sql += " WHERE day=?";
    sql += " ORDER BY trip_id";

    SQLite::Statement q(db_, sql);
    if (day.has_value()) q.bind(1, *day);

    while (q.executeStep()) {
      Trip t;
      t.id           = static_cast<TripId>(q.getColumn(0).getInt64());
      t.vehicle_id   = q.getColumn(1).getInt64();
      t.rider_id     = q.getColumn(2).getInt64();
      t.origin       = Coord{q.getColumn(3).getDouble(), q.getColumn(4).getDouble()};
      t.destination  = Coord{q.getColumn(5).getDouble(), q.getColumn(6).getDouble()};
      t.distance     = q.getColumn(7).getDouble();
      t.fare         = q.getColumn(8).getDouble();
      t.rating       = q.getColumn(9).getInt();
      t.day          = q.getColumn(10).getInt();
      t.completed    = q.getColumn(11).getInt() != 0;
      t.tracked      = q.getColumn(12).getInt() != 0;
      t.started_ms   = q.getColumn(13).getInt64();
      t.completed_ms = q.getColumn(14).getInt64();
      out.push_back(t);
    }
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] load_trips: " << e.what() << "\n";
  }
  return out;
}

std::optional<int64_t> Storage::snapshot_generated_ms() const {
  try {
    SQLite::Statement q(db_, "SELECT generated_ts FROM snapshot_meta WHERE id=1");
    if (q.executeStep()) return static_cast<int64_t>(q.getColumn(0).getInt64());
    return std::nullopt;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int64_t Storage::count_rows(const std::string& table) const {
  static const std::set<std::string> known = {
    "vehicles", "riders", "trips", "vehicle_snapshot", "rider_snapshot", "daily_reports", "settlements"};
  if (known.count(table) == 0) return -1;

  try {
    SQLite::Statement q(db_, "SELECT COUNT(*) FROM " + table);
    if (q.executeStep()) return q.getColumn(0).getInt64();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[JOURNAL][error] count_rows " << table << ": " << e.what() << "\n";
    return -1;
  }
}
