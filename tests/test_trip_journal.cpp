#include <gtest/gtest.h>
#include "engine/dispatch_center.hpp"
#include "storage/storage.h"
#include "storage/trip_journal.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

static std::string temp_db_path(const char* name) {
  return std::string("/tmp/") + name + ".sqlite";
}

static void remove_db(const std::string& path) {
  std::remove(path.c_str());
  std::remove((path + "-wal").c_str());
  std::remove((path + "-shm").c_str());
}

struct JournalFixture : ::testing::Test {
  std::string db_path;
  ScriptedRandom random;

  void SetUp() override {
    db_path = temp_db_path("ride_dispatch_journal_test");
    remove_db(db_path);
  }

  void TearDown() override { remove_db(db_path); }
};

TEST_F(JournalFixture, TripsReportsAndRegistrationsPersist) {
  {
    Storage storage(db_path);
    storage.init();
    DispatchCenter center(test_config(), random, no_transit());
    TripJournal journal(storage, center);
    journal.attach();

    ASSERT_TRUE(journal.affiliate_vehicle(make_vehicle(11111111, "abc123", {0, 0})).ok);
    ASSERT_TRUE(journal.affiliate_rider(make_rider(12345678, "4532 1234 5678 9012")).ok);
    EXPECT_FALSE(journal.affiliate_rider(make_rider(12345678)).ok);   // duplicate, not stored

    center.days().open_day();
    const TripResult r = center.request_trip(12345678, {0, 0}, {40, 0});
    ASSERT_TRUE(r.ok());
    center.days().close_day();

    EXPECT_EQ(storage.count_rows("vehicles"), 1);
    EXPECT_EQ(storage.count_rows("riders"), 1);
    EXPECT_EQ(storage.count_rows("trips"), 1);
    EXPECT_EQ(storage.count_rows("daily_reports"), 1);
    EXPECT_EQ(storage.count_rows("settlements"), 1);
    EXPECT_EQ(storage.count_rows("vehicle_snapshot"), 1);
    EXPECT_EQ(storage.count_rows("rider_snapshot"), 0);
    EXPECT_EQ(storage.count_rows("orders; DROP TABLE trips"), -1);
    EXPECT_TRUE(storage.snapshot_generated_ms().has_value());

    const auto trips = storage.load_trips(1);
    ASSERT_EQ(trips.size(), 1u);
    EXPECT_EQ(trips[0].id, r.trip.id);
    EXPECT_DOUBLE_EQ(trips[0].fare, 100.0);
    EXPECT_TRUE(trips[0].completed);
    EXPECT_TRUE(trips[0].tracked);
    EXPECT_EQ(trips[0].destination, (Coord{40, 0}));
    EXPECT_TRUE(storage.load_trips(2).empty());
  }

  // Open DB and assert the commission split
  SQLite::Database db(db_path, SQLite::OPEN_READONLY);
  SQLite::Statement trip(db, "SELECT commission, driver_share FROM trips WHERE trip_id=1");
  ASSERT_TRUE(trip.executeStep());
  EXPECT_DOUBLE_EQ(trip.getColumn(0).getDouble(), 20.0);
  EXPECT_DOUBLE_EQ(trip.getColumn(1).getDouble(), 80.0);

  SQLite::Statement line(db, "SELECT commission, driver_net FROM settlements WHERE day=1");
  ASSERT_TRUE(line.executeStep());
  EXPECT_DOUBLE_EQ(line.getColumn(0).getDouble(), 20.0);
  EXPECT_DOUBLE_EQ(line.getColumn(1).getDouble(), 80.0);

  SQLite::Statement rider(db, "SELECT card FROM riders WHERE rider_id=12345678");
  ASSERT_TRUE(rider.executeStep());
  EXPECT_EQ(rider.getColumn(0).getString(), "4532123456789012");
}

TEST_F(JournalFixture, RestoreReloadsFleetAndSeedsTripIds) {
  {
    Storage storage(db_path);
    storage.init();
    DispatchCenter center(test_config(), random, no_transit());
    TripJournal journal(storage, center);
    journal.attach();

    ASSERT_TRUE(journal.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
    ASSERT_TRUE(journal.affiliate_vehicle(make_vehicle(22222222, "BBB222", {5, 5})).ok);
    ASSERT_TRUE(journal.affiliate_rider(make_rider(12345678)).ok);

    center.days().open_day();
    ASSERT_TRUE(center.request_trip(12345678, {0, 0}, {1, 0}).ok());
    ASSERT_TRUE(center.request_trip(12345678, {1, 0}, {2, 0}).ok());
    ASSERT_EQ(center.store().vehicle(1)->trip_count, 2);
  }

  Storage storage(db_path);
  storage.init();
  EXPECT_EQ(storage.load_next_trip_seq(), 3u);

  DispatchCenter center(test_config(), random, no_transit());
  TripJournal journal(storage, center);
  EXPECT_EQ(journal.restore(), 3u);
  journal.attach();

  EXPECT_EQ(center.store().vehicle_count(), 2u);
  ASSERT_TRUE(center.store().vehicle(2).has_value());
  EXPECT_EQ(center.store().vehicle(2)->plate, "BBB222");
  EXPECT_EQ(center.store().vehicle(2)->location, (Coord{5, 5}));
  ASSERT_TRUE(center.store().rider(12345678).has_value());

  // Vehicle 1 carried both trips: ScriptedRandom rates each one 5 (its upper bound).
  const auto v1 = center.store().vehicle(1);
  ASSERT_TRUE(v1.has_value());
  EXPECT_EQ(v1->trip_count, 2);
  EXPECT_DOUBLE_EQ(v1->rating_total, 10.0);
  EXPECT_DOUBLE_EQ(v1->total_earnings, 5.0);
  EXPECT_DOUBLE_EQ(v1->period_earnings, 0.0);
  EXPECT_EQ(v1->location, (Coord{2, 0}));
  EXPECT_EQ(center.store().vehicle(2)->trip_count, 0);

  // Restored registrations are not written twice.
  EXPECT_EQ(storage.count_rows("vehicles"), 2);
  EXPECT_EQ(storage.count_rows("riders"), 1);

  center.days().open_day();
  const TripResult r = center.request_trip(12345678, {0, 0}, {1, 0});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.trip.id, 3u);
  EXPECT_EQ(storage.count_rows("trips"), 3);
}

TEST_F(JournalFixture, FailedTripsAreJournaled) {
  Storage storage(db_path);
  storage.init();
  DispatchCenter center(test_config(), random, [](const Trip&, std::chrono::microseconds) {
    throw std::runtime_error("flat tyre");
  });
  TripJournal journal(storage, center);
  journal.attach();

  ASSERT_TRUE(journal.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
  ASSERT_TRUE(journal.affiliate_rider(make_rider(12345678)).ok);
  center.days().open_day();
  EXPECT_EQ(center.request_trip(12345678, {0, 0}, {1, 0}).outcome, TripOutcome::Failed);

  const auto trips = storage.load_trips();
  ASSERT_EQ(trips.size(), 1u);
  EXPECT_FALSE(trips[0].completed);
  EXPECT_EQ(trips[0].rating, 0);
}

TEST_F(JournalFixture, EmptyDatabaseDefaults) {
  Storage storage(db_path);
  storage.init();
  EXPECT_EQ(storage.load_next_trip_seq(), 1u);
  EXPECT_FALSE(storage.snapshot_generated_ms().has_value());
  EXPECT_TRUE(storage.load_vehicle_registrations().empty());
  EXPECT_TRUE(storage.load_trips().empty());
}
