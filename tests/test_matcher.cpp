#include <gtest/gtest.h>
#include "engine/dispatch_center.hpp"
#include "engine/matcher.hpp"
#include "test_support.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

static Vehicle rated(VehicleId id, Coord at, double total, int64_t trips) {
  Vehicle v;
  v.id           = id;
  v.location     = at;
  v.rating_total = total;
  v.trip_count   = trips;
  return v;
}

TEST(PickNearest, ClosestAvailableWins) {
  std::vector<Vehicle> fleet = {rated(1, {0, 1.0}, 0, 0), rated(2, {0, 0.5}, 0, 0), rated(3, {0, 0.1}, 0, 0)};
  fleet[2].available     = false;
  fleet[2].current_rider = 42;

  const Vehicle* v = pick_nearest(fleet, {0, 0}, 2.0, 5.0);
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->id, 2);
}

TEST(PickNearest, RadiusIsStrict) {
  std::vector<Vehicle> fleet = {rated(1, {0, 2.0}, 0, 0)};
  EXPECT_EQ(pick_nearest(fleet, {0, 0}, 2.0, 5.0), nullptr);
  EXPECT_NE(pick_nearest(fleet, {0, 0}, 2.01, 5.0), nullptr);
}

TEST(PickNearest, TieGoesToHigherRating) {
  std::vector<Vehicle> fleet = {rated(1, {0, 1.0}, 3, 1), rated(2, {0, -1.0}, 5, 1)};
  const Vehicle* v = pick_nearest(fleet, {0, 0}, 2.0, 5.0);
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->id, 2);

  std::swap(fleet[0], fleet[1]);
  v = pick_nearest(fleet, {0, 0}, 2.0, 5.0);
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->id, 2);
}

TEST(PickNearest, EmptyFleet) {
  EXPECT_EQ(pick_nearest({}, {0, 0}, 2.0, 5.0), nullptr);
}

TEST(Matcher, TieThroughStoreUsesRatings) {
  EntityStore store(test_config());
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 1.0})).ok);
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(22222222, "BBB222", {0, -1.0})).ok);
  ASSERT_TRUE(store.affiliate_rider(make_rider(12345678)).ok);

  store.complete_trip(1, {0, 1.0}, 3, 0.0);
  store.complete_trip(2, {0, -1.0}, 5, 0.0);

  ASSERT_TRUE(store.claim_rider(12345678, {0, 0}, {1, 1}));
  Matcher matcher(store);
  auto v = matcher.find_and_reserve(12345678, {0, 0}, 2.0);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->id, 2);

  auto stored = store.vehicle(2);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->available);
  EXPECT_EQ(stored->current_rider, PersonId{12345678});

  auto rider = store.rider(12345678);
  ASSERT_TRUE(rider.has_value());
  EXPECT_TRUE(rider->in_trip);
  EXPECT_EQ(rider->assigned_vehicle, VehicleId{2});
}

TEST(Matcher, UnknownRiderLeavesVehicleFree) {
  EntityStore store(test_config());
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);

  Matcher matcher(store);
  EXPECT_FALSE(matcher.find_and_reserve(99999999, {0, 0}, 2.0).has_value());
  EXPECT_TRUE(store.vehicle(1)->available);
}

TEST(Matcher, UnclaimedRiderIsNotAssigned) {
  EntityStore store(test_config());
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
  ASSERT_TRUE(store.affiliate_rider(make_rider(12345678)).ok);

  Matcher matcher(store);
  EXPECT_FALSE(matcher.find_and_reserve(12345678, {0, 0}, 2.0).has_value());
  EXPECT_TRUE(store.vehicle(1)->available);
  EXPECT_FALSE(store.rider(12345678)->in_trip);
}

TEST(EntityStore, RiderClaimIsExclusive) {
  EntityStore store(test_config());
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
  ASSERT_TRUE(store.affiliate_rider(make_rider(12345678)).ok);

  ASSERT_TRUE(store.claim_rider(12345678, {0, 0}, {1, 0}));
  // A second request for the same rider, still before any vehicle is
  // reserved, must not get through nor move the first request's route.
  EXPECT_FALSE(store.claim_rider(12345678, {3, 3}, {4, 4}));
  EXPECT_EQ(store.rider(12345678)->destination, (Coord{1, 0}));
  EXPECT_FALSE(store.claim_rider(99999999, {0, 0}, {1, 0}));

  store.unclaim_rider(12345678);
  ASSERT_TRUE(store.claim_rider(12345678, {0, 0}, {2, 0}));

  Matcher matcher(store);
  auto v = matcher.find_and_reserve(12345678, {0, 0}, 2.0);
  ASSERT_TRUE(v.has_value());
  EXPECT_FALSE(store.assign_rider(12345678, v->id));     // already in a trip
  EXPECT_FALSE(store.claim_rider(12345678, {0, 0}, {1, 0}));

  store.release(v->id, 12345678, Coord{2, 0});
  const auto r = store.rider(12345678);
  EXPECT_FALSE(r->in_trip);
  EXPECT_FALSE(r->assigned_vehicle.has_value());
  EXPECT_EQ(r->location, (Coord{2, 0}));
  EXPECT_TRUE(store.claim_rider(12345678, {2, 0}, {3, 0}));
}

TEST(EntityStore, ReleaseOfUnknownIdsIsHarmless) {
  EntityStore store(test_config());
  ASSERT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
  store.release(42, 99999999, Coord{1, 1});
  EXPECT_TRUE(store.vehicle(1)->available);
  EXPECT_EQ(store.vehicle(1)->location, (Coord{0, 0}));
}

// Several requests for one rider racing each other: one trip, one vehicle.
TEST(Matcher, ConcurrentRequestsForOneRiderHoldOneVehicle) {
  ScriptedRandom random;
  TransitGate gate;
  DispatchCenter center(test_config(), random, gate.hook());

  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0.1})).ok);
  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(22222222, "BBB222", {0, 0.2})).ok);
  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(33333333, "CCC333", {0, 0.3})).ok);
  ASSERT_TRUE(center.affiliate_rider(make_rider(12345678)).ok);
  center.days().open_day();

  std::atomic<int> ready{0};
  std::atomic<int> returned{0};
  std::vector<TripResult> results(3);
  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&, i] {
      ++ready;
      while (ready.load() < 3) std::this_thread::yield();
      results[i] = center.request_trip(12345678, {0, 0}, {1.0 + i, 0});
      ++returned;
    });
  }

  ASSERT_TRUE(gate.wait_for(1));
  // The other two are refused while the first is parked in transit.
  ASSERT_TRUE(eventually([&] { return returned.load() == 2; }));
  EXPECT_EQ(center.days().active_trips(), 1);

  EXPECT_EQ(gate.in_transit().size(), 1u);
  int holding = 0;
  for (const auto& v : center.store().vehicles()) {
    if (v.current_rider == PersonId{12345678}) ++holding;
  }
  EXPECT_EQ(holding, 1);

  const auto rider = center.store().rider(12345678);
  ASSERT_TRUE(rider.has_value());
  EXPECT_TRUE(rider->in_trip);
  ASSERT_TRUE(rider->assigned_vehicle.has_value());
  EXPECT_FALSE(center.store().vehicle(*rider->assigned_vehicle)->available);

  gate.open();
  for (auto& t : threads) t.join();

  int completed = 0;
  for (int i = 0; i < 3; ++i) {
    const TripResult& r = results[i];
    if (r.outcome == TripOutcome::Completed) {
      ++completed;
      // The winner kept its own route.
      EXPECT_EQ(r.trip.destination, (Coord{1.0 + i, 0}));
      EXPECT_DOUBLE_EQ(r.trip.distance, 1.0 + i);
      EXPECT_EQ(center.store().rider(12345678)->location, r.trip.destination);
    } else {
      EXPECT_EQ(r.outcome, TripOutcome::Failed);
    }
  }
  EXPECT_EQ(completed, 1);
  for (const auto& v : center.store().vehicles()) EXPECT_TRUE(v.available);
  EXPECT_FALSE(center.store().rider(12345678)->in_trip);
}

TEST(Matcher, DuplicateRegistrationsRejected) {
  EntityStore store(test_config());
  EXPECT_TRUE(store.affiliate_vehicle(make_vehicle(11111111, "abc123", {0, 0})).ok);
  EXPECT_FALSE(store.affiliate_vehicle(make_vehicle(11111111, "XYZ789", {0, 0})).ok);   // same driver
  EXPECT_FALSE(store.affiliate_vehicle(make_vehicle(22222222, "ABC123", {0, 0})).ok);   // same plate
  EXPECT_EQ(store.vehicle_count(), 1u);
  EXPECT_EQ(store.vehicle(1)->plate, "ABC123");

  EXPECT_TRUE(store.affiliate_rider(make_rider(12345678)).ok);
  EXPECT_FALSE(store.affiliate_rider(make_rider(12345678)).ok);
  EXPECT_FALSE(store.affiliate_rider(make_rider(87654321, "453212345678901")).ok);
  EXPECT_EQ(store.riders().size(), 1u);
}

// 3 vehicles, 5 riders asking at once: exactly the 3 vehicles get used, once each.
TEST(Matcher, ConcurrentRequestsNeverShareAVehicle) {
  ScriptedRandom random;
  TransitGate gate;
  DispatchCenter center(test_config(), random, gate.hook());

  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0.1})).ok);
  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(22222222, "BBB222", {0, 0.2})).ok);
  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(33333333, "CCC333", {0, 0.3})).ok);
  for (PersonId id = 10000001; id <= 10000005; ++id) ASSERT_TRUE(center.affiliate_rider(make_rider(id)).ok);

  center.days().open_day();

  std::vector<TripResult> results(5);
  std::vector<std::thread> threads;
  for (int i = 0; i < 5; ++i) {
    threads.emplace_back([&, i] {
      results[i] = center.request_trip(10000001 + i, {0, 0}, {0.5, 0.5});
    });
  }

  ASSERT_TRUE(gate.wait_for(3));
  // The two losers return while the winners are still parked in transit.
  ASSERT_TRUE(eventually([&] { return center.days().active_trips() == 3; }));

  const auto parked = gate.in_transit();
  const std::set<VehicleId> distinct(parked.begin(), parked.end());
  EXPECT_EQ(parked.size(), 3u);
  EXPECT_EQ(distinct.size(), 3u);

  for (const auto& v : center.store().vehicles()) {
    EXPECT_FALSE(v.available);
    EXPECT_TRUE(v.current_rider.has_value());
  }

  gate.open();
  for (auto& t : threads) t.join();

  int completed = 0, no_vehicle = 0;
  for (const auto& r : results) {
    if (r.outcome == TripOutcome::Completed) ++completed;
    if (r.outcome == TripOutcome::NoVehicle) ++no_vehicle;
  }
  EXPECT_EQ(completed, 3);
  EXPECT_EQ(no_vehicle, 2);
  EXPECT_EQ(center.days().active_trips(), 0);
  for (const auto& v : center.store().vehicles()) EXPECT_TRUE(v.available);
}
