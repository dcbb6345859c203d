#include <gtest/gtest.h>
#include "engine/dispatch_center.hpp"
#include "test_support.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

struct PipelineFixture : ::testing::Test {
  ScriptedRandom random{std::vector<int32_t>{4}};
  std::unique_ptr<DispatchCenter> center;

  void make(DispatchConfig cfg, TransitHook transit) {
    center = std::make_unique<DispatchCenter>(cfg, random, std::move(transit));
    ASSERT_TRUE(center->affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
    ASSERT_TRUE(center->affiliate_rider(make_rider(12345678)).ok);
    center->days().open_day();
  }
};

TEST_F(PipelineFixture, CompletedTripIsPricedAndBooked) {
  make(test_config(), no_transit());

  const TripResult r = center->request_trip(12345678, {0, 0}, {3, 4});
  ASSERT_TRUE(r.ok()) << r.error_message;
  EXPECT_EQ(r.trip.id, 1u);
  EXPECT_DOUBLE_EQ(r.trip.distance, 5.0);
  EXPECT_DOUBLE_EQ(r.trip.fare, 12.5);
  EXPECT_EQ(r.trip.rating, 4);
  EXPECT_TRUE(r.trip.completed);
  EXPECT_EQ(r.trip.day, 1);

  const auto v = center->store().vehicle(1);
  ASSERT_TRUE(v.has_value());
  EXPECT_TRUE(v->available);
  EXPECT_FALSE(v->current_rider.has_value());
  EXPECT_EQ(v->location, (Coord{3, 4}));
  EXPECT_EQ(v->trip_count, 1);
  EXPECT_DOUBLE_EQ(v->period_earnings, 12.5);

  const auto rider = center->store().rider(12345678);
  ASSERT_TRUE(rider.has_value());
  EXPECT_FALSE(rider->in_trip);
  EXPECT_EQ(rider->location, (Coord{3, 4}));

  EXPECT_EQ(center->store().completed_count(), 1u);
  EXPECT_EQ(center->days().active_trips(), 0);
}

TEST_F(PipelineFixture, TransitFaultReleasesReservation) {
  make(test_config(), [](const Trip&, std::chrono::microseconds) {
    throw std::runtime_error("engine failure");
  });

  const TripResult r = center->request_trip(12345678, {0, 0}, {1, 1});
  EXPECT_EQ(r.outcome, TripOutcome::Failed);
  EXPECT_EQ(r.error_message, "engine failure");

  const auto v = center->store().vehicle(1);
  ASSERT_TRUE(v.has_value());
  EXPECT_TRUE(v->available);
  EXPECT_FALSE(v->current_rider.has_value());
  EXPECT_EQ(v->trip_count, 0);
  EXPECT_EQ(v->location, (Coord{0, 0}));

  const auto rider = center->store().rider(12345678);
  ASSERT_TRUE(rider.has_value());
  EXPECT_FALSE(rider->in_trip);
  EXPECT_FALSE(rider->assigned_vehicle.has_value());

  EXPECT_EQ(center->store().completed_count(), 0u);
  EXPECT_EQ(center->days().active_trips(), 0);
}

TEST_F(PipelineFixture, NonStandardFaultIsContained) {
  make(test_config(), [](const Trip&, std::chrono::microseconds) {
    throw 42;
  });

  const TripResult r = center->request_trip(12345678, {0, 0}, {1, 1});
  EXPECT_EQ(r.outcome, TripOutcome::Failed);
  EXPECT_EQ(r.error_message, "unknown fault");
  EXPECT_TRUE(center->store().vehicle(1)->available);
  EXPECT_FALSE(center->store().rider(12345678)->in_trip);
  EXPECT_EQ(center->days().active_trips(), 0);

  // The rider's claim was released: a new request reaches transit again.
  const TripResult again = center->request_trip(12345678, {0, 0}, {1, 1});
  EXPECT_EQ(again.error_message, "unknown fault");
  EXPECT_GT(again.trip.id, r.trip.id);
}

TEST_F(PipelineFixture, RatingAverageStaysWithinBounds) {
  make(test_config(), no_transit());

  for (int i = 0; i < 50; ++i) {
    const TripResult r = center->request_trip(12345678, {0, 0}, {0.1 * (i % 5), 0.1});
    ASSERT_TRUE(r.ok()) << r.error_message;
  }

  const auto v = center->store().vehicle(1);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->trip_count, 50);
  const double avg = v->rating_average(center->config().initial_rating_average);
  EXPECT_GE(avg, center->config().rating.min);
  EXPECT_LE(avg, center->config().rating.max);
}

TEST(Pipeline, RatingAverageWithRealRandomness) {
  MersenneRandomSource random(7);
  DispatchCenter center(test_config(), random, no_transit());
  ASSERT_TRUE(center.affiliate_vehicle(make_vehicle(11111111, "AAA111", {0, 0})).ok);
  ASSERT_TRUE(center.affiliate_rider(make_rider(12345678)).ok);
  center.days().open_day();

  Coord at{0, 0};
  for (int i = 0; i < 200; ++i) {
    const Coord to{at.lat + 0.01, at.lng};
    ASSERT_TRUE(center.request_trip(12345678, at, to).ok());
    at = to;
  }

  const auto v = center.store().vehicle(1);
  ASSERT_TRUE(v.has_value());
  EXPECT_GE(v->rating_average(5.0), 3.0);
  EXPECT_LE(v->rating_average(5.0), 5.0);
  for (const auto& t : center.store().completed_trips()) {
    EXPECT_GE(t.rating, 3);
    EXPECT_LE(t.rating, 5);
  }
}

TEST_F(PipelineFixture, TrackingSampleIsBounded) {
  DispatchConfig cfg = test_config();
  cfg.daily_tracking_sample_size = 2;
  make(cfg, no_transit());

  std::vector<TripResult> results;
  for (int i = 0; i < 4; ++i) results.push_back(center->request_trip(12345678, {0, 0}, {1, 0}));

  EXPECT_TRUE(results[0].trip.tracked);
  EXPECT_TRUE(results[1].trip.tracked);
  EXPECT_FALSE(results[2].trip.tracked);
  EXPECT_FALSE(results[3].trip.tracked);
  EXPECT_EQ(center->store().tracking_sample().size(), 2u);
  EXPECT_EQ(center->store().completed_count(), 4u);
}

TEST_F(PipelineFixture, TripIdsIncrease) {
  make(test_config(), no_transit());
  center->store().seed_trip_ids(41);

  const TripResult a = center->request_trip(12345678, {0, 0}, {1, 0});
  const TripResult b = center->request_trip(12345678, {1, 0}, {0, 0});
  EXPECT_EQ(a.trip.id, 41u);
  EXPECT_EQ(b.trip.id, 42u);
}

TEST_F(PipelineFixture, UnknownRiderFails) {
  make(test_config(), no_transit());
  const TripResult r = center->request_trip(99999999, {0, 0}, {1, 0});
  EXPECT_EQ(r.outcome, TripOutcome::Failed);
  EXPECT_TRUE(center->store().vehicle(1)->available);
  EXPECT_EQ(center->days().active_trips(), 0);
}

TEST_F(PipelineFixture, NothingInRange) {
  make(test_config(), no_transit());
  const TripResult r = center->request_trip(12345678, {10, 10}, {11, 10});
  EXPECT_EQ(r.outcome, TripOutcome::NoVehicle);
  EXPECT_FALSE(center->store().rider(12345678)->in_trip);
}

TEST_F(PipelineFixture, ListenersSeeStartAndCompletion) {
  make(test_config(), no_transit());

  std::vector<TripEvent> events;
  center->pipeline().register_trip_listener([&](TripEvent e, const Trip&) { events.push_back(e); });
  center->pipeline().register_trip_listener([](TripEvent, const Trip&) {
    throw std::runtime_error("listener failure");
  });

  ASSERT_TRUE(center->request_trip(12345678, {0, 0}, {1, 0}).ok());
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], TripEvent::Started);
  EXPECT_EQ(events[1], TripEvent::Completed);
}

TEST(Pipeline, TransitDelayFollowsAcceleration) {
  ScriptedRandom random;
  DispatchConfig cfg = test_config();
  cfg.transit_acceleration = 3600.0;     // one simulated hour per real second
  DispatchCenter center(cfg, random, no_transit());

  // 60 units at 60 km/h is one simulated hour
  EXPECT_EQ(center.pipeline().transit_delay(60.0, 60), std::chrono::microseconds(1000000));
  EXPECT_EQ(center.pipeline().transit_delay(0.0, 60), std::chrono::microseconds(0));
}
