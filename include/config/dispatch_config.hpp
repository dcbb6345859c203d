#pragma once
#include "domain/affiliation.hpp"
#include "domain/fare.hpp"
#include "domain/geo.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct RatingBounds {
  int32_t min = 3;
  int32_t max = 5;
};

// Rectangle riders are spawned in by the simulation driver.
struct ServiceArea {
  double min_lat = 40.39;
  double max_lat = 40.45;
  double min_lng = -3.75;
  double max_lng = -3.65;
};

// Explicit configuration value handed to the store, pipeline and day
// controller at construction. Defaults reproduce the stock operator setup.
struct DispatchConfig {
  // --- dispatch ---
  double       search_radius = 2.0;
  FarePolicy   fare;
  double       commission_fraction = 0.20;
  RatingBounds rating;
  double       initial_rating_average = 5.0;
  int32_t      daily_tracking_sample_size = 5;
  int32_t      days_to_simulate = 2;

  // 1 real second == transit_acceleration simulated seconds; <= 0 disables the delay
  double  transit_acceleration = 1000.0;
  int32_t default_vehicle_speed_kmh = 60;

  AffiliationRules   affiliation;
  std::vector<Coord> starting_points = {
      {40.4178, -3.7094}, {40.4234, -3.7109}, {40.4153, -3.6840}, {40.4050, -3.7026},
      {40.4306, -3.7162}, {40.4200, -3.7100}, {40.4100, -3.6900}, {40.4250, -3.6850},
  };

  // --- simulation driver ---
  int64_t     day_length_ms = 6000;
  int32_t     max_concurrent_actors = 20;
  int32_t     min_requests_per_rider = 1;
  int32_t     max_requests_per_rider = 3;
  int64_t     min_request_pause_ms = 100;
  int64_t     max_request_pause_ms = 500;
  ServiceArea service_area;

  // Throws std::invalid_argument naming every violated rule.
  void validate() const;
};

// Applies one "--name value" override. Returns false for an unknown name and
// throws std::invalid_argument for a malformed value.
bool apply_flag(DispatchConfig& cfg, const std::string& name, const std::string& value);

// One-line summary for startup logs.
std::string describe(const DispatchConfig& cfg);
