#pragma once
#include "domain/ids.hpp"
#include "domain/trip.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// One vehicle's share of a day close.
struct SettlementLine {
  VehicleId   vehicle_id = kNoVehicle;
  std::string plate;
  std::string driver_name;
  double      period_earnings = 0.0;
  double      commission = 0.0;
  double      driver_net = 0.0;
};

struct DailyReport {
  int32_t                     day = 0;
  std::vector<Trip>           tracked_trips;
  double                      tracked_revenue = 0.0;   // sum of tracked fares
  std::vector<SettlementLine> settlements;
  double                      operator_day_total = 0.0;
  double                      operator_total = 0.0;    // cumulative after this day
  int64_t                     closed_ms = 0;
};

struct VehicleSummary {
  VehicleId   vehicle_id = kNoVehicle;
  std::string driver_name;
  std::string plate;
  std::string make;
  std::string model;
  double      total_earnings = 0.0;
  double      commission = 0.0;
  double      driver_net = 0.0;
  int64_t     trip_count = 0;
  double      rating_average = 0.0;
};

// End-of-run statement covering every closed day.
struct FinalReport {
  std::vector<VehicleSummary> vehicles;     // only vehicles with trips
  double                      operator_total = 0.0;
  std::size_t                 completed_trips = 0;
  std::size_t                 distinct_riders = 0;
  std::size_t                 vehicles_with_trips = 0;
  int32_t                     days_closed = 0;
};

void print_daily_report(std::ostream& os, const DailyReport& report);
void print_final_report(std::ostream& os, const FinalReport& report, double commission_fraction);
