#include "config/dispatch_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

double parse_double(const std::string& name, const std::string& value) {
  try {
    std::size_t used = 0;
    const double v = std::stod(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return v;
  } catch (const std::exception&) {
    throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
  }
}

int64_t parse_int(const std::string& name, const std::string& value) {
  try {
    std::size_t used = 0;
    const long long v = std::stoll(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return static_cast<int64_t>(v);
  } catch (const std::exception&) {
    throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
  }
}

} // namespace

void DispatchConfig::validate() const {
  std::vector<std::string> errors;

  if (search_radius <= 0.0) errors.emplace_back("search radius must be > 0");
  if (fare.per_unit <= 0.0) errors.emplace_back("fare per km must be > 0");
  if (fare.per_smaller_unit && *fare.per_smaller_unit <= 0.0) errors.emplace_back("fare per meter must be > 0");
  if (fare.smaller_units_per_unit <= 0.0) errors.emplace_back("smaller units per unit must be > 0");
  if (commission_fraction < 0.0 || commission_fraction > 1.0) errors.emplace_back("commission must be within [0,1]");
  if (rating.min > rating.max) errors.emplace_back("rating min must be <= rating max");
  if (initial_rating_average < rating.min || initial_rating_average > rating.max) {
    errors.emplace_back("initial rating must lie within the rating bounds");
  }
  if (daily_tracking_sample_size < 0) errors.emplace_back("tracking sample size must be >= 0");
  if (days_to_simulate < 0) errors.emplace_back("days must be >= 0");
  if (default_vehicle_speed_kmh <= 0) errors.emplace_back("default vehicle speed must be > 0");
  if (starting_points.empty()) errors.emplace_back("at least one starting point is required");
  if (day_length_ms < 0) errors.emplace_back("day length must be >= 0");
  if (max_concurrent_actors <= 0) errors.emplace_back("actor pool size must be > 0");
  if (min_requests_per_rider < 0 || min_requests_per_rider > max_requests_per_rider) {
    errors.emplace_back("requests per rider range is invalid");
  }
  if (min_request_pause_ms < 0 || min_request_pause_ms > max_request_pause_ms) {
    errors.emplace_back("request pause range is invalid");
  }
  if (service_area.min_lat > service_area.max_lat || service_area.min_lng > service_area.max_lng) {
    errors.emplace_back("service area is empty");
  }

  if (errors.empty()) return;

  std::string msg = "invalid configuration:";
  for (const auto& e : errors) msg += "\n  - " + e;
  throw std::invalid_argument(msg);
}

bool apply_flag(DispatchConfig& cfg, const std::string& name, const std::string& value) {
  if (name == "--search-radius")      cfg.search_radius = parse_double(name, value);
  else if (name == "--fare-per-km")   cfg.fare.per_unit = parse_double(name, value);
  else if (name == "--fare-per-meter") {
    if (value == "none") cfg.fare.per_smaller_unit.reset();
    else cfg.fare.per_smaller_unit = parse_double(name, value);
  }
  else if (name == "--commission")      cfg.commission_fraction = parse_double(name, value);
  else if (name == "--rating-min")      cfg.rating.min = static_cast<int32_t>(parse_int(name, value));
  else if (name == "--rating-max")      cfg.rating.max = static_cast<int32_t>(parse_int(name, value));
  else if (name == "--initial-rating")  cfg.initial_rating_average = parse_double(name, value);
  else if (name == "--tracking-sample") cfg.daily_tracking_sample_size = static_cast<int32_t>(parse_int(name, value));
  else if (name == "--days")            cfg.days_to_simulate = static_cast<int32_t>(parse_int(name, value));
  else if (name == "--acceleration")    cfg.transit_acceleration = parse_double(name, value);
  else if (name == "--day-ms")          cfg.day_length_ms = parse_int(name, value);
  else if (name == "--actors")          cfg.max_concurrent_actors = static_cast<int32_t>(parse_int(name, value));
  else return false;
  return true;
}

std::string describe(const DispatchConfig& cfg) {
  std::ostringstream os;
  os << "radius=" << cfg.search_radius;
  if (cfg.fare.uses_smaller_unit()) os << " fare_per_meter=" << *cfg.fare.per_smaller_unit;
  else                              os << " fare_per_km=" << cfg.fare.per_unit;
  os << " commission=" << cfg.commission_fraction
     << " rating=[" << cfg.rating.min << "," << cfg.rating.max << "]"
     << " initial_rating=" << cfg.initial_rating_average
     << " tracking_sample=" << cfg.daily_tracking_sample_size
     << " days=" << cfg.days_to_simulate
     << " day_ms=" << cfg.day_length_ms
     << " actors=" << cfg.max_concurrent_actors;
  return os.str();
}
