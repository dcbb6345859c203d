#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

struct AffiliationRules {
  std::size_t min_name_chars      = 3;
  std::size_t min_identity_digits = 5;
  std::size_t card_digits         = 16;
  std::size_t min_plate_chars     = 5;
};

struct VehicleRegistration {
  PersonId    driver_id = 0;
  std::string first_name;
  std::string last_name;
  std::string plate;
  std::string make  = "Toyota";
  std::string model = "Corolla";
  int32_t     speed_kmh = 60;
  std::optional<Coord> location;   // defaults to a configured starting point
};

struct RiderRegistration {
  PersonId    id = 0;
  std::string first_name;
  std::string last_name;
  std::string card;
  std::optional<Coord> location;
};

// Outcome of an affiliation attempt. id is the vehicle id or the rider
// identity on success.
struct Affiliation {
  bool        ok = false;
  int64_t     id = 0;
  std::string error_message;

  static Affiliation accepted(int64_t id) { return Affiliation{true, id, {}}; }
  static Affiliation rejected(std::string why) { return Affiliation{false, 0, std::move(why)}; }
};

// Format checks only (no duplicate detection). Empty string when valid.
std::string check_vehicle_registration(const VehicleRegistration& reg, const AffiliationRules& rules);
std::string check_rider_registration(const RiderRegistration& reg, const AffiliationRules& rules);

// Card with separators removed; empty when it is not exactly rules.card_digits digits.
std::string normalize_card(const std::string& raw, const AffiliationRules& rules);
