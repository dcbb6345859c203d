#include "domain/affiliation.hpp"
#include "utils/strings.hpp"

#include <string>

namespace {

std::size_t digit_count(PersonId id) {
  std::size_t n = 0;
  do { ++n; id /= 10; } while (id > 0);
  return n;
}

std::string check_identity(PersonId id, const AffiliationRules& rules) {
  if (id <= 0) return "identity must be a positive number";
  if (digit_count(id) < rules.min_identity_digits) {
    return "identity must have at least " + std::to_string(rules.min_identity_digits) + " digits";
  }
  return {};
}

std::string check_name(const std::string& first, const std::string& last, const AffiliationRules& rules) {
  const std::string full = trim(trim(first) + " " + trim(last));
  if (full.size() < rules.min_name_chars) {
    return "name must have at least " + std::to_string(rules.min_name_chars) + " characters";
  }
  return {};
}

} // namespace

std::string normalize_card(const std::string& raw, const AffiliationRules& rules) {
  std::string card = strip_card_separators(raw);
  if (card.size() != rules.card_digits || !is_all_digits(card)) return {};
  return card;
}

std::string check_vehicle_registration(const VehicleRegistration& reg, const AffiliationRules& rules) {
  if (auto why = check_identity(reg.driver_id, rules); !why.empty()) return why;
  if (auto why = check_name(reg.first_name, reg.last_name, rules); !why.empty()) return why;
  if (trim(reg.plate).size() < rules.min_plate_chars) {
    return "plate must have at least " + std::to_string(rules.min_plate_chars) + " characters";
  }
  if (reg.speed_kmh <= 0) return "speed must be > 0";
  return {};
}

std::string check_rider_registration(const RiderRegistration& reg, const AffiliationRules& rules) {
  if (auto why = check_identity(reg.id, rules); !why.empty()) return why;
  if (auto why = check_name(reg.first_name, reg.last_name, rules); !why.empty()) return why;
  if (normalize_card(reg.card, rules).empty()) {
    return "card must have exactly " + std::to_string(rules.card_digits) + " digits";
  }
  return {};
}
