#pragma once
#include "domain/geo.hpp"
#include "domain/ids.hpp"

#include <optional>
#include <string>

struct Rider {
  PersonId    id = kNoRider;
  std::string first_name;
  std::string last_name;
  std::string card;            // digits only

  Coord                    location;
  Coord                    destination;
  std::optional<VehicleId> assigned_vehicle;  // set iff in_trip
  bool                     in_trip = false;

  std::string full_name() const { return first_name + " " + last_name; }

  std::string masked_card() const {
    const std::string tail = card.size() >= 4 ? card.substr(card.size() - 4) : card;
    return "**** **** **** " + tail;
  }
};
