#include "sim/demo_fleet.hpp"

namespace {

VehicleRegistration vehicle(PersonId driver, const char* first, const char* last,
                            const char* plate, const char* make, const char* model, int32_t speed) {
  VehicleRegistration reg;
  reg.driver_id  = driver;
  reg.first_name = first;
  reg.last_name  = last;
  reg.plate      = plate;
  reg.make       = make;
  reg.model      = model;
  reg.speed_kmh  = speed;
  return reg;
}

RiderRegistration rider(PersonId id, const char* first, const char* last, const char* card) {
  RiderRegistration reg;
  reg.id         = id;
  reg.first_name = first;
  reg.last_name  = last;
  reg.card       = card;
  return reg;
}

} // namespace

std::vector<VehicleRegistration> demo_vehicles() {
  return {
      vehicle(11111111, "Carlos", "Ramirez Lopez",   "ABC123", "Toyota",  "Corolla", 60),
      vehicle(22222222, "Lucia",  "Fernandez Garcia", "XYZ789", "Seat",    "Leon",    55),
      vehicle(33333333, "Juan",   "Perez Martin",    "DEF456", "Skoda",   "Octavia", 65),
      vehicle(44444444, "Miguel", "Torres Sanchez",  "GHI789", "Hyundai", "Ioniq",   50),
      vehicle(55555555, "Maria",  "Lopez Ruiz",      "JKL012", "Toyota",  "Prius",   60),
  };
}

std::vector<RiderRegistration> demo_riders() {
  return {
      rider(12345678, "Juan",   "Perez Garcia",     "4532 1234 5678 9012"),
      rider(87654321, "Maria",  "Lopez Sanchez",    "4532-1234-5678-9013"),
      rider(11223344, "Pedro",  "Martinez Ruiz",    "4532123456789014"),
      rider(55667788, "Laura",  "Fernandez Torres", "4532123456789015"),
      rider(99887766, "Carlos", "Gomez Diaz",       "4532123456789016"),
      rider(44556677, "Ana",    "Rodriguez Castro", "4532123456789017"),
      rider(33445566, "David",  "Jimenez Moreno",   "4532123456789018"),
      rider(22334455, "Isabel", "Navarro Herrera",  "4532123456789019"),
  };
}
