#pragma once
#include "domain/affiliation.hpp"

#include <vector>

// Stock registrations used to populate an empty database for a simulation run.
std::vector<VehicleRegistration> demo_vehicles();
std::vector<RiderRegistration>   demo_riders();
