#pragma once
#include <cmath>

struct Coord {
  double lat = 0.0;
  double lng = 0.0;
};

inline bool operator==(const Coord& a, const Coord& b) { return a.lat == b.lat && a.lng == b.lng; }
inline bool operator!=(const Coord& a, const Coord& b) { return !(a == b); }

// Planar distance on the two coordinate axes. Not geodesic: radius checks and
// fares are both expressed in this metric.
inline double planar_distance(const Coord& a, const Coord& b) {
  const double dlat = b.lat - a.lat;
  const double dlng = b.lng - a.lng;
  return std::sqrt(dlat * dlat + dlng * dlng);
}
