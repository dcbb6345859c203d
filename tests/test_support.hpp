#pragma once
#include "config/dispatch_config.hpp"
#include "domain/affiliation.hpp"
#include "engine/random_source.hpp"
#include "engine/trip_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Replays a fixed list of integers (clamped to the requested range, cycling
// when exhausted). uniform_real always returns the low end.
class ScriptedRandom final : public RandomSource {
public:
  explicit ScriptedRandom(std::vector<int32_t> ints = {}) : ints_(std::move(ints)) {}

  int32_t uniform_int(int32_t lo, int32_t hi) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (ints_.empty()) return hi;
    const int32_t v = ints_[next_++ % ints_.size()];
    return std::clamp(v, lo, hi);
  }

  double uniform_real(double lo, double) override { return lo; }

private:
  std::mutex           mu_;
  std::vector<int32_t> ints_;
  std::size_t          next_ = 0;
};

inline TransitHook no_transit() {
  return [](const Trip&, std::chrono::microseconds) {};
}

// Holds every trip in transit until open() is called.
class TransitGate {
public:
  TransitHook hook() {
    return [this](const Trip& trip, std::chrono::microseconds) {
      std::unique_lock<std::mutex> lk(mu_);
      in_transit_.push_back(trip.vehicle_id);
      changed_.notify_all();
      changed_.wait(lk, [this] { return open_; });
    };
  }

  void open() {
    std::lock_guard<std::mutex> lk(mu_);
    open_ = true;
    changed_.notify_all();
  }

  // True once n trips are parked at the gate.
  bool wait_for(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    std::unique_lock<std::mutex> lk(mu_);
    return changed_.wait_for(lk, timeout, [&] { return in_transit_.size() >= n; });
  }

  std::vector<VehicleId> in_transit() {
    std::lock_guard<std::mutex> lk(mu_);
    return in_transit_;
  }

private:
  std::mutex              mu_;
  std::condition_variable changed_;
  bool                    open_ = false;
  std::vector<VehicleId>  in_transit_;
};

inline DispatchConfig test_config() {
  DispatchConfig cfg;
  cfg.transit_acceleration = 0.0;
  cfg.day_length_ms        = 20;
  return cfg;
}

inline VehicleRegistration make_vehicle(PersonId driver, const std::string& plate, Coord at) {
  VehicleRegistration reg;
  reg.driver_id  = driver;
  reg.first_name = "Driver";
  reg.last_name  = std::to_string(driver);
  reg.plate      = plate;
  reg.location   = at;
  return reg;
}

inline RiderRegistration make_rider(PersonId id, const std::string& card = "4532123456789012") {
  RiderRegistration reg;
  reg.id         = id;
  reg.first_name = "Rider";
  reg.last_name  = std::to_string(id);
  reg.card       = card;
  return reg;
}

// Polls pred for up to timeout.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}
