#include "engine/day_controller.hpp"
#include "utils/clock.hpp"

#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

const char* to_string(DayPhase phase) {
  switch (phase) {
    case DayPhase::Idle:     return "idle";
    case DayPhase::Open:     return "open";
    case DayPhase::Draining: return "draining";
    case DayPhase::Closed:   return "closed";
    case DayPhase::Finished: return "finished";
  }
  return "unknown";
}

DayController::DayController(EntityStore& store) : store_(store) {}

// -------------------- admission --------------------

void DayController::open_day() {
  int32_t day = 0;
  {
    std::lock_guard<std::mutex> lk(day_mu_);
    if (phase_ == DayPhase::Finished) throw std::logic_error("cannot open a day after finish()");
    ending_ = false;
    phase_  = DayPhase::Open;
    day     = day_;
  }
  std::cout << "[DAY] day=" << day << " open at " << now_epoch_ms() << "\n";
  notify_opened_(day);
}

bool DayController::activate_trip() {
  std::lock_guard<std::mutex> lk(day_mu_);
  if (ending_) return false;
  ++active_;
  return true;
}

void DayController::deactivate_trip() {
  bool underflow = false;
  {
    std::lock_guard<std::mutex> lk(day_mu_);
    if (active_ == 0) {
      underflow = true;
    } else {
      --active_;
      if (active_ == 0 && ending_) quiescent_cv_.notify_all();
    }
  }
  if (underflow) std::cerr << "[DAY][error] deactivate_trip() without a matching activate_trip()\n";
}

// -------------------- close --------------------

DailyReport DayController::close_day() {
  std::lock_guard<std::mutex> closing(close_mu_);

  DailyReport report;
  int32_t in_flight = 0;
  {
    std::lock_guard<std::mutex> lk(day_mu_);
    if (phase_ != DayPhase::Open) {
      throw std::logic_error(std::string("close_day() while day is ") + to_string(phase_));
    }
    ending_    = true;
    phase_     = DayPhase::Draining;
    report.day = day_;
    in_flight  = active_;
  }

  if (in_flight > 0) {
    std::cout << "[DAY] day=" << report.day << " waiting for " << in_flight << " active trips\n";
    std::unique_lock<std::mutex> lk(day_mu_);
    quiescent_cv_.wait(lk, [this] { return active_ == 0; });
  }

  // Admission is closed and nothing is in flight: safe to report and settle.
  const double fraction = store_.config().commission_fraction;

  report.tracked_trips = store_.drain_tracking();
  for (const auto& t : report.tracked_trips) report.tracked_revenue += t.fare;

  report.settlements = store_.settle_period(fraction);
  for (const auto& s : report.settlements) report.operator_day_total += s.commission;
  report.closed_ms = now_epoch_ms();

  {
    std::lock_guard<std::mutex> lk(accounts_mu_);
    operator_total_      += report.operator_day_total;
    report.operator_total = operator_total_;
    reports_.push_back(report);
  }
  {
    std::lock_guard<std::mutex> lk(day_mu_);
    ++day_;
    phase_ = DayPhase::Closed;
  }

  print_daily_report(std::cout, report);
  notify_closed_(report);
  return report;
}

FinalReport DayController::finish() {
  {
    std::lock_guard<std::mutex> lk(day_mu_);
    if (phase_ == DayPhase::Open || phase_ == DayPhase::Draining) {
      throw std::logic_error("finish() while a day is still open");
    }
    ending_ = true;
    phase_  = DayPhase::Finished;
  }

  const double fraction = store_.config().commission_fraction;
  const double initial  = store_.config().initial_rating_average;

  FinalReport final_report;
  for (const auto& v : store_.vehicles()) {
    if (v.trip_count == 0) continue;
    VehicleSummary s;
    s.vehicle_id     = v.id;
    s.driver_name    = v.driver_name();
    s.plate          = v.plate;
    s.make           = v.make;
    s.model          = v.model;
    s.total_earnings = v.total_earnings;
    s.commission     = v.commission_on_total(fraction);
    s.driver_net     = v.net_total(fraction);
    s.trip_count     = v.trip_count;
    s.rating_average = v.rating_average(initial);
    final_report.vehicles.push_back(std::move(s));
  }
  final_report.vehicles_with_trips = final_report.vehicles.size();

  std::set<PersonId> riders;
  const auto ledger = store_.completed_trips();
  for (const auto& t : ledger) riders.insert(t.rider_id);
  final_report.completed_trips = ledger.size();
  final_report.distinct_riders = riders.size();

  {
    std::lock_guard<std::mutex> lk(accounts_mu_);
    final_report.operator_total = operator_total_;
    final_report.days_closed    = static_cast<int32_t>(reports_.size());
  }

  print_final_report(std::cout, final_report, fraction);
  return final_report;
}

FinalReport DayController::run(const std::atomic<bool>& stop) {
  const auto& cfg = store_.config();
  for (int32_t d = 0; d < cfg.days_to_simulate && !stop.load(std::memory_order_relaxed); ++d) {
    open_day();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.day_length_ms);
    while (!stop.load(std::memory_order_relaxed) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }

    close_day();
  }
  return finish();
}

// -------------------- accessors --------------------

int32_t DayController::current_day() const {
  std::lock_guard<std::mutex> lk(day_mu_);
  return day_;
}

DayPhase DayController::phase() const {
  std::lock_guard<std::mutex> lk(day_mu_);
  return phase_;
}

int32_t DayController::active_trips() const {
  std::lock_guard<std::mutex> lk(day_mu_);
  return active_;
}

bool DayController::day_ending() const {
  std::lock_guard<std::mutex> lk(day_mu_);
  return ending_;
}

double DayController::operator_total() const {
  std::lock_guard<std::mutex> lk(accounts_mu_);
  return operator_total_;
}

std::vector<DailyReport> DayController::reports() const {
  std::lock_guard<std::mutex> lk(accounts_mu_);
  return reports_;
}

// -------------------- listeners --------------------

void DayController::register_open_listener(OpenListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  open_listeners_.push_back(std::move(listener));
}

void DayController::register_close_listener(CloseListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  close_listeners_.push_back(std::move(listener));
}

void DayController::notify_opened_(int32_t day) {
  std::vector<OpenListener> copy;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (open_listeners_.empty()) return;
    copy = open_listeners_;
  }

  for (auto& listener : copy) {
    try {
      listener(day);
    } catch (const std::exception& e) {
      std::cerr << "[DAY][error] day=" << day << " open listener failed: " << e.what() << "\n";
    }
  }
}

void DayController::notify_closed_(const DailyReport& report) {
  std::vector<CloseListener> copy;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    if (close_listeners_.empty()) return;
    copy = close_listeners_;
  }

  for (auto& listener : copy) {
    try {
      listener(report);
    } catch (const std::exception& e) {
      std::cerr << "[DAY][error] day=" << report.day << " close listener failed: " << e.what() << "\n";
    }
  }
}
