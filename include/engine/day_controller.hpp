#pragma once
#include "domain/report.hpp"
#include "engine/entity_store.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

enum class DayPhase { Idle, Open, Draining, Closed, Finished };

const char* to_string(DayPhase phase);

// Opens and closes operating days. activate_trip() is the admission gate for
// new trips; close_day() stops admission, waits until every admitted trip has
// called deactivate_trip(), and only then reports and settles.
class DayController {
public:
  using OpenListener  = std::function<void(int32_t day)>;
  using CloseListener = std::function<void(const DailyReport&)>;

  explicit DayController(EntityStore& store);

  DayController(const DayController&)            = delete;
  DayController& operator=(const DayController&) = delete;

  // Throws std::logic_error once finished.
  void open_day();

  // False (and nothing counted) once the day is ending.
  bool activate_trip();
  void deactivate_trip();

  // Blocks until no trip is active. Throws std::logic_error unless the day is open.
  DailyReport close_day();

  FinalReport finish();

  // Drives open / wait day_length_ms / close for days_to_simulate days, then
  // finish(). Setting stop ends the current day early.
  FinalReport run(const std::atomic<bool>& stop);

  int32_t  current_day() const;
  DayPhase phase() const;
  int32_t  active_trips() const;
  bool     day_ending() const;
  double   operator_total() const;
  std::vector<DailyReport> reports() const;

  void register_open_listener(OpenListener listener);
  void register_close_listener(CloseListener listener);

private:
  void notify_opened_(int32_t day);
  void notify_closed_(const DailyReport& report);

  EntityStore& store_;

  // admission state
  mutable std::mutex      day_mu_;
  std::condition_variable quiescent_cv_;
  bool     ending_ = false;
  int32_t  active_ = 0;
  DayPhase phase_  = DayPhase::Idle;
  int32_t  day_    = 1;

  std::mutex close_mu_;   // one closer at a time

  // accounting
  mutable std::mutex       accounts_mu_;
  double                   operator_total_ = 0.0;
  std::vector<DailyReport> reports_;

  std::mutex                 listeners_mu_;
  std::vector<OpenListener>  open_listeners_;
  std::vector<CloseListener> close_listeners_;
};
