#include "domain/report.hpp"
#include "utils/strings.hpp"

#include <iomanip>
#include <ios>
#include <ostream>
#include <string>

namespace {

const std::string kRule(60, '=');
const std::string kThinRule(60, '-');

int percent(double fraction) { return static_cast<int>(fraction * 100.0 + 0.5); }

} // namespace

void print_daily_report(std::ostream& os, const DailyReport& report) {
  std::ios saved(nullptr);
  saved.copyfmt(os);

  os << kRule << "\n"
     << "DAY " << report.day << " REPORT\n"
     << kRule << "\n";

  if (report.tracked_trips.empty()) {
    os << "no tracked trips today\n";
  } else {
    int n = 1;
    for (const auto& t : report.tracked_trips) {
      os << std::fixed << std::setprecision(4)
         << n++ << ". trip #" << t.id << " vehicle=" << t.vehicle_id << " rider=" << t.rider_id << "\n"
         << "   origin=(" << t.origin.lat << ", " << t.origin.lng << ")"
         << " destination=(" << t.destination.lat << ", " << t.destination.lng << ")\n"
         << std::setprecision(2)
         << "   distance=" << t.distance << " fare=" << format_money(t.fare)
         << " rating=" << t.rating << "\n";
    }
  }
  os << "tracked revenue: " << format_money(report.tracked_revenue) << "\n"
     << kThinRule << "\n"
     << "SETTLEMENT\n";

  for (const auto& s : report.settlements) {
    os << "vehicle " << s.vehicle_id << " " << s.plate << " (" << s.driver_name << ")"
       << " generated=" << format_money(s.period_earnings)
       << " commission=" << format_money(s.commission)
       << " driver=" << format_money(s.driver_net) << "\n";
  }
  os << "operator day total: " << format_money(report.operator_day_total) << "\n"
     << "operator cumulative: " << format_money(report.operator_total) << "\n"
     << kRule << "\n";
  os.copyfmt(saved);
}

void print_final_report(std::ostream& os, const FinalReport& report, double commission_fraction) {
  std::ios saved(nullptr);
  saved.copyfmt(os);

  os << kRule << "\n"
     << "FINAL REPORT (" << report.days_closed << " days)\n"
     << kRule << "\n";

  for (const auto& v : report.vehicles) {
    os << "vehicle " << v.vehicle_id << " :: " << v.driver_name << "\n"
       << "plate " << v.plate << " :: " << v.make << " " << v.model << "\n"
       << "generated: " << format_money(v.total_earnings) << "\n"
       << "commission (" << percent(commission_fraction) << "%): " << format_money(v.commission) << "\n"
       << "driver (" << percent(1.0 - commission_fraction) << "%): " << format_money(v.driver_net) << "\n"
       << "trips: " << v.trip_count
       << " rating: " << std::fixed << std::setprecision(2) << v.rating_average << "\n"
       << kThinRule << "\n";
  }
  os << "operator total: " << format_money(report.operator_total) << "\n"
     << "completed trips: " << report.completed_trips << "\n"
     << "riders served: " << report.distinct_riders << "\n"
     << "vehicles with trips: " << report.vehicles_with_trips << "\n"
     << kRule << "\n";
  os.copyfmt(saved);
}
