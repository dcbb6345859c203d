#include "server/dispatch_service.hpp"

#include "engine/dispatch_center.hpp"
#include "storage/trip_journal.hpp"
#include "utils/strings.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace rd = ride_dispatch::v1;

namespace {

void to_proto(const Coord& c, rd::Coord* out) {
  out->set_lat(c.lat);
  out->set_lng(c.lng);
}

Coord from_proto(const rd::Coord& c) { return Coord{c.lat(), c.lng()}; }

void to_proto(const Trip& t, rd::Trip* out) {
  out->set_trip_id(t.id);
  out->set_vehicle_id(t.vehicle_id);
  out->set_rider_id(t.rider_id);
  to_proto(t.origin, out->mutable_origin());
  to_proto(t.destination, out->mutable_destination());
  out->set_distance(t.distance);
  out->set_fare(t.fare);
  out->set_rating(t.rating);
  out->set_day(t.day);
  out->set_completed(t.completed);
  out->set_tracked(t.tracked);
  out->set_started_ms(t.started_ms);
  out->set_completed_ms(t.completed_ms);
}

rd::TripOutcome to_proto(TripOutcome o) {
  switch (o) {
    case TripOutcome::Completed: return rd::COMPLETED;
    case TripOutcome::NoVehicle: return rd::NO_VEHICLE;
    case TripOutcome::Rejected:  return rd::REJECTED;
    case TripOutcome::Failed:    return rd::FAILED;
  }
  return rd::TRIP_OUTCOME_UNSPECIFIED;
}

void fill(const Affiliation& a, rd::AffiliationResponse* resp) {
  resp->set_success(a.ok);
  resp->set_id(a.id);
  if (!a.ok) resp->set_error_message(a.error_message);
}

int64_t elapsed_us(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0).count();
}

} // namespace

// ============================= Impl =============================
struct DispatchServiceImpl::Impl {
  Impl(DispatchCenter& c, TripJournal* j) : center(c), journal(j) {}

  DispatchCenter& center;
  TripJournal*    journal;   // optional

  Affiliation affiliate(const VehicleRegistration& reg) {
    return journal ? journal->affiliate_vehicle(reg) : center.affiliate_vehicle(reg);
  }
  Affiliation affiliate(const RiderRegistration& reg) {
    return journal ? journal->affiliate_rider(reg) : center.affiliate_rider(reg);
  }
};

// ========================== API surface =========================
DispatchServiceImpl::DispatchServiceImpl(DispatchCenter& center, TripJournal* journal)
  : d_(std::make_unique<Impl>(center, journal)) {}

DispatchServiceImpl::~DispatchServiceImpl() = default;

// RPC: AffiliateVehicle(AffiliateVehicleRequest) -> AffiliationResponse
grpc::Status DispatchServiceImpl::AffiliateVehicle(
    grpc::ServerContext* ctx,
    const rd::AffiliateVehicleRequest* req,
    rd::AffiliationResponse* resp) {

  const auto t0   = std::chrono::steady_clock::now();
  const auto peer = ctx ? ctx->peer() : "unknown";

  std::cout << "[SERVER] [AffiliateVehicle] peer=" << peer
            << " driver=" << req->driver_id()
            << " plate="  << req->plate()
            << " make="   << req->make()
            << " model="  << req->model()
            << "\n";

  // --- registration -------------------------------------------------------
  VehicleRegistration reg;
  reg.driver_id  = req->driver_id();
  reg.first_name = req->first_name();
  reg.last_name  = req->last_name();
  reg.plate      = req->plate();
  if (!req->make().empty())  reg.make  = req->make();
  if (!req->model().empty()) reg.model = req->model();
  reg.speed_kmh  = req->speed_kmh() > 0 ? req->speed_kmh() : d_->center.config().default_vehicle_speed_kmh;
  if (req->has_location()) reg.location = from_proto(req->location());

  const Affiliation a = d_->affiliate(reg);
  fill(a, resp);
  if (!a.ok) {
    std::cerr << "[SERVER] [AffiliateVehicle][reject] driver=" << req->driver_id()
              << " reason=" << a.error_message << "\n";
  } else {
    std::cout << "[SERVER] [AffiliateVehicle][ok] vehicle=" << a.id << "\n";
  }

  std::cout << "[SERVER] [AffiliateVehicle] driver=" << req->driver_id() << " done in " << elapsed_us(t0) << "us\n";
  return grpc::Status::OK;
}

// RPC: AffiliateRider(AffiliateRiderRequest) -> AffiliationResponse
grpc::Status DispatchServiceImpl::AffiliateRider(
    grpc::ServerContext* ctx,
    const rd::AffiliateRiderRequest* req,
    rd::AffiliationResponse* resp) {

  const auto t0   = std::chrono::steady_clock::now();
  const auto peer = ctx ? ctx->peer() : "unknown";

  std::cout << "[SERVER] [AffiliateRider] peer=" << peer << " rider=" << req->rider_id() << "\n";

  RiderRegistration reg;
  reg.id         = req->rider_id();
  reg.first_name = req->first_name();
  reg.last_name  = req->last_name();
  reg.card       = req->card();
  if (req->has_location()) reg.location = from_proto(req->location());

  const Affiliation a = d_->affiliate(reg);
  fill(a, resp);
  if (!a.ok) {
    std::cerr << "[SERVER] [AffiliateRider][reject] rider=" << req->rider_id()
              << " reason=" << a.error_message << "\n";
  } else {
    std::cout << "[SERVER] [AffiliateRider][ok] rider=" << a.id << "\n";
  }

  std::cout << "[SERVER] [AffiliateRider] rider=" << req->rider_id() << " done in " << elapsed_us(t0) << "us\n";
  return grpc::Status::OK;
}

// RPC: RequestTrip(TripRequest) -> TripResponse
// Blocks for the whole simulated trip.
grpc::Status DispatchServiceImpl::RequestTrip(
    grpc::ServerContext* ctx,
    const rd::TripRequest* req,
    rd::TripResponse* resp) {

  const auto t0   = std::chrono::steady_clock::now();
  const auto peer = ctx ? ctx->peer() : "unknown";

  std::cout << "[SERVER] [RequestTrip] ============================================================= New Trip\n"
            << " peer="   << peer
            << " rider="  << req->rider_id()
            << " origin=(" << req->origin().lat() << "," << req->origin().lng() << ")"
            << " dest=("   << req->destination().lat() << "," << req->destination().lng() << ")"
            << std::endl;

  // --- validation ---------------------------------------------------------
  if (req->rider_id() <= 0) {
    resp->set_success(false);
    resp->set_outcome(rd::FAILED);
    resp->set_error_message("rider_id must be > 0");
    std::cerr << "[SERVER] [RequestTrip][reject] reason=non_positive_rider rider=" << req->rider_id() << "\n";
    return grpc::Status::OK;
  }
  if (!req->has_origin() || !req->has_destination()) {
    resp->set_success(false);
    resp->set_outcome(rd::FAILED);
    resp->set_error_message("origin and destination are required");
    std::cerr << "[SERVER] [RequestTrip][reject] reason=missing_route rider=" << req->rider_id() << "\n";
    return grpc::Status::OK;
  }

  // --- dispatch -----------------------------------------------------------
  const TripResult r = d_->center.request_trip(req->rider_id(),
                                               from_proto(req->origin()),
                                               from_proto(req->destination()));

  resp->set_success(r.ok());
  resp->set_outcome(to_proto(r.outcome));
  if (r.trip.id != 0) to_proto(r.trip, resp->mutable_trip());
  if (!r.ok()) {
    resp->set_error_message(r.error_message);
    std::cerr << "[SERVER] [RequestTrip][reject] rider=" << req->rider_id()
              << " outcome=" << to_string(r.outcome) << " reason=" << r.error_message << "\n";
  } else {
    std::cout << "[SERVER] [RequestTrip][ok] trip=" << r.trip.id
              << " vehicle=" << r.trip.vehicle_id
              << " fare=" << format_money(r.trip.fare) << "\n";
  }

  std::cout << "[SERVER] [RequestTrip] rider=" << req->rider_id() << " done in " << elapsed_us(t0) << "us\n";
  return grpc::Status::OK;
}

// RPC: GetSnapshot(SnapshotRequest) -> SnapshotResponse
grpc::Status DispatchServiceImpl::GetSnapshot(
    grpc::ServerContext*,
    const rd::SnapshotRequest*,
    rd::SnapshotResponse* resp) {

  const LiveSnapshot snap = d_->center.snapshot();
  resp->set_generated_ms(snap.generated_ms);

  for (const auto& v : snap.vehicles) {
    auto* out = resp->add_vehicles();
    out->set_vehicle_id(v.id);
    out->set_plate(v.plate);
    out->set_driver_name(v.driver_name);
    to_proto(v.location, out->mutable_location());
    out->set_available(v.available);
    out->set_current_rider(v.current_rider.value_or(kNoRider));
  }
  for (const auto& r : snap.riders_in_trip) {
    auto* out = resp->add_riders_in_trip();
    out->set_rider_id(r.id);
    out->set_name(r.name);
    to_proto(r.location, out->mutable_location());
    to_proto(r.destination, out->mutable_destination());
    out->set_assigned_vehicle(r.assigned_vehicle.value_or(kNoVehicle));
  }
  return grpc::Status::OK;
}

// RPC: GetDailyReports(DailyReportsRequest) -> DailyReportsResponse
grpc::Status DispatchServiceImpl::GetDailyReports(
    grpc::ServerContext*,
    const rd::DailyReportsRequest*,
    rd::DailyReportsResponse* resp) {

  auto& days = d_->center.days();
  for (const auto& report : days.reports()) {
    auto* out = resp->add_reports();
    out->set_day(report.day);
    for (const auto& t : report.tracked_trips) to_proto(t, out->add_tracked_trips());
    out->set_tracked_revenue(report.tracked_revenue);
    for (const auto& s : report.settlements) {
      auto* line = out->add_settlements();
      line->set_vehicle_id(s.vehicle_id);
      line->set_plate(s.plate);
      line->set_driver_name(s.driver_name);
      line->set_period_earnings(s.period_earnings);
      line->set_commission(s.commission);
      line->set_driver_net(s.driver_net);
    }
    out->set_operator_day_total(report.operator_day_total);
    out->set_operator_total(report.operator_total);
    out->set_closed_ms(report.closed_ms);
  }
  resp->set_operator_total(days.operator_total());
  resp->set_current_day(days.current_day());
  resp->set_phase(to_string(days.phase()));
  return grpc::Status::OK;
}
