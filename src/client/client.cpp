#include <grpcpp/grpcpp.h>
#include "ride_dispatch.grpc.pb.h"
#include "ride_dispatch.pb.h"
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

namespace rd = ride_dispatch::v1;

static void usage(const char* prog) {
    std::cerr <<
      "Usage:\n"
      "  " << prog << " <addr> vehicle <driver_id> <first> <last> <plate> [make] [model] [speed_kmh]\n"
      "  " << prog << " <addr> rider <rider_id> <first> <last> <card>\n"
      "  " << prog << " <addr> trip <rider_id> <from_lat> <from_lng> <to_lat> <to_lng>\n"
      "  " << prog << " <addr> snapshot\n"
      "  " << prog << " <addr> reports\n"
      "  Example:\n"
      "  " << prog << " localhost:50051 vehicle 11111111 Carlos Ramirez ABC123 Toyota Corolla 60\n"
      "  " << prog << " localhost:50051 rider 12345678 Juan Perez 4532123456789012\n"
      "  " << prog << " localhost:50051 trip 12345678 40.4178 -3.7094 40.4300 -3.6900\n";
}

static std::string money(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.2f", v);
    return buf;
}

static int check(const grpc::Status& status) {
    if (!status.ok()) {
        std::cerr << "[client] RPC failed: " << status.error_code() << " - " << status.error_message() << "\n";
        return 2;
    }
    return 0;
}

static int report_affiliation(const rd::AffiliationResponse& resp, const char* what) {
    if (!resp.success()) {
        std::cerr << "[client] rejected: " << resp.error_message() << "\n";
        return 3;
    }
    std::cout << "[client] accepted " << what << " id=" << resp.id() << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3) { usage(argv[0]); return 1; }

    std::string addr = argv[1];
    std::string cmd  = argv[2];

    // InsecureChannelCredentials() is fine for local dev. For anything else, switch to TLS
    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    std::unique_ptr<rd::Dispatch::Stub> stub = rd::Dispatch::NewStub(channel);

    try {
        if (cmd == "vehicle" && argc >= 7) {
            rd::AffiliateVehicleRequest req;
            req.set_driver_id(std::stoll(argv[3]));
            req.set_first_name(argv[4]);
            req.set_last_name(argv[5]);
            req.set_plate(argv[6]);
            if (argc > 7) req.set_make(argv[7]);
            if (argc > 8) req.set_model(argv[8]);
            if (argc > 9) req.set_speed_kmh(std::stoi(argv[9]));

            grpc::ClientContext ctx;
            rd::AffiliationResponse resp;
            if (int rc = check(stub->AffiliateVehicle(&ctx, req, &resp))) return rc;
            return report_affiliation(resp, "vehicle");
        }

        if (cmd == "rider" && argc >= 7) {
            rd::AffiliateRiderRequest req;
            req.set_rider_id(std::stoll(argv[3]));
            req.set_first_name(argv[4]);
            req.set_last_name(argv[5]);
            req.set_card(argv[6]);

            grpc::ClientContext ctx;
            rd::AffiliationResponse resp;
            if (int rc = check(stub->AffiliateRider(&ctx, req, &resp))) return rc;
            return report_affiliation(resp, "rider");
        }

        if (cmd == "trip" && argc >= 8) {
            rd::TripRequest req;
            req.set_rider_id(std::stoll(argv[3]));
            req.mutable_origin()->set_lat(std::stod(argv[4]));
            req.mutable_origin()->set_lng(std::stod(argv[5]));
            req.mutable_destination()->set_lat(std::stod(argv[6]));
            req.mutable_destination()->set_lng(std::stod(argv[7]));

            grpc::ClientContext ctx;
            rd::TripResponse resp;
            if (int rc = check(stub->RequestTrip(&ctx, req, &resp))) return rc;
            if (!resp.success()) {
                std::cerr << "[client] trip " << rd::TripOutcome_Name(resp.outcome())
                          << ": " << resp.error_message() << "\n";
                return 3;
            }
            const auto& t = resp.trip();
            std::cout << "[client] trip=" << t.trip_id()
                      << " vehicle=" << t.vehicle_id()
                      << " distance=" << t.distance()
                      << " fare=" << money(t.fare())
                      << " rating=" << t.rating()
                      << " day=" << t.day() << "\n";
            return 0;
        }

        if (cmd == "snapshot") {
            grpc::ClientContext ctx;
            rd::SnapshotRequest req;
            rd::SnapshotResponse resp;
            if (int rc = check(stub->GetSnapshot(&ctx, req, &resp))) return rc;

            std::cout << "[client] snapshot at " << resp.generated_ms() << "\n";
            for (const auto& v : resp.vehicles()) {
                std::cout << "  vehicle=" << v.vehicle_id()
                          << " plate=" << v.plate()
                          << " driver=" << v.driver_name()
                          << " at=(" << v.location().lat() << "," << v.location().lng() << ")"
                          << (v.available() ? " free" : " busy rider=" + std::to_string(v.current_rider()))
                          << "\n";
            }
            for (const auto& r : resp.riders_in_trip()) {
                std::cout << "  rider=" << r.rider_id()
                          << " name=" << r.name()
                          << " vehicle=" << r.assigned_vehicle()
                          << " to=(" << r.destination().lat() << "," << r.destination().lng() << ")\n";
            }
            return 0;
        }

        if (cmd == "reports") {
            grpc::ClientContext ctx;
            rd::DailyReportsRequest req;
            rd::DailyReportsResponse resp;
            if (int rc = check(stub->GetDailyReports(&ctx, req, &resp))) return rc;

            std::cout << "[client] day=" << resp.current_day() << " phase=" << resp.phase()
                      << " operator_total=" << money(resp.operator_total()) << "\n";
            for (const auto& r : resp.reports()) {
                std::cout << "  day " << r.day()
                          << ": tracked=" << r.tracked_trips_size()
                          << " revenue=" << money(r.tracked_revenue())
                          << " commission=" << money(r.operator_day_total()) << "\n";
                for (const auto& s : r.settlements()) {
                    std::cout << "    " << s.plate() << " " << s.driver_name()
                              << " earned=" << money(s.period_earnings())
                              << " commission=" << money(s.commission())
                              << " net=" << money(s.driver_net()) << "\n";
                }
            }
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "[client] bad argument: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
