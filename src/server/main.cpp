#include "config/dispatch_config.hpp"
#include "engine/dispatch_center.hpp"
#include "server/dispatch_service.hpp"
#include "sim/actor_pool.hpp"
#include "sim/demo_fleet.hpp"
#include "sim/rider_actors.hpp"
#include "storage/storage.h"
#include "storage/trip_journal.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }

static void usage(const char* prog) {
  std::cerr <<
    "Usage:\n"
    "  " << prog << " [--addr host:port] [--db path] [--simulate] [--seed n] [options]\n"
    "  Options:\n"
    "    --search-radius r  --fare-per-km x  --fare-per-meter x|none  --commission f\n"
    "    --rating-min n  --rating-max n  --initial-rating x  --tracking-sample n\n"
    "    --days n  --day-ms ms  --acceleration x  --actors n\n"
    "  The server exits once the configured number of days has been closed.\n";
}

int main(int argc, char** argv) {
  std::string addr = "0.0.0.0:50051"; // 0.0.0.0 listens on all local interfaces
  std::filesystem::path db_file = std::filesystem::path("db") / "ride_dispatch.db";
  bool simulate = false;
  std::optional<uint64_t> seed;
  DispatchConfig cfg;

  // Parse command line and flags
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
      if (a == "--simulate")          { simulate = true; continue; }
      if (i + 1 >= argc)              { usage(argv[0]); return 1; }

      std::string v = argv[++i];
      if (a == "--addr")      addr = v;
      else if (a == "--db")   db_file = v;
      else if (a == "--seed") seed = std::stoull(v);
      else if (!apply_flag(cfg, a, v)) {
        std::cerr << "[SERVER] unknown option " << a << "\n";
        usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] bad option value: " << e.what() << "\n";
    return 1;
  }

  try {
    // Ensure directory exists and use a FILE path, not a directory
    std::error_code ec;
    if (db_file.has_parent_path()) std::filesystem::create_directories(db_file.parent_path(), ec);

    Storage storage(db_file.string());
    storage.init();

    DispatchCenter center(cfg);   // validates cfg
    std::cout << "[SERVER] config " << describe(center.config()) << "\n";

    TripJournal journal(storage, center);
    journal.restore();
    journal.attach();

    if (simulate && center.store().vehicle_count() == 0) {
      for (const auto& reg : demo_vehicles()) journal.affiliate_vehicle(reg);
      for (const auto& reg : demo_riders())   journal.affiliate_rider(reg);
    }

    // --- simulation driver ---------------------------------------------------
    auto sim_random = seed ? std::make_unique<MersenneRandomSource>(*seed)
                           : std::make_unique<MersenneRandomSource>();
    ActorPool   pool(static_cast<std::size_t>(center.config().max_concurrent_actors));
    RiderActors actors(center, *sim_random, pool);
    if (simulate) {
      center.days().register_open_listener([&actors](int32_t) { actors.launch_wave(); });
    }

    // --- gRPC ----------------------------------------------------------------
    DispatchServiceImpl service(center, &journal);

    grpc::ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();

    if (!server) {
      std::cerr << "[SERVER] ERROR: BuildAndStart() returned null\n";
      return 1;
    }
    if (selected_port == 0) {
      std::cerr << "[SERVER] ERROR: failed to bind " << addr << " (in use or permission issue)\n";
      return 1;
    }

    std::cout << "[SERVER] listening on " << addr << " ; db=" << db_file.string()
              << (simulate ? " ; simulation on" : "") << "\n";

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    // --- day loop ------------------------------------------------------------
    std::thread day_loop([&] {
      try {
        center.days().run(g_stop);
      } catch (const std::exception& e) {
        std::cerr << "[SERVER] day loop failed: " << e.what() << "\n";
      }
      g_stop.store(true, std::memory_order_relaxed);
    });

    std::thread stopper([&]{
      while (!g_stop.load(std::memory_order_relaxed)) std::this_thread::sleep_for(50ms);
      server->Shutdown(std::chrono::system_clock::now() + 2s);
    });

    server->Wait();
    stopper.join();
    day_loop.join();

    actors.request_stop();
    pool.stop();

    if (simulate) {
      const SimulationStats s = actors.stats();
      std::cout << "[SERVER] simulation requests=" << s.requests
                << " completed=" << s.completed
                << " no_vehicle=" << s.no_vehicle
                << " rejected=" << s.rejected
                << " failed=" << s.failed << "\n";
    }
    return 0;

  } catch (const SQLite::Exception& e) {
    std::cerr << "[SERVER] SQLite error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] Fatal error: " << e.what() << "\n";
    return 3;
  }
}
