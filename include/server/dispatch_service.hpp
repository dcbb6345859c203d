#pragma once
#include <grpcpp/grpcpp.h>
#include "ride_dispatch.grpc.pb.h"
#include <memory>

namespace rd = ride_dispatch::v1;

class DispatchCenter;
class TripJournal;

class DispatchServiceImpl final : public rd::Dispatch::Service {
public:
  // center (and journal, when given) must outlive the service. With a journal,
  // affiliations are persisted as well.
  explicit DispatchServiceImpl(DispatchCenter& center, TripJournal* journal = nullptr);
  ~DispatchServiceImpl() override;                             // needed for pimpl

  DispatchServiceImpl(const DispatchServiceImpl&)            = delete;
  DispatchServiceImpl& operator=(const DispatchServiceImpl&) = delete;

  grpc::Status AffiliateVehicle(grpc::ServerContext*,
                                const rd::AffiliateVehicleRequest*,
                                rd::AffiliationResponse*) override;

  grpc::Status AffiliateRider(grpc::ServerContext*,
                              const rd::AffiliateRiderRequest*,
                              rd::AffiliationResponse*) override;

  grpc::Status RequestTrip(grpc::ServerContext*,
                           const rd::TripRequest*,
                           rd::TripResponse*) override;

  grpc::Status GetSnapshot(grpc::ServerContext*,
                           const rd::SnapshotRequest*,
                           rd::SnapshotResponse*) override;

  grpc::Status GetDailyReports(grpc::ServerContext*,
                               const rd::DailyReportsRequest*,
                               rd::DailyReportsResponse*) override;

private:
  struct Impl;                    // forward-declared implementation
  std::unique_ptr<Impl> d_;       // pimpl
};
