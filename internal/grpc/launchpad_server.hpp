#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/launchpad_service.hpp"
#include "launchpad/services/v1/launchpad_service.grpc.pb.h"
#include "launchpad/v1.hpp"

namespace launchpad::grpc {

class LaunchPadServer final : public launchpad::v1::LaunchPadService::Service {
 public:
  explicit LaunchPadServer(std::shared_ptr<launchpad::service::LaunchPadService> svc);

  ::grpc::Status SubmitWorkflow(::grpc::ServerContext*, const launchpad::v1::SubmitWorkflowRequest*, launchpad::v1::SubmitWorkflowResponse*) override;

  ::grpc::Status GetFirework(::grpc::ServerContext*, const launchpad::v1::GetFireworkRequest*, launchpad::v1::Firework*) override;
  ::grpc::Status GetWorkflow(::grpc::ServerContext*, const launchpad::v1::GetWorkflowRequest*, launchpad::v1::Workflow*) override;
  ::grpc::Status GetLaunch(::grpc::ServerContext*, const launchpad::v1::GetLaunchRequest*, launchpad::v1::Launch*) override;
  ::grpc::Status ListFireworks(::grpc::ServerContext*, const launchpad::v1::ListFireworksRequest*, launchpad::v1::ListFireworksResponse*) override;

  ::grpc::Status Checkout(::grpc::ServerContext*, const launchpad::v1::CheckoutRequest*, launchpad::v1::CheckoutResponse*) override;
  ::grpc::Status Complete(::grpc::ServerContext*, const launchpad::v1::CompleteRequest*, launchpad::v1::CompleteResponse*) override;
  ::grpc::Status PingLaunch(::grpc::ServerContext*, const launchpad::v1::PingLaunchRequest*, launchpad::v1::PingLaunchResponse*) override;

  ::grpc::Status ChangeFireworkState(::grpc::ServerContext*, const launchpad::v1::ChangeFireworkStateRequest*,
                                     launchpad::v1::ChangeFireworkStateResponse*) override;
  ::grpc::Status ChangeWorkflowState(::grpc::ServerContext*, const launchpad::v1::ChangeWorkflowStateRequest*,
                                     launchpad::v1::ChangeWorkflowStateResponse*) override;

  ::grpc::Status DetectLostRuns(::grpc::ServerContext*, const launchpad::v1::DetectLostRunsRequest*, launchpad::v1::DetectLostRunsResponse*) override;
  ::grpc::Status Reset(::grpc::ServerContext*, const launchpad::v1::ResetRequest*, launchpad::v1::ResetResponse*) override;

 private:
  std::shared_ptr<launchpad::service::LaunchPadService> service_;
};

} // namespace launchpad::grpc
