#pragma once

#include "launchpad/v1.hpp"
#include "service_context.hpp"

namespace launchpad::service {

/*
  Transport-free request handlers for LaunchPadService.

  Each call logs failures with its route and rethrows; the transport maps
  the exception to a status.
*/
class LaunchPadService {
 public:
  explicit LaunchPadService(ServiceContext ctx);

  launchpad::v1::SubmitWorkflowResponse SubmitWorkflow(const launchpad::v1::SubmitWorkflowRequest& req);

  launchpad::v1::Firework GetFirework(const launchpad::v1::GetFireworkRequest& req);
  launchpad::v1::Workflow GetWorkflow(const launchpad::v1::GetWorkflowRequest& req);
  launchpad::v1::Launch   GetLaunch(const launchpad::v1::GetLaunchRequest& req);

  launchpad::v1::ListFireworksResponse ListFireworks(const launchpad::v1::ListFireworksRequest& req);

  launchpad::v1::CheckoutResponse   Checkout(const launchpad::v1::CheckoutRequest& req);
  launchpad::v1::CompleteResponse   Complete(const launchpad::v1::CompleteRequest& req);
  launchpad::v1::PingLaunchResponse PingLaunch(const launchpad::v1::PingLaunchRequest& req);

  launchpad::v1::ChangeFireworkStateResponse ChangeFireworkState(const launchpad::v1::ChangeFireworkStateRequest& req);
  launchpad::v1::ChangeWorkflowStateResponse ChangeWorkflowState(const launchpad::v1::ChangeWorkflowStateRequest& req);

  launchpad::v1::DetectLostRunsResponse DetectLostRuns(const launchpad::v1::DetectLostRunsRequest& req);
  launchpad::v1::ResetResponse          Reset(const launchpad::v1::ResetRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace launchpad::service
