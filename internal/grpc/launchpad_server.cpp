#include "launchpad_server.hpp"

#include "grpc_error.hpp"

namespace launchpad::grpc {

using namespace launchpad::v1;

LaunchPadServer::LaunchPadServer(std::shared_ptr<launchpad::service::LaunchPadService> svc) : service_(std::move(svc)) {
}

::grpc::Status LaunchPadServer::SubmitWorkflow(::grpc::ServerContext*, const SubmitWorkflowRequest* req, SubmitWorkflowResponse* resp) {
  try {
    *resp = service_->SubmitWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::GetFirework(::grpc::ServerContext*, const GetFireworkRequest* req, Firework* resp) {
  try {
    *resp = service_->GetFirework(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::GetWorkflow(::grpc::ServerContext*, const GetWorkflowRequest* req, Workflow* resp) {
  try {
    *resp = service_->GetWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::GetLaunch(::grpc::ServerContext*, const GetLaunchRequest* req, Launch* resp) {
  try {
    *resp = service_->GetLaunch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::ListFireworks(::grpc::ServerContext*, const ListFireworksRequest* req, ListFireworksResponse* resp) {
  try {
    *resp = service_->ListFireworks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::Checkout(::grpc::ServerContext*, const CheckoutRequest* req, CheckoutResponse* resp) {
  try {
    *resp = service_->Checkout(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::Complete(::grpc::ServerContext*, const CompleteRequest* req, CompleteResponse* resp) {
  try {
    *resp = service_->Complete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::PingLaunch(::grpc::ServerContext*, const PingLaunchRequest* req, PingLaunchResponse* resp) {
  try {
    *resp = service_->PingLaunch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::ChangeFireworkState(::grpc::ServerContext*, const ChangeFireworkStateRequest* req, ChangeFireworkStateResponse* resp) {
  try {
    *resp = service_->ChangeFireworkState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::ChangeWorkflowState(::grpc::ServerContext*, const ChangeWorkflowStateRequest* req, ChangeWorkflowStateResponse* resp) {
  try {
    *resp = service_->ChangeWorkflowState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::DetectLostRuns(::grpc::ServerContext*, const DetectLostRunsRequest* req, DetectLostRunsResponse* resp) {
  try {
    *resp = service_->DetectLostRuns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LaunchPadServer::Reset(::grpc::ServerContext*, const ResetRequest* req, ResetResponse* resp) {
  try {
    *resp = service_->Reset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace launchpad::grpc
