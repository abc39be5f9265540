#include "launchpad_service.hpp"

#include <chrono>
#include <optional>
#include <type_traits>

#include "internal/core/launchpad.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace launchpad::service {

using namespace launchpad::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, int64_t id, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      LAUNCHPAD_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      LAUNCHPAD_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    LAUNCHPAD_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                       observability::IntField("id", id), observability::IntField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

LaunchPadService::LaunchPadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitWorkflowResponse LaunchPadService::SubmitWorkflow(const SubmitWorkflowRequest& req) {
  return ObserveRpc("LaunchPadService.SubmitWorkflow", 0, [&] {
    const auto result = ctx_.launchpad->SubmitWorkflow(req.workflow());

    SubmitWorkflowResponse resp;
    resp.set_wf_id(result.wf_id);
    for (const auto& [provisional, assigned] : result.id_map) {
      (*resp.mutable_id_map())[provisional] = assigned;
    }
    return resp;
  });
}

Firework LaunchPadService::GetFirework(const GetFireworkRequest& req) {
  return ObserveRpc("LaunchPadService.GetFirework", req.fw_id(), [&] { return ctx_.launchpad->GetFirework(req.fw_id()); });
}

Workflow LaunchPadService::GetWorkflow(const GetWorkflowRequest& req) {
  return ObserveRpc("LaunchPadService.GetWorkflow", req.fw_id(), [&] { return ctx_.launchpad->GetWorkflowByFireworkId(req.fw_id()); });
}

Launch LaunchPadService::GetLaunch(const GetLaunchRequest& req) {
  return ObserveRpc("LaunchPadService.GetLaunch", req.launch_id(), [&] { return ctx_.launchpad->GetLaunch(req.launch_id()); });
}

ListFireworksResponse LaunchPadService::ListFireworks(const ListFireworksRequest& req) {
  return ObserveRpc("LaunchPadService.ListFireworks", 0, [&] {
    std::optional<FireworkState> state;
    if (req.state() != FIREWORK_STATE_UNSPECIFIED) state = req.state();

    ListFireworksResponse resp;
    for (const auto id : ctx_.launchpad->GetFireworkIds(state)) {
      resp.add_fw_ids(id);
    }
    return resp;
  });
}

CheckoutResponse LaunchPadService::Checkout(const CheckoutRequest& req) {
  return ObserveRpc("LaunchPadService.Checkout", req.fw_id(), [&] {
    std::optional<int64_t> target;
    if (req.fw_id() != 0) target = req.fw_id();

    CheckoutResponse resp;
    auto claim = ctx_.launchpad->Checkout({req.worker(), req.host(), req.launch_dir()}, target);
    if (claim) {
      resp.set_claimed(true);
      *resp.mutable_firework() = std::move(claim->firework);
      *resp.mutable_launch()   = std::move(claim->launch);
    }
    return resp;
  });
}

CompleteResponse LaunchPadService::Complete(const CompleteRequest& req) {
  return ObserveRpc("LaunchPadService.Complete", req.launch_id(), [&] {
    const auto state = req.state() == FIREWORK_STATE_UNSPECIFIED ? FIREWORK_STATE_COMPLETED : req.state();

    CompleteResponse resp;
    *resp.mutable_firework() = ctx_.launchpad->Complete(req.launch_id(), req.action(), state);
    return resp;
  });
}

PingLaunchResponse LaunchPadService::PingLaunch(const PingLaunchRequest& req) {
  return ObserveRpc("LaunchPadService.PingLaunch", req.launch_id(), [&] {
    ctx_.launchpad->PingLaunch(req.launch_id());
    return PingLaunchResponse{};
  });
}

ChangeFireworkStateResponse LaunchPadService::ChangeFireworkState(const ChangeFireworkStateRequest& req) {
  return ObserveRpc("LaunchPadService.ChangeFireworkState", req.fw_id(), [&] {
    auto& lp = *ctx_.launchpad;

    ChangeFireworkStateResponse resp;
    switch (req.operation()) {
      case FIREWORK_OPERATION_PAUSE:
        *resp.mutable_firework() = lp.PauseFirework(req.fw_id());
        break;
      case FIREWORK_OPERATION_RESUME:
        *resp.mutable_firework() = lp.ResumeFirework(req.fw_id());
        break;
      case FIREWORK_OPERATION_DEFUSE:
        *resp.mutable_firework() = lp.DefuseFirework(req.fw_id());
        break;
      case FIREWORK_OPERATION_REIGNITE:
        *resp.mutable_firework() = lp.ReigniteFirework(req.fw_id());
        break;
      case FIREWORK_OPERATION_RERUN:
        *resp.mutable_firework() = lp.RerunFirework(req.fw_id());
        break;
      default:
        throw util::InvalidArgument("change firework state: operation is required");
    }
    return resp;
  });
}

ChangeWorkflowStateResponse LaunchPadService::ChangeWorkflowState(const ChangeWorkflowStateRequest& req) {
  return ObserveRpc("LaunchPadService.ChangeWorkflowState", req.fw_id(), [&] {
    auto& lp = *ctx_.launchpad;

    ChangeWorkflowStateResponse resp;
    switch (req.operation()) {
      case WORKFLOW_OPERATION_PAUSE:
        *resp.mutable_workflow() = lp.PauseWorkflow(req.fw_id());
        break;
      case WORKFLOW_OPERATION_DEFUSE:
        *resp.mutable_workflow() = lp.DefuseWorkflow(req.fw_id());
        break;
      case WORKFLOW_OPERATION_REIGNITE:
        *resp.mutable_workflow() = lp.ReigniteWorkflow(req.fw_id());
        break;
      case WORKFLOW_OPERATION_ARCHIVE:
        *resp.mutable_workflow() = lp.ArchiveWorkflow(req.fw_id());
        break;
      default:
        throw util::InvalidArgument("change workflow state: operation is required");
    }
    return resp;
  });
}

DetectLostRunsResponse LaunchPadService::DetectLostRuns(const DetectLostRunsRequest& req) {
  return ObserveRpc("LaunchPadService.DetectLostRuns", 0, [&] {
    std::optional<std::chrono::milliseconds> expiration;
    if (req.has_expiration()) expiration = util::ToMillis(req.expiration());

    DetectLostRunsResponse resp;
    for (const auto id : ctx_.launchpad->DetectLostRuns(expiration)) {
      resp.add_launch_ids(id);
    }
    return resp;
  });
}

ResetResponse LaunchPadService::Reset(const ResetRequest& req) {
  return ObserveRpc("LaunchPadService.Reset", 0, [&] {
    ctx_.launchpad->ResetStore(req.password());
    return ResetResponse{};
  });
}

} // namespace launchpad::service
