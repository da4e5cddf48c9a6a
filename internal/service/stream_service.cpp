#include "stream_service.hpp"

#include <algorithm>
#include <chrono>
#include <type_traits>

#include "internal/core/stream_supervisor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reaper/reaper.hpp"
#include "internal/util/time.hpp"

namespace streamctl::service {

using namespace streamctl::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& stream_id, Fn&& fn) {
  streamctl::observability::RequestSpan span(route, stream_id);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    streamctl::observability::Metrics::Instance().RecordRequest(route, true);
    streamctl::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    STREAMCTL_LOG_ERROR("RPC failed", {streamctl::observability::StringField("route", route), streamctl::observability::StringField("error", ex.what()),
                                       streamctl::observability::StringField("stream_id", stream_id)});
    streamctl::observability::Metrics::Instance().RecordRequest(route, false);
    streamctl::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

std::string ResolveId(const std::string& id) {
  return id.empty() ? kDefaultStreamId : id;
}

StreamState ToProtoState(model::ProcessState state) {
  switch (state) {
    case model::ProcessState::kStarting:
      return STREAM_STATE_STARTING;
    case model::ProcessState::kRunning:
      return STREAM_STATE_RUNNING;
    case model::ProcessState::kStopping:
      return STREAM_STATE_STOPPING;
    case model::ProcessState::kStopped:
      return STREAM_STATE_STOPPED;
    case model::ProcessState::kCrashed:
      return STREAM_STATE_CRASHED;
    case model::ProcessState::kFailed:
      return STREAM_STATE_FAILED;
  }
  return STREAM_STATE_UNSPECIFIED;
}

StreamStatus ToProto(const model::StreamSnapshot& snapshot) {
  const auto&  process = snapshot.process;
  StreamStatus status;
  status.set_id(process.id());
  status.set_state(ToProtoState(process.state));
  status.set_pid(process.pid.value_or(0));
  status.set_alive(snapshot.alive);
  status.set_log_path(process.log_path.string());
  *status.mutable_started_at() = util::ToProto(process.started_at);
  if (process.stopped_at) {
    *status.mutable_stopped_at() = util::ToProto(*process.stopped_at);
  }
  *status.mutable_spec() = process.spec;
  for (const auto& arg : process.argv) {
    status.add_argv(arg);
  }
  status.set_adopted(process.adopted);
  status.set_exit_code(process.exit_code.value_or(0));
  status.set_term_signal(process.term_signal.value_or(0));
  status.set_last_error(process.last_error);
  return status;
}

} // namespace

std::uint32_t ClampTailLines(std::uint32_t requested) {
  if (requested == 0) {
    return kDefaultTailLines;
  }
  return std::min(requested, kMaxTailLines);
}

StreamService::StreamService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartStreamResponse StreamService::StartStream(const StartStreamRequest& req) {
  StreamSpec spec = req.spec();
  spec.set_id(ResolveId(spec.id()));
  return ObserveRpc("StreamService.StartStream", spec.id(), [&] {
    StartStreamResponse resp;
    *resp.mutable_status() = ToProto(ctx_.supervisor->Start(spec));
    return resp;
  });
}

StopStreamResponse StreamService::StopStream(const StopStreamRequest& req) {
  const auto id = ResolveId(req.id());
  return ObserveRpc("StreamService.StopStream", id, [&] {
    StopStreamResponse resp;
    *resp.mutable_status() = ToProto(ctx_.supervisor->Stop(id, req.force()));
    return resp;
  });
}

GetStreamStatusResponse StreamService::GetStreamStatus(const GetStreamStatusRequest& req) {
  const auto id = ResolveId(req.id());
  return ObserveRpc("StreamService.GetStreamStatus", id, [&] {
    GetStreamStatusResponse resp;
    *resp.mutable_status() = ToProto(ctx_.supervisor->Status(id));
    return resp;
  });
}

ListStreamsResponse StreamService::ListStreams(const ListStreamsRequest&) {
  return ObserveRpc("StreamService.ListStreams", {}, [&] {
    ListStreamsResponse resp;
    for (const auto& snapshot : ctx_.supervisor->List()) {
      *resp.add_streams() = ToProto(snapshot);
    }
    return resp;
  });
}

TailLogResponse StreamService::TailLog(const TailLogRequest& req) {
  const auto id = ResolveId(req.id());
  return ObserveRpc("StreamService.TailLog", id, [&] {
    const auto tail = ctx_.supervisor->TailLog(id, ClampTailLines(req.lines()));

    TailLogResponse resp;
    resp.set_id(id);
    resp.set_content(tail.content);
    resp.set_line_count(static_cast<std::uint32_t>(tail.line_count));
    return resp;
  });
}

CleanupResponse StreamService::Cleanup(const CleanupRequest& req) {
  return ObserveRpc("StreamService.Cleanup", {}, [&] {
    reaper::CleanupOptions options;
    options.ids.assign(req.ids().begin(), req.ids().end());
    options.kill_all_managed = req.kill_all_managed();
    options.remove_logs      = req.remove_logs();

    CleanupResponse resp;
    for (const auto& action : ctx_.reaper->Cleanup(options)) {
      auto* out = resp.add_actions();
      out->set_id(action.id);
      out->set_action(action.action);
      out->set_pid(action.pid);
      out->set_error(action.error);
    }
    return resp;
  });
}

StopAllStreamsResponse StreamService::StopAllStreams(const StopAllStreamsRequest&) {
  return ObserveRpc("StreamService.StopAllStreams", {}, [&] {
    StopAllStreamsResponse resp;
    for (const auto& outcome : ctx_.supervisor->StopAll()) {
      auto* out = resp.add_results();
      out->set_id(outcome.id);
      out->set_pid(outcome.pid.value_or(0));
      out->set_ok(outcome.ok);
      out->set_error(outcome.error);
    }
    return resp;
  });
}

SweepResponse StreamService::Sweep(const SweepRequest&) {
  return ObserveRpc("StreamService.Sweep", {}, [&] {
    SweepResponse resp;
    for (const auto& reconciliation : ctx_.reaper->Sweep()) {
      auto* out = resp.add_reconciled();
      out->set_id(reconciliation.id);
      out->set_from(ToProtoState(reconciliation.from));
      out->set_to(ToProtoState(reconciliation.to));
      out->set_pid(reconciliation.pid);
    }
    return resp;
  });
}

} // namespace streamctl::service
