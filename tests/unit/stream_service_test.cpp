#include "internal/service/stream_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/reaper/reaper.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_transcoder.hpp"

namespace {

using namespace streamctl::v1;
using streamctl::service::ClampTailLines;
using streamctl::service::ServiceContext;
using streamctl::service::StreamService;
using streamctl::testing::SupervisorHarness;

ServiceContext BuildServiceContext(SupervisorHarness& h) {
  ServiceContext ctx;
  ctx.supervisor = h.supervisor;
  ctx.reaper     = std::make_shared<streamctl::reaper::Reaper>(h.supervisor, std::chrono::milliseconds(0));
  return ctx;
}

void TestEmptyIdDefaultsToStream() {
  SupervisorHarness h("streamctl_service_default_id");
  StreamService     service(BuildServiceContext(h));

  StartStreamRequest req;
  req.mutable_spec()->set_source("https://example.invalid/in.m3u8");
  req.mutable_spec()->set_destination("rtmp://example.invalid/app/key");
  const auto resp = service.StartStream(req);

  assert(resp.status().id() == "stream");
  assert(resp.status().state() == STREAM_STATE_RUNNING);
  assert(resp.status().pid() > 0);
  assert(resp.status().alive());
  assert(resp.status().argv_size() > 0);
  assert(resp.status().has_started_at());

  GetStreamStatusRequest status_req;
  assert(service.GetStreamStatus(status_req).status().id() == "stream");

  StopStreamRequest stop_req;
  const auto        stopped = service.StopStream(stop_req);
  assert(stopped.status().state() == STREAM_STATE_STOPPED);
  assert(stopped.status().pid() == 0);
  assert(stopped.status().has_stopped_at());
}

void TestListAndSweepResponses() {
  SupervisorHarness h("streamctl_service_list");
  StreamService     service(BuildServiceContext(h));

  for (const char* id : {"b", "a"}) {
    StartStreamRequest req;
    *req.mutable_spec() = streamctl::testing::MakeSpec(id);
    service.StartStream(req);
  }

  const auto listed = service.ListStreams(ListStreamsRequest{});
  assert(listed.streams_size() == 2);
  assert(listed.streams(0).id() == "a" && listed.streams(1).id() == "b");

  assert(service.Sweep(SweepRequest{}).reconciled_size() == 0);

  const auto stop_all = service.StopAllStreams(StopAllStreamsRequest{});
  assert(stop_all.results_size() == 2);
  assert(stop_all.results(0).ok() && stop_all.results(1).ok());

  CleanupRequest cleanup;
  cleanup.set_remove_logs(true);
  const auto cleaned = service.Cleanup(cleanup);
  assert(cleaned.actions_size() == 2);
  assert(cleaned.actions(0).action() == "removed");
  assert(service.ListStreams(ListStreamsRequest{}).streams_size() == 0);
}

void TestErrorsPropagateAsTypedExceptions() {
  SupervisorHarness h("streamctl_service_errors");
  StreamService     service(BuildServiceContext(h));

  GetStreamStatusRequest req;
  req.set_id("ghost");
  bool threw = false;
  try {
    service.GetStreamStatus(req);
  } catch (const streamctl::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestTailLineClamping() {
  assert(ClampTailLines(0) == 200);
  assert(ClampTailLines(1) == 1);
  assert(ClampTailLines(10000) == 10000);
  assert(ClampTailLines(500000) == 10000);
}

void TestTailLogResponse() {
  SupervisorHarness h("streamctl_service_tail", streamctl::testing::kChattyScript);
  StreamService     service(BuildServiceContext(h));

  StartStreamRequest start;
  *start.mutable_spec() = streamctl::testing::MakeSpec("chatty");
  service.StartStream(start);

  TailLogRequest req;
  req.set_id("chatty");
  req.set_lines(2);
  const bool complete = streamctl::testing::WaitUntil([&] { return service.TailLog(req).content() == "line 49\nline 50"; },
                                                      std::chrono::seconds(3));
  assert(complete);
  const auto resp = service.TailLog(req);
  assert(resp.id() == "chatty");
  assert(resp.line_count() == 2);
}

} // namespace

int main() {
  TestEmptyIdDefaultsToStream();
  TestListAndSweepResponses();
  TestErrorsPropagateAsTypedExceptions();
  TestTailLineClamping();
  TestTailLogResponse();

  std::cout << "streamctl_unit_stream_service: pass\n";
  return 0;
}
