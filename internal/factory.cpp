#include "factory.hpp"

#include <cstdint>
#include <memory>
#include <utility>

#include "internal/grpc/stream_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/process_launcher.hpp"
#include "internal/registry/stream_registry.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace streamctl::factory {

using observability::IntField;
using observability::StringField;

/*
    Build full application dependency graph
*/
Application Build(const streamctl::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto& supervisor_config = config.supervisor();

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  auto registry = std::make_shared<registry::StreamRegistry>(registry::StreamPaths(supervisor_config.base_dir()));
  if (!supervisor_config.skip_rediscovery()) {
    const auto report = registry->Rediscover();
    STREAMCTL_LOG_INFO("Rediscovered streams", {IntField("adopted", static_cast<std::int64_t>(report.adopted.size())),
                                                 IntField("stopped", static_cast<std::int64_t>(report.stopped.size())),
                                                 IntField("discarded", static_cast<std::int64_t>(report.discarded.size()))});
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto launcher = std::make_shared<process::ProcessLauncher>(supervisor_config.transcoder_bin(), config.encoding());
  try {
    launcher->CheckExecutable();
  } catch (const util::ExecutableNotFound& e) {
    // Not fatal: starts fail individually until the binary appears.
    STREAMCTL_LOG_WARN("Transcoder not executable", {StringField("path", launcher->Binary()), StringField("error", e.what())});
  }

  core::SupervisorOptions options;
  options.graceful_timeout = util::ToMillis(supervisor_config.graceful_stop_timeout());
  options.kill_timeout     = util::ToMillis(supervisor_config.kill_wait_timeout());
  options.poll_interval    = util::ToMillis(supervisor_config.poll_interval());

  app.supervisor = std::make_shared<core::StreamSupervisor>(registry, launcher, options);

  // ------------------------------------------------------------------
  // Reaper
  // ------------------------------------------------------------------
  app.reaper = std::make_shared<reaper::Reaper>(app.supervisor, util::ToMillis(supervisor_config.reaper_interval()));
  for (const auto& reconciled : app.reaper->Sweep()) {
    STREAMCTL_LOG_INFO("Reconciled stream at startup", {StringField("stream_id", reconciled.id), IntField("pid", reconciled.pid),
                                                        StringField("state", model::ToString(reconciled.to))});
  }
  app.supervisor->PublishStateCounts();
  app.reaper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.supervisor = app.supervisor;
  ctx.reaper     = app.reaper;

  app.stream_service = std::make_shared<service::StreamService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::StreamServer>(app.stream_service));

  return app;
}

} // namespace streamctl::factory
