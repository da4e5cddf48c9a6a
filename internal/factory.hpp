#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/core/stream_supervisor.hpp"
#include "internal/reaper/reaper.hpp"
#include "internal/service/stream_service.hpp"

namespace streamctl::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<core::StreamSupervisor> supervisor;
  std::shared_ptr<reaper::Reaper>         reaper;
  std::shared_ptr<service::StreamService> stream_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config: registry
  (with rediscovery of streams left by a previous run), launcher,
  supervisor, reaper (started) and the gRPC adapters.

  NOTE:
  This is the composition root of the application.
*/
Application Build(const streamctl::runtime::config::RuntimeConfig& config);

} // namespace streamctl::factory
