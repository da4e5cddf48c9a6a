#pragma once

#include <memory>

namespace streamctl::core { class StreamSupervisor; }
namespace streamctl::reaper { class Reaper; }

namespace streamctl::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<streamctl::core::StreamSupervisor> supervisor;
  std::shared_ptr<streamctl::reaper::Reaper> reaper;
};

}
