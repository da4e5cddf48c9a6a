#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"
#include "streamctl/v1/stream_types.pb.h"

namespace streamctl::model {

/*
  Live/recent record for one stream id. Owned by the registry; everybody
  else works on copies.
*/
struct ManagedProcess {
  streamctl::v1::StreamSpec spec;

  // Present only while the process is believed running.
  std::optional<pid_t> pid;

  std::filesystem::path log_path;
  util::TimePoint       started_at{};
  std::optional<util::TimePoint> stopped_at;

  ProcessState             state{ProcessState::kStarting};
  std::vector<std::string> argv;

  // Rediscovered from the pid directory after a supervisor restart; not our child.
  bool adopted{false};

  std::optional<int> exit_code;
  std::optional<int> term_signal;
  std::string        last_error;

  const std::string& id() const {
    return spec.id();
  }
};

// Snapshot handed to callers: the record plus a liveness bit probed at read time.
struct StreamSnapshot {
  ManagedProcess process;
  bool           alive{false};
};

} // namespace streamctl::model
