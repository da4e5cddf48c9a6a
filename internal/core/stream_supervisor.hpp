#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/logs/log_tail.hpp"
#include "internal/model/managed_process.hpp"
#include "internal/process/process_launcher.hpp"
#include "internal/process/process_probe.hpp"
#include "internal/registry/stream_registry.hpp"
#include "streamctl/v1/stream_types.pb.h"

namespace streamctl::core {

struct SupervisorOptions {
  std::chrono::milliseconds graceful_timeout{1500};
  std::chrono::milliseconds kill_timeout{1000};
  std::chrono::milliseconds poll_interval{50};
};

struct StopOutcome {
  std::string          id;
  std::optional<pid_t> pid;
  bool                 ok{false};
  std::string          error;
};

struct Reconciliation {
  std::string         id;
  model::ProcessState from{model::ProcessState::kRunning};
  model::ProcessState to{model::ProcessState::kCrashed};
  pid_t               pid{-1};
};

/*
  Lifecycle controller. Every multi-step operation on an id runs under
  that id's registry mutex; liveness reads (Status/List) do not lock and
  never reap, so a concurrent Stop still sees the exit status.
*/
class StreamSupervisor {
 public:
  StreamSupervisor(std::shared_ptr<registry::StreamRegistry> registry, std::shared_ptr<process::ProcessLauncher> launcher,
                   SupervisorOptions options = {});

  // Throws InvalidSpec, AlreadyRunning, ExecutableNotFound, SpawnFailed.
  model::StreamSnapshot Start(const streamctl::v1::StreamSpec& spec);

  // Throws NotFound, TerminationTimeout. Idempotent on terminal entries.
  model::StreamSnapshot Stop(const std::string& id, bool force);

  model::StreamSnapshot              Status(const std::string& id) const;
  std::vector<model::StreamSnapshot> List() const;

  logs::LogTail TailLog(const std::string& id, std::size_t lines) const;

  std::vector<StopOutcome> StopAll();

  // Moves a dead Running entry to Crashed and a dead Stopping entry to
  // Stopped. Returns nothing when the entry is absent, terminal or alive.
  std::optional<Reconciliation> Reconcile(const std::string& id);

  // Liveness of the entry's pid. Adopted pids must still look like the
  // transcoder, otherwise the pid has been reused and counts as dead.
  process::ProbeResult ProbeProcess(const model::ManagedProcess& process, bool reap) const;

  void PublishStateCounts() const;

  const std::shared_ptr<registry::StreamRegistry>& Registry() const {
    return registry_;
  }

 private:
  // Caller holds the id's stream mutex.
  std::optional<Reconciliation>    ReconcileLocked(const std::string& id);
  std::optional<process::ExitInfo> WaitForExit(const model::ManagedProcess& process, std::chrono::milliseconds timeout) const;
  // The leader is gone; SIGKILLs whatever is left in its process group.
  // False when members are still alive after `timeout`.
  bool                             ClearProcessGroup(const model::ManagedProcess& process, std::chrono::milliseconds timeout) const;
  // Records `message`, keeps the entry Stopping and throws TerminationTimeout.
  [[noreturn]] void                LeaveStopping(const std::string& id, pid_t pid, const std::string& message);
  model::ManagedProcess            MarkExited(const std::string& id, model::ProcessState state, const process::ExitInfo& exit);
  void                             DiscardChild(pid_t pid) const;
  model::StreamSnapshot            Snapshot(model::ManagedProcess process) const;

  std::shared_ptr<registry::StreamRegistry>  registry_;
  std::shared_ptr<process::ProcessLauncher> launcher_;
  SupervisorOptions                          options_;
};

} // namespace streamctl::core
