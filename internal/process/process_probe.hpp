#pragma once

#include <sys/types.h>

#include <optional>
#include <string>

namespace streamctl::process {

struct ExitInfo {
  std::optional<int> exit_code;
  std::optional<int> term_signal;
};

struct ProbeResult {
  bool     alive{false};
  ExitInfo exit;
};

/*
  Non-blocking liveness probe.

  For children of this process the exit status is read through waitid();
  with reap == false the zombie is left in place (WNOWAIT) so a later
  reaping probe can still collect the status. For anything else (adopted
  pids) falls back to kill(pid, 0) plus a /proc zombie check.
*/
ProbeResult Probe(pid_t pid, bool reap);

inline bool IsAlive(pid_t pid) {
  return Probe(pid, false).alive;
}

// Whether /proc/<pid>/cmdline mentions the file name of `binary`.
// True when /proc cannot be read, so non-Linux hosts are not penalised.
bool CommandLineMentions(pid_t pid, const std::string& binary);

enum class SignalResult {
  kDelivered,
  kNoSuchProcess,
};

// Signals process group `pgid`. Managed transcoders lead their own session,
// so the group id is the launch pid and outlives the leader itself. Throws
// std::system_error on anything other than ESRCH.
SignalResult SignalGroup(pid_t pgid, int signal);

// Whether group `pgid` still has a member that is not a zombie. Falls back
// to killpg(pgid, 0) when /proc cannot be read.
bool GroupAlive(pid_t pgid);

} // namespace streamctl::process
