#include "stream_supervisor.hpp"

#include <signal.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/stream_paths.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace streamctl::core {

using model::ManagedProcess;
using model::ProcessState;
using model::StreamSnapshot;
using observability::IntField;
using observability::StringField;

namespace {

void ValidateSpec(const v1::StreamSpec& spec) {
  registry::ValidateStreamId(spec.id());
  if (spec.source().empty()) {
    throw util::InvalidSpec("stream source must not be empty");
  }
  if (spec.destination().empty()) {
    throw util::InvalidSpec("stream destination must not be empty");
  }
}

std::string DescribeExit(const process::ExitInfo& exit) {
  if (exit.term_signal) {
    return "signal " + std::to_string(*exit.term_signal);
  }
  if (exit.exit_code) {
    return "exit code " + std::to_string(*exit.exit_code);
  }
  return "unknown";
}

} // namespace

StreamSupervisor::StreamSupervisor(std::shared_ptr<registry::StreamRegistry> registry, std::shared_ptr<process::ProcessLauncher> launcher,
                                   SupervisorOptions options)
    : registry_(std::move(registry)), launcher_(std::move(launcher)), options_(options) {
}

StreamSnapshot StreamSupervisor::Start(const v1::StreamSpec& spec) {
  ValidateSpec(spec);
  const auto& id = spec.id();

  auto                        stream_mutex = registry_->StreamMutex(id);
  std::lock_guard<std::mutex> lock(*stream_mutex);

  if (auto existing = registry_->Get(id); existing && model::IsActive(existing->state)) {
    if (ProbeProcess(*existing, false).alive) {
      throw util::AlreadyRunning("stream already running: " + id);
    }
    // Died without anyone noticing; settle it before replacing.
    ReconcileLocked(id);
  }

  const auto log_path = registry_->Paths().LogFile(id);
  auto       launched = launcher_->Launch(spec, log_path);

  ManagedProcess process;
  process.spec       = spec;
  process.pid        = launched.pid;
  process.log_path   = log_path;
  process.started_at = util::Now();
  process.state      = ProcessState::kRunning;
  process.argv       = std::move(launched.argv);

  try {
    registry_->Insert(process);
  } catch (const std::exception& e) {
    STREAMCTL_LOG_ERROR("Failed to record started stream, killing child",
                        {StringField("stream_id", id), IntField("pid", launched.pid), StringField("error", e.what())});
    DiscardChild(launched.pid);
    throw;
  }

  STREAMCTL_LOG_INFO("Stream started", {StringField("stream_id", id), IntField("pid", launched.pid), StringField("log", log_path.string())});
  PublishStateCounts();
  return {std::move(process), true};
}

StreamSnapshot StreamSupervisor::Stop(const std::string& id, bool force) {
  auto                        stream_mutex = registry_->StreamMutex(id);
  std::lock_guard<std::mutex> lock(*stream_mutex);

  auto current = registry_->Get(id);
  if (!current) {
    throw util::NotFound("stream not found: " + id);
  }
  if (model::IsTerminal(current->state)) {
    return Snapshot(std::move(*current));
  }
  if (!current->pid) {
    return Snapshot(MarkExited(id, ProcessState::kStopped, {}));
  }

  const pid_t pid   = *current->pid;
  const auto  probe = ProbeProcess(*current, true);
  if (!probe.alive) {
    STREAMCTL_LOG_INFO("Stream already exited", {StringField("stream_id", id), IntField("pid", pid), StringField("exit", DescribeExit(probe.exit))});
    if (!ClearProcessGroup(*current, options_.kill_timeout)) {
      LeaveStopping(id, pid, "process group " + std::to_string(pid) + " still has live members after SIGKILL");
    }
    auto stopped = MarkExited(id, ProcessState::kStopped, probe.exit);
    PublishStateCounts();
    return Snapshot(std::move(stopped));
  }

  registry_->Update(id, [](ManagedProcess& p) { p.state = ProcessState::kStopping; });

  const auto                       started = std::chrono::steady_clock::now();
  std::optional<process::ExitInfo> exit;
  try {
    if (!force) {
      STREAMCTL_LOG_INFO("Stop requested", {StringField("stream_id", id), IntField("pid", pid)});
      process::SignalGroup(pid, SIGTERM);
      exit = WaitForExit(*current, options_.graceful_timeout);
      if (!exit) {
        STREAMCTL_LOG_WARN("Graceful stop timed out, sending SIGKILL",
                           {StringField("stream_id", id), IntField("pid", pid), IntField("timeout_ms", options_.graceful_timeout.count())});
      }
    } else {
      STREAMCTL_LOG_INFO("Force stop requested", {StringField("stream_id", id), IntField("pid", pid)});
    }

    if (!exit) {
      process::SignalGroup(pid, SIGKILL);
      exit = WaitForExit(*current, options_.kill_timeout);
    }
  } catch (const std::exception& e) {
    registry_->Update(id, [&](ManagedProcess& p) { p.last_error = e.what(); });
    STREAMCTL_LOG_ERROR("Stop failed", {StringField("stream_id", id), IntField("pid", pid), StringField("error", e.what())});
    throw;
  }

  if (!exit) {
    LeaveStopping(id, pid, "process " + std::to_string(pid) + " did not exit after SIGKILL");
  }
  // The leader can exit on SIGTERM while helpers it forked ignore it.
  if (!ClearProcessGroup(*current, options_.kill_timeout)) {
    LeaveStopping(id, pid, "process group " + std::to_string(pid) + " still has live members after SIGKILL");
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveStopDurationMs(force ? "force" : "graceful", elapsed);

  auto stopped = MarkExited(id, ProcessState::kStopped, *exit);
  STREAMCTL_LOG_INFO("Stream stopped", {StringField("stream_id", id), IntField("pid", pid), StringField("exit", DescribeExit(*exit))});
  PublishStateCounts();
  return Snapshot(std::move(stopped));
}

StreamSnapshot StreamSupervisor::Status(const std::string& id) const {
  auto current = registry_->Get(id);
  if (!current) {
    throw util::NotFound("stream not found: " + id);
  }
  return Snapshot(std::move(*current));
}

std::vector<StreamSnapshot> StreamSupervisor::List() const {
  std::vector<StreamSnapshot> out;
  for (auto& process : registry_->ListAll()) {
    out.push_back(Snapshot(std::move(process)));
  }
  return out;
}

logs::LogTail StreamSupervisor::TailLog(const std::string& id, std::size_t lines) const {
  const auto current  = registry_->Get(id);
  const auto log_path = current ? current->log_path : registry_->Paths().LogFile(id);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(log_path, ec)) {
    throw util::NotFound("no log for stream: " + id);
  }
  return logs::TailFile(log_path, lines);
}

std::vector<StopOutcome> StreamSupervisor::StopAll() {
  std::vector<StopOutcome> results;
  for (const auto& process : registry_->ListAll()) {
    if (!model::IsActive(process.state)) {
      continue;
    }

    StopOutcome outcome;
    outcome.id  = process.id();
    outcome.pid = process.pid;
    try {
      Stop(process.id(), false);
      outcome.ok = true;
    } catch (const std::exception& e) {
      outcome.error = e.what();
      STREAMCTL_LOG_WARN("Stop failed during stop-all", {StringField("stream_id", process.id()), StringField("error", e.what())});
    }
    results.push_back(std::move(outcome));
  }
  return results;
}

std::optional<Reconciliation> StreamSupervisor::Reconcile(const std::string& id) {
  auto                        stream_mutex = registry_->StreamMutex(id);
  std::lock_guard<std::mutex> lock(*stream_mutex);
  auto                        result = ReconcileLocked(id);
  if (result) {
    PublishStateCounts();
  }
  return result;
}

std::optional<Reconciliation> StreamSupervisor::ReconcileLocked(const std::string& id) {
  auto current = registry_->Get(id);
  if (!current || model::IsTerminal(current->state)) {
    return std::nullopt;
  }

  process::ProbeResult probe;
  if (current->pid) {
    probe = ProbeProcess(*current, true);
    if (probe.alive) {
      return std::nullopt;
    }
    if (!ClearProcessGroup(*current, options_.kill_timeout)) {
      const std::string message = "process group " + std::to_string(*current->pid) + " still has live members after SIGKILL";
      registry_->Update(id, [&](ManagedProcess& p) { p.last_error = message; });
      STREAMCTL_LOG_ERROR("Stream group survived cleanup", {StringField("stream_id", id), IntField("pid", *current->pid), StringField("error", message)});
      return std::nullopt;
    }
  }

  Reconciliation result;
  result.id   = id;
  result.from = current->state;
  result.to   = current->state == ProcessState::kStopping ? ProcessState::kStopped : ProcessState::kCrashed;
  result.pid  = current->pid.value_or(-1);

  MarkExited(id, result.to, probe.exit);
  if (result.to == ProcessState::kCrashed) {
    STREAMCTL_LOG_WARN("Stream crashed", {StringField("stream_id", id), IntField("pid", result.pid), StringField("exit", DescribeExit(probe.exit))});
  } else {
    STREAMCTL_LOG_INFO("Stream stopped", {StringField("stream_id", id), IntField("pid", result.pid), StringField("exit", DescribeExit(probe.exit))});
  }
  return result;
}

process::ProbeResult StreamSupervisor::ProbeProcess(const ManagedProcess& process, bool reap) const {
  if (!process.pid) {
    return {};
  }

  auto probe = process::Probe(*process.pid, reap);
  if (probe.alive && process.adopted && !process::CommandLineMentions(*process.pid, launcher_->Binary())) {
    return {};
  }
  return probe;
}

void StreamSupervisor::PublishStateCounts() const {
  std::map<ProcessState, std::int64_t> counts;
  for (const auto state : {ProcessState::kStarting, ProcessState::kRunning, ProcessState::kStopping, ProcessState::kStopped,
                           ProcessState::kCrashed, ProcessState::kFailed}) {
    counts[state] = 0;
  }
  for (const auto& process : registry_->ListAll()) {
    ++counts[process.state];
  }
  for (const auto& [state, count] : counts) {
    observability::Metrics::Instance().SetManagedStreams(model::ToString(state), count);
  }
}

std::optional<process::ExitInfo> StreamSupervisor::WaitForExit(const ManagedProcess& process, std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto probe = ProbeProcess(process, true);
    if (!probe.alive) {
      return probe.exit;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options_.poll_interval, deadline - now));
  }
}

bool StreamSupervisor::ClearProcessGroup(const ManagedProcess& process, std::chrono::milliseconds timeout) const {
  const pid_t pgid = *process.pid;
  // Someone else holds the pid now, so the group id no longer names our group.
  if (process::Probe(pgid, false).alive) {
    return true;
  }
  if (!process::GroupAlive(pgid)) {
    return true;
  }

  STREAMCTL_LOG_WARN("Killing leftover process group members", {StringField("stream_id", process.id()), IntField("pgid", pgid)});
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    process::SignalGroup(pgid, SIGKILL);
    std::this_thread::sleep_for(options_.poll_interval);
    if (!process::GroupAlive(pgid)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
  }
}

void StreamSupervisor::LeaveStopping(const std::string& id, pid_t pid, const std::string& message) {
  registry_->Update(id, [&](ManagedProcess& p) {
    p.state      = ProcessState::kStopping;
    p.last_error = message;
  });
  STREAMCTL_LOG_ERROR("Stream left in stopping state", {StringField("stream_id", id), IntField("pid", pid), StringField("error", message)});
  throw util::TerminationTimeout(message);
}

ManagedProcess StreamSupervisor::MarkExited(const std::string& id, ProcessState state, const process::ExitInfo& exit) {
  return registry_->Update(id, [&](ManagedProcess& p) {
    p.state       = state;
    p.pid.reset();
    p.stopped_at  = util::Now();
    p.exit_code   = exit.exit_code;
    p.term_signal = exit.term_signal;
  });
}

void StreamSupervisor::DiscardChild(pid_t pid) const {
  try {
    process::SignalGroup(pid, SIGKILL);
  } catch (const std::system_error& e) {
    STREAMCTL_LOG_ERROR("Failed to kill unrecorded child", {IntField("pid", pid), StringField("error", e.what())});
    return;
  }

  ManagedProcess child;
  child.pid = pid;
  if (!WaitForExit(child, options_.kill_timeout)) {
    STREAMCTL_LOG_ERROR("Unrecorded child survived SIGKILL", {IntField("pid", pid)});
  }
}

StreamSnapshot StreamSupervisor::Snapshot(ManagedProcess process) const {
  const bool alive = ProbeProcess(process, false).alive;
  return {std::move(process), alive};
}

} // namespace streamctl::core
