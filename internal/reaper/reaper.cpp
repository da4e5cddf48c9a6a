#include "reaper.hpp"

#include "internal/observability/logging.hpp"

namespace streamctl::reaper {

using model::ProcessState;
using observability::IntField;
using observability::StringField;

Reaper::Reaper(std::shared_ptr<core::StreamSupervisor> supervisor, std::chrono::milliseconds interval)
    : supervisor_(std::move(supervisor)), interval_(interval) {
}

Reaper::~Reaper() {
  Stop();
}

void Reaper::Start() {
  if (interval_.count() <= 0 || running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&Reaper::Loop, this);
}

void Reaper::Stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Reaper::Loop() {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while (running_) {
    if (wake_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }
    lock.unlock();
    Sweep();
    lock.lock();
  }
}

std::vector<core::Reconciliation> Reaper::Sweep() {
  std::vector<core::Reconciliation> reconciled;
  for (const auto& process : supervisor_->Registry()->ListAll()) {
    if (!model::IsActive(process.state)) {
      continue;
    }
    try {
      if (auto result = supervisor_->Reconcile(process.id())) {
        reconciled.push_back(std::move(*result));
      }
    } catch (const std::exception& e) {
      STREAMCTL_LOG_ERROR("Sweep failed for stream", {StringField("stream_id", process.id()), StringField("error", e.what())});
    }
  }
  return reconciled;
}

std::vector<CleanupAction> Reaper::Cleanup(const CleanupOptions& options) {
  std::vector<CleanupAction> actions;
  const auto                 registry = supervisor_->Registry();

  for (const auto& result : Sweep()) {
    if (result.to == ProcessState::kCrashed) {
      actions.push_back({result.id, kActionMarkedCrashed, result.pid, {}});
    }
  }

  if (options.kill_all_managed) {
    for (const auto& process : registry->ListAll()) {
      if (!model::IsActive(process.state)) {
        continue;
      }
      const pid_t pid = process.pid.value_or(-1);
      try {
        supervisor_->Stop(process.id(), true);
        actions.push_back({process.id(), kActionKilled, pid, {}});
      } catch (const std::exception& e) {
        STREAMCTL_LOG_ERROR("Kill failed during cleanup", {StringField("stream_id", process.id()), IntField("pid", pid), StringField("error", e.what())});
        actions.push_back({process.id(), kActionKillFailed, pid, e.what()});
      }
    }
  }

  std::vector<std::string> targets = options.ids;
  if (targets.empty()) {
    for (const auto& process : registry->ListAll()) {
      targets.push_back(process.id());
    }
  }

  for (const auto& id : targets) {
    auto                        stream_mutex = registry->StreamMutex(id);
    std::lock_guard<std::mutex> lock(*stream_mutex);

    const auto current = registry->Get(id);
    if (!current) {
      actions.push_back({id, kActionNotFound, -1, {}});
      continue;
    }
    if (model::IsActive(current->state)) {
      actions.push_back({id, kActionSkippedActive, current->pid.value_or(-1), {}});
      continue;
    }

    try {
      registry->Remove(id, options.remove_logs);
      actions.push_back({id, kActionRemoved, -1, {}});
      STREAMCTL_LOG_INFO("Stream cleaned up", {StringField("stream_id", id), observability::BoolField("remove_logs", options.remove_logs)});
    } catch (const std::exception& e) {
      STREAMCTL_LOG_ERROR("Cleanup failed for stream", {StringField("stream_id", id), StringField("error", e.what())});
      actions.push_back({id, kActionRemoveFailed, -1, e.what()});
    }
  }

  supervisor_->PublishStateCounts();
  return actions;
}

} // namespace streamctl::reaper
