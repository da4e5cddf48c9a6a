#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/stream_supervisor.hpp"

namespace streamctl::reaper {

struct CleanupOptions {
  // Empty means every entry.
  std::vector<std::string> ids;
  bool                     kill_all_managed{false};
  bool                     remove_logs{false};
};

inline constexpr const char* kActionMarkedCrashed = "marked_crashed";
inline constexpr const char* kActionKilled        = "killed";
inline constexpr const char* kActionKillFailed    = "kill_failed";
inline constexpr const char* kActionRemoved       = "removed";
inline constexpr const char* kActionRemoveFailed  = "remove_failed";
inline constexpr const char* kActionSkippedActive = "skipped_active";
inline constexpr const char* kActionNotFound      = "not_found";

struct CleanupAction {
  std::string id;
  std::string action;
  pid_t       pid{-1};
  std::string error;
};

/*
  Reconciles registry entries against the OS. A background thread sweeps
  every `interval`; Sweep() and Cleanup() can also be called directly.
*/
class Reaper {
 public:
  Reaper(std::shared_ptr<core::StreamSupervisor> supervisor, std::chrono::milliseconds interval);
  ~Reaper();

  Reaper(const Reaper&)            = delete;
  Reaper& operator=(const Reaper&) = delete;

  // No-op when the interval is zero.
  void Start();
  void Stop();

  std::vector<core::Reconciliation> Sweep();
  std::vector<CleanupAction>        Cleanup(const CleanupOptions& options);

 private:
  void Loop();

  std::shared_ptr<core::StreamSupervisor> supervisor_;
  std::chrono::milliseconds               interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace streamctl::reaper
