#pragma once

#include <cstdint>
#include <string_view>

namespace streamctl::model {

enum class ProcessState : std::uint8_t {
  kStarting = 1,
  kRunning  = 2,
  kStopping = 3,
  kStopped  = 4,
  kCrashed  = 5,
  kFailed   = 6,
};

constexpr bool IsTerminal(ProcessState state) {
  return state == ProcessState::kStopped || state == ProcessState::kCrashed || state == ProcessState::kFailed;
}

// States in which the entry may still own a live process group.
constexpr bool IsActive(ProcessState state) {
  return state == ProcessState::kStarting || state == ProcessState::kRunning || state == ProcessState::kStopping;
}

constexpr bool CanTransition(ProcessState from, ProcessState to) {
  if (from == to) {
    return !IsTerminal(from);
  }

  switch (from) {
    case ProcessState::kStarting:
      return to == ProcessState::kRunning || to == ProcessState::kFailed;
    case ProcessState::kRunning:
      return to == ProcessState::kStopping || to == ProcessState::kStopped || to == ProcessState::kCrashed;
    case ProcessState::kStopping:
      return to == ProcessState::kStopped;
    default:
      return false;
  }
}

constexpr std::string_view ToString(ProcessState state) {
  switch (state) {
    case ProcessState::kStarting:
      return "starting";
    case ProcessState::kRunning:
      return "running";
    case ProcessState::kStopping:
      return "stopping";
    case ProcessState::kStopped:
      return "stopped";
    case ProcessState::kCrashed:
      return "crashed";
    case ProcessState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace streamctl::model
