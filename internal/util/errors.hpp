#pragma once

#include <stdexcept>
#include <string>

namespace streamctl::util {

/*
  Central error types.

  Core code throws these; the gRPC adapter maps them to status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyRunning : public std::runtime_error {
 public:
  explicit AlreadyRunning(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidSpec : public std::runtime_error {
 public:
  explicit InvalidSpec(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LaunchError : public std::runtime_error {
 public:
  explicit LaunchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutableNotFound : public LaunchError {
 public:
  explicit ExecutableNotFound(const std::string& msg) : LaunchError(msg) {
  }
};

class SpawnFailed : public LaunchError {
 public:
  explicit SpawnFailed(const std::string& msg) : LaunchError(msg) {
  }
};

// Stop gave up waiting; the entry stays Stopping until the reaper sees the process gone.
class TerminationTimeout : public std::runtime_error {
 public:
  explicit TerminationTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace streamctl::util
