#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/managed_process.hpp"
#include "internal/registry/stream_paths.hpp"

namespace streamctl::registry {

/*
  Authoritative mapping from stream id to ManagedProcess, mirrored on disk
  (see StreamPaths for the layout).

  The map itself is guarded by an internal mutex, so every call here is
  atomic. Multi-step lifecycle operations on one id additionally hold the
  per-id mutex from StreamMutex() for their whole duration.
*/
class StreamRegistry {
 public:
  struct RediscoveryReport {
    std::vector<std::string> adopted;
    std::vector<std::string> stopped;
    std::vector<std::string> discarded;
  };

  explicit StreamRegistry(StreamPaths paths);

  StreamRegistry(const StreamRegistry&)            = delete;
  StreamRegistry& operator=(const StreamRegistry&) = delete;

  std::optional<model::ManagedProcess> Get(const std::string& id) const;

  // Replaces a terminal entry; throws util::AlreadyRunning over an active one.
  void Insert(const model::ManagedProcess& process);

  // Applies `mutation` to a copy, checks the state transition, persists the
  // pid marker and swaps the copy in. Throws util::NotFound.
  model::ManagedProcess Update(const std::string& id, const std::function<void(model::ManagedProcess&)>& mutation);

  std::optional<model::ManagedProcess> Remove(const std::string& id, bool remove_log);

  // Ordered by id.
  std::vector<model::ManagedProcess> ListAll() const;

  std::shared_ptr<std::mutex> StreamMutex(const std::string& id);

  // Rebuilds entries from the pid and meta directories after a restart.
  RediscoveryReport Rediscover();

  const StreamPaths& Paths() const {
    return paths_;
  }

 private:
  void WritePidFile(const model::ManagedProcess& process) const;
  void RemovePidFile(const std::string& id) const;
  void WriteRecord(const model::ManagedProcess& process) const;

  StreamPaths paths_;

  mutable std::mutex                           mutex_;
  std::map<std::string, model::ManagedProcess> entries_;

  std::mutex                                                   stream_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> stream_mutexes_;
};

} // namespace streamctl::registry
