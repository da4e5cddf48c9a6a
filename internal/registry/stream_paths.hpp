#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace streamctl::registry {

inline constexpr std::size_t kMaxStreamIdLength = 128;

inline bool IsStreamIdChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

// Stream ids become file names; reject anything that could escape the base dir.
inline void ValidateStreamId(const std::string& stream_id) {
  if (stream_id.empty()) {
    throw util::InvalidSpec("stream id must not be empty");
  }
  if (stream_id.size() > kMaxStreamIdLength) {
    throw util::InvalidSpec("stream id exceeds " + std::to_string(kMaxStreamIdLength) + " characters");
  }
  if (stream_id.front() == '.') {
    throw util::InvalidSpec("stream id must not start with '.'");
  }
  for (char c : stream_id) {
    if (!IsStreamIdChar(c)) {
      throw util::InvalidSpec("stream id contains invalid character");
    }
  }
}

inline bool IsValidStreamId(const std::string& stream_id) {
  try {
    ValidateStreamId(stream_id);
    return true;
  } catch (const util::InvalidSpec&) {
    return false;
  }
}

/*
  On-disk layout under the base directory:

    pids/<id>.pid    decimal pid, present while the process is believed running
    logs/<id>.log    merged stdout/stderr of the child
    meta/<id>.json   StreamRecord (spec, start time, argv)
*/
class StreamPaths {
 public:
  explicit StreamPaths(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {
  }

  const std::filesystem::path& BaseDir() const {
    return base_dir_;
  }

  std::filesystem::path PidDir() const {
    return base_dir_ / "pids";
  }

  std::filesystem::path LogDir() const {
    return base_dir_ / "logs";
  }

  std::filesystem::path MetaDir() const {
    return base_dir_ / "meta";
  }

  std::filesystem::path PidFile(const std::string& stream_id) const {
    ValidateStreamId(stream_id);
    return PidDir() / (stream_id + ".pid");
  }

  std::filesystem::path LogFile(const std::string& stream_id) const {
    ValidateStreamId(stream_id);
    return LogDir() / (stream_id + ".log");
  }

  std::filesystem::path MetaFile(const std::string& stream_id) const {
    ValidateStreamId(stream_id);
    return MetaDir() / (stream_id + ".json");
  }

  void EnsureLayout() const {
    std::filesystem::create_directories(PidDir());
    std::filesystem::create_directories(LogDir());
    std::filesystem::create_directories(MetaDir());
  }

 private:
  std::filesystem::path base_dir_;
};

} // namespace streamctl::registry
