#pragma once

#include <sys/types.h>

#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "streamctl/v1/stream_types.pb.h"

namespace streamctl::process {

struct LaunchedProcess {
  pid_t                    pid{-1};
  std::vector<std::string> argv;
};

/*
  Starts the external transcoder for one stream.

  The child gets its own session (pgid == pid) so a signal sent to the
  group reaches every helper it forks, and its stdout/stderr go to a
  freshly truncated log file. Either exactly one process is running when
  Launch returns, or it throws and nothing is left behind.
*/
class ProcessLauncher {
 public:
  ProcessLauncher(std::string transcoder_bin, streamctl::runtime::config::EncodingConfig encoding);

  // Deterministic argument vector; argv[0] is the configured binary.
  std::vector<std::string> BuildArguments(const streamctl::v1::StreamSpec& spec) const;

  // Throws util::ExecutableNotFound or util::SpawnFailed.
  LaunchedProcess Launch(const streamctl::v1::StreamSpec& spec, const std::filesystem::path& log_path) const;

  void CheckExecutable() const;

  const std::string& Binary() const {
    return transcoder_bin_;
  }

 private:
  std::string                                transcoder_bin_;
  streamctl::runtime::config::EncodingConfig encoding_;
};

// True when the arguments ask for filtering, which rules out stream copy.
bool RequiresReencode(const std::vector<std::string>& args);

} // namespace streamctl::process
