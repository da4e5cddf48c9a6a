#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace streamctl::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, merged over
  Defaults(), then environment overrides are applied:

    STREAMCTL_DIR            supervisor.base_dir
    FFMPEG_BIN               supervisor.transcoder_bin
    STREAMCTL_BIND_ADDRESS   server.bind_address
    PORT                     server.bind_address = 0.0.0.0:<PORT>
    STREAMCTL_LOG_LEVEL      logging.level
    STREAMCTL_LOG_PATTERN    logging.pattern
*/
class ConfigLoader {
 public:
  static streamctl::runtime::config::RuntimeConfig Defaults();

  // Raw file contents, no defaults or environment applied.
  static streamctl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static streamctl::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml);

  static void ApplyEnvironmentOverrides(streamctl::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first offending field.
  static void Validate(const streamctl::runtime::config::RuntimeConfig& config);

  // Defaults, then the file (if any), then the environment; validated.
  static streamctl::runtime::config::RuntimeConfig Load(const std::optional<std::string>& path);
};

} // namespace streamctl::config
