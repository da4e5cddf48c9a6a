#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace streamctl::config {

using streamctl::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig YamlToConfig(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static bool IsPositive(const google::protobuf::Duration& d) {
  return util::ToMillis(d).count() > 0;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  using std::chrono::milliseconds;

  RuntimeConfig config;
  config.mutable_server()->set_bind_address("0.0.0.0:50051");

  auto* supervisor = config.mutable_supervisor();
  supervisor->set_base_dir("/var/streamctl");
  supervisor->set_transcoder_bin("/usr/bin/ffmpeg");
  *supervisor->mutable_graceful_stop_timeout() = util::FromMillis(milliseconds(1500));
  *supervisor->mutable_kill_wait_timeout()     = util::FromMillis(milliseconds(1000));
  *supervisor->mutable_poll_interval()         = util::FromMillis(milliseconds(50));
  *supervisor->mutable_reaper_interval()       = util::FromMillis(milliseconds(5000));

  auto* encoding = config.mutable_encoding();
  encoding->set_video_codec("libx264");
  encoding->set_video_preset("veryfast");
  encoding->set_video_tune("zerolatency");
  encoding->set_video_bitrate("2000k");
  encoding->set_audio_codec("aac");
  encoding->set_audio_sample_rate(44100);
  encoding->set_audio_bitrate("128k");
  encoding->set_output_format("flv");

  config.mutable_logging()->set_level("info");
  config.mutable_observability()->set_metrics_export_interval_ms(1000);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return YamlToConfig(yaml);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return YamlToConfig(yaml);
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* dir = std::getenv("STREAMCTL_DIR"); dir && *dir) {
    config.mutable_supervisor()->set_base_dir(dir);
  }
  if (const char* bin = std::getenv("FFMPEG_BIN"); bin && *bin) {
    config.mutable_supervisor()->set_transcoder_bin(bin);
  }
  if (const char* port = std::getenv("PORT"); port && *port) {
    config.mutable_server()->set_bind_address(std::string("0.0.0.0:") + port);
  }
  if (const char* address = std::getenv("STREAMCTL_BIND_ADDRESS"); address && *address) {
    config.mutable_server()->set_bind_address(address);
  }
  if (const char* level = std::getenv("STREAMCTL_LOG_LEVEL"); level && *level) {
    config.mutable_logging()->set_level(level);
  }
  if (const char* pattern = std::getenv("STREAMCTL_LOG_PATTERN"); pattern && *pattern) {
    config.mutable_logging()->set_pattern(pattern);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& supervisor = config.supervisor();
  if (config.server().bind_address().empty()) {
    throw std::runtime_error("Invalid configuration: server.bind_address must not be empty");
  }
  if (supervisor.base_dir().empty()) {
    throw std::runtime_error("Invalid configuration: supervisor.base_dir must not be empty");
  }
  if (supervisor.transcoder_bin().empty()) {
    throw std::runtime_error("Invalid configuration: supervisor.transcoder_bin must not be empty");
  }
  if (!IsPositive(supervisor.graceful_stop_timeout())) {
    throw std::runtime_error("Invalid configuration: supervisor.graceful_stop_timeout must be positive");
  }
  if (!IsPositive(supervisor.kill_wait_timeout())) {
    throw std::runtime_error("Invalid configuration: supervisor.kill_wait_timeout must be positive");
  }
  if (!IsPositive(supervisor.poll_interval())) {
    throw std::runtime_error("Invalid configuration: supervisor.poll_interval must be positive");
  }
  if (util::ToMillis(supervisor.reaper_interval()).count() < 0) {
    throw std::runtime_error("Invalid configuration: supervisor.reaper_interval must not be negative");
  }
  if (config.encoding().video_codec().empty() || config.encoding().audio_codec().empty() || config.encoding().output_format().empty()) {
    throw std::runtime_error("Invalid configuration: encoding codecs and output_format must not be empty");
  }
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& path) {
  auto config = Defaults();
  if (path) {
    const auto file = LoadFromYaml(*path);
    config.MergeFrom(file);

    // MergeFrom skips zero-valued fields, so an explicit "0s" would be lost.
    const auto& from = file.supervisor();
    auto*       to   = config.mutable_supervisor();
    if (from.has_graceful_stop_timeout()) {
      *to->mutable_graceful_stop_timeout() = from.graceful_stop_timeout();
    }
    if (from.has_kill_wait_timeout()) {
      *to->mutable_kill_wait_timeout() = from.kill_wait_timeout();
    }
    if (from.has_poll_interval()) {
      *to->mutable_poll_interval() = from.poll_interval();
    }
    if (from.has_reaper_interval()) {
      *to->mutable_reaper_interval() = from.reaper_interval();
    }
  }
  ApplyEnvironmentOverrides(config);
  Validate(config);
  return config;
}

} // namespace streamctl::config
