#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/stream_supervisor.hpp"
#include "internal/process/process_launcher.hpp"
#include "internal/registry/stream_registry.hpp"

namespace streamctl::testing {

// Runs until signalled. Loops instead of exec'ing sleep so /proc cmdline keeps the script name.
inline constexpr const char* kRunForeverScript = "#!/bin/sh\nwhile :; do sleep 0.1; done\n";
inline constexpr const char* kIgnoreTermScript = "#!/bin/sh\ntrap '' TERM\nwhile :; do sleep 0.1; done\n";
inline constexpr const char* kExitAtOnceScript = "#!/bin/sh\nexit 3\n";
// Leaves a helper in its process group that ignores SIGTERM and records its pid next to the script.
inline constexpr const char* kForkingHelperScript =
    "#!/bin/sh\nsh -c 'trap \"\" TERM; while :; do sleep 0.1; done' &\necho $! > \"$(dirname \"$0\")/helper.pid\"\nwhile :; do sleep 0.1; done\n";
inline constexpr const char* kChattyScript =
    "#!/bin/sh\ni=1\nwhile [ $i -le 50 ]; do echo \"line $i\"; i=$((i+1)); done\nwhile :; do sleep 0.1; done\n";

class TempDir {
 public:
  explicit TempDir(const std::string& prefix) {
    auto pattern = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

inline std::filesystem::path WriteScript(const std::filesystem::path& dir, const std::string& name, const std::string& body) {
  const auto    path = dir / name;
  std::ofstream out(path);
  out << body;
  out.close();
  ::chmod(path.c_str(), 0755);
  return path;
}

inline streamctl::v1::StreamSpec MakeSpec(const std::string& id) {
  streamctl::v1::StreamSpec spec;
  spec.set_id(id);
  spec.set_source("https://example.invalid/live/" + id + ".m3u8");
  spec.set_destination("rtmp://example.invalid/app/" + id);
  return spec;
}

inline bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

inline core::SupervisorOptions FastOptions() {
  core::SupervisorOptions options;
  options.graceful_timeout = std::chrono::milliseconds(300);
  options.kill_timeout     = std::chrono::milliseconds(1000);
  options.poll_interval    = std::chrono::milliseconds(20);
  return options;
}

// Reads a pid written by a script, 0 until the file holds one.
inline pid_t ReadPidFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  long          pid = 0;
  if (!(in >> pid)) {
    return 0;
  }
  return static_cast<pid_t>(pid);
}

/*
  A supervisor rooted in a private temp dir with a shell script standing
  in for the transcoder. Force-stops whatever is still running on exit.
*/
class SupervisorHarness {
 public:
  explicit SupervisorHarness(const std::string& name, const char* script = kRunForeverScript, core::SupervisorOptions options = FastOptions())
      : dir_(name) {
    binary   = WriteScript(dir_.path(), name + "_transcoder.sh", script);
    registry = std::make_shared<registry::StreamRegistry>(registry::StreamPaths(dir_.path() / "state"));
    launcher = std::make_shared<process::ProcessLauncher>(binary.string(), config::ConfigLoader::Defaults().encoding());
    supervisor = std::make_shared<core::StreamSupervisor>(registry, launcher, options);
  }

  ~SupervisorHarness() {
    for (const auto& process : registry->ListAll()) {
      if (!model::IsActive(process.state)) {
        continue;
      }
      try {
        supervisor->Stop(process.id(), true);
      } catch (const std::exception& e) {
        std::cerr << "harness cleanup failed for " << process.id() << ": " << e.what() << "\n";
      }
    }
  }

  SupervisorHarness(const SupervisorHarness&)            = delete;
  SupervisorHarness& operator=(const SupervisorHarness&) = delete;

  const std::filesystem::path& dir() const {
    return dir_.path();
  }

  std::filesystem::path                      binary;
  std::shared_ptr<registry::StreamRegistry>  registry;
  std::shared_ptr<process::ProcessLauncher> launcher;
  std::shared_ptr<core::StreamSupervisor>    supervisor;

 private:
  TempDir dir_;
};

} // namespace streamctl::testing
