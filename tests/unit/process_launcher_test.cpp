#include "internal/process/process_launcher.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_transcoder.hpp"

namespace {

using streamctl::process::ProcessLauncher;
using streamctl::process::RequiresReencode;
using streamctl::testing::MakeSpec;
using streamctl::testing::TempDir;
using streamctl::testing::WriteScript;

using Args = std::vector<std::string>;

ProcessLauncher MakeLauncher(const std::string& binary = "/usr/bin/ffmpeg") {
  return ProcessLauncher(binary, streamctl::config::ConfigLoader::Defaults().encoding());
}

bool Contains(const Args& args, const std::string& token) {
  return std::find(args.begin(), args.end(), token) != args.end();
}

void TestCopyArgumentsWithoutFilters() {
  streamctl::v1::StreamSpec spec;
  spec.set_id("s1");
  spec.set_source("https://cdn.example/live.m3u8");
  spec.set_destination("rtmp://live.example/app/key");

  const Args expected = {"/usr/bin/ffmpeg", "-re", "-i", "https://cdn.example/live.m3u8", "-c:v", "copy", "-c:a", "aac", "-ar", "44100",
                         "-b:a", "128k", "-f", "flv", "rtmp://live.example/app/key"};
  assert(MakeLauncher().BuildArguments(spec) == expected);
}

void TestInputOnlyOverlayKeepsStreamCopy() {
  auto spec = MakeSpec("s1");
  spec.set_overlay_image("/srv/logo.png");

  const auto args = MakeLauncher().BuildArguments(spec);
  assert(args[4] == "-i" && args[5] == "/srv/logo.png");
  assert(args[6] == "-c:v" && args[7] == "copy");
}

void TestFullOverlayAddsFilterAndReencodes() {
  auto spec = MakeSpec("s1");
  spec.set_overlay_image("/srv/logo.png");
  spec.set_overlay_mode(streamctl::v1::OVERLAY_MODE_FULL);

  const auto args = MakeLauncher().BuildArguments(spec);
  auto       it   = std::find(args.begin(), args.end(), "-filter_complex");
  assert(it != args.end());
  assert(*(it + 1) == "[0:v][1:v]overlay=(W-w)/2:(H-h)/2:format=auto");
  assert(Contains(args, "libx264") && Contains(args, "veryfast") && Contains(args, "zerolatency") && Contains(args, "2000k"));
  assert(!Contains(args, "copy"));
}

void TestCallerFilterWinsOverFullOverlay() {
  auto spec = MakeSpec("s1");
  spec.set_overlay_image("/srv/logo.png");
  spec.set_overlay_mode(streamctl::v1::OVERLAY_MODE_FULL);
  spec.add_extra_args("-filter_complex");
  spec.add_extra_args("[0:v][1:v]overlay=10:10");

  const auto args = MakeLauncher().BuildArguments(spec);
  assert(std::count(args.begin(), args.end(), "-filter_complex") == 1);
  assert(Contains(args, "[0:v][1:v]overlay=10:10"));
}

void TestExtraArgsPassVerbatimInOrder() {
  auto spec = MakeSpec("s1");
  spec.add_extra_args("-vf");
  spec.add_extra_args("drawtext=text='Live'");
  spec.add_extra_args("-g");
  spec.add_extra_args("60");

  const auto args = MakeLauncher().BuildArguments(spec);
  auto       it   = std::find(args.begin(), args.end(), "-vf");
  assert(it != args.end());
  assert(*(it + 1) == "drawtext=text='Live'" && *(it + 2) == "-g" && *(it + 3) == "60");
  assert(Contains(args, "libx264"));
  assert(args.back() == spec.destination());
}

void TestOverlayAlreadyInExtraArgsIsNotDuplicated() {
  auto spec = MakeSpec("s1");
  spec.set_overlay_image("/srv/logo.png");
  spec.add_extra_args("-i");
  spec.add_extra_args("/srv/logo.png");

  const auto args = MakeLauncher().BuildArguments(spec);
  assert(std::count(args.begin(), args.end(), "/srv/logo.png") == 1);
}

void TestRealtimeInputCanBeDisabled() {
  auto encoding = streamctl::config::ConfigLoader::Defaults().encoding();
  encoding.set_no_realtime_input(true);
  ProcessLauncher launcher("/usr/bin/ffmpeg", encoding);

  const auto args = launcher.BuildArguments(MakeSpec("s1"));
  assert(!Contains(args, "-re"));
  assert(args[1] == "-i");
}

void TestReencodeKeywordDetection() {
  assert(!RequiresReencode({}));
  assert(!RequiresReencode({"-g", "60"}));
  assert(RequiresReencode({"-VF", "hflip"}));
  assert(RequiresReencode({"-filter:v", "scale=1280:720"}));
  assert(RequiresReencode({"-filter:v", "crop=100:100"}));
}

void TestMissingBinaryIsExecutableNotFound() {
  TempDir dir("streamctl_launcher_missing");
  auto    launcher = MakeLauncher((dir.path() / "does-not-exist").string());

  bool threw = false;
  try {
    (void)launcher.Launch(MakeSpec("s1"), dir.path() / "s1.log");
  } catch (const streamctl::util::ExecutableNotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir.path() / "s1.log"));
}

void TestNonExecutableBinaryIsExecutableNotFound() {
  TempDir dir("streamctl_launcher_noexec");
  const auto script = WriteScript(dir.path(), "plain.sh", streamctl::testing::kRunForeverScript);
  std::filesystem::permissions(script, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);

  bool threw = false;
  try {
    (void)MakeLauncher(script.string()).Launch(MakeSpec("s1"), dir.path() / "s1.log");
  } catch (const streamctl::util::ExecutableNotFound&) {
    threw = true;
  }
  // root bypasses permission bits; X_OK still requires an execute bit somewhere.
  assert(threw);
}

void TestUnwritableLogIsSpawnFailed() {
  TempDir    dir("streamctl_launcher_nolog");
  const auto script = WriteScript(dir.path(), "fake.sh", streamctl::testing::kRunForeverScript);

  bool threw = false;
  try {
    (void)MakeLauncher(script.string()).Launch(MakeSpec("s1"), dir.path() / "missing-dir" / "s1.log");
  } catch (const streamctl::util::SpawnFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestLaunchStartsOwnProcessGroupAndCapturesOutput() {
  TempDir    dir("streamctl_launcher_ok");
  const auto script = WriteScript(dir.path(), "fake.sh", "#!/bin/sh\necho \"started $#\"\nwhile :; do sleep 0.1; done\n");
  const auto log    = dir.path() / "s1.log";

  auto launched = MakeLauncher(script.string()).Launch(MakeSpec("s1"), log);
  assert(launched.pid > 0);
  assert(launched.argv.front() == script.string());
  assert(::getpgid(launched.pid) == launched.pid);

  const bool logged = streamctl::testing::WaitUntil([&] { return std::filesystem::file_size(log) > 0; }, std::chrono::seconds(2));
  assert(logged);

  ::killpg(launched.pid, SIGKILL);
  int status = 0;
  ::waitpid(launched.pid, &status, 0);
  assert(WIFSIGNALED(status));
}

} // namespace

int main() {
  TestCopyArgumentsWithoutFilters();
  TestInputOnlyOverlayKeepsStreamCopy();
  TestFullOverlayAddsFilterAndReencodes();
  TestCallerFilterWinsOverFullOverlay();
  TestExtraArgsPassVerbatimInOrder();
  TestOverlayAlreadyInExtraArgsIsNotDuplicated();
  TestRealtimeInputCanBeDisabled();
  TestReencodeKeywordDetection();
  TestMissingBinaryIsExecutableNotFound();
  TestNonExecutableBinaryIsExecutableNotFound();
  TestUnwritableLogIsSpawnFailed();
  TestLaunchStartsOwnProcessGroupAndCapturesOutput();

  std::cout << "streamctl_unit_process_launcher: pass\n";
  return 0;
}
