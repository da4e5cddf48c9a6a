#include "internal/registry/stream_registry.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fake_transcoder.hpp"

namespace {

using streamctl::model::ManagedProcess;
using streamctl::model::ProcessState;
using streamctl::registry::StreamPaths;
using streamctl::registry::StreamRegistry;
using streamctl::testing::MakeSpec;
using streamctl::testing::TempDir;

ManagedProcess Running(const std::string& id, pid_t pid) {
  ManagedProcess process;
  process.spec       = MakeSpec(id);
  process.pid        = pid;
  process.state      = ProcessState::kRunning;
  process.started_at = streamctl::util::Now();
  process.argv       = {"/usr/bin/ffmpeg", "-re", "-i", process.spec.source()};
  return process;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void TestInsertPersistsPidAndRecord() {
  TempDir        dir("streamctl_registry_insert");
  StreamRegistry registry{StreamPaths(dir.path())};

  registry.Insert(Running("s1", 4242));

  assert(ReadAll(registry.Paths().PidFile("s1")) == "4242\n");
  const auto record = ReadAll(registry.Paths().MetaFile("s1"));
  assert(record.find("\"destination\"") != std::string::npos);
  assert(record.find("rtmp://example.invalid/app/s1") != std::string::npos);
}

void TestInsertOverActiveEntryIsRejected() {
  TempDir        dir("streamctl_registry_active");
  StreamRegistry registry{StreamPaths(dir.path())};
  registry.Insert(Running("s1", 4242));

  bool threw = false;
  try {
    registry.Insert(Running("s1", 4343));
  } catch (const streamctl::util::AlreadyRunning&) {
    threw = true;
  }
  assert(threw);
  assert(*registry.Get("s1")->pid == 4242);
}

void TestInsertReplacesTerminalEntry() {
  TempDir        dir("streamctl_registry_replace");
  StreamRegistry registry{StreamPaths(dir.path())};
  registry.Insert(Running("s1", 4242));
  registry.Update("s1", [](ManagedProcess& p) {
    p.state = ProcessState::kCrashed;
    p.pid.reset();
  });
  assert(!std::filesystem::exists(registry.Paths().PidFile("s1")));

  registry.Insert(Running("s1", 5151));
  const auto current = registry.Get("s1");
  assert(current->state == ProcessState::kRunning);
  assert(*current->pid == 5151);
  assert(ReadAll(registry.Paths().PidFile("s1")) == "5151\n");
}

void TestUpdateRejectsIllegalTransition() {
  TempDir        dir("streamctl_registry_transition");
  StreamRegistry registry{StreamPaths(dir.path())};
  registry.Insert(Running("s1", 4242));
  registry.Update("s1", [](ManagedProcess& p) {
    p.state = ProcessState::kStopped;
    p.pid.reset();
  });

  bool threw = false;
  try {
    registry.Update("s1", [](ManagedProcess& p) { p.state = ProcessState::kRunning; });
  } catch (const std::logic_error& e) {
    threw = std::string(e.what()) == "invalid stream state transition for s1: stopped -> running";
  }
  assert(threw && "Stopped entries are never revived in place.");
  assert(registry.Get("s1")->state == ProcessState::kStopped);
}

void TestUpdateUnknownIdIsNotFound() {
  TempDir        dir("streamctl_registry_update_missing");
  StreamRegistry registry{StreamPaths(dir.path())};

  bool threw = false;
  try {
    registry.Update("ghost", [](ManagedProcess&) {});
  } catch (const streamctl::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListIsOrderedById() {
  TempDir        dir("streamctl_registry_list");
  StreamRegistry registry{StreamPaths(dir.path())};
  registry.Insert(Running("charlie", 3));
  registry.Insert(Running("alpha", 1));
  registry.Insert(Running("bravo", 2));

  const auto all = registry.ListAll();
  assert(all.size() == 3);
  assert(all[0].id() == "alpha" && all[1].id() == "bravo" && all[2].id() == "charlie");
}

void TestRemoveDeletesArtifacts() {
  TempDir        dir("streamctl_registry_remove");
  StreamRegistry registry{StreamPaths(dir.path())};
  registry.Insert(Running("s1", 4242));
  std::ofstream(registry.Paths().LogFile("s1")) << "last words\n";
  registry.Update("s1", [](ManagedProcess& p) {
    p.state = ProcessState::kStopped;
    p.pid.reset();
  });

  auto removed = registry.Remove("s1", false);
  assert(removed && removed->id() == "s1");
  assert(!registry.Get("s1"));
  assert(!std::filesystem::exists(registry.Paths().MetaFile("s1")));
  assert(std::filesystem::exists(registry.Paths().LogFile("s1")));

  assert(!registry.Remove("s1", true));
}

void TestRediscoverAdoptsPidFilesAndRestoresSpec() {
  TempDir dir("streamctl_registry_rediscover");
  {
    StreamRegistry first{StreamPaths(dir.path())};
    first.Insert(Running("live", ::getpid()));
    first.Insert(Running("done", 4242));
    first.Update("done", [](ManagedProcess& p) {
      p.state = ProcessState::kStopped;
      p.pid.reset();
    });
  }
  std::ofstream(dir.path() / "pids" / "broken.pid") << "not-a-pid\n";

  StreamRegistry second{StreamPaths(dir.path())};
  const auto     report = second.Rediscover();

  assert(report.adopted.size() == 1 && report.adopted[0] == "live");
  assert(report.stopped.size() == 1 && report.stopped[0] == "done");
  assert(report.discarded.size() == 1 && report.discarded[0] == "broken");
  assert(!std::filesystem::exists(dir.path() / "pids" / "broken.pid"));

  const auto live = second.Get("live");
  assert(live->adopted);
  assert(live->state == ProcessState::kRunning);
  assert(*live->pid == ::getpid());
  assert(live->spec.destination() == "rtmp://example.invalid/app/live");
  assert(live->argv.size() == 4);

  const auto done = second.Get("done");
  assert(done->state == ProcessState::kStopped);
  assert(!done->pid);
  assert(!second.Get("broken"));
}

void TestStreamMutexIsStablePerId() {
  TempDir        dir("streamctl_registry_mutex");
  StreamRegistry registry{StreamPaths(dir.path())};
  assert(registry.StreamMutex("a") == registry.StreamMutex("a"));
  assert(registry.StreamMutex("a") != registry.StreamMutex("b"));
}

} // namespace

int main() {
  TestInsertPersistsPidAndRecord();
  TestInsertOverActiveEntryIsRejected();
  TestInsertReplacesTerminalEntry();
  TestUpdateRejectsIllegalTransition();
  TestUpdateUnknownIdIsNotFound();
  TestListIsOrderedById();
  TestRemoveDeletesArtifacts();
  TestRediscoverAdoptsPidFilesAndRestoresSpec();
  TestStreamMutexIsStablePerId();

  std::cout << "streamctl_unit_stream_registry: pass\n";
  return 0;
}
