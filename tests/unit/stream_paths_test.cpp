#include "internal/registry/stream_paths.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using streamctl::registry::IsValidStreamId;
using streamctl::registry::StreamPaths;

void TestAcceptsPlainIds() {
  assert(IsValidStreamId("s1"));
  assert(IsValidStreamId("stream"));
  assert(IsValidStreamId("Channel_7.backup-2"));
  assert(IsValidStreamId(std::string(128, 'a')));
}

void TestRejectsUnsafeIds() {
  assert(!IsValidStreamId(""));
  assert(!IsValidStreamId(".."));
  assert(!IsValidStreamId("../etc/passwd"));
  assert(!IsValidStreamId("a/b"));
  assert(!IsValidStreamId(".hidden"));
  assert(!IsValidStreamId("with space"));
  assert(!IsValidStreamId("tab\tid"));
  assert(!IsValidStreamId(std::string(129, 'a')));
}

void TestPathsStayUnderBaseDir() {
  StreamPaths paths("/var/streamctl");
  assert(paths.PidFile("s1") == "/var/streamctl/pids/s1.pid");
  assert(paths.LogFile("s1") == "/var/streamctl/logs/s1.log");
  assert(paths.MetaFile("s1") == "/var/streamctl/meta/s1.json");
}

void TestPathConstructionRejectsTraversal() {
  StreamPaths paths("/var/streamctl");
  bool        threw = false;
  try {
    (void)paths.LogFile("../../root/.ssh/authorized_keys");
  } catch (const streamctl::util::InvalidSpec&) {
    threw = true;
  }
  assert(threw && "Traversal ids must never produce a path.");
}

} // namespace

int main() {
  TestAcceptsPlainIds();
  TestRejectsUnsafeIds();
  TestPathsStayUnderBaseDir();
  TestPathConstructionRejectsTraversal();

  std::cout << "streamctl_unit_stream_paths: pass\n";
  return 0;
}
