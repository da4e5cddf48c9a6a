#include "internal/logs/log_tail.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include "tests/support/fake_transcoder.hpp"

namespace {

using streamctl::logs::TailFile;
using streamctl::testing::TempDir;

std::filesystem::path WriteLines(const std::filesystem::path& dir, const std::string& name, int count, bool trailing_newline = true) {
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  for (int i = 1; i <= count; ++i) {
    out << "frame=" << i << " fps=30 q=-1.0 size=" << i * 128 << "kB";
    if (i < count || trailing_newline) {
      out << '\n';
    }
  }
  return path;
}

void TestReturnsExactlyRequestedTrailingLines() {
  TempDir    dir("streamctl_log_tail_exact");
  const auto path = WriteLines(dir.path(), "s1.log", 500);

  const auto tail = TailFile(path, 3);
  assert(tail.line_count == 3);
  assert(tail.content == "frame=498 fps=30 q=-1.0 size=63744kB\nframe=499 fps=30 q=-1.0 size=63872kB\nframe=500 fps=30 q=-1.0 size=64000kB");
}

void TestShortLogReturnsEverything() {
  TempDir    dir("streamctl_log_tail_short");
  const auto path = WriteLines(dir.path(), "s1.log", 4, false);

  const auto tail = TailFile(path, 200);
  assert(tail.line_count == 4);
  assert(tail.content.rfind("frame=1 ", 0) == 0);
}

void TestLargeLogCrossesChunkBoundaries() {
  TempDir    dir("streamctl_log_tail_large");
  const auto path = WriteLines(dir.path(), "s1.log", 100000);

  const auto tail = TailFile(path, 2000);
  assert(tail.line_count == 2000);
  assert(tail.content.rfind("frame=98001 ", 0) == 0);
  assert(tail.content.size() > 4096);
}

void TestCarriageReturnsAreStripped() {
  TempDir    dir("streamctl_log_tail_crlf");
  const auto path = dir.path() / "s1.log";
  std::ofstream(path, std::ios::binary) << "one\r\ntwo\r\n";

  const auto tail = TailFile(path, 10);
  assert(tail.content == "one\ntwo");
}

void TestEmptyLogAndZeroLines() {
  TempDir    dir("streamctl_log_tail_empty");
  const auto path = dir.path() / "s1.log";
  std::ofstream(path).close();

  assert(TailFile(path, 10).line_count == 0);
  assert(TailFile(WriteLines(dir.path(), "s2.log", 5), 0).content.empty());
}

void TestMissingFileThrows() {
  TempDir dir("streamctl_log_tail_missing");
  bool    threw = false;
  try {
    (void)TailFile(dir.path() / "nope.log", 10);
  } catch (const std::system_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReturnsExactlyRequestedTrailingLines();
  TestShortLogReturnsEverything();
  TestLargeLogCrossesChunkBoundaries();
  TestCarriageReturnsAreStripped();
  TestEmptyLogAndZeroLines();
  TestMissingFileThrows();

  std::cout << "streamctl_unit_log_tail: pass\n";
  return 0;
}
