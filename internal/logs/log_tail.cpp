#include "log_tail.hpp"

#include <algorithm>
#include <cerrno>
#include <deque>
#include <fstream>
#include <system_error>
#include <vector>

namespace streamctl::logs {

namespace {

constexpr std::streamoff kInitialChunk = 1024;
constexpr std::streamoff kMaxChunk     = 10 * 1024 * 1024;

std::deque<std::string> SplitLines(const std::string& data) {
  std::deque<std::string> out;
  std::size_t             start = 0;
  while (start < data.size()) {
    auto end = data.find('\n', start);
    if (end == std::string::npos) {
      end = data.size();
    }
    std::string line = data.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    out.push_back(std::move(line));
    start = end + 1;
  }
  return out;
}

} // namespace

LogTail TailFile(const std::filesystem::path& path, std::size_t lines) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::system_error(errno, std::generic_category(), "cannot open " + path.string());
  }

  LogTail tail;
  if (lines == 0) {
    return tail;
  }

  in.seekg(0, std::ios::end);
  std::streamoff position = in.tellg();
  if (position <= 0) {
    return tail;
  }

  std::string    data;
  std::streamoff chunk = kInitialChunk;
  while (position > 0) {
    const auto read_size = std::min(chunk, position);
    position -= read_size;

    std::vector<char> buffer(static_cast<std::size_t>(read_size));
    in.seekg(position, std::ios::beg);
    in.read(buffer.data(), read_size);
    data.insert(0, buffer.data(), static_cast<std::size_t>(in.gcount()));

    // N whole lines need N+1 newlines unless we reached the start of the file.
    const auto newlines = static_cast<std::size_t>(std::count(data.begin(), data.end(), '\n'));
    if (newlines > lines) {
      break;
    }
    chunk = std::min(chunk * 2, kMaxChunk);
  }

  auto all = SplitLines(data);
  // The first line may be a fragment when we stopped mid-file; it is beyond the window anyway.
  while (all.size() > lines) {
    all.pop_front();
  }

  tail.line_count = all.size();
  for (std::size_t i = 0; i < all.size(); ++i) {
    if (i > 0) {
      tail.content.push_back('\n');
    }
    tail.content += all[i];
  }
  return tail;
}

} // namespace streamctl::logs
