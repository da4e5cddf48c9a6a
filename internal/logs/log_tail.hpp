#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace streamctl::logs {

struct LogTail {
  std::string content;
  std::size_t line_count{0};
};

/*
  Returns the last `lines` lines of a file, joined with '\n' (no trailing
  newline). Reads backwards in growing chunks so large logs are not
  loaded whole. Throws std::system_error if the file cannot be opened.
*/
LogTail TailFile(const std::filesystem::path& path, std::size_t lines);

} // namespace streamctl::logs
