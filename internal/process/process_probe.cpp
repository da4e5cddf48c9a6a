#include "process_probe.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace streamctl::process {

namespace {

ExitInfo FromSiginfo(const siginfo_t& info) {
  ExitInfo exit;
  if (info.si_code == CLD_EXITED) {
    exit.exit_code = info.si_status;
  } else if (info.si_code == CLD_KILLED || info.si_code == CLD_DUMPED) {
    exit.term_signal = info.si_status;
  }
  return exit;
}

struct ProcStat {
  char  state{'?'};
  pid_t pgrp{-1};
};

std::optional<ProcStat> ReadStat(pid_t pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) {
    return std::nullopt;
  }

  std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
  // The fields after the parenthesised comm (which may contain spaces) are "state ppid pgrp ...".
  const auto close_paren = content.rfind(')');
  if (close_paren == std::string::npos) {
    return std::nullopt;
  }

  std::istringstream rest(content.substr(close_paren + 1));
  ProcStat           parsed;
  pid_t              ppid = 0;
  if (!(rest >> parsed.state >> ppid >> parsed.pgrp)) {
    return std::nullopt;
  }
  return parsed;
}

bool IsZombie(pid_t pid) {
  const auto stat = ReadStat(pid);
  return stat && stat->state == 'Z';
}

ProbeResult ProbeForeign(pid_t pid) {
  ProbeResult result;
  if (::kill(pid, 0) == 0 || errno == EPERM) {
    result.alive = !IsZombie(pid);
  }
  return result;
}

} // namespace

ProbeResult Probe(pid_t pid, bool reap) {
  if (pid <= 0) {
    return {};
  }

  siginfo_t info{};
  int       options = WEXITED | WNOHANG;
  if (!reap) {
    options |= WNOWAIT;
  }

  int rc;
  do {
    rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, options);
  } while (rc == -1 && errno == EINTR);

  if (rc == -1) {
    // ECHILD: not our child, or already reaped by a concurrent probe.
    return ProbeForeign(pid);
  }

  if (info.si_pid == 0) {
    return {true, {}};
  }

  return {false, FromSiginfo(info)};
}

bool CommandLineMentions(pid_t pid, const std::string& binary) {
  std::ifstream cmdline("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
  if (!cmdline) {
    return true;
  }

  std::string content((std::istreambuf_iterator<char>(cmdline)), std::istreambuf_iterator<char>());
  const auto  name = std::filesystem::path(binary).filename().string();
  if (name.empty()) {
    return true;
  }
  return content.find(name) != std::string::npos;
}

SignalResult SignalGroup(pid_t pgid, int signal) {
  if (pgid <= 1) {
    throw std::system_error(EINVAL, std::generic_category(), "refusing to signal process group " + std::to_string(pgid));
  }

  // Never signal our own group; fall back to the single process.
  const int rc = pgid == ::getpgrp() ? ::kill(pgid, signal) : ::killpg(pgid, signal);
  if (rc != 0) {
    if (errno == ESRCH) {
      return SignalResult::kNoSuchProcess;
    }
    throw std::system_error(errno, std::generic_category(), "killpg(" + std::to_string(pgid) + ")");
  }
  return SignalResult::kDelivered;
}

bool GroupAlive(pid_t pgid) {
  if (pgid <= 1) {
    return false;
  }
  if (::killpg(pgid, 0) != 0 && errno == ESRCH) {
    return false;
  }

  // killpg also reaches zombies nobody has reaped yet; only count live members.
  std::error_code ec;
  auto            it = std::filesystem::directory_iterator("/proc", ec);
  if (ec) {
    return true;
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return true;
    }
    const auto name = it->path().filename().string();
    if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    const auto stat = ReadStat(static_cast<pid_t>(std::stol(name)));
    if (stat && stat->pgrp == pgid && stat->state != 'Z' && stat->state != 'X') {
      return true;
    }
  }
  return false;
}

} // namespace streamctl::process
