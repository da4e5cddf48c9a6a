#include "process_launcher.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string_view>

#include "internal/util/errors.hpp"

namespace streamctl::process {

using streamctl::v1::OVERLAY_MODE_FULL;

namespace {

constexpr std::string_view kFullFrameOverlay = "[0:v][1:v]overlay=(W-w)/2:(H-h)/2:format=auto";

constexpr std::array<std::string_view, 7> kReencodeKeywords = {"-filter_complex", "-vf", "drawtext", "overlay", "format=", "scale", "crop"};

std::string JoinLower(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += arg;
  }
  std::transform(joined.begin(), joined.end(), joined.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return joined;
}

std::string ErrnoMessage(int err) {
  return std::strerror(err);
}

class UniqueFd {
 public:
  explicit UniqueFd(int fd = -1) : fd_(fd) {
  }
  ~UniqueFd() {
    reset();
  }

  UniqueFd(const UniqueFd&)            = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const {
    return fd_;
  }

  explicit operator bool() const {
    return fd_ >= 0;
  }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

[[noreturn]] void ReportAndExit(int status_fd, int err) {
  ssize_t ignored = ::write(status_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

// Runs between fork and exec: async-signal-safe calls only.
[[noreturn]] void RunChild(const char* binary, char* const* argv, int log_fd, int status_fd) {
  if (::setsid() < 0) {
    ReportAndExit(status_fd, errno);
  }

  struct sigaction default_action;
  std::memset(&default_action, 0, sizeof(default_action));
  default_action.sa_handler = SIG_DFL;
  for (int sig = 1; sig < NSIG; ++sig) {
    ::sigaction(sig, &default_action, nullptr);
  }

  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    if (devnull > STDERR_FILENO) {
      ::close(devnull);
    }
  }

  if (::dup2(log_fd, STDOUT_FILENO) < 0 || ::dup2(log_fd, STDERR_FILENO) < 0) {
    ReportAndExit(status_fd, errno);
  }

  ::execv(binary, argv);
  ReportAndExit(status_fd, errno);
}

} // namespace

bool RequiresReencode(const std::vector<std::string>& args) {
  if (args.empty()) {
    return false;
  }

  const auto joined = JoinLower(args);
  return std::any_of(kReencodeKeywords.begin(), kReencodeKeywords.end(),
                     [&](std::string_view keyword) { return joined.find(keyword) != std::string::npos; });
}

ProcessLauncher::ProcessLauncher(std::string transcoder_bin, streamctl::runtime::config::EncodingConfig encoding)
    : transcoder_bin_(std::move(transcoder_bin)), encoding_(std::move(encoding)) {
}

std::vector<std::string> ProcessLauncher::BuildArguments(const streamctl::v1::StreamSpec& spec) const {
  std::vector<std::string> passthrough;

  const auto& image = spec.overlay_image();
  const auto& extra = spec.extra_args();
  if (!image.empty() && std::find(extra.begin(), extra.end(), image) == extra.end()) {
    passthrough.push_back("-i");
    passthrough.push_back(image);
  }

  passthrough.insert(passthrough.end(), extra.begin(), extra.end());

  if (!image.empty() && spec.overlay_mode() == OVERLAY_MODE_FULL) {
    const auto joined = JoinLower(std::vector<std::string>(extra.begin(), extra.end()));
    if (joined.find("-filter_complex") == std::string::npos && joined.find("overlay") == std::string::npos) {
      passthrough.push_back("-filter_complex");
      passthrough.emplace_back(kFullFrameOverlay);
    }
  }

  std::vector<std::string> args{transcoder_bin_};
  if (!encoding_.no_realtime_input()) {
    args.push_back("-re");
  }
  args.push_back("-i");
  args.push_back(spec.source());

  args.insert(args.end(), passthrough.begin(), passthrough.end());

  if (RequiresReencode(passthrough)) {
    args.insert(args.end(), {"-c:v", encoding_.video_codec(), "-preset", encoding_.video_preset(), "-tune", encoding_.video_tune(), "-b:v",
                             encoding_.video_bitrate()});
  } else {
    args.insert(args.end(), {"-c:v", "copy"});
  }

  args.insert(args.end(), {"-c:a", encoding_.audio_codec(), "-ar", std::to_string(encoding_.audio_sample_rate()), "-b:a", encoding_.audio_bitrate(),
                           "-f", encoding_.output_format(), spec.destination()});
  return args;
}

void ProcessLauncher::CheckExecutable() const {
  std::error_code ec;
  if (transcoder_bin_.empty() || !std::filesystem::is_regular_file(transcoder_bin_, ec)) {
    throw util::ExecutableNotFound("transcoder binary not found at " + transcoder_bin_);
  }
  if (::access(transcoder_bin_.c_str(), X_OK) != 0) {
    throw util::ExecutableNotFound("transcoder binary " + transcoder_bin_ + " is not executable: " + ErrnoMessage(errno));
  }
}

LaunchedProcess ProcessLauncher::Launch(const streamctl::v1::StreamSpec& spec, const std::filesystem::path& log_path) const {
  CheckExecutable();

  LaunchedProcess launched;
  launched.argv = BuildArguments(spec);

  // Everything the child touches is prepared before fork.
  std::vector<char*> raw_argv;
  raw_argv.reserve(launched.argv.size() + 1);
  for (auto& arg : launched.argv) {
    raw_argv.push_back(arg.data());
  }
  raw_argv.push_back(nullptr);

  UniqueFd log_fd(::open(log_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!log_fd) {
    throw util::SpawnFailed("cannot open log file " + log_path.string() + ": " + ErrnoMessage(errno));
  }

  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    throw util::SpawnFailed("cannot create status pipe: " + ErrnoMessage(errno));
  }
  UniqueFd status_read(status_pipe[0]);
  UniqueFd status_write(status_pipe[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::SpawnFailed("fork failed: " + ErrnoMessage(errno));
  }
  if (pid == 0) {
    RunChild(transcoder_bin_.c_str(), raw_argv.data(), log_fd.get(), status_write.get());
  }

  status_write.reset();
  log_fd.reset();

  // The pipe closes on successful exec; anything read is the child's errno.
  int     child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_read.get(), &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);

  if (n > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    const auto message = "exec " + transcoder_bin_ + " failed: " + ErrnoMessage(child_errno);
    if (child_errno == ENOENT || child_errno == EACCES || child_errno == ENOEXEC) {
      throw util::ExecutableNotFound(message);
    }
    throw util::SpawnFailed(message);
  }

  launched.pid = pid;
  return launched;
}

} // namespace streamctl::process
