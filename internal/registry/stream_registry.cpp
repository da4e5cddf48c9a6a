#include "stream_registry.hpp"

#include <google/protobuf/util/json_util.h>

#include <cerrno>
#include <charconv>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace streamctl::registry {

namespace fs = std::filesystem;

using model::ManagedProcess;
using model::ProcessState;

namespace {

// Writes to a sibling temp file and renames, so readers never see a partial file.
void WriteFileAtomically(const fs::path& path, const std::string& content) {
  auto          tmp = path;
  tmp += ".tmp";
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::system_error(errno, std::generic_category(), "open " + tmp.string());
  }
  out << content;
  out.close();
  if (!out) {
    throw std::system_error(errno, std::generic_category(), "write " + tmp.string());
  }
  fs::rename(tmp, path);
}

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::system_error(errno, std::generic_category(), "open " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::optional<pid_t> ParsePid(std::string content) {
  while (!content.empty() && (content.back() == '\n' || content.back() == '\r' || content.back() == ' ')) {
    content.pop_back();
  }
  long long value = 0;
  auto [end, ec]  = std::from_chars(content.data(), content.data() + content.size(), value);
  if (ec != std::errc{} || end != content.data() + content.size() || value <= 0) {
    return std::nullopt;
  }
  return static_cast<pid_t>(value);
}

// Ids present in `dir` as "<id><extension>".
std::set<std::string> ScanIds(const fs::path& dir, const std::string& extension) {
  std::set<std::string> ids;
  std::error_code       ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != extension) {
      continue;
    }
    ids.insert(entry.path().stem().string());
  }
  if (ec) {
    throw std::system_error(ec, "scan " + dir.string());
  }
  return ids;
}

} // namespace

StreamRegistry::StreamRegistry(StreamPaths paths) : paths_(std::move(paths)) {
  paths_.EnsureLayout();
}

std::optional<ManagedProcess> StreamRegistry::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void StreamRegistry::Insert(const ManagedProcess& process) {
  ValidateStreamId(process.id());

  std::lock_guard lock(mutex_);
  auto            it = entries_.find(process.id());
  if (it != entries_.end() && model::IsActive(it->second.state)) {
    throw util::AlreadyRunning("stream already running: " + process.id());
  }

  WriteRecord(process);
  try {
    if (process.pid) {
      WritePidFile(process);
    } else {
      RemovePidFile(process.id());
    }
  } catch (...) {
    std::error_code ec;
    fs::remove(paths_.MetaFile(process.id()), ec);
    throw;
  }

  entries_[process.id()] = process;
}

ManagedProcess StreamRegistry::Update(const std::string& id, const std::function<void(ManagedProcess&)>& mutation) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) {
    throw util::NotFound("stream not found: " + id);
  }

  ManagedProcess updated = it->second;
  mutation(updated);

  if (updated.id() != id) {
    throw std::logic_error("stream id cannot change on update");
  }
  if (!model::CanTransition(it->second.state, updated.state)) {
    throw std::logic_error("invalid stream state transition for " + id + ": " + std::string(model::ToString(it->second.state)) +
                           " -> " + std::string(model::ToString(updated.state)));
  }

  if (updated.pid != it->second.pid) {
    if (updated.pid) {
      WritePidFile(updated);
    } else {
      RemovePidFile(id);
    }
  }

  it->second = updated;
  return updated;
}

std::optional<ManagedProcess> StreamRegistry::Remove(const std::string& id, bool remove_log) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }

  fs::remove(paths_.PidFile(id));
  fs::remove(paths_.MetaFile(id));
  if (remove_log) {
    fs::remove(paths_.LogFile(id));
  }

  ManagedProcess removed = std::move(it->second);
  entries_.erase(it);
  return removed;
}

std::vector<ManagedProcess> StreamRegistry::ListAll() const {
  std::lock_guard             lock(mutex_);
  std::vector<ManagedProcess> out;
  out.reserve(entries_.size());
  for (const auto& [id, process] : entries_) {
    out.push_back(process);
  }
  return out;
}

std::shared_ptr<std::mutex> StreamRegistry::StreamMutex(const std::string& id) {
  std::lock_guard lock(stream_mutexes_guard_);
  auto&           mutex = stream_mutexes_[id];
  if (!mutex) {
    mutex = std::make_shared<std::mutex>();
  }
  return mutex;
}

StreamRegistry::RediscoveryReport StreamRegistry::Rediscover() {
  RediscoveryReport report;

  std::lock_guard lock(mutex_);

  auto ids            = ScanIds(paths_.PidDir(), ".pid");
  const auto meta_ids = ScanIds(paths_.MetaDir(), ".json");
  ids.insert(meta_ids.begin(), meta_ids.end());

  for (const auto& id : ids) {
    if (!IsValidStreamId(id)) {
      STREAMCTL_LOG_WARN("Ignoring unmanaged file in state directory", {observability::StringField("stream_id", id)});
      continue;
    }
    if (entries_.count(id) != 0) {
      continue;
    }

    ManagedProcess process;
    process.spec.set_id(id);
    process.log_path = paths_.LogFile(id);

    const auto meta_file = paths_.MetaFile(id);
    if (fs::exists(meta_file)) {
      v1::StreamRecord record;
      const auto       parsed = google::protobuf::util::JsonStringToMessage(ReadFile(meta_file), &record);
      if (parsed.ok()) {
        process.spec = record.spec();
        process.spec.set_id(id);
        process.started_at = util::FromProto(record.started_at());
        process.argv.assign(record.argv().begin(), record.argv().end());
      } else {
        STREAMCTL_LOG_WARN("Unreadable stream record", {observability::StringField("stream_id", id),
                                                         observability::StringField("error", parsed.ToString())});
      }
    }

    const auto pid_file = paths_.PidFile(id);
    if (fs::exists(pid_file)) {
      const auto pid = ParsePid(ReadFile(pid_file));
      if (!pid) {
        STREAMCTL_LOG_WARN("Discarding malformed pid file", {observability::StringField("stream_id", id)});
        fs::remove(pid_file);
        report.discarded.push_back(id);
      } else {
        process.pid     = pid;
        process.state   = ProcessState::kRunning;
        process.adopted = true;
        if (process.started_at == util::TimePoint{}) {
          process.started_at = util::Now();
        }
        entries_[id] = process;
        report.adopted.push_back(id);
        STREAMCTL_LOG_INFO("Adopted stream from previous run",
                           {observability::StringField("stream_id", id), observability::IntField("pid", *pid)});
        continue;
      }
    }

    if (!fs::exists(meta_file)) {
      continue;
    }
    process.state = ProcessState::kStopped;
    entries_[id]  = process;
    report.stopped.push_back(id);
  }

  return report;
}

void StreamRegistry::WritePidFile(const ManagedProcess& process) const {
  WriteFileAtomically(paths_.PidFile(process.id()), std::to_string(*process.pid) + "\n");
}

void StreamRegistry::RemovePidFile(const std::string& id) const {
  fs::remove(paths_.PidFile(id));
}

void StreamRegistry::WriteRecord(const ManagedProcess& process) const {
  v1::StreamRecord record;
  *record.mutable_spec()       = process.spec;
  *record.mutable_started_at() = util::ToProto(process.started_at);
  for (const auto& arg : process.argv) {
    record.add_argv(arg);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(record, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize stream record: " + status.ToString());
  }
  WriteFileAtomically(paths_.MetaFile(process.id()), json);
}

} // namespace streamctl::registry
