#include "conductor/sessions/persistence.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/observability/global.hpp"

#include <sstream>

namespace conductor::sessions {

std::string encode_session_document(const std::vector<Session> &sessions,
                                    const common::TimePoint written_at) {
  std::ostringstream out;
  out << "{\n  \"sessions\": {";
  bool first = true;
  for (const auto &session : sessions) {
    out << (first ? "\n    " : ",\n    ");
    first = false;
    out << common::json_quote(session.thread_id) << ": " << encode_session_json(session);
  }
  out << (sessions.empty() ? "}" : "\n  }");
  out << ",\n  \"lastUpdated\": " << common::json_quote(common::format_timestamp(written_at));
  out << ",\n  \"version\": " << common::json_quote(SESSION_FILE_VERSION) << "\n}\n";
  return out.str();
}

common::Result<std::vector<Session>> parse_session_document(const std::string &json) {
  using R = common::Result<std::vector<Session>>;
  const auto document = common::json_parse_object(json);
  if (!document.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure, document.error());
  }
  const auto sessions_member = document.value().find("sessions");
  if (sessions_member == document.value().end() || sessions_member->second.is_string) {
    return R::failure(common::ErrorCode::PersistenceFailure, "sessions object missing");
  }
  const auto entries = common::json_parse_object(sessions_member->second.raw);
  if (!entries.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure, "sessions: " + entries.error());
  }

  std::vector<Session> sessions;
  sessions.reserve(entries.value().size());
  for (const auto &[thread_id, member] : entries.value()) {
    if (member.is_string) {
      return R::failure(common::ErrorCode::PersistenceFailure,
                        "session " + thread_id + " is not an object");
    }
    auto session = parse_session_json(member.raw);
    if (!session.ok()) {
      return R::failure(common::ErrorCode::PersistenceFailure,
                        "session " + thread_id + ": " + session.error());
    }
    if (session.value().thread_id != thread_id) {
      return R::failure(common::ErrorCode::PersistenceFailure,
                        "session key " + thread_id + " does not match its threadId");
    }
    sessions.push_back(std::move(session.value()));
  }
  return R::success(std::move(sessions));
}

SessionFile::SessionFile(std::filesystem::path path) : path_(std::move(path)) {}

common::Status SessionFile::save(const std::vector<Session> &sessions,
                                 const common::TimePoint written_at) const {
  if (!path_.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path_.parent_path()); !dir.ok()) {
      return common::Status::error(common::ErrorCode::PersistenceFailure, dir.error());
    }
  }
  const auto status =
      common::write_file_atomic(path_, encode_session_document(sessions, written_at));
  if (!status.ok()) {
    return common::Status::error(common::ErrorCode::PersistenceFailure, status.error());
  }
  return common::Status::success();
}

common::Result<std::vector<Session>> SessionFile::load() const {
  using R = common::Result<std::vector<Session>>;
  const auto content = common::read_file(path_);
  if (!content.ok()) {
    if (content.code() == common::ErrorCode::NotFound) {
      return R::success({});
    }
    return R::failure(common::ErrorCode::PersistenceFailure, content.error());
  }
  if (common::trim(content.value()).empty()) {
    return R::success({});
  }
  auto parsed = parse_session_document(content.value());
  if (!parsed.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure,
                      path_.string() + ": " + parsed.error());
  }
  return parsed;
}

PersistenceWriter::PersistenceWriter(const SessionFile &file, common::Clock clock)
    : file_(file), clock_(std::move(clock)) {}

PersistenceWriter::~PersistenceWriter() { stop(); }

void PersistenceWriter::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { write_loop(); });
}

void PersistenceWriter::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::optional<Pending> leftover;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    leftover.swap(pending_);
  }
  if (leftover.has_value()) {
    write_snapshot(leftover->sequence, leftover->sessions);
  }
  idle_cv_.notify_all();
}

bool PersistenceWriter::is_running() const { return running_; }

std::uint64_t PersistenceWriter::schedule(std::vector<Session> snapshot) {
  std::unique_lock<std::mutex> lock(mutex_);
  const std::uint64_t sequence = ++next_sequence_;
  if (!running_) {
    lock.unlock();
    write_snapshot(sequence, snapshot);
    return sequence;
  }
  pending_ = Pending{.sequence = sequence, .sessions = std::move(snapshot)};
  lock.unlock();
  cv_.notify_one();
  return sequence;
}

common::Status PersistenceWriter::wait_for(const std::uint64_t sequence) {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this, sequence]() { return written_through_ >= sequence; });
  return last_status_;
}

void PersistenceWriter::flush() {
  std::uint64_t target = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = next_sequence_;
  }
  (void)wait_for(target);
}

void PersistenceWriter::write_loop() {
  while (true) {
    Pending job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !running_ || pending_.has_value(); });
      if (!running_) {
        return;
      }
      job = std::move(*pending_);
      pending_.reset();
    }
    write_snapshot(job.sequence, job.sessions);
  }
}

void PersistenceWriter::write_snapshot(const std::uint64_t sequence,
                                       const std::vector<Session> &snapshot) {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence <= written_through_) {
      return;
    }
  }

  const auto status = file_.save(snapshot, clock_());
  observability::record_persistence(file_.path().string(), status.ok(), status.error());
  if (status.ok()) {
    ++writes_;
  } else {
    ++failures_;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    written_through_ = sequence;
    last_status_ = status;
  }
  idle_cv_.notify_all();
}

} // namespace conductor::sessions
