#pragma once

#include "conductor/common/result.hpp"
#include "conductor/common/time.hpp"
#include "conductor/sessions/session.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace conductor::sessions {

inline constexpr const char *SESSION_FILE_VERSION = "1.0.0";

/// The persisted session document:
/// {"sessions":{<thread_id>:{...}},"lastUpdated":"...","version":"1.0.0"}
class SessionFile {
public:
  explicit SessionFile(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] common::Status save(const std::vector<Session> &sessions,
                                    common::TimePoint written_at) const;
  /// A missing file yields an empty set; a malformed one is a PersistenceFailure.
  [[nodiscard]] common::Result<std::vector<Session>> load() const;

private:
  std::filesystem::path path_;
};

[[nodiscard]] std::string encode_session_document(const std::vector<Session> &sessions,
                                                  common::TimePoint written_at);
[[nodiscard]] common::Result<std::vector<Session>>
parse_session_document(const std::string &json);

/// Background writer and the only path to the session file. Each schedule() replaces the
/// pending snapshot, so bursts of mutations collapse into one write of the latest state.
/// Snapshots carry an increasing sequence number and a write never replaces a newer one.
class PersistenceWriter {
public:
  PersistenceWriter(const SessionFile &file, common::Clock clock);
  ~PersistenceWriter();

  PersistenceWriter(const PersistenceWriter &) = delete;
  PersistenceWriter &operator=(const PersistenceWriter &) = delete;

  void start();
  /// Writes any pending snapshot before returning.
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Returns the snapshot's sequence number. While stopped the write happens inline.
  std::uint64_t schedule(std::vector<Session> snapshot);
  /// Blocks until the snapshot numbered `sequence` (or a newer one) has been written and
  /// returns the outcome of that write.
  [[nodiscard]] common::Status wait_for(std::uint64_t sequence);
  /// Blocks until everything scheduled so far has been written (or failed).
  void flush();

  [[nodiscard]] std::uint64_t writes() const { return writes_; }
  [[nodiscard]] std::uint64_t failures() const { return failures_; }

private:
  struct Pending {
    std::uint64_t sequence = 0;
    std::vector<Session> sessions;
  };

  void write_loop();
  void write_snapshot(std::uint64_t sequence, const std::vector<Session> &snapshot);

  const SessionFile &file_;
  common::Clock clock_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::optional<Pending> pending_;
  std::uint64_t next_sequence_ = 0;
  std::uint64_t written_through_ = 0;
  common::Status last_status_ = common::Status::success();
  // Held for the duration of one file write.
  std::mutex write_mutex_;
  std::atomic<std::uint64_t> writes_{0};
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace conductor::sessions
