#include "conductor/sessions/session.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/json_util.hpp"

#include <openssl/rand.h>

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace conductor::sessions {

namespace {

const std::vector<SessionState> kNoTransitions;

common::Result<std::optional<std::string>> optional_string(const common::JsonObject &object,
                                                           const std::string &key) {
  using R = common::Result<std::optional<std::string>>;
  const auto it = object.find(key);
  if (it == object.end() || (!it->second.is_string && it->second.raw == "null")) {
    return R::success(std::nullopt);
  }
  if (!it->second.is_string) {
    return R::failure(common::ErrorCode::PersistenceFailure, key + " must be a string");
  }
  return R::success(it->second.raw);
}

common::Status required_string(const common::JsonObject &object, const std::string &key,
                               std::string &out) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_string) {
    return common::Status::error(common::ErrorCode::PersistenceFailure,
                                 key + " missing or not a string");
  }
  out = it->second.raw;
  return common::Status::success();
}

common::Status required_timestamp(const common::JsonObject &object, const std::string &key,
                                  common::TimePoint &out) {
  std::string raw;
  if (auto status = required_string(object, key, raw); !status.ok()) {
    return status;
  }
  const auto parsed = common::parse_timestamp(raw);
  if (!parsed.ok()) {
    return common::Status::error(common::ErrorCode::PersistenceFailure,
                                 key + ": " + parsed.error());
  }
  out = parsed.value();
  return common::Status::success();
}

void append_optional(std::ostringstream &out, const char *key,
                     const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << ",\"" << key << "\":" << common::json_quote(*value);
  }
}

} // namespace

std::string_view to_string(const SessionState state) {
  switch (state) {
  case SessionState::Initializing:
    return "initializing";
  case SessionState::Starting:
    return "starting";
  case SessionState::Ready:
    return "ready";
  case SessionState::Running:
    return "running";
  case SessionState::Waiting:
    return "waiting";
  case SessionState::Completed:
    return "completed";
  case SessionState::Error:
    return "error";
  }
  return "error";
}

std::string_view state_label(const SessionState state) {
  switch (state) {
  case SessionState::Initializing:
    return "Initializing";
  case SessionState::Starting:
    return "Starting";
  case SessionState::Ready:
    return "Ready";
  case SessionState::Running:
    return "Running";
  case SessionState::Waiting:
    return "Waiting";
  case SessionState::Completed:
    return "Completed";
  case SessionState::Error:
    return "Error";
  }
  return "Error";
}

common::Result<SessionState> parse_session_state(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  for (const auto state : all_session_states()) {
    if (to_string(state) == normalized) {
      return common::Result<SessionState>::success(state);
    }
  }
  return common::Result<SessionState>::failure("Unknown session state: " + name);
}

const std::vector<SessionState> &all_session_states() {
  static const std::vector<SessionState> states = {
      SessionState::Initializing, SessionState::Starting, SessionState::Ready,
      SessionState::Running,      SessionState::Waiting,  SessionState::Completed,
      SessionState::Error,
  };
  return states;
}

const std::vector<SessionState> &allowed_transitions(const SessionState from) {
  static const std::vector<SessionState> from_initializing = {
      SessionState::Starting, SessionState::Waiting, SessionState::Error};
  static const std::vector<SessionState> from_starting = {SessionState::Ready,
                                                          SessionState::Error};
  static const std::vector<SessionState> from_ready = {SessionState::Running,
                                                       SessionState::Waiting};
  static const std::vector<SessionState> from_running = {SessionState::Completed,
                                                         SessionState::Error};
  static const std::vector<SessionState> from_waiting = {SessionState::Running};
  static const std::vector<SessionState> back_to_ready = {SessionState::Ready};

  switch (from) {
  case SessionState::Initializing:
    return from_initializing;
  case SessionState::Starting:
    return from_starting;
  case SessionState::Ready:
    return from_ready;
  case SessionState::Running:
    return from_running;
  case SessionState::Waiting:
    return from_waiting;
  case SessionState::Completed:
  case SessionState::Error:
    return back_to_ready;
  }
  return kNoTransitions;
}

bool can_transition(const SessionState from, const SessionState to) {
  for (const auto allowed : allowed_transitions(from)) {
    if (allowed == to) {
      return true;
    }
  }
  return false;
}

bool is_terminal(const SessionState state) {
  return state == SessionState::Completed || state == SessionState::Error;
}

bool is_active(const SessionState state) { return !is_terminal(state); }

common::Result<std::string> generate_session_id(const common::TimePoint at) {
  unsigned char data[8];
  if (RAND_bytes(data, static_cast<int>(sizeof(data))) != 1) {
    return common::Result<std::string>::failure(common::ErrorCode::IoError,
                                                "random source unavailable");
  }
  std::ostringstream stream;
  stream << "session_" << common::epoch_millis(at) << "_" << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return common::Result<std::string>::success(stream.str());
}

std::string encode_session_json(const Session &session) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":" << common::json_quote(session.id);
  out << ",\"threadId\":" << common::json_quote(session.thread_id);
  out << ",\"repository\":" << common::json_quote(session.repository);
  append_optional(out, "branch", session.branch);
  append_optional(out, "worktreePath", session.worktree_path);
  append_optional(out, "containerId", session.container_id);
  out << ",\"state\":" << common::json_quote(std::string(to_string(session.state)));
  append_optional(out, "error", session.error);
  out << ",\"logs\":" << common::json_string_array(session.logs);
  out << ",\"metadata\":{";
  out << "\"userId\":" << common::json_quote(session.metadata.user_id);
  out << ",\"guildId\":" << common::json_quote(session.metadata.guild_id);
  out << ",\"channelId\":" << common::json_quote(session.metadata.channel_id);
  out << ",\"createdAt\":" << common::json_quote(common::format_timestamp(session.metadata.created_at));
  out << ",\"updatedAt\":" << common::json_quote(common::format_timestamp(session.metadata.updated_at));
  out << ",\"priority\":" << session.metadata.priority;
  out << "}}";
  return out.str();
}

common::Result<Session> parse_session_json(const std::string &json) {
  using R = common::Result<Session>;
  const auto parsed = common::json_parse_object(json);
  if (!parsed.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure, parsed.error());
  }
  const auto &object = parsed.value();

  Session session;
  if (auto status = required_string(object, "id", session.id); !status.ok()) {
    return R::failure(status);
  }
  if (auto status = required_string(object, "threadId", session.thread_id); !status.ok()) {
    return R::failure(status);
  }
  if (auto status = required_string(object, "repository", session.repository); !status.ok()) {
    return R::failure(status);
  }

  std::string state_name;
  if (auto status = required_string(object, "state", state_name); !status.ok()) {
    return R::failure(status);
  }
  const auto state = parse_session_state(state_name);
  if (!state.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure, state.error());
  }
  session.state = state.value();

  const std::vector<std::pair<std::string, std::optional<std::string> *>> optional_fields = {
      {"branch", &session.branch},
      {"worktreePath", &session.worktree_path},
      {"containerId", &session.container_id},
      {"error", &session.error},
  };
  for (const auto &[key, target] : optional_fields) {
    auto value = optional_string(object, key);
    if (!value.ok()) {
      return R::failure(value.status());
    }
    *target = value.value();
  }

  if (const auto logs = object.find("logs"); logs != object.end()) {
    auto entries = common::json_parse_string_array(logs->second.raw);
    if (logs->second.is_string || !entries.ok()) {
      return R::failure(common::ErrorCode::PersistenceFailure, "logs must be a string array");
    }
    session.logs = std::move(entries.value());
  }

  const auto metadata_member = object.find("metadata");
  if (metadata_member == object.end() || metadata_member->second.is_string) {
    return R::failure(common::ErrorCode::PersistenceFailure, "metadata missing");
  }
  const auto metadata = common::json_parse_object(metadata_member->second.raw);
  if (!metadata.ok()) {
    return R::failure(common::ErrorCode::PersistenceFailure, "metadata: " + metadata.error());
  }
  const auto &meta = metadata.value();
  auto &out = session.metadata;
  const std::vector<std::pair<std::string, std::string *>> identity_fields = {
      {"userId", &out.user_id},
      {"guildId", &out.guild_id},
      {"channelId", &out.channel_id},
  };
  for (const auto &[key, target] : identity_fields) {
    if (auto status = required_string(meta, key, *target); !status.ok()) {
      return R::failure(status);
    }
  }
  if (auto status = required_timestamp(meta, "createdAt", out.created_at); !status.ok()) {
    return R::failure(status);
  }
  if (auto status = required_timestamp(meta, "updatedAt", out.updated_at); !status.ok()) {
    return R::failure(status);
  }
  if (const auto priority = meta.find("priority"); priority != meta.end()) {
    char *end = nullptr;
    const long value = std::strtol(priority->second.raw.c_str(), &end, 10);
    if (priority->second.is_string || end == priority->second.raw.c_str() || *end != '\0') {
      return R::failure(common::ErrorCode::PersistenceFailure, "priority must be an integer");
    }
    out.priority = static_cast<std::int32_t>(value);
  }

  return R::success(std::move(session));
}

} // namespace conductor::sessions
