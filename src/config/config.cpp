#include "conductor/config/config.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/toml.hpp"

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace conductor::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".conductor";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

// Upper bound for every interval and timeout: one year.
constexpr std::uint64_t MAX_SECS = 365ULL * 24 * 60 * 60;
constexpr std::uint64_t MAX_MINS = MAX_SECS / 60;
constexpr std::uint64_t MAX_MS = MAX_SECS * 1000;

struct DurationField {
  const char *key;
  std::uint64_t value;
  std::uint64_t max;
};

const std::vector<std::string> &known_keys() {
  static const std::vector<std::string> keys = {
      "scheduler.max_sessions",
      "scheduler.queue_timeout_secs",
      "scheduler.default_priority",
      "scheduler.deadlock_check_secs",
      "scheduler.timeout_poll_ms",
      "scheduler.deadlock_policy",
      "sessions.store_path",
      "sessions.log_capacity",
      "sessions.default_priority",
      "sessions.autosave_interval_secs",
      "recovery.enabled",
      "recovery.interval_secs",
      "recovery.initializing_timeout_mins",
      "recovery.starting_timeout_mins",
      "recovery.running_warning_mins",
      "observability.backend",
      "observability.level",
  };
  return keys;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CONDUCTOR_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::int32_t clamp_i32(const std::int64_t value) {
  if (value > std::numeric_limits<std::int32_t>::max()) {
    return std::numeric_limits<std::int32_t>::max();
  }
  if (value < std::numeric_limits<std::int32_t>::min()) {
    return std::numeric_limits<std::int32_t>::min();
  }
  return static_cast<std::int32_t>(value);
}

bool parse_env_i64(const char *raw, std::int64_t &out) {
  if (raw == nullptr || *raw == '\0') {
    return false;
  }
  char *end = nullptr;
  const long long parsed = std::strtoll(raw, &end, 10);
  if (end == raw || *end != '\0') {
    return false;
  }
  out = parsed;
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  if (!path.ok()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError, parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  auto &sched = config.scheduler;
  sched.max_sessions = clamp_i32(doc.get_i64("scheduler.max_sessions", sched.max_sessions));
  sched.queue_timeout_secs = doc.get_u64("scheduler.queue_timeout_secs", sched.queue_timeout_secs);
  sched.default_priority =
      clamp_i32(doc.get_i64("scheduler.default_priority", sched.default_priority));
  sched.deadlock_check_secs =
      doc.get_u64("scheduler.deadlock_check_secs", sched.deadlock_check_secs);
  sched.timeout_poll_ms = doc.get_u64("scheduler.timeout_poll_ms", sched.timeout_poll_ms);
  sched.deadlock_policy =
      common::to_lower(doc.get_string("scheduler.deadlock_policy", sched.deadlock_policy));

  auto &sessions = config.sessions;
  sessions.store_path = doc.get_string("sessions.store_path", sessions.store_path);
  sessions.log_capacity = clamp_i32(doc.get_i64("sessions.log_capacity", sessions.log_capacity));
  sessions.default_priority =
      clamp_i32(doc.get_i64("sessions.default_priority", sessions.default_priority));
  sessions.autosave_interval_secs =
      doc.get_u64("sessions.autosave_interval_secs", sessions.autosave_interval_secs);

  auto &recovery = config.recovery;
  recovery.enabled = doc.get_bool("recovery.enabled", recovery.enabled);
  recovery.interval_secs = doc.get_u64("recovery.interval_secs", recovery.interval_secs);
  recovery.initializing_timeout_mins =
      doc.get_u64("recovery.initializing_timeout_mins", recovery.initializing_timeout_mins);
  recovery.starting_timeout_mins =
      doc.get_u64("recovery.starting_timeout_mins", recovery.starting_timeout_mins);
  recovery.running_warning_mins =
      doc.get_u64("recovery.running_warning_mins", recovery.running_warning_mins);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  config.unknown_keys = doc.unknown_keys(known_keys());
  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  std::int64_t value = 0;
  if (parse_env_i64(std::getenv("CONDUCTOR_MAX_SESSIONS"), value)) {
    config.scheduler.max_sessions = clamp_i32(value);
  }
  if (parse_env_i64(std::getenv("CONDUCTOR_QUEUE_TIMEOUT"), value) && value >= 0) {
    config.scheduler.queue_timeout_secs = static_cast<std::uint64_t>(value);
  }
  if (const char *store = std::getenv("CONDUCTOR_STORE_PATH"); store != nullptr && *store) {
    config.sessions.store_path = store;
  }
  if (const char *level = std::getenv("CONDUCTOR_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.level = common::to_lower(level);
  }
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.status());
  }

  const auto content = common::read_file(path_result.value());
  if (!content.ok() && content.code() != common::ErrorCode::NotFound) {
    return common::Result<Config>::failure(content.status());
  }

  Config config;
  if (content.ok()) {
    auto parsed = parse_config(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                             path_result.value().string() + ": " +
                                                 parsed.error());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  config.sessions.store_path = common::expand_path(config.sessions.store_path);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[scheduler]\n";
  out << "max_sessions = " << config.scheduler.max_sessions << "\n";
  out << "queue_timeout_secs = " << config.scheduler.queue_timeout_secs << "\n";
  out << "default_priority = " << config.scheduler.default_priority << "\n";
  out << "deadlock_check_secs = " << config.scheduler.deadlock_check_secs << "\n";
  out << "timeout_poll_ms = " << config.scheduler.timeout_poll_ms << "\n";
  out << "deadlock_policy = " << common::quote_toml_string(config.scheduler.deadlock_policy)
      << "\n\n";

  out << "[sessions]\n";
  out << "store_path = " << common::quote_toml_string(config.sessions.store_path) << "\n";
  out << "log_capacity = " << config.sessions.log_capacity << "\n";
  out << "default_priority = " << config.sessions.default_priority << "\n";
  out << "autosave_interval_secs = " << config.sessions.autosave_interval_secs << "\n\n";

  out << "[recovery]\n";
  out << "enabled = " << (config.recovery.enabled ? "true" : "false") << "\n";
  out << "interval_secs = " << config.recovery.interval_secs << "\n";
  out << "initializing_timeout_mins = " << config.recovery.initializing_timeout_mins << "\n";
  out << "starting_timeout_mins = " << config.recovery.starting_timeout_mins << "\n";
  out << "running_warning_mins = " << config.recovery.running_warning_mins << "\n\n";

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }
  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      return dir.status();
    }
  }
  return common::write_file_atomic(path, render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const DurationField durations[] = {
      {"scheduler.queue_timeout_secs", config.scheduler.queue_timeout_secs, MAX_SECS},
      {"scheduler.deadlock_check_secs", config.scheduler.deadlock_check_secs, MAX_SECS},
      {"scheduler.timeout_poll_ms", config.scheduler.timeout_poll_ms, MAX_MS},
      {"sessions.autosave_interval_secs", config.sessions.autosave_interval_secs, MAX_SECS},
      {"recovery.interval_secs", config.recovery.interval_secs, MAX_SECS},
      {"recovery.initializing_timeout_mins", config.recovery.initializing_timeout_mins,
       MAX_MINS},
      {"recovery.starting_timeout_mins", config.recovery.starting_timeout_mins, MAX_MINS},
      {"recovery.running_warning_mins", config.recovery.running_warning_mins, MAX_MINS},
  };
  for (const auto &field : durations) {
    if (field.value > field.max) {
      return R::failure(common::ErrorCode::ConfigError,
                        std::string(field.key) + " must be <= " + std::to_string(field.max));
    }
  }

  if (config.scheduler.max_sessions < 1) {
    return R::failure(common::ErrorCode::ConfigError, "scheduler.max_sessions must be >= 1");
  }
  if (config.scheduler.max_sessions > 10) {
    warnings.push_back("scheduler.max_sessions above 10 may exhaust host resources");
  }
  if (config.scheduler.deadlock_check_secs == 0) {
    return R::failure(common::ErrorCode::ConfigError,
                      "scheduler.deadlock_check_secs must be > 0");
  }
  if (config.scheduler.timeout_poll_ms == 0) {
    return R::failure(common::ErrorCode::ConfigError, "scheduler.timeout_poll_ms must be > 0");
  }
  if (config.scheduler.deadlock_policy != "oldest" &&
      config.scheduler.deadlock_policy != "lowest_priority") {
    return R::failure(common::ErrorCode::ConfigError,
                      "Invalid scheduler.deadlock_policy: " + config.scheduler.deadlock_policy);
  }
  if (config.scheduler.queue_timeout_secs == 0) {
    warnings.push_back("scheduler.queue_timeout_secs = 0 disables queue timeouts");
  }

  if (config.sessions.log_capacity < 1) {
    return R::failure(common::ErrorCode::ConfigError, "sessions.log_capacity must be >= 1");
  }
  if (config.sessions.autosave_interval_secs == 0) {
    return R::failure(common::ErrorCode::ConfigError,
                      "sessions.autosave_interval_secs must be > 0");
  }
  if (common::trim(config.sessions.store_path).empty()) {
    warnings.push_back("sessions.store_path is empty; sessions will not be persisted");
  }

  if (config.recovery.enabled && config.recovery.interval_secs == 0) {
    return R::failure(common::ErrorCode::ConfigError, "recovery.interval_secs must be > 0");
  }

  const std::string &backend = config.observability.backend;
  if (backend != "log" && backend != "none") {
    return R::failure(common::ErrorCode::ConfigError,
                      "Invalid observability.backend: " + backend);
  }
  const std::string &level = config.observability.level;
  if (level != "trace" && level != "debug" && level != "info" && level != "warn" &&
      level != "error") {
    warnings.push_back("Unknown observability.level '" + level + "', using info");
  }

  for (const auto &key : config.unknown_keys) {
    warnings.push_back("Unknown config key: " + key);
  }

  return R::success(std::move(warnings));
}

} // namespace conductor::config
