#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "conductor/config/config.hpp"

#include <algorithm>

namespace {

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace cfg = conductor::config;
  namespace t = conductor::testing;
  namespace c = conductor::common;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.scheduler.max_sessions == 3, "max sessions");
                     require(config.scheduler.queue_timeout_secs == 300, "queue timeout");
                     require(config.scheduler.default_priority == 10, "scheduler priority");
                     require(config.scheduler.deadlock_check_secs == 30, "deadlock interval");
                     require(config.scheduler.deadlock_policy == "oldest", "policy");
                     require(config.sessions.log_capacity == 100, "log capacity");
                     require(config.sessions.default_priority == 5, "session priority");
                     require(config.sessions.autosave_interval_secs == 300, "autosave");
                     require(config.recovery.initializing_timeout_mins == 10, "init timeout");
                     require(config.recovery.starting_timeout_mins == 15, "start timeout");
                     require(config.recovery.running_warning_mins == 60, "running warning");

                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "defaults carry no warnings");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const auto parsed = cfg::parse_config("[scheduler]\n"
                                                           "max_sessions = 5\n"
                                                           "queue_timeout_secs = 60\n"
                                                           "deadlock_policy = \"LOWEST_PRIORITY\"\n"
                                                           "[sessions]\n"
                                                           "store_path = \"/var/lib/s.json\"\n"
                                                           "log_capacity = 20\n"
                                                           "[recovery]\n"
                                                           "enabled = false\n"
                                                           "[observability]\n"
                                                           "backend = \"none\"\n"
                                                           "level = \"debug\"\n"
                                                           "[extra]\n"
                                                           "flag = 1\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.scheduler.max_sessions == 5, "max sessions");
                     require(config.scheduler.queue_timeout_secs == 60, "timeout");
                     require(config.scheduler.deadlock_policy == "lowest_priority",
                             "policy lowercased");
                     require(config.sessions.store_path == "/var/lib/s.json", "store path");
                     require(config.sessions.log_capacity == 20, "log capacity");
                     require(!config.recovery.enabled, "recovery disabled");
                     require(config.observability.backend == "none", "backend");
                     require(config.unknown_keys == std::vector<std::string>({"extra.flag"}),
                             "unknown keys collected");

                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(has_warning(validated.value(), "Unknown config key: extra.flag"),
                             "unknown key warning");
                   }});

  tests.push_back({"config_parse_error_is_config_error", [] {
                     const auto parsed = cfg::parse_config("[scheduler\nmax_sessions 3\n");
                     require(parsed.code() == c::ErrorCode::ConfigError, "parse failure code");
                   }});

  tests.push_back({"config_validate_rejects_bad_values", [] {
                     cfg::Config config;
                     config.scheduler.max_sessions = 0;
                     require(cfg::validate_config(config).code() == c::ErrorCode::ConfigError,
                             "zero capacity");

                     config = cfg::Config{};
                     config.scheduler.deadlock_policy = "random";
                     require(!cfg::validate_config(config).ok(), "unknown policy");

                     config = cfg::Config{};
                     config.sessions.log_capacity = -1;
                     require(!cfg::validate_config(config).ok(), "negative log capacity");

                     config = cfg::Config{};
                     config.scheduler.timeout_poll_ms = 0;
                     require(!cfg::validate_config(config).ok(), "zero poll interval");

                     config = cfg::Config{};
                     config.recovery.interval_secs = 0;
                     require(!cfg::validate_config(config).ok(), "zero recovery interval");
                     config.recovery.enabled = false;
                     require(cfg::validate_config(config).ok(), "ignored when disabled");

                     config = cfg::Config{};
                     config.observability.backend = "statsd";
                     require(!cfg::validate_config(config).ok(), "unknown backend");
                   }});

  tests.push_back({"config_validate_bounds_durations", [] {
                     auto parsed = cfg::parse_config("[scheduler]\nqueue_timeout_secs = 9300000000\n");
                     require(parsed.ok(), parsed.error());
                     const auto huge = cfg::validate_config(parsed.value());
                     require(huge.code() == c::ErrorCode::ConfigError, "huge timeout rejected");
                     require(huge.error().find("scheduler.queue_timeout_secs") != std::string::npos,
                             "names the key");

                     cfg::Config config;
                     config.scheduler.queue_timeout_secs = 365ULL * 24 * 60 * 60;
                     require(cfg::validate_config(config).ok(), "one year accepted");

                     config = cfg::Config{};
                     config.scheduler.timeout_poll_ms = 365ULL * 24 * 60 * 60 * 1000 + 1;
                     require(!cfg::validate_config(config).ok(), "poll interval bounded");

                     config = cfg::Config{};
                     config.recovery.running_warning_mins = 365ULL * 24 * 60 + 1;
                     require(!cfg::validate_config(config).ok(), "minutes bounded");

                     config = cfg::Config{};
                     config.sessions.autosave_interval_secs = 400ULL * 24 * 60 * 60;
                     require(!cfg::validate_config(config).ok(), "autosave bounded");
                   }});

  tests.push_back({"config_validate_warnings", [] {
                     cfg::Config config;
                     config.scheduler.max_sessions = 12;
                     config.scheduler.queue_timeout_secs = 0;
                     config.sessions.store_path = "";
                     config.observability.level = "loud";
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     const auto &warnings = validated.value();
                     require(warnings.size() == 4, "four warnings");
                     require(has_warning(warnings, "max_sessions"), "capacity warning");
                     require(has_warning(warnings, "disables queue timeouts"), "timeout warning");
                     require(has_warning(warnings, "will not be persisted"), "store warning");
                     require(has_warning(warnings, "loud"), "level warning");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     t::EnvGuard max("CONDUCTOR_MAX_SESSIONS", std::string("7"));
                     t::EnvGuard timeout("CONDUCTOR_QUEUE_TIMEOUT", std::string("45"));
                     t::EnvGuard store("CONDUCTOR_STORE_PATH", std::string("/tmp/x.json"));
                     t::EnvGuard level("CONDUCTOR_LOG_LEVEL", std::string("WARN"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.scheduler.max_sessions == 7, "max sessions override");
                     require(config.scheduler.queue_timeout_secs == 45, "timeout override");
                     require(config.sessions.store_path == "/tmp/x.json", "store override");
                     require(config.observability.level == "warn", "level override");
                   }});

  tests.push_back({"config_env_overrides_ignore_garbage", [] {
                     t::EnvGuard max("CONDUCTOR_MAX_SESSIONS", std::string("many"));
                     t::EnvGuard timeout("CONDUCTOR_QUEUE_TIMEOUT", std::string("-5"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.scheduler.max_sessions == 3, "non-numeric ignored");
                     require(config.scheduler.queue_timeout_secs == 300, "negative ignored");
                   }});

  tests.push_back({"config_save_and_load_via_path_env", [] {
                     t::TempWorkspace ws;
                     const auto path = ws.path() / "conf" / "config.toml";
                     t::EnvGuard config_path("CONDUCTOR_CONFIG_PATH", path.string());
                     t::EnvGuard home("HOME", ws.path().string());
                     t::EnvGuard max("CONDUCTOR_MAX_SESSIONS", std::nullopt);
                     t::EnvGuard store("CONDUCTOR_STORE_PATH", std::nullopt);
                     cfg::clear_config_path_override();

                     require(!cfg::config_exists(), "nothing written yet");
                     const auto defaults = cfg::load_config();
                     require(defaults.ok(), defaults.error());
                     require(defaults.value().sessions.store_path ==
                                 (ws.path() / ".conductor" / "sessions.json").string(),
                             "default store path expands ~");

                     cfg::Config config;
                     config.scheduler.max_sessions = 4;
                     config.sessions.store_path = "~/data/sessions.json";
                     require(cfg::save_config(config).ok(), "save");
                     require(cfg::config_exists(), "file written");
                     require(cfg::config_path().value() == path, "path from env");
                     require(cfg::config_dir().value() == path.parent_path(), "dir from env");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.max_sessions == 4, "round trip");
                     require(loaded.value().sessions.store_path ==
                                 (ws.path() / "data" / "sessions.json").string(),
                             "store path expanded on load");
                     require(loaded.value().unknown_keys.empty(), "render emits known keys only");
                   }});

  tests.push_back({"config_override_takes_precedence_over_env", [] {
                     t::TempWorkspace ws;
                     t::EnvGuard config_path("CONDUCTOR_CONFIG_PATH",
                                             (ws.path() / "env.toml").string());
                     cfg::set_config_path_override(ws.path() / "flag.toml");
                     ws.create_file("flag.toml", "[scheduler]\nmax_sessions = 9\n");
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().scheduler.max_sessions == 9, "flag file used");
                     require(!cfg::config_path_override().has_value(), "override cleared");
                   }});

  tests.push_back({"config_load_reports_bad_file", [] {
                     t::TempWorkspace ws;
                     ws.create_file("config.toml", "this is not toml\n");
                     cfg::set_config_path_override(ws.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.code() == c::ErrorCode::ConfigError, "bad file");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error names the file");
                   }});
}
