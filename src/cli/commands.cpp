#include "conductor/cli/commands.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/config/config.hpp"
#include "conductor/daemon/daemon.hpp"
#include "conductor/observability/factory.hpp"
#include "conductor/observability/global.hpp"
#include "conductor/runtime/app.hpp"
#include "conductor/sessions/store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace conductor::cli {

namespace {

std::string version_string() {
#ifdef CONDUCTOR_VERSION
  std::string version = CONDUCTOR_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "conductor " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Opens the configured store without a background writer; nothing is written back.
common::Result<std::unique_ptr<sessions::SessionStore>>
open_store(const config::Config &config, sessions::SessionEventBus &bus) {
  using R = common::Result<std::unique_ptr<sessions::SessionStore>>;
  sessions::SessionStoreOptions options;
  options.store_path = config.sessions.store_path;
  options.log_capacity = static_cast<std::size_t>(std::max(1, config.sessions.log_capacity));
  options.default_priority = config.sessions.default_priority;
  options.async_persist = false;
  auto store = std::make_unique<sessions::SessionStore>(bus, options);
  if (auto status = store->init(); !status.ok()) {
    return R::failure(status);
  }
  return R::success(std::move(store));
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &config = cfg.value();

  sessions::SessionEventBus bus;
  auto store = open_store(config, bus);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  const auto stats = store.value()->get_stats();

  if (auto cp = config::config_path(); cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  std::cout << "Store: " << config.sessions.store_path << "\n";
  std::cout << "Max sessions: " << config.scheduler.max_sessions << "\n";
  std::cout << "Queue timeout: " << config.scheduler.queue_timeout_secs << "s\n";
  std::cout << "Sessions: " << stats.total << " total, " << stats.active << " active\n";
  for (const auto &[state, count] : stats.by_state) {
    if (count > 0) {
      std::cout << "  " << std::left << std::setw(14) << sessions::state_label(state) << count
                << "\n";
    }
  }
  std::cout << "Error rate: " << std::fixed << std::setprecision(1) << stats.error_rate
            << "%\n";
  if (stats.average_duration_minutes.has_value()) {
    std::cout << "Average duration: " << std::fixed << std::setprecision(1)
              << *stats.average_duration_minutes << " min\n";
  }

  if (auto dir = config::config_dir(); dir.ok()) {
    if (auto state = common::read_file(dir.value() / "daemon_state.json"); state.ok()) {
      std::cout << "Daemon state: " << common::trim(state.value()) << "\n";
    }
  }
  return 0;
}

int run_sessions(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  sessions::SessionFilter filter;
  std::string value;
  while (take_option(args, "--state", "-s", value)) {
    auto state = sessions::parse_session_state(value);
    if (!state.ok()) {
      std::cerr << state.error() << "\n";
      return 1;
    }
    filter.states.push_back(state.value());
  }
  if (take_option(args, "--user", "-u", value)) {
    filter.user_id = value;
  }
  if (take_option(args, "--repo", "-r", value)) {
    filter.repository = value;
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  sessions::SessionEventBus bus;
  auto store = open_store(cfg.value(), bus);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  const auto list = store.value()->list_sessions(filter);
  if (list.empty()) {
    std::cout << "No sessions.\n";
    return 0;
  }
  for (const auto &session : list) {
    std::cout << std::left << std::setw(14) << sessions::state_label(session.state) << " "
              << session.id << "  thread=" << session.thread_id
              << "  repo=" << session.repository;
    if (session.branch.has_value()) {
      std::cout << "@" << *session.branch;
    }
    std::cout << "  user=" << session.metadata.user_id
              << "  created=" << common::format_timestamp(session.metadata.created_at);
    if (session.error.has_value()) {
      std::cout << "  error=\"" << *session.error << "\"";
    }
    std::cout << "\n";
  }
  return 0;
}

int run_daemon(std::vector<std::string> args) {
  daemon::DaemonOptions options;
  std::string duration_raw;
  if (take_option(args, "--duration-secs", "", duration_raw)) {
    char *end = nullptr;
    const long duration = std::strtol(duration_raw.c_str(), &end, 10);
    if (end == duration_raw.c_str() || *end != '\0' || duration <= 0) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      return 1;
    }
    options.duration = std::chrono::seconds(duration);
  }
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto runtime = runtime::Runtime::create(std::move(cfg.value()));
  if (!runtime.ok()) {
    observability::set_global_observer(nullptr);
    std::cerr << runtime.error() << "\n";
    return 1;
  }

  daemon::Daemon daemon(*runtime.value());
  const auto status = daemon.run(options);
  observability::set_global_observer(nullptr);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string sub = args.empty() ? "show" : args[0];

  if (sub == "path") {
    auto cp = config::config_path();
    if (!cp.ok()) {
      std::cerr << cp.error() << "\n";
      return 1;
    }
    std::cout << cp.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (sub == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (sub == "validate") {
    const auto result = config::validate_config(cfg.value());
    if (!result.ok()) {
      std::cerr << "[FAIL] " << result.error() << "\n";
      return 1;
    }
    for (const auto &warning : result.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }

  std::cerr << "usage: conductor config show|validate|path\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n";
  std::cout << "Bounded-concurrency scheduler and session lifecycle manager\n\n";
  std::cout << "USAGE\n";
  std::cout << "  conductor [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  daemon [--duration-secs N]          Run the scheduler until SIGINT/SIGTERM\n";
  std::cout << "  status                              Show configuration and session statistics\n";
  std::cout << "  sessions [--state S] [--user U] [--repo R]\n";
  std::cout << "                                      List persisted sessions, newest first\n";
  std::cout << "  config show|validate|path           Inspect the configuration\n";
  std::cout << "  version                             Print the version\n";
  std::cout << "  help                                Show this help\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args.front();
  args.erase(args.begin());

  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }
  if (subcommand == "version" || subcommand == "--version" || subcommand == "-V") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace conductor::cli
