#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "conductor/common/json_util.hpp"
#include "conductor/daemon/daemon.hpp"
#include "conductor/daemon/pid_file.hpp"
#include "conductor/daemon/state_writer.hpp"
#include "conductor/health/health.hpp"
#include "conductor/runtime/app.hpp"
#include "conductor/runtime/periodic.hpp"
#include "conductor/scheduler/scheduler_events.hpp"
#include "conductor/sessions/store.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace {

bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

} // namespace

void register_health_runtime_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace t = conductor::testing;
  namespace h = conductor::health;
  namespace rt = conductor::runtime;
  namespace d = conductor::daemon;
  namespace c = conductor::common;

  tests.push_back({"health_registry_tracks_components", [] {
                     t::ManualClock clock;
                     h::HealthRegistry registry(clock.clock());
                     require(registry.healthy(), "empty registry is healthy");

                     registry.mark_starting("store");
                     require(registry.get("store")->status == "starting", "starting");
                     registry.mark_ok("store");
                     const auto ok = registry.get("store");
                     require(ok->status == "ok" && ok->last_ok == ok->updated_at, "ok");
                     require(ok->updated_at == "2026-01-15T09:30:00.000Z", "clock used");

                     clock.advance(std::chrono::seconds(1));
                     registry.mark_error("store", "disk full");
                     registry.bump_restart("store");
                     const auto failed = registry.get("store");
                     require(failed->status == "error", "error status");
                     require(failed->last_error == std::optional<std::string>("disk full"),
                             "error kept");
                     require(failed->restart_count == 1, "restart counted");
                     require(failed->last_ok == std::optional<std::string>(
                                                    "2026-01-15T09:30:00.000Z"),
                             "last ok retained");
                     require(!registry.healthy(), "unhealthy");

                     registry.reset("store");
                     require(!registry.get("store").has_value() && registry.healthy(), "reset");
                   }});

  tests.push_back({"health_report_json_shape", [] {
                     t::ManualClock clock;
                     h::HealthRegistry registry(clock.clock());
                     registry.mark_ok("scheduler");

                     conductor::sessions::SessionStats sessions;
                     for (const auto state : conductor::sessions::all_session_states()) {
                       sessions.by_state[state] = 0;
                     }
                     sessions.total = 3;
                     sessions.active = 2;
                     sessions.by_state[conductor::sessions::SessionState::Error] = 1;
                     sessions.error_rate = 100.0 / 3.0;

                     conductor::scheduler::QueueStats queue{.running = 1,
                                                            .waiting = 2,
                                                            .max_sessions = 3,
                                                            .average_wait_seconds = 1.5,
                                                            .max_wait_seconds = 2.0};

                     const auto json = h::render_report_json(registry.snapshot(), sessions, queue);
                     const auto parsed = c::json_parse_object(json);
                     require(parsed.ok(), parsed.error());
                     const auto &root = parsed.value();
                     require(root.contains("components") && root.contains("sessions") &&
                                 root.contains("queue"),
                             "top-level sections");

                     const auto session_part = c::json_parse_object(root.at("sessions").raw);
                     require(session_part.ok(), session_part.error());
                     require(session_part.value().at("error_rate").raw == "33.33",
                             "two decimals");
                     require(!session_part.value().contains("average_duration_minutes"),
                             "absent average omitted");
                     require(root.at("sessions").raw.find("\"error\":1") != std::string::npos,
                             "by_state counts");

                     const auto queue_part = c::json_parse_object(root.at("queue").raw);
                     require(queue_part.value().at("waiting").raw == "2", "waiting");
                     require(queue_part.value().at("average_wait_seconds").raw == "1.50",
                             "average wait");
                     require(root.at("components").raw.find("\"scheduler\":{\"status\":\"ok\"") !=
                                 std::string::npos,
                             "component status");
                   }});

  tests.push_back({"periodic_task_run_once_reports_health", [] {
                     h::HealthRegistry registry;
                     int calls = 0;
                     rt::PeriodicTask ok_task(
                         "ok", std::chrono::seconds(60),
                         [&]() {
                           ++calls;
                           return c::Status::success();
                         },
                         &registry);
                     require(ok_task.run_once().ok(), "ok task");
                     require(calls == 1 && ok_task.runs() == 1, "ran once");
                     require(registry.get("ok")->status == "ok", "marked ok");

                     rt::PeriodicTask throwing(
                         "throws", std::chrono::seconds(60),
                         []() -> c::Status { throw std::runtime_error("kaput"); }, &registry);
                     const auto status = throwing.run_once();
                     require(!status.ok() && status.error().find("kaput") != std::string::npos,
                             "exception converted to status");
                     require(registry.get("throws")->status == "error", "marked error");
                   }});

  tests.push_back({"periodic_task_runs_on_interval", [] {
                     std::atomic<int> calls{0};
                     rt::PeriodicTask task("tick", std::chrono::milliseconds(20), [&]() {
                       ++calls;
                       return c::Status::success();
                     });
                     require(task.interval() == std::chrono::milliseconds(20), "interval");
                     task.start();
                     require(task.is_running(), "running");
                     require(wait_until([&]() { return calls.load() >= 3; }), "ticks");
                     task.stop();
                     const int after_stop = calls.load();
                     std::this_thread::sleep_for(std::chrono::milliseconds(60));
                     require(calls.load() == after_stop, "no runs after stop");
                     require(!task.is_running(), "stopped");
                   }});

  tests.push_back({"runtime_create_rejects_invalid_config", [] {
                     t::TempWorkspace ws;
                     auto config = t::temp_config(ws);
                     config.scheduler.max_sessions = 0;
                     const auto runtime = rt::Runtime::create(config);
                     require(runtime.code() == c::ErrorCode::ConfigError, "invalid config");
                   }});

  tests.push_back({"runtime_builds_tasks_from_config", [] {
                     t::TempWorkspace ws;
                     auto config = t::temp_config(ws);
                     config.recovery.enabled = false;
                     config.scheduler.max_sessions = 4;
                     auto runtime = rt::Runtime::create(config);
                     require(runtime.ok(), runtime.error());
                     auto &rtm = *runtime.value();
                     require(rtm.tasks().size() == 3, "recovery task omitted when disabled");
                     require(rtm.scheduler().options().max_sessions == 4, "capacity applied");
                     require(rtm.deadlock_detector().policy().name() == "oldest", "policy");
                     require(!rtm.is_running(), "not started");
                   }});

  tests.push_back({"runtime_start_and_stop_persist_sessions", [] {
                     t::TempWorkspace ws;
                     auto config = t::temp_config(ws);
                     auto runtime = rt::Runtime::create(config);
                     require(runtime.ok(), runtime.error());
                     auto &rtm = *runtime.value();
                     require(rtm.start().ok(), "start");
                     require(rtm.is_running(), "running");
                     require(rtm.tasks().size() == 4, "four tasks");
                     require(rtm.health().get("sessions")->status == "ok", "sessions healthy");

                     conductor::sessions::CreateSessionOptions options;
                     options.repository = "org/app";
                     require(rtm.store().create_session("t1", "u", "g", "c", options).ok(),
                             "create");
                     require(rtm.stop().ok(), "stop");
                     require(!rtm.is_running(), "stopped");
                     require(rtm.scheduler().is_shut_down(), "scheduler shut down");
                     require(ws.read("sessions.json").find("\"t1\"") != std::string::npos,
                             "saved on stop");
                   }});

  tests.push_back({"runtime_start_fails_on_corrupt_store", [] {
                     t::TempWorkspace ws;
                     ws.create_file("sessions.json", "{broken");
                     auto runtime = rt::Runtime::create(t::temp_config(ws));
                     require(runtime.ok(), runtime.error());
                     const auto started = runtime.value()->start();
                     require(started.code() == c::ErrorCode::PersistenceFailure, "fatal load");
                     require(runtime.value()->health().get("sessions")->status == "error",
                             "health reflects failure");
                     require(!runtime.value()->is_running(), "not running");
                   }});

  tests.push_back({"state_writer_writes_report", [] {
                     t::TempWorkspace ws;
                     const auto path = ws.path() / "state" / "daemon_state.json";
                     d::StateWriter writer(path, []() { return std::string("{\"ok\":true}"); },
                                           std::chrono::milliseconds(100));
                     writer.write_state();
                     const auto parsed = c::json_parse_object(ws.read("state/daemon_state.json"));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().contains("written_at"), "written_at");
                     require(parsed.value().contains("uptime_seconds"), "uptime");
                     require(parsed.value().at("report").raw == "{\"ok\":true}", "report");

                     std::filesystem::remove(path);
                     writer.start();
                     require(writer.is_running(), "running");
                     writer.stop();
                     require(!writer.is_running() && std::filesystem::exists(path),
                             "final state written on stop");
                   }});

  tests.push_back({"pid_file_guards_single_instance", [] {
                     t::TempWorkspace ws;
                     const auto path = ws.path() / "daemon.pid";
                     {
                       d::PidFile pid(path);
                       require(pid.acquire().ok(), "acquire");
                       require(ws.read("daemon.pid") == std::to_string(getpid()) + "\n",
                               "pid written");

                       d::PidFile second(path);
                       require(second.acquire().code() == c::ErrorCode::AlreadyExists,
                               "live pid blocks a second instance");
                     }
                     require(!std::filesystem::exists(path), "released on destruction");

                     ws.create_file("daemon.pid", "999999999\n");
                     d::PidFile stale(path);
                     require(stale.acquire().ok(), "stale pid is replaced");
                     require(d::PidFile::is_process_running(static_cast<int>(getpid())), "self");
                     require(!d::PidFile::is_process_running(0), "pid 0");
                   }});

  tests.push_back({"daemon_runs_for_duration", [] {
                     t::TempWorkspace ws;
                     auto runtime = rt::Runtime::create(t::temp_config(ws));
                     require(runtime.ok(), runtime.error());

                     d::Daemon daemon(*runtime.value());
                     d::DaemonOptions options;
                     options.duration = std::chrono::seconds(1);
                     options.state_dir = ws.path() / "run";
                     options.state_interval = std::chrono::milliseconds(100);
                     options.install_signal_handlers = false;
                     require(daemon.run(options).ok(), "daemon run");
                     require(!daemon.is_running(), "stopped");
                     require(!runtime.value()->is_running(), "runtime stopped");
                     require(!std::filesystem::exists(ws.path() / "run" / "daemon.pid"),
                             "pid file removed");

                     const auto state = c::json_parse_object(ws.read("run/daemon_state.json"));
                     require(state.ok(), state.error());
                     require(state.value().at("report").raw.find("\"queue\"") !=
                                 std::string::npos,
                             "state carries the health report");
                   }});

  tests.push_back({"daemon_stops_on_request", [] {
                     t::TempWorkspace ws;
                     auto runtime = rt::Runtime::create(t::temp_config(ws));
                     require(runtime.ok(), runtime.error());
                     d::Daemon daemon(*runtime.value());
                     d::DaemonOptions options;
                     options.state_dir = ws.path();
                     options.install_signal_handlers = false;

                     c::Status result = c::Status::success();
                     std::thread runner([&]() { result = daemon.run(options); });
                     require(wait_until([&]() { return daemon.is_running(); }), "daemon up");
                     daemon.request_stop();
                     runner.join();
                     require(result.ok(), result.error());
                     require(!daemon.is_running(), "daemon down");
                   }});
}
