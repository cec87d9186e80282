#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "conductor/sessions/session.hpp"
#include "conductor/sessions/store.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace {

namespace s = conductor::sessions;

s::SessionStoreOptions memory_options(std::size_t log_capacity = 100) {
  s::SessionStoreOptions options;
  options.log_capacity = log_capacity;
  return options;
}

s::CreateSessionOptions repo(const std::string &name) {
  s::CreateSessionOptions options;
  options.repository = name;
  return options;
}

s::SessionUpdate to_state(const s::SessionState state) {
  s::SessionUpdate update;
  update.state = state;
  return update;
}

/// Drives a freshly created session along Initializing -> Starting -> Ready -> Running.
void make_running(s::SessionStore &store, const std::string &thread_id) {
  for (const auto state : {s::SessionState::Starting, s::SessionState::Ready,
                           s::SessionState::Running}) {
    const auto updated = store.update_session(thread_id, to_state(state));
    conductor::tests::require(updated.ok(), updated.error());
  }
}

} // namespace

void register_sessions_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace t = conductor::testing;

  tests.push_back({"sessions_transition_table", [] {
                     using S = s::SessionState;
                     require(s::can_transition(S::Initializing, S::Starting), "init->starting");
                     require(s::can_transition(S::Initializing, S::Waiting), "init->waiting");
                     require(s::can_transition(S::Initializing, S::Error), "init->error");
                     require(!s::can_transition(S::Initializing, S::Running), "init->running");
                     require(s::can_transition(S::Starting, S::Ready), "starting->ready");
                     require(!s::can_transition(S::Starting, S::Completed),
                             "starting->completed");
                     require(s::can_transition(S::Ready, S::Running), "ready->running");
                     require(s::can_transition(S::Ready, S::Waiting), "ready->waiting");
                     require(s::can_transition(S::Running, S::Completed), "running->completed");
                     require(!s::can_transition(S::Running, S::Ready), "running->ready");
                     require(s::can_transition(S::Waiting, S::Running), "waiting->running");
                     require(!s::can_transition(S::Waiting, S::Error), "waiting->error");
                     require(s::can_transition(S::Completed, S::Ready), "completed->ready");
                     require(s::can_transition(S::Error, S::Ready), "error->ready");
                     require(!s::can_transition(S::Error, S::Running), "error->running");

                     require(s::is_terminal(S::Completed) && s::is_terminal(S::Error),
                             "terminal states");
                     require(s::is_active(S::Waiting) && !s::is_active(S::Error),
                             "active states");
                   }});

  tests.push_back({"sessions_state_names", [] {
                     require(s::to_string(s::SessionState::Initializing) == "initializing",
                             "wire name");
                     require(s::state_label(s::SessionState::Running) == "Running", "label");
                     const auto parsed = s::parse_session_state(" Completed ");
                     require(parsed.ok() && parsed.value() == s::SessionState::Completed,
                             "parse should be case-insensitive");
                     require(!s::parse_session_state("paused").ok(), "unknown state");
                     require(s::all_session_states().size() == 7, "seven states");
                   }});

  tests.push_back({"sessions_generate_id_format", [] {
                     const auto at = t::ManualClock::default_start();
                     const auto a = s::generate_session_id(at);
                     const auto b = s::generate_session_id(at);
                     require(a.ok() && b.ok(), "id generation");
                     const std::string prefix = "session_1768469400000_";
                     require(a.value().rfind(prefix, 0) == 0, "id prefix: " + a.value());
                     require(a.value().size() == prefix.size() + 16, "16 hex chars");
                     require(a.value() != b.value(), "ids must differ");
                   }});

  tests.push_back({"sessions_create_defaults_and_events", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");

                     auto options = repo("org/app");
                     options.branch = "feature/x";
                     const auto created = store.create_session("thread-1", "u1", "g1", "c1",
                                                               options);
                     require(created.ok(), created.error());
                     const auto &session = created.value();
                     require(session.state == s::SessionState::Initializing, "initial state");
                     require(session.metadata.priority == 5, "default priority");
                     require(session.metadata.created_at == clock.now(), "created_at");
                     require(session.metadata.updated_at == clock.now(), "updated_at");
                     require(session.branch == std::optional<std::string>("feature/x"), "branch");
                     require(session.logs.empty(), "no logs yet");
                     require(recorder.count(s::SessionEvent::Type::Created) == 1,
                             "created event");

                     const auto fetched = store.get_session("thread-1");
                     require(fetched.has_value() && fetched->id == session.id, "get_session");
                     require(!store.get_session("thread-2").has_value(), "unknown thread");
                   }});

  tests.push_back({"sessions_create_rejects_bad_input", [] {
                     s::SessionEventBus bus;
                     s::SessionStore store(bus, memory_options());
                     require(store.init().ok(), "init");
                     require(store.create_session("", "u", "g", "c", repo("r")).code() ==
                                 conductor::common::ErrorCode::InvalidArgument,
                             "empty thread id");
                     require(store.create_session("t", "u", "g", "c", repo(" ")).code() ==
                                 conductor::common::ErrorCode::InvalidArgument,
                             "empty repository");
                     require(store.create_session("t", "u", "g", "c", repo("r")).ok(), "first");
                     require(store.create_session("t", "u", "g", "c", repo("r")).code() ==
                                 conductor::common::ErrorCode::AlreadyExists,
                             "duplicate thread");
                     require(store.size() == 1, "only one session stored");
                   }});

  tests.push_back({"sessions_update_emits_specific_events", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");

                     clock.advance(std::chrono::seconds(5));
                     s::SessionUpdate update;
                     update.state = s::SessionState::Starting;
                     update.worktree_path = "/work/t1";
                     update.add_logs = {"cloning", "checked out"};
                     const auto updated = store.update_session("t1", update);
                     require(updated.ok(), updated.error());
                     require(updated.value().state == s::SessionState::Starting, "state");
                     require(updated.value().worktree_path ==
                                 std::optional<std::string>("/work/t1"),
                             "worktree path");
                     require(updated.value().metadata.updated_at == clock.now(),
                             "updated_at advanced");
                     require(updated.value().metadata.created_at ==
                                 t::ManualClock::default_start(),
                             "created_at unchanged");

                     require(recorder.count(s::SessionEvent::Type::Updated) == 1, "updated");
                     require(recorder.count(s::SessionEvent::Type::StateChanged) == 1,
                             "state changed");
                     require(recorder.count(s::SessionEvent::Type::LogAdded) == 1, "log added");
                     require(recorder.count(s::SessionEvent::Type::ErrorOccurred) == 0,
                             "no error");

                     for (const auto &event : recorder.events()) {
                       if (event.type == s::SessionEvent::Type::StateChanged) {
                         require(event.previous_state == s::SessionState::Initializing,
                                 "previous state carried");
                       }
                       if (event.type == s::SessionEvent::Type::LogAdded) {
                         require(event.logs.size() == 2, "log lines carried");
                       }
                     }

                     s::SessionUpdate failure;
                     failure.state = s::SessionState::Error;
                     failure.error = "clone failed";
                     require(store.update_session("t1", failure).ok(), "fail session");
                     require(recorder.count(s::SessionEvent::Type::ErrorOccurred) == 1,
                             "error event");
                   }});

  tests.push_back({"sessions_invalid_transition_leaves_record_unchanged", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");

                     clock.advance(std::chrono::seconds(1));
                     s::SessionUpdate update;
                     update.state = s::SessionState::Completed;
                     update.add_logs = {"should not land"};
                     const auto result = store.update_session("t1", update);
                     require(result.code() == conductor::common::ErrorCode::InvalidTransition,
                             "initializing -> completed must fail");
                     require(result.error().find("initializing") != std::string::npos,
                             "message names the source state");

                     const auto stored = store.get_session("t1");
                     require(stored->state == s::SessionState::Initializing, "state kept");
                     require(stored->logs.empty(), "logs kept");
                     require(stored->metadata.updated_at == t::ManualClock::default_start(),
                             "timestamp kept");
                     require(recorder.count(s::SessionEvent::Type::Updated) == 0,
                             "no update event");

                     require(store.update_session("missing", update).code() ==
                                 conductor::common::ErrorCode::NotFound,
                             "unknown thread");
                   }});

  tests.push_back({"sessions_same_state_update_is_not_a_transition", [] {
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options());
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");
                     const auto same = store.update_session(
                         "t1", to_state(s::SessionState::Initializing));
                     require(same.ok(), same.error());
                     require(recorder.count(s::SessionEvent::Type::StateChanged) == 0,
                             "no state change");
                   }});

  tests.push_back({"sessions_logs_are_capped", [] {
                     s::SessionEventBus bus;
                     s::SessionStore store(bus, memory_options(3));
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");

                     s::SessionUpdate update;
                     update.add_logs = {"1", "2"};
                     require(store.update_session("t1", update).ok(), "first batch");
                     update.add_logs = {"3", "4", "5"};
                     const auto after = store.update_session("t1", update);
                     require(after.ok(), after.error());
                     require(after.value().logs == std::vector<std::string>({"3", "4", "5"}),
                             "oldest lines dropped");

                     s::SessionUpdate replace;
                     replace.clear_logs = true;
                     replace.add_logs = {"fresh"};
                     const auto replaced = store.update_session("t1", replace);
                     require(replaced.value().logs == std::vector<std::string>({"fresh"}),
                             "clear then append");
                   }});

  tests.push_back({"sessions_delete_emits_removed_record", [] {
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options());
                     require(store.init().ok(), "init");
                     const auto created = store.create_session("t1", "u", "g", "c", repo("r"));
                     require(store.delete_session("t1").ok(), "delete");
                     require(store.delete_session("t1").code() ==
                                 conductor::common::ErrorCode::NotFound,
                             "second delete");
                     require(store.size() == 0, "empty store");

                     const auto events = recorder.events();
                     require(events.back().type == s::SessionEvent::Type::Deleted, "deleted");
                     require(events.back().session.id == created.value().id, "removed record");

                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(),
                             "thread id reusable after delete");
                   }});

  tests.push_back({"sessions_list_filters_and_order", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");

                     require(store.create_session("a", "alice", "g", "c", repo("org/one")).ok(),
                             "a");
                     clock.advance(std::chrono::minutes(1));
                     require(store.create_session("b", "bob", "g", "c", repo("org/two")).ok(),
                             "b");
                     clock.advance(std::chrono::minutes(1));
                     require(store.create_session("c", "alice", "g", "c", repo("org/two")).ok(),
                             "c");
                     make_running(store, "c");

                     const auto all = store.list_sessions();
                     require(all.size() == 3, "all sessions");
                     require(all[0].thread_id == "c" && all[2].thread_id == "a",
                             "newest first");

                     s::SessionFilter by_user;
                     by_user.user_id = "alice";
                     require(store.list_sessions(by_user).size() == 2, "user filter");

                     s::SessionFilter by_repo_state;
                     by_repo_state.repository = "org/two";
                     by_repo_state.states = {s::SessionState::Running};
                     const auto running = store.list_sessions(by_repo_state);
                     require(running.size() == 1 && running[0].thread_id == "c",
                             "repo and state filter");

                     s::SessionFilter window;
                     window.created_after = t::ManualClock::default_start() +
                                            std::chrono::seconds(30);
                     window.created_before = t::ManualClock::default_start() +
                                             std::chrono::seconds(90);
                     const auto windowed = store.list_sessions(window);
                     require(windowed.size() == 1 && windowed[0].thread_id == "b",
                             "created window");
                   }});

  tests.push_back({"sessions_stats", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");

                     const auto empty = store.get_stats();
                     require(empty.total == 0 && empty.error_rate == 0.0, "empty stats");
                     require(empty.by_state.size() == 7, "every state listed");
                     require(!empty.average_duration_minutes.has_value(), "no durations");

                     for (const auto *id : {"a", "b", "c", "d"}) {
                       require(store.create_session(id, "u", "g", "c", repo("r")).ok(), id);
                     }
                     make_running(store, "a");
                     clock.advance(std::chrono::minutes(30));
                     require(store.update_session("a", to_state(s::SessionState::Completed)).ok(),
                             "complete a");
                     require(store.update_session("b", to_state(s::SessionState::Error)).ok(),
                             "fail b");

                     const auto stats = store.get_stats();
                     require(stats.total == 4, "total");
                     require(stats.active == 2, "active");
                     require(stats.by_state.at(s::SessionState::Completed) == 1, "completed");
                     require(stats.by_state.at(s::SessionState::Initializing) == 2, "init");
                     require(stats.error_rate == 25.0, "error rate");
                     require(stats.average_duration_minutes.has_value() &&
                                 *stats.average_duration_minutes == 30.0,
                             "average duration");
                     require(store.active_sessions().size() == 2, "active sessions");
                   }});

  tests.push_back({"sessions_concurrent_updates_are_serialized", [] {
                     s::SessionEventBus bus;
                     std::atomic<int> log_events{0};
                     (void)bus.on(s::SessionEvent::Type::LogAdded,
                                  [&](const s::SessionEvent &) { ++log_events; });
                     s::SessionStore store(bus, memory_options(1000));
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");

                     std::vector<std::thread> workers;
                     for (int w = 0; w < 4; ++w) {
                       workers.emplace_back([&store, w]() {
                         for (int i = 0; i < 50; ++i) {
                           s::SessionUpdate update;
                           update.add_logs = {std::to_string(w) + ":" + std::to_string(i)};
                           (void)store.update_session("t1", update);
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(store.get_session("t1")->logs.size() == 200, "no lost updates");
                     require(log_events.load() == 200, "one event per update");
                   }});

  tests.push_back({"sessions_update_preconditions_reject_stale_writers", [] {
                     t::ManualClock clock;
                     s::SessionEventBus bus;
                     t::SessionEventRecorder recorder(bus);
                     s::SessionStore store(bus, memory_options(), clock.clock());
                     require(store.init().ok(), "init");
                     require(store.create_session("t1", "u", "g", "c", repo("r")).ok(), "create");
                     const auto seen = store.get_session("t1").value();

                     clock.advance(std::chrono::seconds(5));
                     require(store.update_session("t1", to_state(s::SessionState::Starting)).ok(),
                             "advance");

                     s::SessionUpdate stale = to_state(s::SessionState::Error);
                     stale.error = "too slow";
                     stale.expected_state = seen.state;
                     const auto by_state = store.update_session("t1", stale);
                     require(by_state.code() == conductor::common::ErrorCode::Conflict,
                             "state precondition");

                     stale.expected_state = s::SessionState::Starting;
                     stale.expected_updated_at = seen.metadata.updated_at;
                     const auto by_time = store.update_session("t1", stale);
                     require(by_time.code() == conductor::common::ErrorCode::Conflict,
                             "timestamp precondition");

                     const auto stored = store.get_session("t1");
                     require(stored->state == s::SessionState::Starting, "state kept");
                     require(!stored->error.has_value(), "error kept");
                     require(recorder.count(s::SessionEvent::Type::ErrorOccurred) == 0,
                             "no error event");

                     stale.expected_updated_at = stored->metadata.updated_at;
                     require(store.update_session("t1", stale).ok(), "fresh preconditions pass");
                   }});
}
