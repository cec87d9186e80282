#include "bench_common.hpp"

#include "conductor/scheduler/deadlock.hpp"
#include "conductor/scheduler/scheduler.hpp"

#include <string>

void run_scheduler_benchmarks() {
  namespace sch = conductor::scheduler;

  conductor::bench::run_bench("scheduler_admit_complete", 5000, [] {
    sch::SchedulerEventBus bus;
    sch::Scheduler scheduler(bus, sch::SchedulerOptions{.max_sessions = 3});
    for (int i = 0; i < 16; ++i) {
      (void)scheduler.request_execution("s" + std::to_string(i), i % 7);
    }
    for (int i = 0; i < 16; ++i) {
      scheduler.complete_execution("s" + std::to_string(i));
    }
  });

  conductor::bench::run_bench("scheduler_deadlock_sweep", 2000, [] {
    sch::SchedulerEventBus bus;
    sch::Scheduler scheduler(bus, sch::SchedulerOptions{.max_sessions = 1});
    (void)scheduler.request_execution("holder");
    for (int i = 0; i < 32; ++i) {
      (void)scheduler.request_execution("c" + std::to_string(i), std::nullopt,
                                        {"c" + std::to_string((i + 1) % 32)});
    }
    (void)scheduler.resolve_deadlocks(sch::OldestDependencyPolicy{});
  });
}
