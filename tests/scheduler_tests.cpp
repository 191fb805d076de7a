#include <gtest/gtest.h>

#include "test_support.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vrtk;
using vrtk::test::quiet_config;
using vrtk::test::RecordingListener;

namespace
{
   std::vector<RtEvent> events_of(Scheduler const& sched, RtEventKind kind)
   {
      std::vector<RtEvent> matching;
      for (auto const& event : sched.rt_log()) {
         if (event.kind == kind) matching.push_back(event);
      }
      return matching;
   }
}

TEST(Scheduler, CrossedLockOrderIsReportedAsDeadlock)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto& l1 = sched.create_lock("L1");
   auto& l2 = sched.create_lock("L2");
   RecordingListener listener;
   sched.set_listener(&listener);

   auto const a = sched.create_thread(cpu, Priority(1), "A", [&](ThreadId self) {
      l1.acquire(self);
      sched.advance_time(self, 1);
      l2.acquire(self, SourceLocation{.file = "a.vdmrt", .line = 12});
   });
   auto const b = sched.create_thread(cpu, Priority(1), "B", [&](ThreadId self) {
      l2.acquire(self);
      sched.advance_time(self, 1);
      l1.acquire(self, SourceLocation{.file = "b.vdmrt", .line = 30});
   });
   sched.start(a);
   sched.start(b);

   try {
      (void)sched.run();
      FAIL() << "run() returned although both threads are blocked";
   }
   catch (DeadlockDetected const& deadlock) {
      EXPECT_EQ(deadlock.at(), VirtualTime(1));
      auto const& blocked = deadlock.blocked();
      ASSERT_EQ(blocked.size(), 2u);
      EXPECT_EQ(blocked[0].id, a);
      EXPECT_EQ(blocked[0].state, RunState::Locking);
      EXPECT_EQ(blocked[0].blocked_on, "lock 'L2'");
      EXPECT_EQ(blocked[0].where.line, 12u);
      EXPECT_EQ(blocked[1].id, b);
      EXPECT_EQ(blocked[1].state, RunState::Locking);
      EXPECT_EQ(blocked[1].blocked_on, "lock 'L1'");

      std::string const text = deadlock.what();
      EXPECT_NE(text.find("'A'"), std::string::npos);
      EXPECT_NE(text.find("'B'"), std::string::npos);
      EXPECT_NE(text.find("b.vdmrt:30"), std::string::npos);
   }

   EXPECT_EQ(listener.deadlocks.size(), 1u);
   EXPECT_EQ(events_of(sched, RtEventKind::Deadlock).size(), 1u);
   EXPECT_EQ(sched.thread_info(a).state, RunState::Locking);
}

TEST(Scheduler, WaitWithNoSignallerIsADeadlock)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto& cond = sched.create_lock("cond");

   auto const t = sched.create_thread(cpu, Priority(1), "T", [&](ThreadId self) {
      cond.acquire(self);
      cond.wait_for(self);
   });
   auto const bystander = sched.create_thread(cpu, Priority(1), "bystander", [](ThreadId) {});
   sched.start(t);
   sched.start(bystander);

   try {
      (void)sched.run();
      FAIL() << "run() returned with a thread waiting forever";
   }
   catch (DeadlockDetected const& deadlock) {
      ASSERT_EQ(deadlock.blocked().size(), 1u);
      EXPECT_EQ(deadlock.blocked()[0].id, t);
      EXPECT_EQ(deadlock.blocked()[0].state, RunState::Waiting);
      EXPECT_EQ(deadlock.blocked()[0].blocked_on, "lock 'cond'");
   }
   EXPECT_EQ(sched.thread_info(bystander).state, RunState::Terminated);
   EXPECT_FALSE(cond.is_locked());
}

TEST(Scheduler, UnstartedThreadsDoNotCountAsBlocked)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto const idle = sched.create_thread(cpu, Priority(1), "idle", [](ThreadId) {});

   RunReport report;
   EXPECT_NO_THROW(report = sched.run());
   EXPECT_EQ(report.never_started, 1u);
   EXPECT_EQ(report.terminated, 0u);
   EXPECT_EQ(sched.thread_info(idle).state, RunState::Created);
}

TEST(Scheduler, TimeIsMonotonicAcrossCpus)
{
   Scheduler sched(quiet_config());
   auto const cpu0 = sched.add_cpu("cpu0");
   auto const cpu1 = sched.add_cpu("cpu1");

   std::vector<VirtualTime> observed;
   auto stepper = [&](std::vector<VirtualTime::Delta> steps) {
      return [&, steps](ThreadId self) {
         for (auto step : steps) {
            observed.push_back(sched.global_time());
            sched.advance_time(self, step);
            EXPECT_EQ(sched.thread_info(self).virtual_time, sched.global_time());
         }
         observed.push_back(sched.global_time());
      };
   };
   std::vector<ThreadId> threads{
      sched.create_thread(cpu0, Priority(2), "a", stepper({7, 1, 9})),
      sched.create_thread(cpu0, Priority(1), "b", stepper({3, 3, 3, 3})),
      sched.create_thread(cpu1, Priority(1), "c", stepper({5, 2, 11})),
      sched.create_thread(cpu1, Priority(4), "d", stepper({1, 1})),
   };
   for (auto id : threads) sched.start(id);

   auto const report = sched.run();

   EXPECT_TRUE(std::is_sorted(observed.begin(), observed.end()));
   EXPECT_EQ(report.end_time, VirtualTime(18));
   EXPECT_EQ(sched.cpu_time(cpu0), VirtualTime(17));
   EXPECT_EQ(sched.cpu_time(cpu1), VirtualTime(18));

   VirtualTime previous{0};
   for (auto const& event : events_of(sched, RtEventKind::ThreadSwapIn)) {
      EXPECT_GE(event.time, previous);
      previous = event.time;
   }
}

TEST(Scheduler, HighestPriorityRunsFirst)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");

   std::vector<std::string> order;
   auto record = [&](std::string name) {
      return [&order, name](ThreadId) { order.push_back(name); };
   };
   auto const p1 = sched.create_thread(cpu, Priority(1), "p1", record("p1"));
   auto const p3 = sched.create_thread(cpu, Priority(3), "p3", record("p3"));
   auto const p2 = sched.create_thread(cpu, Priority(2), "p2", record("p2"));
   sched.start(p1);
   sched.start(p3);
   sched.start(p2);
   (void)sched.run();

   EXPECT_EQ(order, (std::vector<std::string>{"p3", "p2", "p1"}));
}

TEST(Scheduler, LowerPriorityRunsWhileHigherOneSleeps)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");

   std::vector<std::string> order;
   auto const high = sched.create_thread(cpu, Priority(9), "high", [&](ThreadId self) {
      order.push_back("high@" + std::to_string(sched.global_time().value()));
      sched.advance_time(self, 10);
      order.push_back("high@" + std::to_string(sched.global_time().value()));
   });
   auto const low = sched.create_thread(cpu, Priority(1), "low", [&](ThreadId self) {
      order.push_back("low@" + std::to_string(sched.global_time().value()));
      sched.advance_time(self, 20);
      order.push_back("low@" + std::to_string(sched.global_time().value()));
   });
   sched.start(high);
   sched.start(low);
   (void)sched.run();

   EXPECT_EQ(order, (std::vector<std::string>{"high@0", "low@0", "high@10", "low@20"}));
}

TEST(Scheduler, SecondRunContinuesFromPreviousTime)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");

   auto const first = sched.create_thread(cpu, Priority(1), "first", [&](ThreadId self) {
      sched.advance_time(self, 5);
      throw std::runtime_error("first run fails");
   });
   sched.start(first);
   auto const report1 = sched.run();
   EXPECT_EQ(report1.end_time, VirtualTime(5));
   EXPECT_EQ(report1.failures.size(), 1u);

   VirtualTime started_at;
   auto const second = sched.create_thread(cpu, Priority(1), "second", [&](ThreadId self) {
      started_at = sched.global_time();
      sched.advance_time(self, 2);
   });
   sched.start(second);
   auto const report2 = sched.run();

   EXPECT_EQ(started_at, VirtualTime(5));
   EXPECT_EQ(report2.end_time, VirtualTime(7));
   EXPECT_TRUE(report2.failures.empty());
   EXPECT_EQ(report2.terminated, 2u);
}

TEST(Scheduler, ThreadsCanBeCreatedDuringARun)
{
   Scheduler sched(quiet_config());
   auto const cpu0 = sched.add_cpu("cpu0");
   auto const cpu1 = sched.add_cpu("cpu1");

   std::optional<VirtualTime> child_started;
   ThreadId child = 0;
   auto const parent = sched.create_thread(cpu0, Priority(1), "parent", [&](ThreadId self) {
      sched.advance_time(self, 4);
      child = sched.create_thread(cpu1, Priority(1), "child", [&](ThreadId) {
         child_started = sched.global_time();
      });
      sched.start(child);
   });
   sched.start(parent);

   auto const report = sched.run();

   ASSERT_NE(child, 0u);
   EXPECT_EQ(child_started, VirtualTime(4));
   EXPECT_EQ(sched.thread_info(child).state, RunState::Terminated);
   EXPECT_EQ(report.terminated, 2u);
}

TEST(Scheduler, RunFromALogicalThreadIsRejected)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");

   bool rejected = false;
   auto const t = sched.create_thread(cpu, Priority(1), "T", [&](ThreadId) {
      try {
         (void)sched.run();
      }
      catch (Error const&) {
         rejected = true;
      }
   });
   sched.start(t);
   auto const report = sched.run();

   EXPECT_TRUE(rejected);
   EXPECT_TRUE(report.failures.empty());
}

TEST(Scheduler, InterpreterCallsNeedTheRunningThread)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto const t = sched.create_thread(cpu, Priority(1), "T", [](ThreadId) {});

   EXPECT_THROW(sched.advance_time(t, 1), InvalidThreadReference);
   EXPECT_THROW(sched.yield(t), InvalidThreadReference);
   EXPECT_THROW(sched.boundary(t, LocationKind::Statement, SourceLocation{}), InvalidThreadReference);
   EXPECT_THROW(sched.advance_time(99, 1), InvalidThreadReference);
}

TEST(Scheduler, RtLogRecordsThreadLifecycle)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto const t = sched.create_thread(cpu, Priority(1), "T", [&](ThreadId self) {
      sched.advance_time(self, 3);
   });
   sched.start(t);
   (void)sched.run();

   std::set<RtEventKind> kinds;
   for (auto const& event : sched.rt_log()) {
      EXPECT_EQ(event.thread, t);
      EXPECT_EQ(event.cpu, cpu);
      kinds.insert(event.kind);
   }
   EXPECT_EQ(kinds, (std::set<RtEventKind>{RtEventKind::ThreadCreate, RtEventKind::ThreadSwapIn,
                                            RtEventKind::ThreadSwapOut, RtEventKind::ThreadKill}));
   EXPECT_EQ(events_of(sched, RtEventKind::ThreadSwapIn).size(), 2u);

   auto const kills = events_of(sched, RtEventKind::ThreadKill);
   ASSERT_EQ(kills.size(), 1u);
   EXPECT_EQ(kills[0].time, VirtualTime(3));

   std::FILE* out = std::tmpfile();
   ASSERT_NE(out, nullptr);
   sched.dump_rt_log(out);
   EXPECT_GT(std::ftell(out), 0);
   std::fclose(out);
}

TEST(Scheduler, RtLogSpansRuns)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   auto const first = sched.create_thread(cpu, Priority(1), "first", [&](ThreadId self) {
      sched.advance_time(self, 4);
   });
   sched.start(first);
   (void)sched.run();

   auto const second = sched.create_thread(cpu, Priority(1), "second", [&](ThreadId self) {
      sched.advance_time(self, 2);
   });
   sched.start(second);
   (void)sched.run();

   auto const creates = events_of(sched, RtEventKind::ThreadCreate);
   ASSERT_EQ(creates.size(), 2u);
   EXPECT_EQ(creates[0].thread, first);
   EXPECT_EQ(creates[1].thread, second);

   auto const kills = events_of(sched, RtEventKind::ThreadKill);
   ASSERT_EQ(kills.size(), 2u);
   EXPECT_EQ(kills[0].thread, first);
   EXPECT_EQ(kills[0].time, VirtualTime(4));
   EXPECT_EQ(kills[1].thread, second);
   EXPECT_EQ(kills[1].time, VirtualTime(6));
}

TEST(Scheduler, RtLogCanBeDisabled)
{
   SchedulerConfig config = quiet_config();
   config.rt_log = false;
   Scheduler sched(config);
   auto const cpu = sched.add_cpu("cpu0");
   auto const t = sched.create_thread(cpu, Priority(1), "T", [](ThreadId) {});
   sched.start(t);
   (void)sched.run();

   EXPECT_TRUE(sched.rt_log().empty());
}

TEST(Scheduler, ListenerSeesEveryTermination)
{
   Scheduler sched(quiet_config());
   auto const cpu = sched.add_cpu("cpu0");
   RecordingListener listener;
   sched.set_listener(&listener);

   std::vector<ThreadId> threads;
   for (int i = 0; i < 4; ++i) {
      threads.push_back(sched.create_thread(cpu, Priority(1), "t" + std::to_string(i), [&, i](ThreadId self) {
         sched.advance_time(self, static_cast<VirtualTime::Delta>(4 - i));
      }));
   }
   for (auto id : threads) sched.start(id);
   (void)sched.run();

   ASSERT_EQ(listener.terminations.size(), 4u);
   // Shorter steps finish first
   for (std::size_t i = 0; i < 4; ++i) {
      EXPECT_EQ(listener.terminations[i].id, threads[3 - i]);
      EXPECT_EQ(listener.terminations[i].kind, TerminationKind::Normal);
      EXPECT_EQ(listener.terminations[i].at, VirtualTime(i + 1));
      EXPECT_TRUE(listener.terminations[i].error.empty());
   }
}

TEST(Scheduler, TeardownUnwindsBlockedThreads)
{
   bool unwound = false;
   {
      Scheduler sched(quiet_config());
      auto const cpu = sched.add_cpu("cpu0");
      auto& lock = sched.create_lock("L");

      struct Marker
      {
         bool& flag;
         ~Marker() { flag = true; }
      };
      auto const t = sched.create_thread(cpu, Priority(1), "T", [&](ThreadId self) {
         Marker marker{unwound};
         lock.acquire(self);
         lock.wait_for(self);
      });
      sched.start(t);
      EXPECT_THROW((void)sched.run(), DeadlockDetected);
      EXPECT_FALSE(unwound);
   }
   EXPECT_TRUE(unwound);
}
