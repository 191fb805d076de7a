#include <gtest/gtest.h>

#include "kernel.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <optional>
#include <vector>

using namespace vrtk;
using vrtk::test::quiet_config;

TEST(LatencyModel, DelayIsBasePlusRoundedUpPayloadTerm)
{
   EXPECT_EQ((LatencyModel{.base = 10}).delay_for(4096), 10u);
   EXPECT_EQ((LatencyModel{.base = 2, .bytes_per_unit = 4}).delay_for(9), 5u);
   EXPECT_EQ((LatencyModel{.base = 2, .bytes_per_unit = 4}).delay_for(8), 4u);
   EXPECT_EQ((LatencyModel{.base = 0, .bytes_per_unit = 4}).delay_for(0), 0u);
}

TEST(VirtualBus, JitterNeverReordersDeliveries)
{
   kernel::SchedulerState state{SchedulerConfig{.log_level = LogLevel::Off}};
   kernel::VirtualCpu cpu{1, "cpu0", 0};
   kernel::TaskControlBlock big(state, 1, "big", Priority(1), &cpu, ThreadEntry{});
   kernel::TaskControlBlock small(state, 2, "small", Priority(1), &cpu, ThreadEntry{});

   kernel::VirtualBus bus(1, "link", 1, 2, LatencyModel{.base = 0, .bytes_per_unit = 1});
   EXPECT_TRUE(bus.connects(1));
   EXPECT_TRUE(bus.connects(2));
   EXPECT_FALSE(bus.connects(3));
   EXPECT_EQ(bus.other_end(1), 2u);

   auto const first  = bus.enqueue(&big, 1, 100, VirtualTime(0));
   auto const second = bus.enqueue(&small, 1, 1, VirtualTime(1)); // would be due at 2
   EXPECT_EQ(first.deliver_at, VirtualTime(100));
   EXPECT_EQ(second.deliver_at, VirtualTime(100));
   EXPECT_EQ(second.to, 2u);
   EXPECT_LT(first.sequence, second.sequence);

   EXPECT_EQ(bus.next_delivery_time(), VirtualTime(100));
   EXPECT_EQ(bus.pop_delivery().tcb, &big);
   EXPECT_EQ(bus.pop_delivery().tcb, &small);
   EXPECT_EQ(bus.in_flight(), 0u);
   EXPECT_FALSE(bus.next_delivery_time().has_value());
}

TEST(VirtualBus, CancelDropsOnlyThatThreadsRecord)
{
   kernel::SchedulerState state{SchedulerConfig{.log_level = LogLevel::Off}};
   kernel::VirtualCpu cpu{1, "cpu0", 0};
   kernel::TaskControlBlock a(state, 1, "a", Priority(1), &cpu, ThreadEntry{});
   kernel::TaskControlBlock b(state, 2, "b", Priority(1), &cpu, ThreadEntry{});

   kernel::VirtualBus bus(1, "link", 1, 2, LatencyModel{.base = 5});
   (void)bus.enqueue(&a, 1, 0, VirtualTime(0));
   (void)bus.enqueue(&b, 2, 0, VirtualTime(3));

   EXPECT_TRUE(bus.cancel(&a));
   EXPECT_FALSE(bus.cancel(&a));
   EXPECT_EQ(bus.in_flight(), 1u);
   EXPECT_EQ(bus.next_delivery_time(), VirtualTime(8));
}

TEST(VirtualBus, CrossingResumesAfterLatency)
{
   Scheduler sched(quiet_config());
   auto const cpu1 = sched.add_cpu("cpu1");
   auto const cpu2 = sched.add_cpu("cpu2");
   auto const bus = sched.add_bus("bus", cpu1, cpu2, LatencyModel{.base = 10});

   VirtualTime enqueued, after_delivery;
   std::optional<RunState> state_in_flight;
   ThreadId sender = 0;

   sender = sched.create_thread(cpu1, Priority(1), "sender", [&](ThreadId self) {
      sched.advance_time(self, 5);
      enqueued = sched.global_time();
      sched.cross_bus(bus, self, 32);
      after_delivery = sched.global_time();
   });
   auto const watcher = sched.create_thread(cpu2, Priority(1), "watcher", [&](ThreadId self) {
      sched.advance_time(self, 6);
      state_in_flight = sched.thread_info(sender).state;
   });
   sched.start(sender);
   sched.start(watcher);

   auto const report = sched.run();

   EXPECT_EQ(enqueued, VirtualTime(5));
   EXPECT_GE(after_delivery, enqueued + 10);
   EXPECT_EQ(state_in_flight, RunState::Waiting);
   EXPECT_EQ(sched.thread_info(sender).virtual_time, VirtualTime(15));
   EXPECT_EQ(report.end_time, VirtualTime(15));

   auto const log = sched.rt_log();
   auto const request = std::find_if(log.begin(), log.end(),
                                     [](RtEvent const& e) { return e.kind == RtEventKind::MessageRequest; });
   auto const delivered = std::find_if(log.begin(), log.end(),
                                       [](RtEvent const& e) { return e.kind == RtEventKind::MessageDelivered; });
   ASSERT_NE(request, log.end());
   ASSERT_NE(delivered, log.end());
   EXPECT_LT(request, delivered);
   EXPECT_EQ(request->bus, bus);
   EXPECT_EQ(request->time, VirtualTime(5));
   EXPECT_EQ(delivered->time, VirtualTime(15));
   EXPECT_EQ(delivered->cpu, cpu2);
}

TEST(VirtualBus, DeliveriesKeepEnqueueOrderPerBus)
{
   Scheduler sched(quiet_config());
   auto const cpu1 = sched.add_cpu("cpu1");
   auto const cpu2 = sched.add_cpu("cpu2");
   auto const bus = sched.add_bus("bus", cpu1, cpu2, LatencyModel{.base = 0, .bytes_per_unit = 1});

   auto const bulk = sched.create_thread(cpu1, Priority(2), "bulk", [&](ThreadId self) {
      sched.cross_bus(bus, self, 100);
   });
   auto const ping = sched.create_thread(cpu1, Priority(1), "ping", [&](ThreadId self) {
      sched.cross_bus(bus, self, 1); // Alone it would arrive at t=1
   });
   sched.start(bulk);
   sched.start(ping);
   (void)sched.run();

   std::vector<ThreadId> delivered;
   std::vector<VirtualTime> times;
   for (auto const& event : sched.rt_log()) {
      if (event.kind != RtEventKind::MessageDelivered) continue;
      delivered.push_back(event.thread);
      times.push_back(event.time);
   }
   EXPECT_EQ(delivered, (std::vector<ThreadId>{bulk, ping}));
   ASSERT_EQ(times.size(), 2u);
   EXPECT_LE(times[0], times[1]);
   EXPECT_EQ(times[1], VirtualTime(100));
}

TEST(VirtualBus, TopologyIsChecked)
{
   Scheduler sched(quiet_config());
   auto const cpu1 = sched.add_cpu("cpu1");
   auto const cpu2 = sched.add_cpu("cpu2");
   auto const cpu3 = sched.add_cpu("cpu3");
   EXPECT_THROW(sched.add_bus("loop", cpu1, cpu1, LatencyModel{}), TopologyError);
   EXPECT_THROW(sched.add_bus("nowhere", cpu1, 9, LatencyModel{}), TopologyError);
   auto const bus = sched.add_bus("bus", cpu1, cpu2, LatencyModel{.base = 1});

   bool wrong_cpu = false, unknown_bus = false;
   auto const outsider = sched.create_thread(cpu3, Priority(1), "outsider", [&](ThreadId self) {
      try {
         sched.cross_bus(bus, self, 1);
      }
      catch (TopologyError const&) {
         wrong_cpu = true;
      }
      try {
         sched.cross_bus(bus + 5, self, 1);
      }
      catch (TopologyError const&) {
         unknown_bus = true;
      }
      EXPECT_THROW(sched.add_cpu("late"), TopologyError);
   });
   sched.start(outsider);
   auto const report = sched.run();

   EXPECT_TRUE(wrong_cpu);
   EXPECT_TRUE(unknown_bus);
   EXPECT_TRUE(report.failures.empty());
}
