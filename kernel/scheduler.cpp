/**
 * Scheduler front end and the virtual time event loop
 */
#include "kernel.hpp"

#include <algorithm>
#include <cassert>
#include <cinttypes>
#include <cstdio>
#include <string>
#include <utility>

namespace vrtk::kernel
{
   TaskControlBlock& SchedulerState::live_thread(ThreadId id) const
   {
      auto* tcb = find(id);
      if (!tcb) throw InvalidThreadReference(id, "no such thread");
      if (!tcb->live()) throw InvalidThreadReference(id, "thread '" + tcb->name + "' has terminated");
      return *tcb;
   }

   TaskControlBlock& SchedulerState::running_thread(ThreadId id) const
   {
      auto& tcb = live_thread(id);
      if (running != &tcb || port_get_thread_pointer() != &tcb) {
         throw InvalidThreadReference(id, "thread '" + tcb.name + "' is not the running thread");
      }
      return tcb;
   }

   VirtualCpu& SchedulerState::cpu(CpuId id) const
   {
      if (id == 0 || id > cpus.size()) throw TopologyError("no such CPU " + std::to_string(id));
      return *cpus[id - 1];
   }

   VirtualBus& SchedulerState::bus(BusId id) const
   {
      if (id == 0 || id > buses.size()) throw TopologyError("no such bus " + std::to_string(id));
      return *buses[id - 1];
   }

   TaskControlBlock& SchedulerState::caller(ThreadId id, SourceLocation const& where)
   {
      std::lock_guard<std::mutex> guard(mutex);
      auto& tcb = running_thread(id);
      if (where.known()) tcb.location = where;
      return tcb;
   }

   static void DEBUG_DUMP_READY_QUEUES(SchedulerState& s, char const* where)
   {
      if (!s.log.enabled(LogLevel::Trace)) return;
      for (auto const& cpu : s.cpus) {
         VRTK_LOG(s, LogLevel::Trace, "[%s] cpu %u '%s' clock=%" PRIu64 " ready=%zu sleepers=%zu current=%u",
                  where, cpu->id(), cpu->name().c_str(), cpu->clock().value(),
                  cpu->ready_count(), cpu->sleeper_count(), cpu->current() ? cpu->current()->id : 0u);
      }
   }

   // Hands the host thread to the next thread on 'cpu' until it yields
   static void run_slice(SchedulerState& s, VirtualCpu& cpu, std::unique_lock<std::mutex>& guard)
   {
      auto* tcb = cpu.dispatch(s.global_clock);
      if (!tcb) return;

      s.rt_log.record(tcb->virtual_time, RtEventKind::ThreadSwapIn, tcb->id, cpu.id());
      VRTK_LOG(s, LogLevel::Trace, "swap in    id=%u prio=%u cpu=%u", tcb->id, tcb->priority, cpu.id());
      if (!tcb->context_live) start_context(s, *tcb);
      s.running = tcb;
      guard.unlock();

      port_set_thread_pointer(tcb);
      port_switch(tcb->context());
      port_set_thread_pointer(nullptr);

      guard.lock();
      s.running = nullptr;
      assert(tcb->state != RunState::Running && "thread returned to the loop without yielding");
      if (port_context_finished(tcb->context())) {
         port_context_destroy(tcb->context());
         tcb->context_live = false;
         tcb->entry = nullptr;
      }
   }

   static void deliver(SchedulerState& s, VirtualBus& bus)
   {
      auto const delivery = bus.pop_delivery();
      auto& tcb = *delivery.tcb;
      assert(tcb.state == RunState::Waiting && tcb.waiting_bus == &bus);

      tcb.waiting_bus = nullptr;
      tcb.state = RunState::Runnable;
      tcb.virtual_time = std::max(tcb.virtual_time, delivery.deliver_at);
      tcb.cpu->make_ready(&tcb);

      s.rt_log.record(delivery.deliver_at, RtEventKind::MessageDelivered, tcb.id, delivery.to, bus.id(),
                      "from cpu " + std::to_string(delivery.from) + ", " + std::to_string(delivery.payload) + " bytes");
      VRTK_LOG(s, LogLevel::Debug, "deliver    id=%u bus=%u seq=%" PRIu64, tcb.id, bus.id(), delivery.sequence);
   }

   static RunReport make_report(SchedulerState const& s)
   {
      RunReport report{.end_time = s.global_clock, .failures = s.failures};
      for (auto const& tcb : s.registry) {
         if (tcb->state == RunState::Terminated) ++report.terminated;
         else if (tcb->state == RunState::Created) ++report.never_started;
      }
      return report;
   }

   RunReport run_loop(SchedulerState& s)
   {
      std::unique_lock<std::mutex> guard(s.mutex);
      while (true) {
         // Earliest event. Deliveries win ties so the woken thread competes at that instant
         std::optional<VirtualTime> best;
         VirtualBus* best_bus = nullptr;
         VirtualCpu* best_cpu = nullptr;
         for (auto const& bus : s.buses) {
            auto const due = bus->next_delivery_time();
            if (due && (!best || *due < *best)) { best = due; best_bus = bus.get(); }
         }
         for (auto const& cpu : s.cpus) {
            auto const due = cpu->next_dispatch_time();
            if (due && (!best || *due < *best)) { best = due; best_bus = nullptr; best_cpu = cpu.get(); }
         }

         if (best) {
            s.global_clock = std::max(s.global_clock, *best);
            if (best_bus) {
               deliver(s, *best_bus);
            } else {
               run_slice(s, *best_cpu, guard);
            }
            continue;
         }

         // Nothing can run. The debugger may still release a suspended thread
         bool const any_suspended = std::any_of(s.registry.begin(), s.registry.end(),
            [](auto const& tcb) { return tcb->state == RunState::Suspended; });
         if (any_suspended) {
            DEBUG_DUMP_READY_QUEUES(s, "idle, waiting for debugger");
            auto const seen = s.command_epoch;
            s.debugger_cv.wait(guard, [&] { return s.command_epoch != seen; });
            continue;
         }

         std::vector<BlockedThread> blocked;
         for (auto const& tcb : s.registry) {
            if (!tcb->blocked()) continue;
            blocked.push_back(BlockedThread{
               .id         = tcb->id,
               .name       = tcb->name,
               .state      = tcb->state,
               .blocked_on = tcb->blocked_on(),
               .where      = tcb->location,
            });
         }
         if (!blocked.empty()) {
            DeadlockDetected deadlock(s.global_clock, std::move(blocked));
            VRTK_LOG(s, LogLevel::Error, "%s", deadlock.what());
            s.rt_log.record(s.global_clock, RtEventKind::Deadlock, 0, 0, 0,
                            std::to_string(deadlock.blocked().size()) + " blocked");
            auto* listener = s.listener;
            guard.unlock();
            if (listener) listener->on_deadlock(deadlock);
            throw deadlock;
         }

         VRTK_LOG(s, LogLevel::Debug, "run complete");
         return make_report(s);
      }
   }

} // namespace vrtk::kernel

namespace vrtk
{
   using kernel::TaskControlBlock;

   Scheduler::Scheduler(SchedulerConfig config) :
      state(std::make_unique<kernel::SchedulerState>(config))
   {}

   Scheduler::~Scheduler()
   {
      auto& s = *state;
      {
         std::lock_guard<std::mutex> guard(s.mutex);
         s.listener = nullptr;
         s.debugger.set_pause(false);
      }

      // Unwind every fiber through its own stop path so locks are let go
      terminate_all();
      try {
         (void)kernel::run_loop(s);
      }
      catch (Error const& e) {
         VRTK_LOG(s, LogLevel::Warn, "teardown: %s", e.what());
      }

      for (auto& tcb : s.registry) {
         if (!tcb->context_live) continue;
         port_context_destroy(tcb->context());
         tcb->context_live = false;
      }
   }

   CpuId Scheduler::add_cpu(std::string name, uint64_t speed_hz)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      if (s.in_run) throw TopologyError("CPUs cannot be added during a run");
      auto const id = static_cast<CpuId>(s.cpus.size() + 1);
      s.cpus.push_back(std::make_unique<kernel::VirtualCpu>(id, std::move(name), speed_hz));
      VRTK_LOG(s, LogLevel::Debug, "add cpu    %u '%s' speed=%" PRIu64, id, s.cpus.back()->name().c_str(), speed_hz);
      return id;
   }

   BusId Scheduler::add_bus(std::string name, CpuId first, CpuId second, LatencyModel latency)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      if (s.in_run) throw TopologyError("buses cannot be added during a run");
      (void)s.cpu(first);
      (void)s.cpu(second);
      if (first == second) throw TopologyError("bus '" + name + "' must join two different CPUs");

      auto const id = static_cast<BusId>(s.buses.size() + 1);
      s.buses.push_back(std::make_unique<kernel::VirtualBus>(id, std::move(name), first, second, latency));
      VRTK_LOG(s, LogLevel::Debug, "add bus    %u '%s' %u<->%u", id, s.buses.back()->name().c_str(), first, second);
      return id;
   }

   ResourceLock& Scheduler::create_lock(std::string name)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      auto const id = static_cast<LockId>(s.locks.size() + 1);
      s.locks.push_back(std::make_unique<ResourceLock>(s, id, std::move(name)));
      return *s.locks.back();
   }

   void Scheduler::set_listener(SchedulerListener* listener)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      s.listener = listener;
   }

   ThreadId Scheduler::create_thread(CpuId cpu, Priority priority, std::string name, ThreadEntry entry)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      if (priority >= MAX_PRIORITIES) {
         throw TopologyError("priority " + std::to_string(static_cast<unsigned>(priority)) + " out of range for thread '" + name + "'");
      }
      if (!entry) throw Error("thread '" + name + "' has no entry");
      auto& vcpu = s.cpu(cpu);

      auto const id = static_cast<ThreadId>(s.registry.size() + 1);
      s.registry.push_back(std::make_unique<TaskControlBlock>(s, id, std::move(name), priority, &vcpu, std::move(entry)));
      s.rt_log.record(s.global_clock, RtEventKind::ThreadCreate, id, cpu, 0, s.registry.back()->name);
      VRTK_LOG(s, LogLevel::Debug, "create     id=%u '%s' prio=%u cpu=%u",
               id, s.registry.back()->name.c_str(), static_cast<unsigned>(priority), cpu);
      return id;
   }

   void Scheduler::start(ThreadId thread)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      auto& tcb = s.live_thread(thread);
      if (tcb.state != RunState::Created) throw InvalidThreadReference(thread, "thread already started");
      tcb.state = RunState::Runnable;
      tcb.virtual_time = s.global_clock;
      tcb.cpu->make_ready(&tcb);
      VRTK_LOG(s, LogLevel::Debug, "start      id=%u", tcb.id);
   }

   void Scheduler::acquire(ResourceLock& lock, ThreadId thread, SourceLocation const& where)  { lock.acquire(thread, where); }
   void Scheduler::release(ResourceLock& lock, ThreadId thread, SourceLocation const& where)  { lock.release(thread, where); }
   void Scheduler::wait_for(ResourceLock& lock, ThreadId thread, SourceLocation const& where) { lock.wait_for(thread, where); }
   void Scheduler::signal(ResourceLock& lock)     { lock.signal(); }
   void Scheduler::signal_all(ResourceLock& lock) { lock.signal_all(); }

   void Scheduler::advance_time(ThreadId thread, VirtualTime::Delta duration)
   {
      if (duration == 0) { yield(thread); return; }

      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.running_thread(thread);
      kernel::leave_cpu_locked(s, tcb, RunState::Timestep);
      tcb.wake_tick = tcb.virtual_time + duration;
      tcb.cpu->add_sleeper(&tcb);
      VRTK_LOG(s, LogLevel::Trace, "timestep   id=%u until=%" PRIu64 " (+%" PRIu64 ")",
               tcb.id, tcb.wake_tick.value(), duration);
      kernel::park(tcb, guard);
   }

   void Scheduler::advance_cycles(ThreadId thread, uint64_t cycles)
   {
      VirtualTime::Delta duration;
      {
         auto& s = *state;
         std::lock_guard<std::mutex> guard(s.mutex);
         auto& tcb = s.running_thread(thread);
         duration = tcb.cpu->cycles_to_duration(cycles, s.config.units_per_second);
      }
      advance_time(thread, duration);
   }

   void Scheduler::yield(ThreadId thread)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.running_thread(thread);
      kernel::leave_cpu_locked(s, tcb, RunState::Runnable);
      tcb.cpu->make_ready(&tcb);
      kernel::park(tcb, guard);
   }

   void Scheduler::cross_bus(BusId bus_id, ThreadId thread, std::size_t payload_size)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.running_thread(thread);
      auto& bus = s.bus(bus_id);
      if (!bus.connects(tcb.cpu->id())) {
         throw TopologyError("bus '" + bus.name() + "' is not attached to CPU '" + tcb.cpu->name() + "'");
      }

      kernel::leave_cpu_locked(s, tcb, RunState::Waiting);
      tcb.waiting_bus = &bus;
      auto const& delivery = bus.enqueue(&tcb, tcb.cpu->id(), payload_size, tcb.virtual_time);
      s.rt_log.record(tcb.virtual_time, RtEventKind::MessageRequest, tcb.id, tcb.cpu->id(), bus.id(),
                      "to cpu " + std::to_string(delivery.to) + ", " + std::to_string(payload_size) + " bytes");
      VRTK_LOG(s, LogLevel::Debug, "send       id=%u bus=%u deliver_at=%" PRIu64,
               tcb.id, bus.id(), delivery.deliver_at.value());
      kernel::park(tcb, guard);
   }

   void Scheduler::terminate(ThreadId thread)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.live_thread(thread);
      if (!tcb.held_locks.empty()) {
         throw IllegalLockState(tcb.held_locks.front()->name(), tcb.location,
                                "thread '" + tcb.name + "' terminated while holding the lock");
      }

      if (tcb.state == RunState::Created) {
         auto const event = kernel::retire_unstarted_locked(s, tcb, TerminationKind::Normal);
         auto* listener = s.listener;
         guard.unlock();
         if (listener) listener->on_thread_terminated(event);
         return;
      }

      if (s.running == &tcb && port_get_thread_pointer() == &tcb) {
         throw kernel::ThreadStopRequest{TerminationKind::Normal};
      }
      kernel::request_stop_locked(s, tcb, TerminationKind::Normal);
   }

   RunReport Scheduler::run()
   {
      auto& s = *state;
      if (port_in_context()) throw Error("run() called from a logical thread");
      {
         std::lock_guard<std::mutex> guard(s.mutex);
         if (s.in_run) throw Error("scheduler is already running");
         s.in_run = true;
         s.failures.clear(); // Per run; the RT log keeps accumulating
      }

      struct RunScope
      {
         kernel::SchedulerState& s;
         ~RunScope()
         {
            std::lock_guard<std::mutex> guard(s.mutex);
            s.in_run = false;
         }
      } const scope{s};

      return kernel::run_loop(s);
   }

   VirtualTime Scheduler::global_time() const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.global_clock;
   }

   VirtualTime Scheduler::cpu_time(CpuId cpu) const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.cpu(cpu).clock();
   }

   std::vector<RtEvent> Scheduler::rt_log() const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.rt_log.events();
   }

   void Scheduler::dump_rt_log(std::FILE* out) const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      s.rt_log.dump(out);
   }

} // namespace vrtk
