#include "kernel.hpp"

#include <algorithm>
#include <cassert>
#include <exception>
#include <string>
#include <utility>

namespace vrtk
{
   char const* to_string(RunState state) noexcept
   {
      switch (state) {
         case RunState::Created:    return "CREATED";
         case RunState::Runnable:   return "RUNNABLE";
         case RunState::Running:    return "RUNNING";
         case RunState::Waiting:    return "WAITING";
         case RunState::Locking:    return "LOCKING";
         case RunState::Suspended:  return "SUSPENDED";
         case RunState::Timestep:   return "TIMESTEP";
         case RunState::Terminated: return "TERMINATED";
      }
      return "UNKNOWN";
   }
}

namespace vrtk::kernel
{
   std::string TaskControlBlock::blocked_on() const
   {
      if (waiting_lock) return "lock '" + waiting_lock->name() + "'";
      if (waiting_bus)  return "bus '" + waiting_bus->name() + "'";
      return {};
   }

   void leave_cpu_locked(SchedulerState& s, TaskControlBlock& tcb, RunState next)
   {
      assert(tcb.state == RunState::Running && "only the running thread gives up its CPU");
      tcb.cpu->swap_out(&tcb);
      tcb.state = next;
      s.rt_log.record(tcb.virtual_time, RtEventKind::ThreadSwapOut, tcb.id, tcb.cpu->id());
      VRTK_LOG(s, LogLevel::Trace, "swap out   id=%u -> %s", tcb.id, to_string(next));
   }

   static void make_runnable_locked(SchedulerState& s, TaskControlBlock& tcb)
   {
      tcb.state = RunState::Runnable;
      tcb.virtual_time = std::max(tcb.virtual_time, s.global_clock);
      tcb.cpu->make_ready(&tcb);
   }

   void wake_locked(SchedulerState& s, TaskControlBlock& tcb)
   {
      if (!tcb.blocked()) return;
      VRTK_LOG(s, LogLevel::Debug, "wake       id=%u from %s", tcb.id, to_string(tcb.state));
      tcb.waiting_lock = nullptr;
      make_runnable_locked(s, tcb);
   }

   void request_stop_locked(SchedulerState& s, TaskControlBlock& tcb, TerminationKind kind)
   {
      assert(tcb.state != RunState::Created && "retire_unstarted_locked() handles unstarted threads");
      if (!tcb.live()) return;

      if (!tcb.stop_requested) {
         tcb.stop_requested = true;
         tcb.stop_kind = kind;
         VRTK_LOG(s, LogLevel::Debug, "stop       id=%u requested while %s", tcb.id, to_string(tcb.state));
      }

      switch (tcb.state) {
         case RunState::Timestep:
            // Unwinds now rather than at its deadline
            tcb.cpu->forget(&tcb);
            make_runnable_locked(s, tcb);
            break;
         case RunState::Waiting:
            if (tcb.waiting_bus) {
               (void)tcb.waiting_bus->cancel(&tcb);
               tcb.waiting_bus = nullptr;
            }
            tcb.waiting_lock = nullptr;
            make_runnable_locked(s, tcb);
            break;
         case RunState::Locking:
            tcb.waiting_lock = nullptr;
            make_runnable_locked(s, tcb);
            break;
         case RunState::Suspended:
            make_runnable_locked(s, tcb);
            break;
         default:
            break; // Running or Runnable: unwinds at its next yield point
      }
      s.notify_debugger_command();
   }

   ThreadTermination retire_unstarted_locked(SchedulerState& s, TaskControlBlock& tcb, TerminationKind kind)
   {
      assert(tcb.state == RunState::Created);
      tcb.state = RunState::Terminated;
      tcb.entry = nullptr;
      s.rt_log.record(s.global_clock, RtEventKind::ThreadKill, tcb.id, tcb.cpu->id());
      VRTK_LOG(s, LogLevel::Debug, "retire     id=%u never started", tcb.id);
      return ThreadTermination{
         .id                   = tcb.id,
         .name                 = tcb.name,
         .kind                 = kind,
         .at                   = s.global_clock,
         .error                = {},
         .force_released_locks = {},
      };
   }

   ThreadInfo info_locked(TaskControlBlock const& tcb)
   {
      return ThreadInfo{
         .id           = tcb.id,
         .name         = tcb.name,
         .state        = tcb.state,
         .priority     = tcb.priority,
         .cpu          = tcb.cpu->id(),
         .virtual_time = tcb.state == RunState::Timestep ? tcb.wake_tick : tcb.virtual_time,
         .swapped_in   = tcb.swapped_in,
         .location     = tcb.location,
      };
   }

   void park(TaskControlBlock& tcb, std::unique_lock<std::mutex>& sched_guard,
             std::unique_lock<std::mutex>* resource_guard)
   {
      auto& s = tcb.kernel;
      // A stop that landed between the caller's checks and here must not be lost
      if (tcb.stop_requested) request_stop_locked(s, tcb, tcb.stop_kind);

      sched_guard.unlock();
      if (resource_guard) resource_guard->unlock();

      port_yield();

      // Back on the CPU. Lock order: resource first
      if (resource_guard) resource_guard->lock();
      sched_guard.lock();
      if (tcb.stop_requested) throw ThreadStopRequest{tcb.stop_kind};
   }

   static void finish_thread(SchedulerState& s, TaskControlBlock& tcb, TerminationKind kind, std::string error)
   {
      // Force-release whatever is still held. abandon() edits held_locks
      std::vector<std::string> released;
      auto const held = tcb.held_locks;
      for (auto* lock : held) {
         if (LockAccess::abandon(*lock, tcb)) released.push_back(lock->name());
      }

      if (!released.empty()) {
         if (kind == TerminationKind::Normal) {
            kind  = TerminationKind::Failed;
            error = IllegalLockState(released.front(), tcb.location, "thread ended while holding the lock").what();
         } else if (kind == TerminationKind::Stopped) {
            error = AbnormalTermination(tcb.id, tcb.name, released).what();
            VRTK_LOG(s, LogLevel::Warn, "%s", error.c_str());
         }
      }

      std::unique_lock<std::mutex> guard(s.mutex);
      leave_cpu_locked(s, tcb, RunState::Terminated);
      s.rt_log.record(tcb.virtual_time, RtEventKind::ThreadKill, tcb.id, tcb.cpu->id());

      if (kind == TerminationKind::Failed) {
         VRTK_LOG(s, LogLevel::Error, "thread id=%u '%s' failed: %s", tcb.id, tcb.name.c_str(), error.c_str());
         s.failures.push_back(ThreadFailure{.id = tcb.id, .name = tcb.name, .error = error});
      } else {
         VRTK_LOG(s, LogLevel::Debug, "exit       id=%u", tcb.id);
      }

      ThreadTermination const event{
         .id                   = tcb.id,
         .name                 = tcb.name,
         .kind                 = kind,
         .at                   = tcb.virtual_time,
         .error                = std::move(error),
         .force_released_locks = std::move(released),
      };
      auto* listener = s.listener;
      guard.unlock();

      if (listener) listener->on_thread_terminated(event);
   }

   void thread_trampoline(void* arg)
   {
      auto& tcb = *static_cast<TaskControlBlock*>(arg);
      auto& s = tcb.kernel;

      TerminationKind kind = TerminationKind::Normal;
      std::string error;
      try {
         {
            std::lock_guard<std::mutex> guard(s.mutex);
            if (tcb.stop_requested) throw ThreadStopRequest{tcb.stop_kind};
         }
         tcb.entry(tcb.id);

         std::lock_guard<std::mutex> guard(s.mutex);
         if (tcb.stop_requested) kind = tcb.stop_kind; // never reached a yield point
      }
      catch (ThreadStopRequest const& stop) {
         kind = stop.kind;
      }
      catch (std::exception const& e) {
         kind  = TerminationKind::Failed;
         error = e.what();
      }

      finish_thread(s, tcb, kind, std::move(error));
   }

   void start_context(SchedulerState& s, TaskControlBlock& tcb)
   {
      assert(!tcb.context_live);
      port_context_init(tcb.context(), s.config.stack_size, thread_trampoline, &tcb);
      tcb.context_live = true;
   }

} // namespace vrtk::kernel
