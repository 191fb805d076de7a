#include "kernel.hpp"

#include <algorithm>
#include <utility>

namespace vrtk
{
   char const* to_string(LocationKind kind) noexcept
   {
      switch (kind) {
         case LocationKind::Statement:  return "statement";
         case LocationKind::Expression: return "expression";
      }
      return "unknown";
   }

   char const* to_string(SuspendCause cause) noexcept
   {
      switch (cause) {
         case SuspendCause::Breakpoint: return "breakpoint";
         case SuspendCause::Step:       return "step";
         case SuspendCause::Pause:      return "pause";
         case SuspendCause::Catchpoint: return "catchpoint";
      }
      return "unknown";
   }
}

namespace vrtk::kernel
{
   bool Breakpoint::matches(LocationKind at_kind, SourceLocation const& at) const
   {
      if (type == Type::Catch || kind != at_kind) return false;
      if (!where) return true;
      if (where->file != at.file || where->line != at.line) return false;
      return where->column == 0 || where->column == at.column;
   }

   BreakpointId Debugger::add(Breakpoint breakpoint)
   {
      breakpoint.id = next_id++;
      breakpoints.push_back(std::move(breakpoint));
      return breakpoints.back().id;
   }

   bool Debugger::remove(BreakpointId id)
   {
      return std::erase_if(breakpoints, [id](Breakpoint const& bp) { return bp.id == id; }) != 0;
   }

   std::vector<Breakpoint> Debugger::matching(LocationKind kind, SourceLocation const& where) const
   {
      std::vector<Breakpoint> hits;
      for (auto const& bp : breakpoints) {
         if (bp.matches(kind, where)) hits.push_back(bp);
      }
      return hits;
   }

   std::vector<Breakpoint> Debugger::catchpoints() const
   {
      std::vector<Breakpoint> hits;
      for (auto const& bp : breakpoints) {
         if (bp.type == Breakpoint::Type::Catch) hits.push_back(bp);
      }
      return hits;
   }

   void suspend_running(SchedulerState& s, TaskControlBlock& tcb, Suspension const& suspension)
   {
      std::unique_lock<std::mutex> guard(s.mutex);
      leave_cpu_locked(s, tcb, RunState::Suspended);
      VRTK_LOG(s, LogLevel::Info, "suspend    id=%u '%s' (%s) at %s", tcb.id, tcb.name.c_str(),
               to_string(suspension.cause), suspension.where.to_string().c_str());
      auto* listener = s.listener;
      guard.unlock();

      // The listener may already resume or stop us from in here
      if (listener) listener->on_suspended(suspension);

      guard.lock();
      park(tcb, guard);
      VRTK_LOG(s, LogLevel::Info, "resumed    id=%u", tcb.id);
   }

} // namespace vrtk::kernel

namespace vrtk
{
   using kernel::Breakpoint;

   void Scheduler::boundary(ThreadId thread, LocationKind kind, SourceLocation const& where)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.running_thread(thread);
      tcb.location = where;
      if (tcb.stop_requested) throw kernel::ThreadStopRequest{tcb.stop_kind};

      bool const stepping = std::exchange(tcb.step_pending, false);
      bool const paused   = s.debugger.pause_requested();
      auto const candidates = s.debugger.matching(kind, where);
      auto* listener = s.listener;
      guard.unlock();

      std::optional<Suspension> hit;
      if (stepping || paused) {
         hit = Suspension{
            .thread = thread,
            .cause  = stepping ? SuspendCause::Step : SuspendCause::Pause,
            .kind   = kind,
            .where  = where,
         };
      }

      // Conditions run on this thread with no kernel mutex held
      BoundaryContext const context{.thread = thread, .kind = kind, .where = where};
      for (auto const& bp : candidates) {
         if (bp.condition && !bp.condition(context)) continue;

         if (bp.type == Breakpoint::Type::Trace) {
            auto const message = bp.message ? bp.message(context) : std::string{};
            VRTK_LOG(s, LogLevel::Info, "trace      id=%u at %s: %s", thread, where.to_string().c_str(), message.c_str());
            if (listener) listener->on_trace(thread, where, message);
            continue;
         }
         if (!hit) {
            hit = Suspension{
               .thread     = thread,
               .cause      = SuspendCause::Breakpoint,
               .breakpoint = bp.id,
               .kind       = kind,
               .where      = where,
            };
         }
      }

      if (hit) kernel::suspend_running(s, tcb, *hit);
   }

   void Scheduler::exception_raised(ThreadId thread, SourceLocation const& where, std::string_view description)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.running_thread(thread);
      if (where.known()) tcb.location = where;
      if (tcb.stop_requested) throw kernel::ThreadStopRequest{tcb.stop_kind};
      auto const catchpoints = s.debugger.catchpoints();
      guard.unlock();

      for (auto const& cp : catchpoints) {
         if (cp.on_exception && !cp.on_exception(thread, description)) continue;
         VRTK_LOG(s, LogLevel::Info, "catch      id=%u at %s: %.*s", thread, where.to_string().c_str(),
                  static_cast<int>(description.size()), description.data());
         kernel::suspend_running(s, tcb, Suspension{
            .thread     = thread,
            .cause      = SuspendCause::Catchpoint,
            .breakpoint = cp.id,
            .kind       = LocationKind::Statement,
            .where      = where,
            .detail     = std::string(description),
         });
         return;
      }
   }

   BreakpointId Scheduler::suspend_at(LocationKind kind, Condition condition)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.debugger.add(Breakpoint{
         .type      = Breakpoint::Type::Suspend,
         .kind      = kind,
         .condition = std::move(condition),
      });
   }

   BreakpointId Scheduler::break_at(SourceLocation where, LocationKind kind, Condition condition)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.debugger.add(Breakpoint{
         .type      = Breakpoint::Type::Suspend,
         .kind      = kind,
         .where     = std::move(where),
         .condition = std::move(condition),
      });
   }

   BreakpointId Scheduler::trace_at(SourceLocation where, LocationKind kind, TraceMessage message)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.debugger.add(Breakpoint{
         .type    = Breakpoint::Type::Trace,
         .kind    = kind,
         .where   = std::move(where),
         .message = std::move(message),
      });
   }

   BreakpointId Scheduler::catch_exceptions(ExceptionCondition condition)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.debugger.add(Breakpoint{
         .type         = Breakpoint::Type::Catch,
         .on_exception = std::move(condition),
      });
   }

   bool Scheduler::clear_breakpoint(BreakpointId id)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      return s.debugger.remove(id);
   }

   static bool resume_locked(kernel::SchedulerState& s, kernel::TaskControlBlock& tcb)
   {
      if (tcb.state != RunState::Suspended) return false;
      tcb.state = RunState::Runnable;
      tcb.virtual_time = std::max(tcb.virtual_time, s.global_clock);
      tcb.cpu->make_ready(&tcb);
      VRTK_LOG(s, LogLevel::Debug, "resume     id=%u", tcb.id);
      return true;
   }

   bool Scheduler::resume(ThreadId thread)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      auto& tcb = s.live_thread(thread);
      if (!resume_locked(s, tcb)) return false;
      s.notify_debugger_command();
      return true;
   }

   bool Scheduler::step(ThreadId thread)
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      auto& tcb = s.live_thread(thread);
      if (tcb.state != RunState::Suspended) return false;
      tcb.step_pending = true;
      (void)resume_locked(s, tcb);
      s.notify_debugger_command();
      return true;
   }

   void Scheduler::stop(ThreadId thread)
   {
      auto& s = *state;
      std::unique_lock<std::mutex> guard(s.mutex);
      auto& tcb = s.live_thread(thread);
      if (tcb.state == RunState::Created) {
         auto const event = kernel::retire_unstarted_locked(s, tcb, TerminationKind::Stopped);
         auto* listener = s.listener;
         guard.unlock();
         if (listener) listener->on_thread_terminated(event);
         return;
      }
      kernel::request_stop_locked(s, tcb, TerminationKind::Stopped);
   }

   void Scheduler::pause_all()
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      s.debugger.set_pause(true);
      VRTK_LOG(s, LogLevel::Info, "pause requested");
   }

   void Scheduler::resume_all()
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      s.debugger.set_pause(false);
      for (auto& tcb : s.registry) (void)resume_locked(s, *tcb);
      s.notify_debugger_command();
   }

   void Scheduler::terminate_all()
   {
      auto& s = *state;
      std::vector<ThreadTermination> retired;
      std::unique_lock<std::mutex> guard(s.mutex);
      for (auto& tcb : s.registry) {
         if (tcb->state == RunState::Created) {
            retired.push_back(kernel::retire_unstarted_locked(s, *tcb, TerminationKind::Stopped));
         } else if (tcb->live()) {
            kernel::request_stop_locked(s, *tcb, TerminationKind::Stopped);
         }
      }
      s.notify_debugger_command();
      auto* listener = s.listener;
      guard.unlock();

      if (listener) {
         for (auto const& event : retired) listener->on_thread_terminated(event);
      }
   }

   std::vector<ThreadInfo> Scheduler::list_threads() const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      std::vector<ThreadInfo> threads;
      threads.reserve(s.registry.size());
      // Registry order is creation order
      for (auto const& tcb : s.registry) threads.push_back(kernel::info_locked(*tcb));
      return threads;
   }

   ThreadInfo Scheduler::thread_info(ThreadId thread) const
   {
      auto& s = *state;
      std::lock_guard<std::mutex> guard(s.mutex);
      auto const* tcb = s.find(thread);
      if (!tcb) throw InvalidThreadReference(thread, "no such thread");
      return kernel::info_locked(*tcb);
   }

} // namespace vrtk
