#ifndef _VRTK_KERNEL_TASK_HPP_
#define _VRTK_KERNEL_TASK_HPP_

#include "vrtk.hpp"
#include "port.h"
#include "port_traits.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

namespace vrtk::kernel
{
   struct SchedulerState;
   class VirtualCpu;
   class VirtualBus;

   struct TaskControlBlock
   {
      static constexpr std::size_t NOT_SLEEPING = std::numeric_limits<std::size_t>::max();

      SchedulerState& kernel;
      ThreadId        id;
      std::string     name;
      uint8_t         priority;
      VirtualCpu*     cpu;   // bound at creation
      ThreadEntry     entry;

      RunState    state{RunState::Created};
      VirtualTime virtual_time{0}; // earliest eligible time
      VirtualTime wake_tick{0};    // Timestep deadline
      bool        swapped_in{false};

      // What it is blocked on, and where it last reported itself
      ResourceLock const* waiting_lock{nullptr};
      VirtualBus*         waiting_bus{nullptr};
      SourceLocation      location;

      // Only touched by the owning thread and by its termination path
      std::vector<ResourceLock*> held_locks;

      // Debugger requests
      bool            stop_requested{false};
      TerminationKind stop_kind{TerminationKind::Stopped};
      bool            step_pending{false};

      // Intrusive ready queue links / sleeper heap slot
      TaskControlBlock* next{nullptr};
      TaskControlBlock* prev{nullptr};
      std::size_t sleep_index{NOT_SLEEPING};

      // Opaque, in-place port context storage
      bool context_live{false};
      alignas(VRTK_PORT_CONTEXT_ALIGN) std::array<std::byte, VRTK_PORT_CONTEXT_SIZE> context_storage{};
      port_context_t* context() noexcept { return reinterpret_cast<port_context_t*>(context_storage.data()); }

      TaskControlBlock(SchedulerState& kernel, ThreadId id, std::string name, Priority priority, VirtualCpu* cpu, ThreadEntry entry) :
         kernel(kernel), id(id), name(std::move(name)), priority(priority), cpu(cpu), entry(std::move(entry)) {}

      [[nodiscard]] uint64_t creation_order() const noexcept { return id; }
      [[nodiscard]] bool live() const noexcept { return state != RunState::Terminated; }
      [[nodiscard]] bool blocked() const noexcept { return state == RunState::Locking || state == RunState::Waiting; }
      [[nodiscard]] std::string blocked_on() const;
   };

   // Thrown from a yield point to unwind a thread that was stopped or
   // terminated. Deliberately not a std::exception.
   struct ThreadStopRequest
   {
      TerminationKind kind;
   };

   // ---- Requires SchedulerState::mutex ----
   // Running -> next, gives up the CPU slot
   void leave_cpu_locked(SchedulerState& s, TaskControlBlock& tcb, RunState next);
   // Locking/Waiting -> Runnable; other states are left alone
   void wake_locked(SchedulerState& s, TaskControlBlock& tcb);
   // Sets the stop flag and makes a started thread reach a yield point soon
   void request_stop_locked(SchedulerState& s, TaskControlBlock& tcb, TerminationKind kind);
   // Created -> Terminated. The caller reports the event once unlocked
   [[nodiscard]] ThreadTermination retire_unstarted_locked(SchedulerState& s, TaskControlBlock& tcb, TerminationKind kind);
   [[nodiscard]] ThreadInfo info_locked(TaskControlBlock const& tcb);

   // ---- Called on the thread's own fiber ----
   // Hands the CPU back to the scheduler loop. 'sched_guard' is unlocked for
   // the duration of the switch and held again on return. 'resource_guard',
   // if any, is likewise dropped and re-held (even while unwinding).
   void park(TaskControlBlock& tcb, std::unique_lock<std::mutex>& sched_guard,
             std::unique_lock<std::mutex>* resource_guard = nullptr);

   void thread_trampoline(void* arg);
   void start_context(SchedulerState& s, TaskControlBlock& tcb);

} // namespace vrtk::kernel

#endif
