#ifndef _VRTK_KERNEL_KERNEL_HPP_
#define _VRTK_KERNEL_KERNEL_HPP_

#include "vrtk.hpp"
#include "debugger.hpp"
#include "log.hpp"
#include "rt_log.hpp"
#include "task.hpp"
#include "virtual_bus.hpp"
#include "virtual_cpu.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace vrtk::kernel
{
   struct SchedulerState
   {
      SchedulerConfig config;
      Logger log;

      // Registry, CPUs, buses, debugger table and every TCB's state. A
      // ResourceLock's own mutex is always taken before this one.
      mutable std::mutex mutex;
      std::condition_variable debugger_cv; // run loop waits here while only SUSPENDED threads remain
      uint64_t command_epoch{0};

      RtLog rt_log;
      std::vector<std::unique_ptr<ResourceLock>>     locks;
      std::vector<std::unique_ptr<VirtualCpu>>       cpus;
      std::vector<std::unique_ptr<VirtualBus>>       buses;
      std::vector<std::unique_ptr<TaskControlBlock>> registry; // index = id - 1

      VirtualTime global_clock{0};
      TaskControlBlock* running{nullptr};
      bool in_run{false};

      SchedulerListener* listener{nullptr};
      Debugger debugger;
      std::vector<ThreadFailure> failures;

      explicit SchedulerState(SchedulerConfig cfg) :
         config(cfg), log(cfg.log_level, cfg.log_sink), rt_log(cfg.rt_log) {}

      // ---- Requires mutex ----
      [[nodiscard]] TaskControlBlock* find(ThreadId id) const noexcept
      {
         if (id == 0 || id > registry.size()) return nullptr;
         return registry[id - 1].get();
      }
      // Throws InvalidThreadReference for unknown or terminated ids
      TaskControlBlock& live_thread(ThreadId id) const;
      // Also requires the caller to be that thread, on its own fiber
      TaskControlBlock& running_thread(ThreadId id) const;
      VirtualCpu& cpu(CpuId id) const;
      VirtualBus& bus(BusId id) const;

      // Takes the mutex: resolves the calling thread and records 'where'
      TaskControlBlock& caller(ThreadId id, SourceLocation const& where);

      void notify_debugger_command()
      {
         ++command_epoch;
         debugger_cv.notify_all();
      }
   };

   // Termination path access to a lock's private state
   struct LockAccess
   {
      // Force-releases 'lock' if 'tcb' holds it. Returns whether it did
      static bool abandon(ResourceLock& lock, TaskControlBlock& tcb);
   };

   // Drives the event loop until nothing is left to run. Throws DeadlockDetected.
   RunReport run_loop(SchedulerState& s);

   // Thread side of a debugger suspension, returns once resumed
   void suspend_running(SchedulerState& s, TaskControlBlock& tcb, Suspension const& suspension);

} // namespace vrtk::kernel

#endif
