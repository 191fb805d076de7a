#include "kernel.hpp"

#include <algorithm>
#include <cassert>

namespace vrtk
{
   using kernel::TaskControlBlock;

   namespace
   {
      // Membership of a lock's wait set for the duration of one block. Must
      // be destroyed with the lock's own mutex held.
      class WaiterEntry
      {
         std::vector<TaskControlBlock*>& wait_set;
         TaskControlBlock* tcb;

      public:
         WaiterEntry(std::vector<TaskControlBlock*>& set, TaskControlBlock* tcb) : wait_set(set), tcb(tcb)
         {
            assert(std::find(wait_set.begin(), wait_set.end(), tcb) == wait_set.end() && "duplicate waiter");
            wait_set.push_back(tcb);
         }
         ~WaiterEntry() { std::erase(wait_set, tcb); }

         WaiterEntry(WaiterEntry const&)            = delete;
         WaiterEntry& operator=(WaiterEntry const&) = delete;
      };
   }

   ResourceLock::ResourceLock(kernel::SchedulerState& state, LockId id, std::string name) :
      sched_state(state), lock_id(id), lock_name(std::move(name))
   {}

   // Assumes 'guard' holds this lock's mutex
   void ResourceLock::take_under_guard(TaskControlBlock& tcb)
   {
      owner = &tcb;
      if (std::find(tcb.held_locks.begin(), tcb.held_locks.end(), this) == tcb.held_locks.end()) {
         tcb.held_locks.push_back(this);
      }
   }

   void ResourceLock::drop_under_guard()
   {
      if (!owner) return;
      std::erase(owner->held_locks, this);
      owner = nullptr;
   }

   void ResourceLock::wake_under_guard(bool include_waiting)
   {
      std::lock_guard<std::mutex> sched(sched_state.mutex);
      for (auto* waiter : wait_set) {
         if (waiter->state == RunState::Locking ||
             (include_waiting && waiter->state == RunState::Waiting))
         {
            kernel::wake_locked(sched_state, *waiter);
         }
      }
   }

   void ResourceLock::contend_under_guard(TaskControlBlock& tcb, std::unique_lock<std::mutex>& guard)
   {
      // No ticket: every woken waiter retries and whichever runs first wins
      while (owner && owner != &tcb) {
         WaiterEntry entry(wait_set, &tcb);
         std::unique_lock<std::mutex> sched(sched_state.mutex);
         VRTK_LOG(sched_state, LogLevel::Debug, "lock '%s': id=%u blocked, held by id=%u",
                  lock_name.c_str(), tcb.id, owner->id);
         tcb.waiting_lock = this;
         kernel::leave_cpu_locked(sched_state, tcb, RunState::Locking);
         kernel::park(tcb, sched, &guard);
         tcb.waiting_lock = nullptr;
      }
      take_under_guard(tcb);
   }

   void ResourceLock::acquire(ThreadId thread, SourceLocation const& where)
   {
      auto& tcb = sched_state.caller(thread, where);
      std::unique_lock<std::mutex> guard(mutex);
      contend_under_guard(tcb, guard);
   }

   bool ResourceLock::try_acquire(ThreadId thread, SourceLocation const& where)
   {
      auto& tcb = sched_state.caller(thread, where);
      std::lock_guard<std::mutex> guard(mutex);
      if (owner && owner != &tcb) return false;
      take_under_guard(tcb);
      return true;
   }

   void ResourceLock::release(ThreadId thread, SourceLocation const& where)
   {
      auto& tcb = sched_state.caller(thread, where);
      std::lock_guard<std::mutex> guard(mutex);
      if (owner && owner != &tcb) {
         throw IllegalLockState(lock_name, where,
                                "release by thread '" + tcb.name + "' while held by '" + owner->name + "'");
      }
      if (!owner) return; // Releasing a free lock is harmless
      drop_under_guard();
      wake_under_guard(false);
   }

   void ResourceLock::wait_for(ThreadId thread, SourceLocation const& where)
   {
      auto& tcb = sched_state.caller(thread, where);
      std::unique_lock<std::mutex> guard(mutex);
      if (owner != &tcb) {
         throw IllegalLockState(lock_name, where, "wait by thread '" + tcb.name + "' which does not hold the lock");
      }

      drop_under_guard();
      wake_under_guard(false);
      {
         WaiterEntry entry(wait_set, &tcb);
         std::unique_lock<std::mutex> sched(sched_state.mutex);
         VRTK_LOG(sched_state, LogLevel::Debug, "lock '%s': id=%u waiting for a signal", lock_name.c_str(), tcb.id);
         tcb.waiting_lock = this;
         kernel::leave_cpu_locked(sched_state, tcb, RunState::Waiting);
         kernel::park(tcb, sched, &guard);
         tcb.waiting_lock = nullptr;
      }
      contend_under_guard(tcb, guard);
   }

   void ResourceLock::signal()
   {
      // Every waiter re-contends, so waking one or all looks the same to them
      signal_all();
   }

   void ResourceLock::signal_all()
   {
      std::lock_guard<std::mutex> guard(mutex);
      wake_under_guard(true);
   }

   void ResourceLock::reset()
   {
      std::lock_guard<std::mutex> guard(mutex);
      {
         std::lock_guard<std::mutex> sched(sched_state.mutex);
         if (sched_state.in_run) throw TopologyError("lock '" + lock_name + "' cannot be reset during a run");
      }
      drop_under_guard();
      wait_set.clear();
   }

   std::optional<ThreadId> ResourceLock::held_by() const
   {
      std::lock_guard<std::mutex> guard(mutex);
      if (!owner) return std::nullopt;
      return owner->id;
   }

   bool ResourceLock::is_locked() const
   {
      std::lock_guard<std::mutex> guard(mutex);
      return owner != nullptr;
   }

   std::vector<ThreadId> ResourceLock::waiters() const
   {
      std::lock_guard<std::mutex> guard(mutex);
      std::vector<ThreadId> ids;
      ids.reserve(wait_set.size());
      for (auto const* waiter : wait_set) ids.push_back(waiter->id);
      return ids;
   }

} // namespace vrtk

namespace vrtk::kernel
{
   bool LockAccess::abandon(ResourceLock& lock, TaskControlBlock& tcb)
   {
      std::lock_guard<std::mutex> guard(lock.mutex);
      if (lock.owner != &tcb) return false;
      lock.drop_under_guard();
      lock.wake_under_guard(false);
      return true;
   }

} // namespace vrtk::kernel
