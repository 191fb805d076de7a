#include "virtual_cpu.hpp"

#include <algorithm>
#include <cassert>

namespace vrtk::kernel
{
   // ---------------- ReadyMatrix ----------------

   void ReadyMatrix::CreationOrderQueue::insert(TaskControlBlock* tcb) noexcept
   {
      assert(tcb->next == nullptr && tcb->prev == nullptr && "TCB already linked");

      // Walk back from the tail: newly runnable threads are usually the youngest
      TaskControlBlock* after = tail;
      while (after && after->creation_order() > tcb->creation_order()) after = after->prev;

      tcb->prev = after;
      tcb->next = after ? after->next : head;
      if (tcb->next) tcb->next->prev = tcb; else tail = tcb;
      if (after) after->next = tcb; else head = tcb;
   }

   void ReadyMatrix::CreationOrderQueue::remove(TaskControlBlock* tcb) noexcept
   {
      if (tcb->prev) tcb->prev->next = tcb->next; else head = tcb->next;
      if (tcb->next) tcb->next->prev = tcb->prev; else tail = tcb->prev;
      tcb->next = tcb->prev = nullptr;
   }

   // This walks the linked list so isn't 'free'. Debugging and reporting only
   std::size_t ReadyMatrix::CreationOrderQueue::size() const noexcept
   {
      std::size_t n = 0;
      for (auto* tcb = head; tcb; tcb = tcb->next) ++n;
      return n;
   }

   std::size_t ReadyMatrix::size() const noexcept
   {
      std::size_t n = 0;
      for (auto const& queue : matrix) n += queue.size();
      return n;
   }

   void ReadyMatrix::enqueue_task(TaskControlBlock* tcb) noexcept
   {
      assert(tcb->priority < MAX_PRIORITIES);
      matrix[tcb->priority].insert(tcb);
      bitmap |= (1u << tcb->priority);
   }

   void ReadyMatrix::remove_task(TaskControlBlock* tcb) noexcept
   {
      auto const priority = tcb->priority;
      matrix[priority].remove(tcb);
      if (matrix[priority].empty()) bitmap &= ~(1u << priority);
   }

   TaskControlBlock* ReadyMatrix::pop_best_eligible(VirtualTime now) noexcept
   {
      uint32_t levels = bitmap;
      while (levels) {
         auto const priority = UINT32_BITS - 1 - std::countl_zero(levels);
         for (auto* tcb = matrix[priority].front(); tcb; tcb = tcb->next) {
            if (now.has_reached(tcb->virtual_time)) {
               remove_task(tcb);
               return tcb;
            }
         }
         levels &= ~(1u << priority);
      }
      return nullptr;
   }

   std::optional<VirtualTime> ReadyMatrix::earliest_eligible() const noexcept
   {
      std::optional<VirtualTime> earliest;
      for (auto const& queue : matrix) {
         for (auto* tcb = queue.front(); tcb; tcb = tcb->next) {
            if (!earliest || tcb->virtual_time < *earliest) earliest = tcb->virtual_time;
         }
      }
      return earliest;
   }

   // ---------------- SleepMinHeap ----------------

   void SleepMinHeap::swap_nodes(std::size_t a, std::size_t b) noexcept
   {
      std::swap(heap_buffer[a], heap_buffer[b]);
      heap_buffer[a]->sleep_index = a;
      heap_buffer[b]->sleep_index = b;
   }

   void SleepMinHeap::sift_up(std::size_t i) noexcept
   {
      while (i > 0) {
         std::size_t pnt = parent(i);
         if (!earlier(heap_buffer[i], heap_buffer[pnt])) break;
         swap_nodes(i, pnt);
         i = pnt;
      }
   }

   void SleepMinHeap::sift_down(std::size_t i) noexcept
   {
      auto const size_count = heap_buffer.size();
      while (true) {
         std::size_t lft = left(i), rht = right(i), mid = i;
         if (lft < size_count && earlier(heap_buffer[lft], heap_buffer[mid])) mid = lft;
         if (rht < size_count && earlier(heap_buffer[rht], heap_buffer[mid])) mid = rht;
         if (mid == i) break;
         swap_nodes(i, mid);
         i = mid;
      }
   }

   void SleepMinHeap::push(TaskControlBlock* tcb)
   {
      assert(tcb->sleep_index == TaskControlBlock::NOT_SLEEPING && "thread is already sleeping");
      auto const i = heap_buffer.size();
      heap_buffer.push_back(tcb);
      tcb->sleep_index = i;
      sift_up(i);
   }

   TaskControlBlock* SleepMinHeap::pop_min() noexcept
   {
      if (heap_buffer.empty()) return nullptr;
      TaskControlBlock* tcb = heap_buffer.front();
      tcb->sleep_index = TaskControlBlock::NOT_SLEEPING;
      heap_buffer.front() = heap_buffer.back();
      heap_buffer.pop_back();
      if (!heap_buffer.empty()) {
         heap_buffer.front()->sleep_index = 0;
         sift_down(0);
      }
      return tcb;
   }

   void SleepMinHeap::remove(TaskControlBlock* tcb) noexcept
   {
      auto const i = tcb->sleep_index;
      if (i == TaskControlBlock::NOT_SLEEPING) return; // not in heap
      tcb->sleep_index = TaskControlBlock::NOT_SLEEPING;

      auto const last = heap_buffer.size() - 1;
      if (i == last) { heap_buffer.pop_back(); return; } // removed last

      heap_buffer[i] = heap_buffer[last];
      heap_buffer.pop_back();
      heap_buffer[i]->sleep_index = i;

      // Re-heapify from i (either direction)
      if (i > 0 && earlier(heap_buffer[i], heap_buffer[parent(i)])) {
         sift_up(i);
      } else {
         sift_down(i);
      }
   }

   // ---------------- VirtualCpu ----------------

   void VirtualCpu::make_ready(TaskControlBlock* tcb) noexcept
   {
      assert(tcb->cpu == this);
      ready.enqueue_task(tcb);
   }

   void VirtualCpu::add_sleeper(TaskControlBlock* tcb)
   {
      assert(tcb->cpu == this);
      sleepers.push(tcb);
   }

   void VirtualCpu::forget(TaskControlBlock* tcb) noexcept
   {
      if (tcb->sleep_index != TaskControlBlock::NOT_SLEEPING) {
         sleepers.remove(tcb);
      } else if (tcb->state == RunState::Runnable) {
         ready.remove_task(tcb);
      }
   }

   std::optional<VirtualTime> VirtualCpu::next_dispatch_time() const noexcept
   {
      auto earliest = ready.earliest_eligible();
      if (auto const* top_tcb = sleepers.top()) {
         if (!earliest || top_tcb->wake_tick < *earliest) earliest = top_tcb->wake_tick;
      }
      if (!earliest) return std::nullopt;
      return std::max(*earliest, local_clock);
   }

   TaskControlBlock* VirtualCpu::dispatch(VirtualTime now) noexcept
   {
      assert(current_task == nullptr && "CPU slot still taken");

      // Wake sleepers
      while (auto* top_tcb = sleepers.top()) {
         if (now.is_before(top_tcb->wake_tick)) break; // Not due yet
         (void)sleepers.pop_min();
         top_tcb->virtual_time = std::max(top_tcb->virtual_time, top_tcb->wake_tick);
         top_tcb->state = RunState::Runnable;
         ready.enqueue_task(top_tcb);
      }

      auto* next_task = ready.pop_best_eligible(now);
      if (!next_task) return nullptr;

      next_task->virtual_time = std::max(next_task->virtual_time, now);
      local_clock = std::max(local_clock, next_task->virtual_time);
      next_task->state = RunState::Running;
      next_task->swapped_in = true;
      current_task = next_task;
      return next_task;
   }

   void VirtualCpu::swap_out(TaskControlBlock* tcb) noexcept
   {
      tcb->swapped_in = false;
      if (current_task == tcb) current_task = nullptr;
   }

   VirtualTime::Delta VirtualCpu::cycles_to_duration(uint64_t cycles, uint64_t units_per_second) const
   {
      if (speed == 0) {
         throw TopologyError("CPU " + cpu_name + " has no speed, cannot convert cycles to time");
      }
      auto const scaled = static_cast<unsigned __int128>(cycles) * units_per_second;
      auto const duration = (scaled + speed - 1) / speed;
      if (duration > std::numeric_limits<uint64_t>::max()) return std::numeric_limits<uint64_t>::max();
      return static_cast<VirtualTime::Delta>(duration);
   }

} // namespace vrtk::kernel
