#ifndef _VRTK_KERNEL_VIRTUAL_CPU_HPP_
#define _VRTK_KERNEL_VIRTUAL_CPU_HPP_

#include "task.hpp"

#include <array>
#include <bit>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vrtk::kernel
{
   static constexpr uint32_t UINT32_BITS = std::numeric_limits<uint32_t>::digits;

   // Runnable threads of one CPU: one queue per priority level, each queue
   // kept in creation order so ties always break the same way.
   class ReadyMatrix
   {
      class CreationOrderQueue
      {
         TaskControlBlock* head{nullptr};
         TaskControlBlock* tail{nullptr};

      public:
         [[nodiscard]] constexpr bool empty() const noexcept { return !head; }
         [[nodiscard]] constexpr TaskControlBlock* front() const noexcept { return head; }

         void insert(TaskControlBlock* tcb) noexcept;
         void remove(TaskControlBlock* tcb) noexcept;
         [[nodiscard]] std::size_t size() const noexcept;
      };

      std::array<CreationOrderQueue, MAX_PRIORITIES> matrix{};
      uint32_t bitmap{0};
      static_assert(MAX_PRIORITIES <= UINT32_BITS, "bitmap cannot hold that many priorities!");

   public:
      [[nodiscard]] constexpr bool empty() const noexcept { return bitmap == 0; }
      [[nodiscard]] constexpr bool empty_at(uint32_t priority) const noexcept { return matrix[priority].empty(); }
      [[nodiscard]] std::size_t size_at(uint32_t priority) const noexcept { return matrix[priority].size(); }
      [[nodiscard]] constexpr int best_priority() const noexcept
      {
         return bitmap ? static_cast<int>(UINT32_BITS - 1 - std::countl_zero(bitmap)) : -1;
      }
      [[nodiscard]] std::bitset<UINT32_BITS> bitmap_view() const noexcept { return {bitmap}; }
      [[nodiscard]] std::size_t size() const noexcept;

      void enqueue_task(TaskControlBlock* tcb) noexcept;
      void remove_task(TaskControlBlock* tcb) noexcept;
      // Highest priority, then oldest, among threads eligible at 'now'
      TaskControlBlock* pop_best_eligible(VirtualTime now) noexcept;
      [[nodiscard]] std::optional<VirtualTime> earliest_eligible() const noexcept;
   };

   // Threads in Timestep, ordered by (deadline, creation order)
   class SleepMinHeap
   {
      std::vector<TaskControlBlock*> heap_buffer;

      static std::size_t parent(std::size_t i) noexcept { return (i - 1u) >> 1; }
      static std::size_t left  (std::size_t i) noexcept { return (i << 1) + 1u; }
      static std::size_t right (std::size_t i) noexcept { return (i << 1) + 2u; }

      static bool earlier(TaskControlBlock const* a, TaskControlBlock const* b) noexcept
      {
         if (a->wake_tick != b->wake_tick) return a->wake_tick.is_before(b->wake_tick);
         return a->creation_order() < b->creation_order();
      }
      void swap_nodes(std::size_t a, std::size_t b) noexcept;
      void sift_up(std::size_t i) noexcept;
      void sift_down(std::size_t i) noexcept;

   public:
      [[nodiscard]] bool empty() const noexcept { return heap_buffer.empty(); }
      [[nodiscard]] std::size_t size() const noexcept { return heap_buffer.size(); }
      [[nodiscard]] TaskControlBlock* top() const noexcept
      {
         return heap_buffer.empty() ? nullptr : heap_buffer.front();
      }

      void push(TaskControlBlock* tcb);
      TaskControlBlock* pop_min() noexcept;
      void remove(TaskControlBlock* tcb) noexcept;
   };

   class VirtualCpu
   {
      CpuId       cpu_id;
      std::string cpu_name;
      uint64_t    speed;           // cycles per second, 0 = unknown
      VirtualTime local_clock{0};
      TaskControlBlock* current_task{nullptr};

      ReadyMatrix  ready;
      SleepMinHeap sleepers;

   public:
      VirtualCpu(CpuId id, std::string name, uint64_t speed_hz) :
         cpu_id(id), cpu_name(std::move(name)), speed(speed_hz) {}

      [[nodiscard]] CpuId id() const noexcept { return cpu_id; }
      [[nodiscard]] std::string const& name() const noexcept { return cpu_name; }
      [[nodiscard]] uint64_t speed_hz() const noexcept { return speed; }
      [[nodiscard]] VirtualTime clock() const noexcept { return local_clock; }
      [[nodiscard]] TaskControlBlock* current() const noexcept { return current_task; }
      [[nodiscard]] std::size_t ready_count() const noexcept { return ready.size(); }
      [[nodiscard]] std::size_t sleeper_count() const noexcept { return sleepers.size(); }

      // Runnable thread joins the run queue
      void make_ready(TaskControlBlock* tcb) noexcept;
      // Timestep thread waits for the clock to reach its wake_tick
      void add_sleeper(TaskControlBlock* tcb);
      // Drop from whichever queue holds it
      void forget(TaskControlBlock* tcb) noexcept;

      // When this CPU could next dispatch, if it has any work at all
      [[nodiscard]] std::optional<VirtualTime> next_dispatch_time() const noexcept;
      // Wake due sleepers, swap in the best eligible thread at 'now'
      TaskControlBlock* dispatch(VirtualTime now) noexcept;
      // Current thread gives up the execution slot
      void swap_out(TaskControlBlock* tcb) noexcept;

      // Cycles to virtual time units, rounded up
      [[nodiscard]] VirtualTime::Delta cycles_to_duration(uint64_t cycles, uint64_t units_per_second) const;
   };

} // namespace vrtk::kernel

#endif
