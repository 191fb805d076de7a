#ifndef _VRTK_KERNEL_VIRTUAL_BUS_HPP_
#define _VRTK_KERNEL_VIRTUAL_BUS_HPP_

#include "task.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace vrtk::kernel
{
   struct Delivery
   {
      TaskControlBlock* tcb;
      CpuId       from;
      CpuId       to;
      std::size_t payload;
      VirtualTime enqueued;
      VirtualTime deliver_at;
      uint64_t    sequence;
   };

   // Point to point link between two CPUs. Deliveries leave in the order
   // they were enqueued: a record is never due before the one ahead of it.
   class VirtualBus
   {
      BusId        bus_id;
      std::string  bus_name;
      CpuId        first;
      CpuId        second;
      LatencyModel latency;

      std::deque<Delivery> in_flight_queue;
      uint64_t next_sequence{0};

   public:
      VirtualBus(BusId id, std::string name, CpuId first, CpuId second, LatencyModel latency) :
         bus_id(id), bus_name(std::move(name)), first(first), second(second), latency(latency) {}

      [[nodiscard]] BusId id() const noexcept { return bus_id; }
      [[nodiscard]] std::string const& name() const noexcept { return bus_name; }
      [[nodiscard]] bool connects(CpuId cpu) const noexcept { return cpu == first || cpu == second; }
      [[nodiscard]] CpuId other_end(CpuId cpu) const noexcept { return cpu == first ? second : first; }
      [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_queue.size(); }

      Delivery const& enqueue(TaskControlBlock* tcb, CpuId from, std::size_t payload, VirtualTime now);
      [[nodiscard]] std::optional<VirtualTime> next_delivery_time() const noexcept;
      Delivery pop_delivery();
      // Drops a record whose thread was stopped while in flight
      bool cancel(TaskControlBlock const* tcb) noexcept;
   };

} // namespace vrtk::kernel

#endif
