#include "virtual_bus.hpp"

#include <algorithm>
#include <cassert>

namespace vrtk::kernel
{
   Delivery const& VirtualBus::enqueue(TaskControlBlock* tcb, CpuId from, std::size_t payload, VirtualTime now)
   {
      assert(connects(from) && "sender is not on this bus");

      auto deliver_at = now + latency.delay_for(payload);
      if (!in_flight_queue.empty()) {
         // Jitter in the delay must not let a later message overtake
         deliver_at = std::max(deliver_at, in_flight_queue.back().deliver_at);
      }

      in_flight_queue.push_back(Delivery{
         .tcb        = tcb,
         .from       = from,
         .to         = other_end(from),
         .payload    = payload,
         .enqueued   = now,
         .deliver_at = deliver_at,
         .sequence   = next_sequence++,
      });
      return in_flight_queue.back();
   }

   std::optional<VirtualTime> VirtualBus::next_delivery_time() const noexcept
   {
      if (in_flight_queue.empty()) return std::nullopt;
      return in_flight_queue.front().deliver_at;
   }

   Delivery VirtualBus::pop_delivery()
   {
      assert(!in_flight_queue.empty());
      Delivery head = in_flight_queue.front();
      in_flight_queue.pop_front();
      return head;
   }

   bool VirtualBus::cancel(TaskControlBlock const* tcb) noexcept
   {
      auto it = std::find_if(in_flight_queue.begin(), in_flight_queue.end(),
                             [tcb](Delivery const& d) { return d.tcb == tcb; });
      if (it == in_flight_queue.end()) return false;
      in_flight_queue.erase(it);
      return true;
   }

} // namespace vrtk::kernel
