#include "rt_log.hpp"

namespace vrtk
{
   char const* to_string(RtEventKind kind) noexcept
   {
      switch (kind) {
         case RtEventKind::ThreadCreate:     return "ThreadCreate";
         case RtEventKind::ThreadSwapIn:     return "ThreadSwapIn";
         case RtEventKind::ThreadSwapOut:    return "ThreadSwapOut";
         case RtEventKind::ThreadKill:       return "ThreadKill";
         case RtEventKind::MessageRequest:   return "MessageRequest";
         case RtEventKind::MessageDelivered: return "MessageDelivered";
         case RtEventKind::Deadlock:         return "Deadlock";
      }
      return "Unknown";
   }
}

namespace vrtk::kernel
{
   void RtLog::record(VirtualTime time, RtEventKind kind, ThreadId thread, CpuId cpu, BusId bus, std::string detail)
   {
      if (!enabled) return;
      entries.push_back(RtEvent{
         .time   = time,
         .kind   = kind,
         .thread = thread,
         .cpu    = cpu,
         .bus    = bus,
         .detail = std::move(detail),
      });
   }

   void RtLog::dump(std::FILE* out) const
   {
      if (!out) return;
      for (auto const& event : entries) {
         std::fprintf(out, "%s -> id: %u cpu: %u", to_string(event.kind), event.thread, event.cpu);
         if (event.bus != 0) std::fprintf(out, " bus: %u", event.bus);
         if (!event.detail.empty()) std::fprintf(out, " detail: \"%s\"", event.detail.c_str());
         std::fprintf(out, " time: %llu\n", static_cast<unsigned long long>(event.time.value()));
      }
      std::fflush(out);
   }

} // namespace vrtk::kernel
