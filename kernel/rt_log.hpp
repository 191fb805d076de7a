#ifndef _VRTK_KERNEL_RT_LOG_HPP_
#define _VRTK_KERNEL_RT_LOG_HPP_

#include "vrtk.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace vrtk::kernel
{
   // Real-time event trace over the scheduler's whole lifetime: thread
   // creation precedes run(), and later runs append. Guarded by the scheduler mutex.
   class RtLog
   {
      std::vector<RtEvent> entries;
      bool enabled;

   public:
      explicit RtLog(bool enabled) noexcept : enabled(enabled) {}

      void record(VirtualTime time, RtEventKind kind, ThreadId thread, CpuId cpu, BusId bus = 0, std::string detail = {});

      [[nodiscard]] std::vector<RtEvent> const& events() const noexcept { return entries; }

      void dump(std::FILE* out) const;
   };

} // namespace vrtk::kernel

#endif
