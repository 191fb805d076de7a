#ifndef _VRTK_KERNEL_DEBUGGER_HPP_
#define _VRTK_KERNEL_DEBUGGER_HPP_

#include "vrtk.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace vrtk::kernel
{
   struct Breakpoint
   {
      enum class Type : uint8_t { Suspend, Trace, Catch };

      BreakpointId                  id{0};
      Type                          type{Type::Suspend};
      LocationKind                  kind{LocationKind::Statement};
      std::optional<SourceLocation> where; // empty: any location of 'kind'
      Condition                     condition;
      TraceMessage                  message;
      ExceptionCondition            on_exception;

      // Same file and line; the column only counts when one was given
      [[nodiscard]] bool matches(LocationKind at_kind, SourceLocation const& at) const;
   };

   // Breakpoint table and the global pause flag. Guarded by the scheduler mutex.
   class Debugger
   {
      std::vector<Breakpoint> breakpoints;
      BreakpointId next_id{1};
      bool pause{false};

   public:
      BreakpointId add(Breakpoint breakpoint);
      bool remove(BreakpointId id);

      // Copies, so conditions can be evaluated with no mutex held
      [[nodiscard]] std::vector<Breakpoint> matching(LocationKind kind, SourceLocation const& where) const;
      [[nodiscard]] std::vector<Breakpoint> catchpoints() const;

      void set_pause(bool on) noexcept { pause = on; }
      [[nodiscard]] bool pause_requested() const noexcept { return pause; }
   };

} // namespace vrtk::kernel

#endif
