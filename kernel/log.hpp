/**
 * Kernel diagnostics. printf style, stamped with the virtual time.
 */
#ifndef _VRTK_KERNEL_LOG_HPP_
#define _VRTK_KERNEL_LOG_HPP_

#include "vrtk.hpp"

#include <cstdio>
#include <mutex>

#ifndef VRTK_LOG_ENABLE
# define VRTK_LOG_ENABLE 1
#endif

#if VRTK_LOG_ENABLE
# define VRTK_LOG(state, level, fmt, ...) \
     do { \
        if ((state).log.enabled(level)) \
           (state).log.write((level), (state).global_clock, fmt, ##__VA_ARGS__); \
     } while (0)
#else
# define VRTK_LOG(...) ((void)0)
#endif

namespace vrtk::kernel
{
   // One per Scheduler. The debugger may log from its own host thread.
   class Logger
   {
   public:
      Logger(LogLevel level, std::FILE* sink) noexcept : configured(level), sink(sink) {}

      [[nodiscard]] LogLevel level() const noexcept;
      [[nodiscard]] bool enabled(LogLevel message) const noexcept;

      void write(LogLevel level, VirtualTime now, char const* fmt, ...) __attribute__((format(printf, 4, 5)));

   private:
      mutable std::mutex mutex;
      LogLevel configured;
      std::FILE* sink;
   };

} // namespace vrtk::kernel

#endif
