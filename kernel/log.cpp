#include "log.hpp"

#include <cstdarg>

namespace vrtk
{
   char const* to_string(LogLevel level) noexcept
   {
      switch (level) {
         case LogLevel::Error: return "ERROR";
         case LogLevel::Warn:  return "WARN";
         case LogLevel::Info:  return "INFO";
         case LogLevel::Debug: return "DEBUG";
         case LogLevel::Trace: return "TRACE";
         case LogLevel::Off:   return "OFF";
      }
      return "UNKNOWN";
   }
}

namespace vrtk::kernel
{
   LogLevel Logger::level() const noexcept
   {
      std::lock_guard<std::mutex> guard(mutex);
      return configured;
   }

   bool Logger::enabled(LogLevel message) const noexcept
   {
      auto const current = level();
      if (current == LogLevel::Off || message == LogLevel::Off) return false;
      return static_cast<uint8_t>(message) <= static_cast<uint8_t>(current);
   }

   void Logger::write(LogLevel level, VirtualTime now, char const* fmt, ...)
   {
      char buf[1024];
      va_list args;
      va_start(args, fmt);
      std::vsnprintf(buf, sizeof(buf), fmt, args);
      va_end(args);

      std::lock_guard<std::mutex> guard(mutex);
      if (!sink) return;
      std::fprintf(sink, "[t=%012llu] %-5s %s\n",
                   static_cast<unsigned long long>(now.value()), vrtk::to_string(level), buf);
      std::fflush(sink);
   }

} // namespace vrtk::kernel
