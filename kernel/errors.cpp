#include "vrtk.hpp"

#include <string>

namespace vrtk
{
   std::string SourceLocation::to_string() const
   {
      if (!known()) return "<unknown location>";
      std::string text = (file.empty() ? std::string("<input>") : file) + ":" + std::to_string(line);
      if (column != 0) text += ":" + std::to_string(column);
      return text;
   }

   IllegalLockState::IllegalLockState(std::string lock_name, SourceLocation where, std::string const& detail) :
      Error("Illegal Lock state (" + std::to_string(CODE) + "): " + detail +
            " [lock '" + lock_name + "' at " + where.to_string() + "]"),
      lock(std::move(lock_name)),
      location(std::move(where))
   {}

   InvalidThreadReference::InvalidThreadReference(ThreadId thread, std::string const& detail) :
      Error("Invalid thread reference " + std::to_string(thread) + ": " + detail),
      id(thread)
   {}

   static std::string describe_deadlock(VirtualTime at, std::vector<BlockedThread> const& blocked)
   {
      std::string text = "Deadlock detected at t=" + std::to_string(at.value()) + ", " +
                         std::to_string(blocked.size()) + " thread(s) blocked:";
      for (auto const& thread : blocked) {
         text += "\n  thread " + std::to_string(thread.id) + " '" + thread.name + "' " +
                 to_string(thread.state) + " on " + (thread.blocked_on.empty() ? "<nothing>" : thread.blocked_on);
         if (thread.where.known()) text += " at " + thread.where.to_string();
      }
      return text;
   }

   DeadlockDetected::DeadlockDetected(VirtualTime at, std::vector<BlockedThread> blocked) :
      Error(describe_deadlock(at, blocked)),
      time(at),
      threads(std::move(blocked))
   {}

   static std::string describe_abnormal(ThreadId thread, std::string const& thread_name, std::vector<std::string> const& locks)
   {
      std::string text = "Thread " + std::to_string(thread) + " '" + thread_name +
                         "' stopped while holding ";
      for (std::size_t i = 0; i < locks.size(); ++i) {
         if (i) text += ", ";
         text += "'" + locks[i] + "'";
      }
      return text + "; force-released";
   }

   AbnormalTermination::AbnormalTermination(ThreadId thread, std::string const& thread_name, std::vector<std::string> released_locks) :
      Error(describe_abnormal(thread, thread_name, released_locks)),
      id(thread),
      locks(std::move(released_locks))
   {}

} // namespace vrtk
