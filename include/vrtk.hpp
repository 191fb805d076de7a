/**
 * Virtual Real-Time Kernel Application Programming Interface
 *
 * Logical threads bound to virtual CPUs, resource locks, virtual buses with
 * modeled latency, and the suspend/resume hooks a debugger drives.
 * Everything runs on virtual time owned by one Scheduler instance.
*/
#ifndef _VRTK_HPP_
#define _VRTK_HPP_

#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace vrtk
{
   //-------------- Config ---------------
   static constexpr uint32_t    MAX_PRIORITIES           = 32; // 0 = lowest, 31 = highest
   static constexpr std::size_t DEFAULT_STACK_SIZE       = 256 * 1024;
   static constexpr uint64_t    DEFAULT_UNITS_PER_SECOND = 1'000'000'000; // 1 unit = 1ns

   static_assert(MAX_PRIORITIES <= std::numeric_limits<uint32_t>::digits, "Unsupported configuration");

   class VirtualTime
   {
      uint64_t t{0};

   public:
      using Delta = uint64_t;

      constexpr VirtualTime() noexcept = default;
      constexpr explicit VirtualTime(uint64_t value) noexcept : t(value) {}

      [[nodiscard]] constexpr uint64_t value() const noexcept { return t; }

      [[nodiscard]] static constexpr VirtualTime max() noexcept
      {
         return VirtualTime(std::numeric_limits<uint64_t>::max());
      }

      // "now >= deadline"
      [[nodiscard]] constexpr bool has_reached(VirtualTime deadline) const noexcept { return t >= deadline.t; }
      // "now < deadline"
      [[nodiscard]] constexpr bool is_before(VirtualTime deadline) const noexcept { return t < deadline.t; }

      // ---- Arithmetic ----
      // Saturates instead of wrapping: virtual time never goes backwards
      friend constexpr VirtualTime operator+(VirtualTime time, Delta delta) noexcept
      {
         return delta > std::numeric_limits<uint64_t>::max() - time.t ? max() : VirtualTime(time.t + delta);
      }
      friend constexpr VirtualTime operator+(Delta delta, VirtualTime time) noexcept
      {
         return time + delta;
      }
      VirtualTime& operator+=(Delta delta) noexcept
      {
         *this = *this + delta; return *this;
      }

      // Elapsed units between two instants, 0 if rhs is later
      friend constexpr Delta operator-(VirtualTime lhs, VirtualTime rhs) noexcept
      {
         return lhs.t > rhs.t ? lhs.t - rhs.t : 0;
      }

      friend constexpr auto operator<=>(VirtualTime const&, VirtualTime const&) noexcept = default;
   };
   static_assert(sizeof(VirtualTime) == sizeof(uint64_t), "VirtualTime should be as cheap as uint64_t");
   static_assert(std::is_trivially_copyable_v<VirtualTime>);

   using ThreadId     = uint32_t; // 0 is invalid
   using CpuId        = uint32_t; // 0 is invalid
   using BusId        = uint32_t; // 0 is invalid
   using LockId       = uint32_t;
   using BreakpointId = uint32_t;

   struct Priority
   {
      uint8_t val;
      constexpr explicit Priority(uint8_t v) : val(v) {}
      operator uint8_t() const { return val; } // Intentionally implicit
   };

   enum class RunState : uint8_t
   {
      Created,    // registered, not yet started
      Runnable,   // waiting for its CPU to dispatch it
      Running,    // executing interpreter code, holds the CPU slot
      Waiting,    // blocked on a condition signal or a bus delivery
      Locking,    // blocked acquiring a ResourceLock
      Suspended,  // halted by the debugger
      Timestep,   // yielding until its CPU clock reaches a deadline
      Terminated,
   };
   [[nodiscard]] char const* to_string(RunState state) noexcept;

   enum class LocationKind : uint8_t { Statement, Expression };
   [[nodiscard]] char const* to_string(LocationKind kind) noexcept;

   struct SourceLocation
   {
      std::string file;
      uint32_t    line{0};
      uint32_t    column{0};

      [[nodiscard]] bool known() const noexcept { return !file.empty() || line != 0; }
      [[nodiscard]] std::string to_string() const;

      friend bool operator==(SourceLocation const&, SourceLocation const&) = default;
   };

   enum class LogLevel : uint8_t
   {
      Error = 0,
      Warn  = 1,
      Info  = 2,
      Debug = 3,
      Trace = 4,
      Off   = 255,
   };
   [[nodiscard]] char const* to_string(LogLevel level) noexcept;

   //-------------- Errors ---------------
   class Error : public std::runtime_error
   {
   public:
      using std::runtime_error::runtime_error;
   };

   // Release or wait by a thread that does not hold the lock, or a thread
   // terminating while it still holds one.
   class IllegalLockState : public Error
   {
   public:
      static constexpr int CODE = 65;

      IllegalLockState(std::string lock_name, SourceLocation where, std::string const& detail);

      [[nodiscard]] std::string const& lock_name() const noexcept { return lock; }
      [[nodiscard]] SourceLocation const& where() const noexcept { return location; }

   private:
      std::string lock;
      SourceLocation location;
   };

   class InvalidThreadReference : public Error
   {
   public:
      InvalidThreadReference(ThreadId thread, std::string const& detail);

      [[nodiscard]] ThreadId thread() const noexcept { return id; }

   private:
      ThreadId id;
   };

   // Bad CPU/bus ids, bus not attached to the caller's CPU, priorities out of
   // range, topology changes during a run.
   class TopologyError : public Error
   {
   public:
      using Error::Error;
   };

   struct BlockedThread
   {
      ThreadId       id;
      std::string    name;
      RunState       state;
      std::string    blocked_on;
      SourceLocation where;
   };

   class DeadlockDetected : public Error
   {
   public:
      DeadlockDetected(VirtualTime at, std::vector<BlockedThread> blocked);

      [[nodiscard]] VirtualTime at() const noexcept { return time; }
      [[nodiscard]] std::vector<BlockedThread> const& blocked() const noexcept { return threads; }

   private:
      VirtualTime time;
      std::vector<BlockedThread> threads;
   };

   // A thread stopped by the debugger while it held locks. Reported, never
   // thrown at the debugger: the locks have already been force-released.
   class AbnormalTermination : public Error
   {
   public:
      AbnormalTermination(ThreadId thread, std::string const& thread_name, std::vector<std::string> released_locks);

      [[nodiscard]] ThreadId thread() const noexcept { return id; }
      [[nodiscard]] std::vector<std::string> const& released_locks() const noexcept { return locks; }

   private:
      ThreadId id;
      std::vector<std::string> locks;
   };

   //-------------- Reporting ---------------
   struct ThreadInfo
   {
      ThreadId       id;
      std::string    name;
      RunState       state;
      uint8_t        priority;
      CpuId          cpu;
      VirtualTime    virtual_time;
      bool           swapped_in;
      SourceLocation location;
   };

   enum class TerminationKind : uint8_t { Normal, Stopped, Failed };

   struct ThreadTermination
   {
      ThreadId                 id;
      std::string              name;
      TerminationKind          kind;
      VirtualTime              at;
      std::string              error;                // empty for a clean exit
      std::vector<std::string> force_released_locks;
   };

   struct ThreadFailure
   {
      ThreadId    id;
      std::string name;
      std::string error;
   };

   struct RunReport
   {
      VirtualTime                end_time;
      std::size_t                terminated{0};
      std::size_t                never_started{0};
      std::vector<ThreadFailure> failures;
   };

   enum class SuspendCause : uint8_t { Breakpoint, Step, Pause, Catchpoint };
   [[nodiscard]] char const* to_string(SuspendCause cause) noexcept;

   struct Suspension
   {
      ThreadId       thread;
      SuspendCause   cause;
      BreakpointId   breakpoint{0}; // 0 unless a breakpoint or catchpoint fired
      LocationKind   kind;
      SourceLocation where;
      std::string    detail;        // exception description for catchpoints
   };

   enum class RtEventKind : uint8_t
   {
      ThreadCreate,
      ThreadSwapIn,
      ThreadSwapOut,
      ThreadKill,
      MessageRequest,
      MessageDelivered,
      Deadlock,
   };
   [[nodiscard]] char const* to_string(RtEventKind kind) noexcept;

   struct RtEvent
   {
      VirtualTime time;
      RtEventKind kind;
      ThreadId    thread{0};
      CpuId       cpu{0};
      BusId       bus{0};
      std::string detail;
   };

   //-------------- Debugger hooks ---------------
   struct BoundaryContext
   {
      ThreadId       thread;
      LocationKind   kind;
      SourceLocation where;
   };

   // Evaluated on the paused thread, so it may inspect interpreter state
   using Condition          = std::function<bool(BoundaryContext const&)>;
   using TraceMessage       = std::function<std::string(BoundaryContext const&)>;
   using ExceptionCondition = std::function<bool(ThreadId, std::string_view description)>;

   // Callbacks run with no kernel mutex held and may issue debugger commands.
   // The listener must stay valid while registered.
   class SchedulerListener
   {
   public:
      virtual ~SchedulerListener() = default;

      virtual void on_thread_terminated(ThreadTermination const&) {}
      virtual void on_deadlock(DeadlockDetected const&) {}
      virtual void on_suspended(Suspension const&) {}
      virtual void on_trace(ThreadId, SourceLocation const&, std::string const&) {}
   };

   //-------------- Topology ---------------
   struct LatencyModel
   {
      VirtualTime::Delta base{0};           // fixed per-message delay
      uint64_t           bytes_per_unit{0}; // bandwidth, 0 = payload size is free

      [[nodiscard]] constexpr VirtualTime::Delta delay_for(std::size_t payload_size) const noexcept
      {
         if (bytes_per_unit == 0) return base;
         return base + (static_cast<uint64_t>(payload_size) + bytes_per_unit - 1) / bytes_per_unit;
      }
   };

   struct SchedulerConfig
   {
      std::size_t stack_size{DEFAULT_STACK_SIZE};
      uint64_t    units_per_second{DEFAULT_UNITS_PER_SECOND};
      LogLevel    log_level{LogLevel::Warn};
      std::FILE*  log_sink{stderr};
      bool        rt_log{true};
   };

   using ThreadEntry = std::function<void(ThreadId)>;

   namespace kernel
   {
      struct SchedulerState;
      struct TaskControlBlock;
      struct LockAccess;
   }

   class ResourceLock
   {
   public:
      ResourceLock(kernel::SchedulerState& state, LockId id, std::string name);
      ResourceLock(ResourceLock const&)            = delete;
      ResourceLock& operator=(ResourceLock const&) = delete;

      // Re-entrant. Blocks the calling thread (LOCKING) while another holds it
      void acquire(ThreadId thread, SourceLocation const& where = {});
      [[nodiscard]] bool try_acquire(ThreadId thread, SourceLocation const& where = {});
      void release(ThreadId thread, SourceLocation const& where = {});
      // Release, block until signalled (WAITING), then re-acquire
      void wait_for(ThreadId thread, SourceLocation const& where = {});
      void signal();
      void signal_all();
      // Between runs only
      void reset();

      [[nodiscard]] std::optional<ThreadId> held_by() const;
      [[nodiscard]] bool is_locked() const;
      [[nodiscard]] std::vector<ThreadId> waiters() const;
      [[nodiscard]] LockId id() const noexcept { return lock_id; }
      [[nodiscard]] std::string const& name() const noexcept { return lock_name; }

   private:
      friend struct kernel::LockAccess;

      void contend_under_guard(kernel::TaskControlBlock& tcb, std::unique_lock<std::mutex>& guard);
      void take_under_guard(kernel::TaskControlBlock& tcb);
      void drop_under_guard();
      void wake_under_guard(bool include_waiting);

      kernel::SchedulerState& sched_state;
      LockId lock_id;
      std::string lock_name;

      mutable std::mutex mutex;  // guards owner and wait_set
      kernel::TaskControlBlock* owner{nullptr};
      std::vector<kernel::TaskControlBlock*> wait_set;
   };

   class Scheduler
   {
   public:
      explicit Scheduler(SchedulerConfig config = {});
      ~Scheduler();
      Scheduler(Scheduler const&)            = delete;
      Scheduler& operator=(Scheduler const&) = delete;

      // ---- Topology (before run) ----
      CpuId add_cpu(std::string name, uint64_t speed_hz = 0);
      BusId add_bus(std::string name, CpuId first, CpuId second, LatencyModel latency);
      ResourceLock& create_lock(std::string name);
      void set_listener(SchedulerListener* listener);

      // ---- Interpreter ----
      ThreadId create_thread(CpuId cpu, Priority priority, std::string name, ThreadEntry entry);
      void start(ThreadId thread);

      void acquire(ResourceLock& lock, ThreadId thread, SourceLocation const& where = {});
      void release(ResourceLock& lock, ThreadId thread, SourceLocation const& where = {});
      void wait_for(ResourceLock& lock, ThreadId thread, SourceLocation const& where = {});
      void signal(ResourceLock& lock);
      void signal_all(ResourceLock& lock);

      void advance_time(ThreadId thread, VirtualTime::Delta duration);
      void advance_cycles(ThreadId thread, uint64_t cycles);
      void yield(ThreadId thread);
      void cross_bus(BusId bus, ThreadId thread, std::size_t payload_size);
      void terminate(ThreadId thread);

      void boundary(ThreadId thread, LocationKind kind, SourceLocation const& where);
      void exception_raised(ThreadId thread, SourceLocation const& where, std::string_view description);

      // Drives every started thread until all terminate. Throws DeadlockDetected.
      RunReport run();

      // ---- Debugger ----
      [[nodiscard]] std::vector<ThreadInfo> list_threads() const;
      [[nodiscard]] ThreadInfo thread_info(ThreadId thread) const;

      BreakpointId suspend_at(LocationKind kind, Condition condition = {});
      BreakpointId break_at(SourceLocation where, LocationKind kind, Condition condition = {});
      BreakpointId trace_at(SourceLocation where, LocationKind kind, TraceMessage message);
      BreakpointId catch_exceptions(ExceptionCondition condition = {});
      bool clear_breakpoint(BreakpointId id);

      bool resume(ThreadId thread);
      bool step(ThreadId thread);
      void stop(ThreadId thread);
      void pause_all();
      void resume_all();
      void terminate_all();

      // ---- Reporting ----
      [[nodiscard]] VirtualTime global_time() const;
      [[nodiscard]] VirtualTime cpu_time(CpuId cpu) const;
      [[nodiscard]] std::vector<RtEvent> rt_log() const;
      void dump_rt_log(std::FILE* out) const;

   private:
      std::unique_ptr<kernel::SchedulerState> state;
   };

} // namespace vrtk

#endif
