/**
 * port_linux_boost_context.cpp
 * Every logical thread runs on its own Boost.Context fiber. The host thread
 * that drives the scheduler loop owns the scheduler side of each switch.
 */
#include <port.h>
#include <port_traits.h>

#include <boost/context/fiber.hpp>
#include <boost/context/protected_fixedsize_stack.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <utility>

struct port_context
{
  boost::context::fiber thread; // thread fiber (owned by scheduler when parked)
  boost::context::fiber sched;  // scheduler fiber (owned by thread when running)
  std::size_t  stack_size;
  port_entry_t entry;
  void*        arg;
  bool         started;
  bool         finished;
};

static_assert(VRTK_PORT_CONTEXT_SIZE  == sizeof(port_context_t), "Adjust port_traits.h definition to match");
static_assert(VRTK_PORT_CONTEXT_ALIGN == alignof(port_context_t), "Adjust port_traits.h definition to match");
static_assert(VRTK_STACK_ALIGN == 16);

// thread-local "which context is on this host thread's CPU right now?"
static thread_local port_context* tls_current = nullptr;

void port_context_init(port_context_t* context,
                       std::size_t stack_size,
                       port_entry_t entry,
                       void* arg)
{
   ::new (context) port_context{
      .thread     = {},
      .sched      = {},
      .stack_size = std::max<std::size_t>(stack_size, VRTK_MIN_STACK_SIZE),
      .entry      = entry,
      .arg        = arg,
      .started    = false,
      .finished   = false,
   };

   // Guard page below every stack, so a runaway interpreter recursion faults
   // instead of scribbling over a neighbouring fiber.
   boost::context::protected_fixedsize_stack stack_allocator{context->stack_size};

   context->thread = boost::context::fiber(std::allocator_arg, stack_allocator,
      [context](boost::context::fiber&& sched_in) mutable -> boost::context::fiber
      {
         // First entry, save the scheduler fiber handle
         context->sched   = std::move(sched_in);
         context->started = true;

         context->entry(context->arg); // Enter kernel trampoline

         context->finished = true;
         tls_current = nullptr;
         // Returning the scheduler fiber resumes it and releases this stack
         return std::move(context->sched);
      });
}

void port_context_destroy(port_context_t* context)
{
   // A parked fiber that never finished is unwound by its destructor
   // (Boost throws forced_unwind on the fiber's own stack).
   context->~port_context();
}

int port_context_finished(port_context_t const* context)
{
   return context->finished ? 1 : 0;
}

static thread_local void* global_thread_pointer = nullptr;
void  port_set_thread_pointer(void* tp) { global_thread_pointer = tp; }
void* port_get_thread_pointer(void)     { return global_thread_pointer; }

// Switch into 'to'. Returns when the thread yields or its entry returns
void port_switch(port_context_t* to)
{
   port_context* previous = tls_current;
   tls_current = to;
   to->thread = std::move(to->thread).resume();
   tls_current = previous;
}

// Thread calls this to hand the host thread back to the scheduler
void port_yield()
{
   if (!tls_current) return; // Not on a fiber, nothing to yield to

   port_context* current = nullptr;
   std::swap(current, tls_current);
   // Yield to the stored scheduler fiber; the returned fiber
   // is the scheduler's handle for the next yield.
   current->sched = std::move(current->sched).resume();
}

int port_in_context(void)
{
   return tls_current != nullptr ? 1 : 0;
}
