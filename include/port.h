
#ifndef _PORT_H_
#define _PORT_H_
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct port_context port_context_t;
typedef void (*port_entry_t)(void*);

/* Context lifecycle */
void port_context_init(port_context_t* ctx, size_t stack_size,
                       port_entry_t entry, void* arg);
/* Unwinds the context's stack if its entry never returned */
void port_context_destroy(port_context_t* ctx);
int  port_context_finished(port_context_t const* ctx);  /* nonzero once entry returned */

/* Switching. Only the host thread driving the scheduler switches contexts */
void port_switch(port_context_t* to);   /* returns when 'to' yields or finishes */
void port_yield(void);                  /* running context -> scheduler */
int  port_in_context(void);             /* nonzero on a context's own stack */

/* Per host thread pointer, the kernel keeps its running TCB here */
void  port_set_thread_pointer(void* tp);
void* port_get_thread_pointer(void);

#ifdef __cplusplus
}
#endif

#endif
