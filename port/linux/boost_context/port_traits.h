/**
 * port_traits.h
 * Port traits for Linux Boost.Context port backend.
 */
#ifndef _PORT_TRAITS_H_
#define _PORT_TRAITS_H_

#define VRTK_PORT_CONTEXT_SIZE   48u   // must match sizeof(port_context)
#define VRTK_PORT_CONTEXT_ALIGN  8u    // must match alignof(port_context)
#define VRTK_STACK_ALIGN         16u   // initial SP alignment for this port
#define VRTK_MIN_STACK_SIZE      (16u * 1024u)

#endif
