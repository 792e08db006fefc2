// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_CORE_UTILITIES_HH__
#define __EVALKIT_CORE_UTILITIES_HH__

#include <ecore/cxxaux.hh>

#if !defined __EVALKIT_CORE_HH__ && !defined __EVALKIT_BUILD__
#error Only <evalkit-core.hh> can be included directly.
#endif

namespace Evalkit {

// == Timestamps ==
uint64  timestamp_realtime   ();        ///< Wall clock time in µseconds.
uint64  timestamp_benchmark  ();        ///< Monotonic nanoseconds since program start.
uint64  timestamp_resolution ();        ///< Resolution of timestamp_benchmark() in nanoseconds.

/// Trap into an attached debugger, or raise SIGTRAP.
inline void
breakpoint ()
{
#if defined __i386__ || defined __x86_64__
  __asm__ __volatile__ ("int $03");
#else
  __builtin_trap();
#endif
}

} // Evalkit

#endif /* __EVALKIT_CORE_UTILITIES_HH__ */
