// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_THREAD_HH__
#define __EVALKIT_THREAD_HH__

#include <ecore/utilities.hh>
#include <pthread.h>

namespace Evalkit {

/// Non-recursive mutex on top of pthread_mutex_t, usable in static storage.
class Mutex {
  pthread_mutex_t mutex_;
  EVALKIT_CLASS_NON_COPYABLE (Mutex);
public:
  constexpr Mutex    () : mutex_ (PTHREAD_MUTEX_INITIALIZER) {}
  void      lock     ()         { pthread_mutex_lock (&mutex_); }
  void      unlock   ()         { pthread_mutex_unlock (&mutex_); }
  bool      try_lock ()         { return pthread_mutex_trylock (&mutex_) == 0; }
};

/** Scope bound lock ownership.
 * The mutex is locked on construction. A section can be run unlocked by
 * calling unlock() and lock() in pairs, the destructor releases whatever
 * the ScopedLock still holds.
 */
template<class MUTEX>
class ScopedLock {
  MUTEX &mutex_;
  int    depth_;
  EVALKIT_CLASS_NON_COPYABLE (ScopedLock);
public:
  explicit ScopedLock  (MUTEX &mutex) : mutex_ (mutex), depth_ (0) { lock(); }
  /*dtor*/ ~ScopedLock ()               { while (depth_ > 0) unlock(); }
  void     lock        ()               { mutex_.lock(); depth_++; }
  void     unlock      ()               { depth_--; mutex_.unlock(); }
};

} // Evalkit

#endif // __EVALKIT_THREAD_HH__
