// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "utilities.hh"
#include <time.h>

namespace Evalkit {

EVALKIT_STATIC_ASSERT (DBL_MANT_DIG == 53);     // number formatting assumes IEEE 754 doubles

static uint64
monotonic_nsecs ()
{
  struct timespec tp = { 0, 0 };
  clock_gettime (CLOCK_MONOTONIC, &tp);
  return tp.tv_sec * 1000000000ULL + tp.tv_nsec;
}

static const uint64 benchmark_start = monotonic_nsecs();

uint64
timestamp_realtime ()
{
  struct timespec tp = { 0, 0 };
  clock_gettime (CLOCK_REALTIME, &tp);
  return tp.tv_sec * 1000000ULL + tp.tv_nsec / 1000;
}

uint64
timestamp_benchmark ()
{
  return monotonic_nsecs() - benchmark_start;
}

uint64
timestamp_resolution ()
{
  struct timespec tp = { 0, 0 };
  if (clock_getres (CLOCK_MONOTONIC, &tp) < 0)
    return 1000;
  return MAX (uint64 (1), tp.tv_sec * 1000000000ULL + tp.tv_nsec);
}

} // Evalkit
