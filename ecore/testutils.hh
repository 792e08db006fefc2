// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_TESTUTILS_HH__
#define __EVALKIT_TESTUTILS_HH__

#include <ecore/ecore.hh>

namespace Evalkit {

void init_core_test (const String &app_ident, int *argcp, char **argv, const StringVector &args = StringVector());

namespace Test {

// == Test Macros ==
#define TSTART(...)             Evalkit::Test::test_output (Evalkit::Test::OUTPUT_START, Evalkit::string_format (__VA_ARGS__)) ///< Announce a test case.
#define TDONE()                 Evalkit::Test::test_output (Evalkit::Test::OUTPUT_DONE, "")     ///< Finish the current test case.
#define TINFO(...)              Evalkit::Test::test_output (Evalkit::Test::OUTPUT_INFO, Evalkit::string_format (__VA_ARGS__)) ///< Message for verbose runs.
#define TASSERT(cond)           do { if (EVALKIT_LIKELY (cond)) break; \
    Evalkit::Test::assertion_failed (EVALKIT_PRETTY_FILE, __LINE__, #cond); } while (0)     ///< Test assertion, traps if @a cond fails.
#define TCMP(a,cmp,b)           TCMP_op (a, cmp, b, #a, #b, )                           ///< Compare @a a and @a b with operator @a cmp.
#define TCMPS(a,cmp,b)          TCMP_op (a, cmp, b, #a, #b, Evalkit::Test::as_cstring)  ///< Variant of TCMP() for C strings.

/// @cond
#define TCMP_op(a,cmp,b,sa,sb,cast)     do { if (a cmp b) break;                        \
    const Evalkit::String __tcmp_msg = Evalkit::string_format ("'%s %s %s': %s %s %s", sa, #cmp, sb, \
                                                               Evalkit::Test::stringify_arg (cast (a), sa), #cmp, \
                                                               Evalkit::Test::stringify_arg (cast (b), sb)); \
    Evalkit::Test::assertion_failed (EVALKIT_PRETTY_FILE, __LINE__, __tcmp_msg.c_str()); } while (0)
/// @endcond

enum ModeType {
  MODE_TESTING  = 0x1,  ///< Program runs test cases, criticals are fatal.
  MODE_VERBOSE  = 0x2,  ///< Print TINFO() messages.
  MODE_SLOW     = 0x4,  ///< Run REGISTER_SLOWTEST() cases instead of the regular ones.
};

int     run                ();  ///< Run all registered tests of the selected mode.
bool    verbose            ();
bool    slow               ();

enum OutputKind { OUTPUT_START, OUTPUT_DONE, OUTPUT_INFO };
void    test_output        (OutputKind kind, const String &message);
void    assertion_failed   (const char *file, int line, const char *message);

/** Benchmark helper.
 * benchmark() calls its callee in growing batches until the deadline is used
 * up and yields the fastest time measured per call.
 */
class Timer {
  const double   deadline_;
  vector<double> samples_;
  double         elapsed_;
  int64          batch_, calls_;
  int64          next_batch     ();
public:
  explicit       Timer          (double deadline_in_secs = 0);
  double         min_elapsed    () const;       ///< Fastest measured call in seconds.
  double         test_elapsed   () const        { return elapsed_; }
  template<typename Callee>
  double         benchmark      (Callee callee);
};

template<typename Callee> double
Timer::benchmark (Callee callee)
{
  samples_.clear();
  elapsed_ = 0;
  batch_ = 0;
  calls_ = 0;
  for (int64 n = next_batch(); n > 0; n = next_batch())
    {
      const uint64 start = timestamp_benchmark();
      for (int64 i = 0; i < n; i++)
        callee();
      const double seconds = (timestamp_benchmark() - start) / 1000000000.0;
      elapsed_ += seconds;
      calls_ += n;
      if (seconds * 1000000000.0 >= timestamp_resolution() * 100.0)
        samples_.push_back (seconds / n);
    }
  return min_elapsed();
}

// == Stringify Args ==
inline const char*              as_cstring     (const char *s)                       { return s; }
inline String                   stringify_arg  (const char   *a, const char *str_a)  { return a ? string_to_cquote (a) : "(null)"; }
template<class V> inline String stringify_arg  (const V      *a, const char *str_a)  { return string_format ("%p", a); }
template<class A> inline String stringify_arg  (const A      &a, const char *str_a)  { return str_a; }
template<> inline String stringify_arg<double> (const double &a, const char *str_a)  { return string_format ("%.17g", a); }
template<> inline String stringify_arg<bool>   (const bool   &a, const char *str_a)  { return a ? "true" : "false"; }
template<> inline String stringify_arg<int>    (const int    &a, const char *str_a)  { return string_format ("%d", a); }
template<> inline String stringify_arg<uint>   (const uint   &a, const char *str_a)  { return string_format ("%u", a); }
template<> inline String stringify_arg<int64>  (const int64  &a, const char *str_a)  { return string_format ("%lld", (long long) a); }
template<> inline String stringify_arg<uint64> (const uint64 &a, const char *str_a)  { return string_format ("%llu", (unsigned long long) a); }
template<> inline String stringify_arg<String> (const String &a, const char *str_a)  { return string_to_cquote (a); }

// == Test Registration ==
class RegisterTest {
public:
  RegisterTest (char kind, const char *testname, void (*test_func) ());
};

/// Register a test function to run with every test program invocation.
#define REGISTER_TEST(name, ...)     static const Evalkit::Test::RegisterTest \
  EVALKIT_CPP_PASTE2 (__evalkit_register_test__, __LINE__) ('t', name, __VA_ARGS__)

/// Register a test function that only runs in slow mode (--test-slow).
#define REGISTER_SLOWTEST(name, ...) static const Evalkit::Test::RegisterTest \
  EVALKIT_CPP_PASTE2 (__evalkit_register_test__, __LINE__) ('s', name, __VA_ARGS__)

// == Test Traps ==
/** Run the following code in a forked child.
 * Returns true in the child, which must terminate with _exit(). The parent
 * gets false once the child is gone, its outcome is then available from the
 * trap_*() accessors.
 */
bool    trap_fork          (uint64 usec_timeout, bool silent);
bool    trap_fork_silent   ();
bool    trap_timed_out     ();
bool    trap_passed        ();
bool    trap_aborted       ();
bool    trap_sigtrap       ();
String  trap_stdout        ();
String  trap_stderr        ();

} // Test
} // Evalkit

#endif /* __EVALKIT_TESTUTILS_HH__ */
