// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <evalkit-test.hh>
#include <stdlib.h>
#include <unistd.h>
using namespace Evalkit;

namespace {

static void
test_traps ()
{
  // a failing TASSERT must stop the child, otherwise no other test can be trusted
  if (Test::trap_fork_silent())
    {
      TASSERT (1 + 1 == 3);
      _exit (0);
    }
  TASSERT (Test::trap_aborted() || Test::trap_sigtrap());
  TASSERT (Test::trap_stderr().find ("1 + 1 == 3") != String::npos);
  if (Test::trap_fork_silent())
    {
      printout ("out:%d\n", 1);
      printerr ("err:%s\n", String ("2"));
      _exit (0);
    }
  TASSERT (Test::trap_passed());
  TCMP (Test::trap_stdout(), ==, "out:1\n");
  TCMP (Test::trap_stderr(), ==, "err:2\n");
  TASSERT (!Test::trap_timed_out());
  if (Test::trap_fork_silent())
    _exit (3);
  TASSERT (!Test::trap_passed() && !Test::trap_aborted());
}
REGISTER_TEST ("0-Testing/Traps", test_traps);

static void
test_fatal_conditions ()
{
  if (Test::trap_fork_silent())
    {
      fatal ("parser state %d is corrupt", 7);
      _exit (0);
    }
  TASSERT (Test::trap_aborted());
  TASSERT (Test::trap_stderr().find ("FATAL: parser state 7 is corrupt") != String::npos);
  // criticals abort test programs
  if (Test::trap_fork_silent())
    {
      critical ("unbalanced %s", "scope");
      _exit (0);
    }
  TASSERT (Test::trap_aborted());
  TASSERT (Test::trap_stderr().find ("CRITICAL: unbalanced scope") != String::npos);
  TASSERT (Test::trap_stderr().find ("multitest[") != String::npos);
  if (Test::trap_fork_silent())
    {
      const char *name = NULL;
      assert_return (name != NULL);
      _exit (0);
    }
  TASSERT (Test::trap_aborted());
  TASSERT (Test::trap_stderr().find ("assertion failed: name != NULL") != String::npos);
  if (Test::trap_fork_silent())
    {
      assert (sizeof (int) == 1);
      _exit (0);
    }
  TASSERT (Test::trap_aborted());
  TASSERT (Test::trap_stderr().find ("sizeof (int) == 1") != String::npos);
  // without fatal-warnings, criticals only report
  if (Test::trap_fork_silent())
    {
      debug_config_del ("fatal-warnings");
      critical ("recoverable");
      _exit (0);
    }
  TASSERT (Test::trap_passed());
  TASSERT (Test::trap_stderr().find ("recoverable") != String::npos);
}
REGISTER_TEST ("0-Testing/Fatal Conditions", test_fatal_conditions);

static void
test_debug_config ()
{
  const char *key = "evalkit-test-config-key";
  unsetenv ("EVALKIT_DEBUG");
  TCMP (debug_config_get (key), ==, "");
  TCMP (debug_config_get (key, "fallback"), ==, "fallback");
  TCMP (debug_config_int (key, 42), ==, 42);
  setenv ("EVALKIT_DEBUG", "Parser:evalkit-test-config-key=0x20:other", 1);
  TCMP (debug_config_get (key), ==, "0x20");
  TCMP (debug_config_int (key, 42), ==, 32);
  TCMP (debug_config_bool ("other"), ==, true);
  TCMP (debug_config_bool ("Parser"), ==, true);
  TCMP (debug_config_bool ("missing", true), ==, true);
  // overrides win over the environment, later environment entries win over earlier ones
  debug_config_add ("evalkit-test-config-key=-5");
  TCMP (debug_config_int (key, 42), ==, -5);
  debug_config_del (key);
  TCMP (debug_config_int (key, 42), ==, 32);
  setenv ("EVALKIT_DEBUG", "evalkit-test-config-key=1;evalkit-test-config-key=off", 1);
  TCMP (debug_config_bool (key, true), ==, false);
  debug_config_add (key);
  TCMP (debug_config_get (key), ==, "1");
  debug_config_del (key);
  debug_config_add ("=ignored");
  TCMP (debug_config_get (""), ==, "");
  unsetenv ("EVALKIT_DEBUG");
}
REGISTER_TEST ("General/Debug Configuration", test_debug_config);

static void
test_debug_keys ()
{
  setenv ("EVALKIT_DEBUG", "Fold", 1);
  TASSERT (debug_key_enabled ("Fold"));
  TASSERT (!debug_key_enabled ("Parser"));
  setenv ("EVALKIT_DEBUG", "all:Parser=0", 1);
  TASSERT (debug_key_enabled ("Fold"));
  TASSERT (!debug_key_enabled ("Parser"));
  setenv ("EVALKIT_DEBUG", "Parser=0:all", 1);
  TASSERT (debug_key_enabled ("Parser"));
  if (Test::trap_fork_silent())
    {
      setenv ("EVALKIT_DEBUG", "Evaluator", 1);
      Lib::debug_keys_possible = true;  // may have been cleared while $EVALKIT_DEBUG was unset
      EVALKIT_KEY_DEBUG ("Evaluator", "lookup %s", "width");
      EVALKIT_KEY_DEBUG ("Parser", "hidden");
      _exit (0);
    }
  TASSERT (Test::trap_passed());
  TASSERT (Test::trap_stderr().find ("Evaluator: lookup width") != String::npos);
  TASSERT (Test::trap_stderr().find ("hidden") == String::npos);
  unsetenv ("EVALKIT_DEBUG");
  TASSERT (!debug_key_enabled ("Fold"));
}
REGISTER_TEST ("General/Debug Keys", test_debug_keys);

static void
test_flippers ()
{
  static FlipperOption test_flipper = EVALKIT_FLIPPER ("evalkit-test-flipper", "Flipper for tests.");
  static FlipperOption default_on = EVALKIT_FLIPPER ("evalkit-test-default", "Enabled by default.", true);
  unsetenv ("EVALKIT_FLIPPER");
  TASSERT (!test_flipper);
  TASSERT (default_on);
  setenv ("EVALKIT_FLIPPER", "evalkit-test-flipper:evalkit-test-default=0", 1);
  TASSERT (test_flipper);
  TASSERT (!default_on);
  setenv ("EVALKIT_FLIPPER", "all", 1);
  TASSERT (test_flipper);
  unsetenv ("EVALKIT_FLIPPER");
}
REGISTER_TEST ("General/Flippers", test_flippers);

static void
test_arg_parsing ()
{
  char a0[] = "evalrun", a1[] = "--bool", a2[] = "-D", a3[] = "x=1", a4[] = "-Dy=2", a5[] = "-D=z=3", a6[] = "1 + x", a7[] = "-D";
  char *argv[] = { a0, a1, a2, a3, a4, a5, a6, a7, NULL };
  int argc = 8;
  StringVector defines;
  bool seen_bool = false;
  for (size_t i = 1; i < size_t (argc); i++)
    {
      const char *value = NULL;
      if (arg_parse_option (argc, argv, &i, "--bool"))
        seen_bool = true;
      else if (arg_parse_string_option (argc, argv, &i, "-D", &value))
        defines.push_back (value);
    }
  TASSERT (seen_bool);
  TCMP (defines.size(), ==, 3u);
  TCMP (defines[0], ==, "x=1");
  TCMP (defines[1], ==, "y=2");
  TCMP (defines[2], ==, "z=3");
  // a trailing "-D" lacks its value and stays in place
  TCMP (arg_parse_collapse (&argc, argv), ==, 5);
  TCMP (argc, ==, 3);
  TCMPS (argv[0], ==, "evalrun");
  TCMPS (argv[1], ==, "1 + x");
  TCMPS (argv[2], ==, "-D");
  TASSERT (argv[3] == NULL);
}
REGISTER_TEST ("General/Argument Parsing", test_arg_parsing);

static void
test_program_info ()
{
  TCMP (program_alias(), ==, "multitest");
  TASSERT (init_core_initialized());
  TASSERT (init_test_flags() & Test::MODE_TESTING);
  TASSERT (!evalkit_version().empty());
  TASSERT (debug_config_bool ("fatal-warnings"));
  // initialization happens once
  if (Test::trap_fork_silent())
    {
      init_core ("another", NULL, NULL);
      _exit (0);
    }
  TASSERT (Test::trap_aborted());
  TASSERT (Test::trap_stderr().find ("already initialized as: multitest") != String::npos);
}
REGISTER_TEST ("General/Program Info", test_program_info);

static void
test_timer ()
{
  volatile double sink = 0;
  Test::Timer timer (0.02);
  const double fastest = timer.benchmark ([&sink] () { for (int i = 0; i < 100; i++) sink = sink + i; });
  TCMP (fastest, >, 0.0);
  TCMP (fastest, <=, timer.test_elapsed());
  TCMP (timer.test_elapsed(), <, 1.0);
  TCMP (timestamp_resolution(), >, 0u);
  const uint64 before = timestamp_benchmark();
  TCMP (before, <=, timestamp_benchmark());
  TCMP (timestamp_realtime(), >, 1000000000ULL * 1000000);
}
REGISTER_TEST ("General/Timer", test_timer);

static void
test_macros ()
{
  EVALKIT_STATIC_ASSERT (EVALKIT_ABS (-8) == 8);
  TCMP (CLAMP (7, 0, 5), ==, 5);
  TCMP (CLAMP (-7, 0, 5), ==, 0);
  TCMP (MIN (3, 4), ==, 3);
  TCMP (MAX (3, 4), ==, 4);
  const int primes[] = { 2, 3, 5, 7 };
  TCMP (ARRAY_SIZE (primes), ==, 4u);
  TCMPS (EVALKIT_CPP_STRINGIFY (EVALKIT_MIN), ==, "EVALKIT_MIN");
  TASSERT (String (STRLOC()).find ("multitest.cc:") != String::npos);
}
REGISTER_TEST ("General/Macros", test_macros);

} // Anon

int
main (int   argc,
      char *argv[])
{
  init_core_test ("multitest", &argc, argv);

  return Test::run();
}
