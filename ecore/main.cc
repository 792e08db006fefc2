// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "main.hh"
#include "inout.hh"
#include "testutils.hh"
#include <string.h>
#include <errno.h>
#include <glib.h>

#ifndef EVALKIT_VERSION
#define EVALKIT_VERSION "0.0.0"
#endif

namespace Evalkit {

String
evalkit_version ()
{
  return EVALKIT_VERSION;
}

// == Argument Parsing ==
/** Match @a arg against argv[*i].
 * A matched argument is consumed by setting it to NULL, arg_parse_collapse()
 * removes consumed arguments afterwards.
 */
bool
arg_parse_option (uint argc, char **argv, size_t *i, const char *arg)
{
  if (*i >= argc || !argv[*i] || strcmp (argv[*i], arg) != 0)
    return false;
  argv[*i] = NULL;
  return true;
}

/** Match an option that takes a value.
 * Accepts "-D VALUE", "-D=VALUE" and "-DVALUE" forms for @a arg "-D". In the
 * first form, *i is advanced past the value. Consumed arguments are set to NULL.
 */
bool
arg_parse_string_option (uint argc, char **argv, size_t *i, const char *arg, const char **strp)
{
  if (*i >= argc || !argv[*i])
    return false;
  const size_t length = strlen (arg);
  const char *current = argv[*i];
  if (strncmp (current, arg, length) != 0)
    return false;
  const char *rest = current + length;
  if (rest[0])
    *strp = rest[0] == '=' ? rest + 1 : rest;
  else if (*i + 1 < argc && argv[*i + 1])
    {
      argv[*i] = NULL;
      *i += 1;
      *strp = argv[*i];
    }
  else
    return false;
  argv[*i] = NULL;
  return true;
}

/// Remove NULL entries from @a argv, returns the number of removed arguments.
int
arg_parse_collapse (int *argcp, char **argv)
{
  int kept = 1;
  for (int i = 1; i < *argcp; i++)
    if (argv[i])
      argv[kept++] = argv[i];
  const int removed = *argcp - kept;
  for (int i = kept; i < *argcp; i++)
    argv[i] = NULL;
  *argcp = kept;
  return removed;
}

// == Initialization ==
static String  *program_ident = NULL;
static uint64   test_flags = 0;

/// Parse an init setting of the form "name" or "name=bool".
static bool
setting_matches (const String &setting, const char *name, bool *value)
{
  const size_t length = strlen (name);
  if (setting.compare (0, length, name) != 0)
    return false;
  if (setting.size() == length)
    *value = true;
  else if (setting[length] == '=')
    *value = string_to_bool (setting.substr (length + 1));
  else
    return false;
  return true;
}

static void
enable_fatal_warnings ()
{
  debug_config_add ("fatal-warnings");
  const GLogLevelFlags fatal_mask = g_log_set_always_fatal (GLogLevelFlags (G_LOG_FATAL_MASK));
  g_log_set_always_fatal (GLogLevelFlags (fatal_mask | G_LOG_LEVEL_WARNING | G_LOG_LEVEL_CRITICAL));
}

/** Initialize the Evalkit core.
 * Assigns @a app_ident as program name, applies the settings in @a args
 * ("testing", "test-verbose", "test-slow", "fatal-warnings") and removes the
 * options it handles from @a argcp and @a argv: --fatal-warnings makes criticals
 * and glib warnings abort, test programs also accept --test-verbose and --test-slow.
 * Test programs always treat criticals as fatal.
 */
void
init_core (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  assert_return (!app_ident.empty());
  if (program_ident)
    {
      if (*program_ident != app_ident)
        critical ("%s: program already initialized as: %s", EVALKIT_STRFUNC(), *program_ident);
      return;
    }
  program_ident = new String (app_ident);
  bool testing = false, fatal_warnings = false, value;
  for (const String &setting : args)
    if (setting_matches (setting, "testing", &value))
      testing = value;
    else if (setting_matches (setting, "test-verbose", &value) && value)
      test_flags |= Test::MODE_VERBOSE;
    else if (setting_matches (setting, "test-slow", &value) && value)
      test_flags |= Test::MODE_SLOW;
    else if (setting_matches (setting, "fatal-warnings", &value))
      fatal_warnings = value;
  const uint argc = argcp ? *argcp : 0;
  for (size_t i = 1; i < argc; i++)
    if (arg_parse_option (argc, argv, &i, "--fatal-warnings"))
      fatal_warnings = true;
    else if (testing && arg_parse_option (argc, argv, &i, "--test-verbose"))
      test_flags |= Test::MODE_VERBOSE;
    else if (testing && arg_parse_option (argc, argv, &i, "--test-slow"))
      test_flags |= Test::MODE_SLOW;
  if (argcp && argv)
    arg_parse_collapse (argcp, argv);
  if (testing)
    {
      test_flags |= Test::MODE_TESTING;
      if (Lib::option_list_enabled ("EVALKIT_TEST", "test-verbose", false))
        test_flags |= Test::MODE_VERBOSE;
      if (Lib::option_list_enabled ("EVALKIT_TEST", "test-slow", false))
        test_flags |= Test::MODE_SLOW;
    }
  if (testing || fatal_warnings)
    enable_fatal_warnings();
}

bool
init_core_initialized ()
{
  return program_ident != NULL;
}

/// Flags from Test::ModeType, set up by init_core().
uint64
init_test_flags ()
{
  return test_flags;
}

/// Short program name for messages, the last path component of the name passed to init_core().
String
program_alias ()
{
  if (!program_ident)
    return program_invocation_short_name;
  const size_t slash = program_ident->rfind ('/');
  return slash == String::npos ? *program_ident : program_ident->substr (slash + 1);
}

} // Evalkit
