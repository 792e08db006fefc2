// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "inout.hh"
#include "main.hh"
#include "thread.hh"
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

namespace Evalkit {

// == Basic I/O ==
namespace Lib {

void
printout_string (const String &string)
{
  fflush (stderr);
  fputs (string.c_str(), stdout);
  fflush (stdout);
}

void
printerr_string (const String &string)
{
  fflush (stdout);
  fputs (string.c_str(), stderr);
  fflush (stderr);
}

} // Lib

// == Option Lists ==
/** Find @a key in a colon separated option list such as "Parser:parse-max-depth=64".
 * A bare "key" means "key=1", entries listed later override earlier ones.
 * @returns the position of the last matching entry or -1, the entry value is stored in @a value.
 */
static ssize_t
option_list_find (const char *options, const String &key, String *value)
{
  ssize_t found = -1;
  const String list = options ? options : "";
  size_t start = 0;
  for (ssize_t index = 0; start <= list.size(); index++)
    {
      size_t stop = list.find_first_of (":;", start);
      if (stop == String::npos)
        stop = list.size();
      const String entry = list.substr (start, stop - start);
      const size_t eq = entry.find ('=');
      if (entry.substr (0, eq) == key)
        {
          found = index;
          *value = eq == String::npos ? "1" : entry.substr (eq + 1);
        }
      start = stop + 1;
    }
  return found;
}

/// Check @a key against the option list in the environment variable @a envvar, honoring "all".
bool
Lib::option_list_enabled (const char *envvar, const char *key, bool default_value)
{
  const char *options = getenv (envvar);
  if (!options || !options[0])
    return default_value;
  String kvalue, avalue;
  const ssize_t kpos = option_list_find (options, key, &kvalue);
  const ssize_t apos = option_list_find (options, "all", &avalue);
  if (kpos < 0 && apos < 0)
    return default_value;
  return string_to_bool (kpos >= apos ? kvalue : avalue);
}

// == Debug Configuration ==
struct DebugConfig {
  Mutex                   mutex;
  std::map<String,String> overrides;
};
static DurableInstance<DebugConfig> debug_config;

/// Override a debug configuration entry, @a option is "key=value" or "key".
void
debug_config_add (const String &option)
{
  const size_t eq = option.find ('=');
  const String key = option.substr (0, eq);
  if (key.empty())
    return;
  ScopedLock<Mutex> locker (debug_config->mutex);
  debug_config->overrides[key] = eq == String::npos ? "1" : option.substr (eq + 1);
}

/// Remove an override added with debug_config_add().
void
debug_config_del (const String &key)
{
  ScopedLock<Mutex> locker (debug_config->mutex);
  debug_config->overrides.erase (key);
}

/// Look up @a key in the overrides, then in $EVALKIT_DEBUG.
String
debug_config_get (const String &key, const String &default_value)
{
  {
    ScopedLock<Mutex> locker (debug_config->mutex);
    auto it = debug_config->overrides.find (key);
    if (it != debug_config->overrides.end())
      return it->second;
  }
  String value;
  if (option_list_find (getenv ("EVALKIT_DEBUG"), key, &value) >= 0)
    return value;
  return default_value;
}

bool
debug_config_bool (const String &key, bool default_value)
{
  return string_to_bool (debug_config_get (key), default_value);
}

int64
debug_config_int (const String &key, int64 default_value)
{
  const String value = debug_config_get (key);
  return value.empty() ? default_value : string_to_int (value);
}

namespace Lib {
volatile bool debug_keys_possible = true;
} // Lib

/// Check if $EVALKIT_DEBUG enables debugging messages for @a key.
bool
debug_key_enabled (const char *key)
{
  const char *options = getenv ("EVALKIT_DEBUG");
  if (!options || !options[0])
    {
      Lib::debug_keys_possible = false;
      return false;
    }
  return Lib::option_list_enabled ("EVALKIT_DEBUG", key, false);
}

FlipperOption::operator bool () const
{
  return Lib::option_list_enabled ("EVALKIT_FLIPPER", key_, default_value_);
}

// == Logging ==
namespace Lib {

void
log_message (char kind, const char *key, const char *file, int line, const String &message)
{
  const String where = file ? string_format ("%s:%d: ", file, line) : "";
  if (kind == 'D')
    {
      const uint64 usecs = timestamp_benchmark() / 1000;
      printerr ("[%u.%06u] %s: %s\n", uint (usecs / 1000000), uint (usecs % 1000000), key ? key : "debug", message);
      return;
    }
  const char *what = kind == 'F' ? "FATAL" : "CRITICAL";
  printerr ("%s%s[%d]: %s: %s\n", where, program_alias(), getpid(), what, message);
  if (kind == 'F' || debug_config_bool ("fatal-warnings"))
    {
      printerr ("Aborting...\n");
      ::abort();
    }
}

void
log_fatal (const char *file, int line, const String &message)
{
  log_message ('F', NULL, file, line, message);
  ::abort();    // unreached
}

} // Lib

} // Evalkit
