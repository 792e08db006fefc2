// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_INOUT_HH__
#define __EVALKIT_INOUT_HH__

#include <ecore/strings.hh>

namespace Evalkit {

// == Basic I/O ==
template<class... Args> void printout (const char *format, const Args &...args) EVALKIT_PRINTF (1, 0);
template<class... Args> void printerr (const char *format, const Args &...args) EVALKIT_PRINTF (1, 0);

// == Debug Configuration ==
void    debug_config_add        (const String &option);
void    debug_config_del        (const String &key);
String  debug_config_get        (const String &key, const String &default_value = "");
bool    debug_config_bool       (const String &key, bool default_value = false);
int64   debug_config_int        (const String &key, int64 default_value);
bool    debug_key_enabled       (const char *key);

/// Feature toggle, enabled by listing its key in $EVALKIT_FLIPPER.
class FlipperOption {
  const char *const key_;
  const bool        default_value_;
public:
  constexpr FlipperOption (const char *key, bool default_value) : key_ (key), default_value_ (default_value) {}
  operator  bool          () const;
};

// == Logging Macros ==
#define EVALKIT_FLIPPER(key, blurb, ...)  Evalkit::FlipperOption (key, bool (__VA_ARGS__))
#define EVALKIT_KEY_DEBUG(key, ...)       do { if (EVALKIT_UNLIKELY (Evalkit::Lib::debug_keys_possible) && Evalkit::debug_key_enabled (key)) \
      Evalkit::Lib::log_message ('D', key, EVALKIT_PRETTY_FILE, __LINE__, Evalkit::string_format (__VA_ARGS__)); } while (0)
#define EVALKIT_CRITICAL(...)             do { Evalkit::Lib::log_message ('C', NULL, EVALKIT_PRETTY_FILE, __LINE__, Evalkit::string_format (__VA_ARGS__)); } while (0)
#define EVALKIT_FATAL(...)                do { Evalkit::Lib::log_fatal (EVALKIT_PRETTY_FILE, __LINE__, Evalkit::string_format (__VA_ARGS__)); } while (0)
#define EVALKIT_ASSERT(cond)              do { if (EVALKIT_LIKELY (cond)) break; Evalkit::Lib::log_fatal (EVALKIT_PRETTY_FILE, __LINE__, "assertion failed: " #cond); } while (0)
#define EVALKIT_ASSERT_RETURN(cond, ...)  do { if (EVALKIT_LIKELY (cond)) break; \
      Evalkit::Lib::log_message ('C', NULL, EVALKIT_PRETTY_FILE, __LINE__, "assertion failed: " #cond); return __VA_ARGS__; } while (0)

/**
 * @def EVALKIT_KEY_DEBUG(key, format,...)
 * Print a debugging message if $EVALKIT_DEBUG lists @a key or "all".
 * @def EVALKIT_CRITICAL(format,...)
 * Report a programming error on stderr, fatal with EVALKIT_DEBUG=fatal-warnings.
 * @def EVALKIT_ASSERT_RETURN(condition [, rvalue])
 * Report a failed function precondition and return @a rvalue.
 */

#ifdef EVALKIT_CONVENIENCE
#define critical         EVALKIT_CRITICAL
#define fatal            EVALKIT_FATAL
#define assert_return    EVALKIT_ASSERT_RETURN
#  ifndef assert
#  include <assert.h>
#  undef  assert
#  define assert         EVALKIT_ASSERT
#  endif
#endif // EVALKIT_CONVENIENCE

// == Implementation Details ==
namespace Lib {
extern volatile bool debug_keys_possible;       ///< Cleared once $EVALKIT_DEBUG turns out to be empty.
bool option_list_enabled (const char *envvar, const char *key, bool default_value);
void printout_string (const String &string);
void printerr_string (const String &string);
void log_message     (char kind, const char *key, const char *file, int line, const String &message);
void log_fatal       (const char *file, int line, const String &message) EVALKIT_NORETURN;
} // Lib

/// Print a message on stdout like printf() in the POSIX/C locale.
template<class... Args> void
printout (const char *format, const Args &...args)
{
  Lib::printout_string (string_format (format, args...));
}

/// Print a message on stderr like printf() in the POSIX/C locale.
template<class... Args> void
printerr (const char *format, const Args &...args)
{
  Lib::printerr_string (string_format (format, args...));
}

} // Evalkit

#endif /* __EVALKIT_INOUT_HH__ */
