// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_STRINGS_HH__
#define __EVALKIT_STRINGS_HH__

#include <ecore/utilities.hh>
#include <stdarg.h>

namespace Evalkit {

// == Formatting ==
String  string_cprintf           (const char *format, ...) EVALKIT_PRINTF (1, 2);
String  string_vcprintf          (const char *format, va_list vargs);
template<class... Args>
String  string_format            (const char *format, const Args &...args);

// == Conversions ==
bool    string_to_bool           (const String &string, bool empty_default = false);
int64   string_to_int            (const String &string, uint base = 10);
uint64  string_to_uint           (const String &string, uint base = 10);
String  string_from_int          (int64 value);
double  string_to_cdouble        (const char *dblstring, const char **endptr);
String  string_from_double_short (double value);

// == Quoting ==
String  string_to_cescape        (const String &string);
String  string_to_cquote         (const String &string);
String  string_strip             (const String &string);

// == Implementation Details ==
namespace Lib {
String                                  format_cstring (const char *format, ...);
template<class T> inline const T&       format_arg (const T &arg)       { return arg; }
inline const char*                      format_arg (const String &arg)  { return arg.c_str(); }
} // Lib

/** Format a string like printf() in the POSIX/C locale.
 * String arguments may be passed directly for "%s" directives.
 */
template<class... Args> String
string_format (const char *format, const Args &...args)
{
  return Lib::format_cstring (format, Lib::format_arg (args)...);
}

} // Evalkit

#endif /* __EVALKIT_STRINGS_HH__ */
