// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "strings.hh"
#include <cmath>
#include <cstring>
#include <locale.h>
#include <stdio.h>
#include <stdlib.h>
#include <strings.h>

namespace Evalkit {

/// The "C" locale, created once and shared by all threads.
static locale_t
posix_locale ()
{
  static locale_t clocale = newlocale (LC_ALL_MASK, "C", NULL);
  return clocale;
}

/// Switches the calling thread to the "C" locale for the lifetime of the guard.
class CLocaleGuard {
  locale_t saved_;
  EVALKIT_CLASS_NON_COPYABLE (CLocaleGuard);
public:
  CLocaleGuard  () : saved_ (uselocale (posix_locale())) {}
  ~CLocaleGuard ()      { uselocale (saved_); }
};

String
string_vcprintf (const char *format, va_list vargs)
{
  CLocaleGuard clocale;
  char small[512];
  va_list args;
  va_copy (args, vargs);
  const int length = vsnprintf (small, sizeof (small), format, args);
  va_end (args);
  if (length < 0)
    return format;
  if (size_t (length) < sizeof (small))
    return String (small, length);
  String result (length + 1, 0);
  va_copy (args, vargs);
  vsnprintf (&result[0], result.size(), format, args);
  va_end (args);
  result.resize (length);
  return result;
}

/// Format a string like printf() in the POSIX/C locale, so '.' is always the radix character.
String
string_cprintf (const char *format, ...)
{
  va_list args;
  va_start (args, format);
  String result = string_vcprintf (format, args);
  va_end (args);
  return result;
}

namespace Lib {
String
format_cstring (const char *format, ...)
{
  va_list args;
  va_start (args, format);
  String result = string_vcprintf (format, args);
  va_end (args);
  return result;
}
} // Lib

/** Interpret @a string as boolean.
 * Numbers are true when non-zero, "on", "yes" and "true" are true, other words
 * are false. An empty or all blank @a string yields @a empty_default.
 */
bool
string_to_bool (const String &string, bool empty_default)
{
  const String word = string_strip (string);
  if (word.empty())
    return empty_default;
  const char *p = word.c_str();
  if (p[0] == '-' || p[0] == '+')
    p++;
  if (p[0] >= '0' && p[0] <= '9')
    return strtoull (p, NULL, 0) != 0;
  if (strncasecmp (p, "on", 2) == 0)
    return true;
  return p[0] == 'y' || p[0] == 'Y' || p[0] == 't' || p[0] == 'T';
}

static const char*
skip_number_prefix (const char *p, uint *base)
{
  while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r')
    p++;
  if (*base == 16 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X'))
    return p + 2;
  if (*base == 10 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X'))
    {
      *base = 16;
      return p + 2;
    }
  return p;
}

/// Parse an integer in @a base, a "0x" prefix selects base 16.
int64
string_to_int (const String &string, uint base)
{
  const char *p = string.c_str();
  while (*p == ' ' || *p == '\t')
    p++;
  const bool negative = p[0] == '-';
  if (p[0] == '-' || p[0] == '+')
    p++;
  const int64 value = strtoull (skip_number_prefix (p, &base), NULL, base);
  return negative ? -value : value;
}

/// Parse an unsigned integer in @a base, a "0x" prefix selects base 16.
uint64
string_to_uint (const String &string, uint base)
{
  const char *p = skip_number_prefix (string.c_str(), &base);
  return strtoull (p, NULL, base);
}

String
string_from_int (int64 value)
{
  return string_cprintf ("%lld", (long long) value);
}

/// Parse a floating point number with strtod() in the POSIX/C locale.
double
string_to_cdouble (const char *dblstring, const char **endptr)
{
  CLocaleGuard clocale;
  char *end = NULL;
  const double value = strtod (dblstring, &end);
  if (endptr)
    *endptr = end;
  return value;
}

/** Shortest decimal text that reads back as @a value.
 * Yields "0.1" for 0.1 where "%.17g" would print "0.10000000000000001".
 */
String
string_from_double_short (double value)
{
  if (std::isnan (value))
    return "nan";
  if (std::isinf (value))
    return value < 0 ? "-inf" : "inf";
  String text;
  for (int digits = 1; digits <= 17; digits++)
    {
      text = string_cprintf ("%.*g", digits, value);
      if (string_to_cdouble (text.c_str(), NULL) == value)
        break;
    }
  return text;
}

/// Escape @a string for inclusion in C source, non-printable bytes become octal escapes.
String
string_to_cescape (const String &string)
{
  String result;
  for (const char c : string)
    {
      const uint8 byte = c;
      if (byte == '\\' || byte == '"')
        result += String ("\\") + c;
      else if (byte < 0x20 || byte >= 0x7f || byte == '?')
        result += string_cprintf ("\\%03o", byte);
      else
        result += c;
    }
  return result;
}

String
string_to_cquote (const String &string)
{
  return "\"" + string_to_cescape (string) + "\"";
}

/// Remove leading and trailing ASCII whitespace.
String
string_strip (const String &string)
{
  const char *blanks = " \t\n\r\f\v";
  const size_t first = string.find_first_not_of (blanks);
  if (first == String::npos)
    return "";
  const size_t last = string.find_last_not_of (blanks);
  return string.substr (first, last - first + 1);
}

} // Evalkit
