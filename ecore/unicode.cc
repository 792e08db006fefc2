// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "unicode.hh"
#include <glib.h>

namespace Evalkit {

bool
Unicode::isvalid (unichar uc)
{
  return g_unichar_validate (uc);
}

/** Decode the UTF-8 @a string into code points.
 * Every byte that does not start a well formed sequence is replaced by U+FFFD,
 * so malformed input still yields one code point per unreadable byte.
 */
vector<unichar>
utf8_decode (const String &string)
{
  vector<unichar> chars;
  chars.reserve (string.size());
  const gchar *p = string.data(), *const end = p + string.size();
  while (p < end)
    {
      if (uint8 (*p) < 0x80)    // ASCII, including embedded NULs
        {
          chars.push_back (uint8 (*p++));
          continue;
        }
      const gunichar uc = g_utf8_get_char_validated (p, end - p);
      if (uc >= 0xfffffffe)     // (gunichar) -1 or -2
        {
          chars.push_back (0xfffd);
          p++;
        }
      else
        {
          chars.push_back (uc);
          p = g_utf8_next_char (p);
        }
    }
  return chars;
}

/// Encode @a n_chars code points as UTF-8.
String
utf8_encode (const unichar *chars, size_t n_chars)
{
  String result;
  result.reserve (n_chars);
  for (size_t i = 0; i < n_chars; i++)
    {
      gchar buffer[8];
      const gint length = g_unichar_to_utf8 (chars[i], buffer);
      result.append (buffer, length);
    }
  return result;
}

String
utf8_encode (unichar uc)
{
  return utf8_encode (&uc, 1);
}

} // Evalkit
