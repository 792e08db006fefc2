// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <evalkit-test.hh>
#include <stdlib.h>
#include <string.h>
#include <math.h>
#include <glib.h>
using namespace Evalkit;

namespace {

static void
check_utf8_against_glib (size_t n_chars)
{
  for (size_t i = 0; i < n_chars; i++)
    {
      const unichar uc = 1 + rand() % (0x100 << (i % 14));
      if (!Unicode::isvalid (uc))
        {
          TASSERT ((uc >= 0xd800 && uc <= 0xdfff) || uc > 0x10ffff);
          continue;
        }
      gchar gstr[8] = { 0, };
      const gint glength = g_unichar_to_utf8 (uc, gstr);
      const String encoded = utf8_encode (uc);
      TCMP (encoded, ==, String (gstr, glength));
      TCMP (unichar (g_utf8_get_char (encoded.c_str())), ==, uc);
      const vector<unichar> decoded = utf8_decode (encoded + "|");
      TCMP (decoded.size(), ==, 2u);
      TCMP (decoded[0], ==, uc);
      TCMP (decoded[1], ==, unichar ('|'));
    }
}

static void
test_utf8_random ()
{
  check_utf8_against_glib (20000);
}
REGISTER_TEST ("Strings/UTF-8 Random Code Points", test_utf8_random);

static void
test_utf8_random_slow ()
{
  check_utf8_against_glib (2000000);
}
REGISTER_SLOWTEST ("Strings/UTF-8 Random Code Points", test_utf8_random_slow);

static void
test_utf8_malformed ()
{
  // "π≈3" with a stray continuation byte, an overlong '/' and a cut off 4 byte sequence
  const String text = "\xcf\x80\xe2\x89\x88" "3" "\x80" "\xc0\xaf" "\xf0\x9f\x8e";
  const vector<unichar> chars = utf8_decode (text);
  const unichar expected[] = { 0x3c0, 0x2248, '3', 0xfffd, 0xfffd, 0xfffd, 0xfffd, 0xfffd, 0xfffd };
  TCMP (chars.size(), ==, ARRAY_SIZE (expected));
  for (size_t i = 0; i < MIN (chars.size(), ARRAY_SIZE (expected)); i++)
    TCMP (chars[i], ==, expected[i]);
  // NUL bytes are regular characters
  const vector<unichar> nuls = utf8_decode (String ("a\0b", 3));
  TCMP (nuls.size(), ==, 3u);
  TCMP (nuls[1], ==, 0u);
  TCMP (utf8_decode ("").size(), ==, 0u);
  TCMP (utf8_encode (vector<unichar>().data(), 0), ==, "");
  TCMP (utf8_encode (chars.data(), 3), ==, "\xcf\x80\xe2\x89\x88" "3");
  TASSERT (Unicode::isvalid ('x'));
  TASSERT (Unicode::isvalid (0xfffd));
  TASSERT (Unicode::isvalid (0x10ffff));
  TASSERT (!Unicode::isvalid (0xdc00));
  TASSERT (!Unicode::isvalid (0x110000));
}
REGISTER_TEST ("Strings/UTF-8 Malformed Input", test_utf8_malformed);

static void
test_number_conversions ()
{
  TCMP (string_to_bool ("1"), ==, true);
  TCMP (string_to_bool (" true "), ==, true);
  TCMP (string_to_bool ("ON"), ==, true);
  TCMP (string_to_bool ("0x0"), ==, false);
  TCMP (string_to_bool ("off"), ==, false);
  TCMP (string_to_bool ("never"), ==, false);
  TCMP (string_to_bool ("  "), ==, false);
  TCMP (string_to_bool ("", true), ==, true);
  TCMP (string_to_int ("-273"), ==, -273);
  TCMP (string_to_int ("+0x10"), ==, 16);
  TCMP (string_to_int ("777", 8), ==, 511);
  TCMP (string_to_uint ("ff", 16), ==, 255u);
  TCMP (string_to_uint ("0xFF", 16), ==, 255u);
  TCMP (string_to_uint ("12abc"), ==, 12u);
  TCMP (string_from_int (-1234567890123LL), ==, "-1234567890123");
  const char *rest = NULL;
  TCMP (string_to_cdouble ("6.25e-1)", &rest), ==, 0.625);
  TCMPS (rest, ==, ")");
  TCMP (string_to_cdouble (".5", NULL), ==, 0.5);
  TCMP (string_from_double_short (0.1 + 0.2), ==, "0.30000000000000004");
  TCMP (string_from_double_short (0.3), ==, "0.3");
  TCMP (string_from_double_short (100), ==, "1e+02");        // %g picks exponent form for short mantissas
  TCMP (string_from_double_short (-0.0), ==, "-0");
  TCMP (string_from_double_short (2.5e-8), ==, "2.5e-08");
  TCMP (string_from_double_short (HUGE_VAL), ==, "inf");
  TCMP (string_from_double_short (-HUGE_VAL), ==, "-inf");
  TCMP (string_from_double_short (nan ("")), ==, "nan");
  for (double v : { 1.0 / 7, M_PI, 1e300, 5e-324, -123.456 })
    TCMP (string_to_cdouble (string_from_double_short (v).c_str(), NULL), ==, v);
}
REGISTER_TEST ("Strings/Number Conversions", test_number_conversions);

static void
test_quoting ()
{
  TCMP (string_to_cescape ("plain"), ==, "plain");
  TCMP (string_to_cescape ("say \"hi\"\\"), ==, "say \\\"hi\\\"\\\\");
  TCMP (string_to_cescape ("tab\tbell\a"), ==, "tab\\011bell\\007");
  TCMP (string_to_cescape ("\xc3\xa4"), ==, "\\303\\244");
  TCMP (string_to_cquote (""), ==, "\"\"");
  TCMP (string_to_cquote ("a\nb"), ==, "\"a\\012b\"");
  TCMP (string_strip ("\t width \r\n"), ==, "width");
  TCMP (string_strip ("inner  space"), ==, "inner  space");
  TCMP (string_strip ("\f\v"), ==, "");
  TCMP (string_strip (""), ==, "");
}
REGISTER_TEST ("Strings/Quoting", test_quoting);

static void
test_formatting ()
{
  TCMP (string_format ("%s=%d", String ("depth"), 3), ==, "depth=3");
  TCMP (string_format ("%c%s%c", '[', "x", ']'), ==, "[x]");
  TCMP (string_format ("%.3f", 2.0 / 3), ==, "0.667");
  TCMP (string_format ("%5s|%-3d|", "ab", 7), ==, "   ab|7  |");
  TCMP (string_format ("no directives"), ==, "no directives");
  TCMP (string_cprintf ("%x:%o", 255, 8), ==, "ff:10");
  const String wide (2000, 'w');
  const String formatted = string_format ("<%s>", wide);
  TCMP (formatted.size(), ==, 2002u);
  TCMP (formatted[1001], ==, 'w');
  TCMP (formatted[2001], ==, '>');
}
REGISTER_TEST ("Strings/Formatting", test_formatting);

} // Anon
