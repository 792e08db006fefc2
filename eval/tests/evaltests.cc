// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <evalkit-test.hh>
#include <evalkit.hh>
#include <cmath>
using namespace Evalkit;

namespace {

static void
test_cursor()
{
  Cursor cursor ("a\xc3\xb1" "b c");
  TCMP (cursor.size(), ==, 5u);
  TCMP (cursor.first(), ==, unichar ('a'));
  TCMP (cursor.pop_first(), ==, unichar ('a'));
  TCMP (cursor.first(), ==, unichar (0xf1));
  TCMP (cursor.string(), ==, "\xc3\xb1" "b c");
  TASSERT (cursor.has_prefix ("\xc3\xb1" "b"));
  TASSERT (!cursor.has_prefix ("b"));
  const Cursor saved = cursor;
  TCMP (cursor.scan_to_end_of_token(), ==, "\xc3\xb1" "b");
  TCMP (saved.prefix_up_to (cursor.start()).string(), ==, "\xc3\xb1" "b");
  TASSERT (cursor.skip_whitespace() == true);
  TASSERT (cursor.skip_whitespace() == false);
  TASSERT (cursor.scan_character ('c'));
  TASSERT (cursor.empty());
  TCMP (cursor.first(), ==, unichar (0));
  TCMP (cursor.scan_to_end_of_token(), ==, "");
  cursor.reset (saved.start());
  TCMP (cursor.string(), ==, saved.string());
  TCMP (cursor.suffix_from (cursor.start() + 2).string(), ==, " c");
  TCMP (cursor.scan_characters ([] (unichar uc) { return uc == 'x'; }), ==, "");
  TCMP (cursor.start(), ==, saved.start());
}
REGISTER_TEST ("Scanner/Cursor", test_cursor);

static SubExpressionP
scan_one (bool (*scanner) (Cursor&, SubExpressionP&), const String &text, String *rest = NULL)
{
  Cursor cursor (text);
  SubExpressionP token;
  if (!scanner (cursor, token))
    token.reset();
  if (rest)
    *rest = cursor.string();
  return token;
}

static void
test_numeric_literals()
{
  String rest;
  SubExpressionP t;
  t = scan_one (Scanner::scan_numeric_literal, "42", &rest);
  TASSERT (t && t->is_literal() && t->value() == 42 && rest == "");
  t = scan_one (Scanner::scan_numeric_literal, "0x1F+", &rest);
  TASSERT (t && t->is_literal() && t->value() == 31 && rest == "+");
  t = scan_one (Scanner::scan_numeric_literal, ".5", &rest);
  TASSERT (t && t->value() == 0.5 && rest == "");
  t = scan_one (Scanner::scan_numeric_literal, "2.5e-1", &rest);
  TASSERT (t && t->value() == 0.25 && rest == "");
  t = scan_one (Scanner::scan_numeric_literal, "1E3", &rest);
  TASSERT (t && t->value() == 1000 && rest == "");
  // incomplete fractions and exponents are not consumed
  t = scan_one (Scanner::scan_numeric_literal, "5.x", &rest);
  TASSERT (t && t->value() == 5 && rest == ".x");
  t = scan_one (Scanner::scan_numeric_literal, "5.", &rest);
  TASSERT (t && t->value() == 5 && rest == ".");
  t = scan_one (Scanner::scan_numeric_literal, ".5e", &rest);
  TASSERT (t && t->value() == 0.5 && rest == "e");
  t = scan_one (Scanner::scan_numeric_literal, "3e+", &rest);
  TASSERT (t && t->value() == 3 && rest == "e+");
  // no number
  TASSERT (!scan_one (Scanner::scan_numeric_literal, "abc", &rest) && rest == "abc");
  TASSERT (!scan_one (Scanner::scan_numeric_literal, ".e", &rest) && rest == ".e");
  // malformed numbers yield error leaves
  t = scan_one (Scanner::scan_numeric_literal, "0x", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("0x"));
  t = scan_one (Scanner::scan_numeric_literal, "1e999", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("1e999"));
  TCMP (t->description(), ==, "1e999");
}
REGISTER_TEST ("Scanner/Numeric Literals", test_numeric_literals);

static void
test_identifiers()
{
  String rest;
  SubExpressionP t;
  t = scan_one (Scanner::scan_identifier, "foo.bar.baz+1", &rest);
  TASSERT (t && t->symbol() == Symbol::variable ("foo.bar.baz") && rest == "+1");
  t = scan_one (Scanner::scan_identifier, "foo..", &rest);
  TASSERT (t && t->symbol().name() == "foo" && rest == "..");
  t = scan_one (Scanner::scan_identifier, ".x", &rest);
  TASSERT (t && t->symbol().name() == ".x" && rest == "");
  t = scan_one (Scanner::scan_identifier, "x'", &rest);
  TASSERT (t && t->symbol().name() == "x'" && rest == "");
  t = scan_one (Scanner::scan_identifier, "$a_1@", &rest);
  TASSERT (t && t->symbol().name() == "$a_1@" && rest == "");
  t = scan_one (Scanner::scan_identifier, "\xc3\xa9t\xc3\xa9 ", &rest); // été
  TASSERT (t && t->symbol().name() == "\xc3\xa9t\xc3\xa9" && rest == " ");
  TASSERT (!scan_one (Scanner::scan_identifier, ".", &rest) && rest == ".");
  TASSERT (!scan_one (Scanner::scan_identifier, "1a", &rest) && rest == "1a");
  TASSERT (Scanner::is_identifier_head ('_') && !Scanner::is_identifier_head ('1'));
  TASSERT (Scanner::is_identifier_char ('1') && Scanner::is_identifier_char (0x0301));
  TASSERT (!Scanner::is_identifier_head (0x0301));
  TASSERT (Scanner::is_identifier_head (0x1F600) && !Scanner::is_identifier_head (0x1FFFE));
}
REGISTER_TEST ("Scanner/Identifiers", test_identifiers);

static void
test_operators()
{
  String rest;
  SubExpressionP t;
  t = scan_one (Scanner::scan_operator, "+-", &rest);
  TASSERT (t && t->symbol() == Symbol::infix ("+") && rest == "-");
  t = scan_one (Scanner::scan_operator, "->x", &rest);
  TASSERT (t && t->symbol().name() == "->" && rest == "x");
  t = scan_one (Scanner::scan_operator, "..<5", &rest);
  TASSERT (t && t->symbol().name() == "..<" && rest == "5");
  t = scan_one (Scanner::scan_operator, "<=>", &rest);
  TASSERT (t && t->symbol().name() == "<=>" && rest == "");
  t = scan_one (Scanner::scan_operator, "((", &rest);
  TASSERT (t && t->symbol().name() == "(" && rest == "(");
  t = scan_one (Scanner::scan_operator, "\xe2\x88\x9a" "2", &rest); // √
  TASSERT (t && t->symbol().name() == "\xe2\x88\x9a" && rest == "2");
  TASSERT (!scan_one (Scanner::scan_operator, ")", &rest) && rest == ")");
  TASSERT (Scanner::is_operator_char ('%') && !Scanner::is_operator_char ('-') && !Scanner::is_operator_char ('.'));
}
REGISTER_TEST ("Scanner/Operators", test_operators);

static void
test_quoted_identifiers()
{
  String rest;
  SubExpressionP t;
  t = scan_one (Scanner::scan_quoted_identifier, "`hello world` + 1", &rest);
  TASSERT (t && t->symbol() == Symbol::variable ("`hello world`") && rest == " + 1");
  t = scan_one (Scanner::scan_quoted_identifier, "'a\\tb'", &rest);
  TASSERT (t && t->symbol().name() == "'a\tb'");
  t = scan_one (Scanner::scan_quoted_identifier, "'\\n'", &rest);
  TASSERT (t && t->symbol().name() == "'\n'");
  t = scan_one (Scanner::scan_quoted_identifier, "\"x\\\"y\"", &rest);
  TASSERT (t && t->symbol().name() == "\"x\"y\"" && rest == "");
  t = scan_one (Scanner::scan_quoted_identifier, "'\\u{e9}'", &rest);
  TASSERT (t && t->symbol().name() == "'\xc3\xa9'");
  t = scan_one (Scanner::scan_quoted_identifier, "'\\q'", &rest);
  TASSERT (t && t->symbol().name() == "'q'");
  // malformed
  t = scan_one (Scanner::scan_quoted_identifier, "'abc", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::missing_delimiter ("'"));
  t = scan_one (Scanner::scan_quoted_identifier, "'", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("'"));
  t = scan_one (Scanner::scan_quoted_identifier, "'\\u{}'", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("}"));
  t = scan_one (Scanner::scan_quoted_identifier, "'\\u{110000}'", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("110000"));
  t = scan_one (Scanner::scan_quoted_identifier, "'\\u{41", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::missing_delimiter ("}"));
  t = scan_one (Scanner::scan_quoted_identifier, "'\\u{41x' + 1", &rest);
  TASSERT (t && t->is_error() && t->error() == ExpressionError::unexpected_token ("x'"));
  TASSERT (!scan_one (Scanner::scan_quoted_identifier, "abc", &rest) && rest == "abc");
}
REGISTER_TEST ("Scanner/Quoted Identifiers", test_quoted_identifiers);

static void
test_escape_identifier()
{
  TCMP (Scanner::escape_identifier ("abc"), ==, "abc");
  TCMP (Scanner::escape_identifier ("'a b'"), ==, "'a b'");
  TCMP (Scanner::escape_identifier ("'a\tb\n'"), ==, "'a\\tb\\n'");
  TCMP (Scanner::escape_identifier (String ("'a\0b'", 5)), ==, "'a\\0b'");
  TCMP (Scanner::escape_identifier ("'\x01'"), ==, "'\\u{1}'");
  TCMP (Scanner::escape_identifier ("'\xc3\xa9'"), ==, "'\xc3\xa9'");
  TCMP (Scanner::escape_identifier ("\"x\"y\""), ==, "\"x\\\"y\"");
  TCMP (Scanner::escape_identifier ("'a\\b'"), ==, "'a\\\\b'");
  // escaped names scan back to the same name
  const char *names[] = { "'a\tb'", "`\x01\x7f`", "\"q\"uote\"", "'back\\slash'", "'\xe2\x80\xa8'" };
  for (size_t i = 0; i < ARRAY_SIZE (names); i++)
    {
      const SubExpressionP t = scan_one (Scanner::scan_quoted_identifier, Scanner::escape_identifier (names[i]));
      TASSERT (t && t->is_symbol());
      TCMP (t->symbol().name(), ==, names[i]);
    }
}
REGISTER_TEST ("Scanner/Escape Identifier", test_escape_identifier);

static void
test_format_number()
{
  TCMP (Scanner::format_number (1), ==, "1");
  TCMP (Scanner::format_number (-42), ==, "-42");
  TCMP (Scanner::format_number (-0.0), ==, "0");
  TCMP (Scanner::format_number (0.5), ==, "0.5");
  TCMP (Scanner::format_number (0.1), ==, "0.1");
  TCMP (Scanner::format_number (1e15), ==, "1000000000000000");
  TCMP (Scanner::format_number (1e20), ==, "1e+20");
  TCMP (Scanner::format_number (1.0 / 3), ==, "0.3333333333333333");
  TCMP (Scanner::format_number (NAN), ==, "nan");
  TCMP (Scanner::format_number (-INFINITY), ==, "-inf");
}
REGISTER_TEST ("Scanner/Number Formatting", test_format_number);

static void
test_precedence_table()
{
  bool right = true;
  TCMP (Scanner::operator_precedence ("*", &right), ==, 1);
  TASSERT (right == false);
  TCMP (Scanner::operator_precedence ("==", &right), ==, -4);
  TASSERT (right == true);
  TCMP (Scanner::operator_precedence ("+="), ==, -8);
  TCMP (Scanner::operator_precedence ("unknown", &right), ==, 0);
  TASSERT (right == false);
  TCMP (Scanner::operator_precedence (","), ==, -100);
  TCMP (Scanner::operator_precedence ("[]"), ==, 100);
  struct { const char *lhs, *rhs; bool result; } cases[] = {
    { "*", "+", true }, { "+", "*", false }, { "-", "-", true }, { "+", "-", true },
    { "=", "=", false }, { "<", "<", false }, { "&&", "||", true }, { "||", "&&", false },
    { "?", ":", true }, { ":", "?", true }, { "<<", "*", true }, { "..", "+", false },
    { "and", "or", true }, { "+", ",", true }, { ",", "+", false },
  };
  for (size_t i = 0; i < ARRAY_SIZE (cases); i++)
    TASSERT (Scanner::operator_takes_precedence (cases[i].lhs, cases[i].rhs) == cases[i].result);
}
REGISTER_TEST ("Scanner/Operator Precedence", test_precedence_table);

} // Anon

int
main (int   argc,
      char *argv[])
{
  init_core_test ("evaltests", &argc, argv);

  return Test::run();
}
