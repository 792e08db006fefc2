// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "scanner.hh"
#include <cmath>

namespace Evalkit {
namespace Scanner {

struct CharRange { unichar first, last; };

static bool
range_table_contains (const CharRange *ranges, size_t n_ranges, unichar uc)
{
  size_t lo = 0, hi = n_ranges;
  while (lo < hi)
    {
      const size_t mid = (lo + hi) / 2;
      if (uc < ranges[mid].first)
        hi = mid;
      else if (uc > ranges[mid].last)
        lo = mid + 1;
      else
        return true;
    }
  return false;
}

// sorted, non-overlapping
static const CharRange operator_ranges[] = {
  { 0x00A1, 0x00A7 }, { 0x00A9, 0x00A9 }, { 0x00AB, 0x00AC }, { 0x00AE, 0x00AE },
  { 0x00B0, 0x00B1 }, { 0x00B6, 0x00B6 }, { 0x00BB, 0x00BB }, { 0x00BF, 0x00BF },
  { 0x00D7, 0x00D7 }, { 0x00F7, 0x00F7 }, { 0x2016, 0x2017 }, { 0x2020, 0x2027 },
  { 0x2030, 0x203E }, { 0x2041, 0x2053 }, { 0x2055, 0x205E }, { 0x2190, 0x23FF },
  { 0x2500, 0x2775 }, { 0x2794, 0x2BFF }, { 0x2E00, 0x2E7F }, { 0x3001, 0x3003 },
  { 0x3008, 0x3030 },
};

bool
is_operator_char (unichar uc)
{
  switch (uc)
    {
    case '/': case '=': case '+': case '!': case '*': case '%':
    case '<': case '>': case '&': case '|': case '^': case '~':
    case '?': case ':': case 0x00AD:
      return true;
    }
  if (uc < 0xA1)
    return false;
  return range_table_contains (operator_ranges, ARRAY_SIZE (operator_ranges), uc);
}

// sorted, non-overlapping, ASCII is handled separately
static const CharRange identifier_head_ranges[] = {
  { 0x00A8, 0x00A8 }, { 0x00AA, 0x00AA }, { 0x00AD, 0x00AD }, { 0x00AF, 0x00AF },
  { 0x00B2, 0x00B5 }, { 0x00B7, 0x00BA }, { 0x00BC, 0x00BE }, { 0x00C0, 0x00D6 },
  { 0x00D8, 0x00F6 }, { 0x00F8, 0x00FF }, { 0x0100, 0x02FF }, { 0x0370, 0x167F },
  { 0x1681, 0x180D }, { 0x180F, 0x1DBF }, { 0x1E00, 0x1FFF }, { 0x200B, 0x200D },
  { 0x202A, 0x202E }, { 0x203F, 0x2040 }, { 0x2054, 0x2054 }, { 0x2060, 0x206F },
  { 0x2070, 0x20CF }, { 0x2100, 0x218F }, { 0x2460, 0x24FF }, { 0x2776, 0x2793 },
  { 0x2C00, 0x2DFF }, { 0x2E80, 0x2FFF }, { 0x3004, 0x3007 }, { 0x3021, 0x302F },
  { 0x3031, 0x303F }, { 0x3040, 0xD7FF }, { 0xF900, 0xFD3D }, { 0xFD40, 0xFDCF },
  { 0xFDF0, 0xFE1F }, { 0xFE30, 0xFE44 }, { 0xFE47, 0xFFFD },
};

bool
is_identifier_head (unichar uc)
{
  if (uc < 0x80)
    return (uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') || uc == '_' || uc == '#' || uc == '$' || uc == '@';
  if (uc >= 0x10000)
    return uc <= 0xEFFFD && (uc & 0xFFFF) <= 0xFFFD; // planes 1 - 14 without the last two code points
  return range_table_contains (identifier_head_ranges, ARRAY_SIZE (identifier_head_ranges), uc);
}

bool
is_identifier_char (unichar uc)
{
  if (uc >= '0' && uc <= '9')
    return true;
  if ((uc >= 0x0300 && uc <= 0x036F) || (uc >= 0x1DC0 && uc <= 0x1DFF) ||
      (uc >= 0x20D0 && uc <= 0x20FF) || (uc >= 0xFE20 && uc <= 0xFE2F))
    return true;
  return is_identifier_head (uc);
}

bool
is_quote_char (unichar uc)
{
  return uc == '`' || uc == '\'' || uc == '"';
}

static bool
is_decimal_digit (unichar uc)
{
  return uc >= '0' && uc <= '9';
}

static bool
is_hex_digit (unichar uc)
{
  return (uc >= '0' && uc <= '9') || (uc >= 'A' && uc <= 'F') || (uc >= 'a' && uc <= 'f');
}

/// Check if any of @a delimiters follows at the cursor position, without consuming it.
bool
match_delimiter (const Cursor &cursor, const StringVector &delimiters)
{
  for (const String &delimiter : delimiters)
    if (cursor.has_prefix (delimiter))
      return true;
  return false;
}

static String
scan_exponent (Cursor &cursor)
{
  const size_t start = cursor.start();
  String e = cursor.scan_character ([] (unichar uc) { return uc == 'e' || uc == 'E'; });
  if (!e.empty())
    {
      const String sign = cursor.scan_character ([] (unichar uc) { return uc == '-' || uc == '+'; });
      const String exponent = cursor.scan_characters (is_decimal_digit);
      if (!exponent.empty())
        return e + sign + exponent;
    }
  cursor.reset (start);
  return "";
}

static String
scan_number (Cursor &cursor)
{
  String number;
  const size_t start = cursor.start();
  const String integer = cursor.scan_characters (is_decimal_digit);
  if (!integer.empty())
    {
      if (integer == "0" && cursor.scan_character ('x'))
        return "0x" + cursor.scan_characters (is_hex_digit);
      const size_t end_of_int = cursor.start();
      number = integer;
      if (cursor.scan_character ('.'))
        {
          const String fraction = cursor.scan_characters (is_decimal_digit);
          if (fraction.empty())
            {
              cursor.reset (end_of_int);
              return integer;
            }
          number += "." + fraction;
        }
    }
  else if (cursor.scan_character ('.'))
    {
      const String fraction = cursor.scan_characters (is_decimal_digit);
      if (fraction.empty())
        {
          cursor.reset (start);
          return "";
        }
      number = "." + fraction;
    }
  else
    return "";
  return number + scan_exponent (cursor);
}

/** Scan a decimal or hexadecimal number.
 * Yields a literal, or an error leaf for text that does not convert to a finite double.
 */
bool
scan_numeric_literal (Cursor &cursor, SubExpressionP &token)
{
  const String number = scan_number (cursor);
  if (number.empty())
    return false;
  const char *end = NULL;
  const double value = string_to_cdouble (number.c_str(), &end);
  if (!end || *end != 0 || number == "0x" || !std::isfinite (value))
    token = SubExpression::new_error (ExpressionError::unexpected_token (number), number);
  else
    token = SubExpression::new_literal (value);
  return true;
}

/// Scan a possibly dotted identifier such as `a`, `.b`, `foo.bar` or `x'`.
bool
scan_identifier (Cursor &cursor, SubExpressionP &token)
{
  size_t start = cursor.start();
  String identifier;
  if (cursor.scan_character ('.'))
    identifier = ".";
  else
    {
      identifier = cursor.scan_character (is_identifier_head);
      if (identifier.empty())
        return false;
      start = cursor.start();
      if (cursor.scan_character ('.'))
        identifier += ".";
    }
  for (String tail = cursor.scan_characters (is_identifier_char); !tail.empty(); tail = cursor.scan_characters (is_identifier_char))
    {
      identifier += tail;
      start = cursor.start();
      if (cursor.scan_character ('.'))
        identifier += ".";
    }
  if (identifier.back() == '.')
    {
      cursor.reset (start);
      if (identifier == ".")
        return false;
      identifier.pop_back();
    }
  else if (cursor.scan_character ('\''))
    identifier += "'";
  token = SubExpression::new_symbol (Symbol::variable (identifier));
  return true;
}

/// Scan an operator token, always yields an infix symbol that the parser reclassifies.
bool
scan_operator (Cursor &cursor, SubExpressionP &token)
{
  String op = cursor.scan_characters ([] (unichar uc) { return uc == '.'; });
  if (op.empty())
    op = cursor.scan_characters ([] (unichar uc) { return uc == '-'; });
  if (!op.empty())
    op += cursor.scan_characters (is_operator_char);
  else
    {
      op = cursor.scan_characters (is_operator_char);
      if (op.empty())
        op = cursor.scan_character ([] (unichar uc) { return uc == '(' || uc == '[' || uc == ','; });
      if (op.empty())
        return false;
    }
  token = SubExpression::new_symbol (Symbol::infix (op));
  return true;
}

/** Scan a quoted identifier.
 * The resulting variable name retains its delimiters, so `'x'` and `x` are different names.
 * Escape sequences are resolved, malformed input yields an error leaf.
 */
bool
scan_quoted_identifier (Cursor &cursor, SubExpressionP &token)
{
  const unichar delimiter = cursor.first();
  if (!is_quote_char (delimiter))
    return false;
  String string = utf8_encode (cursor.pop_first());
  const String delimiter_string = string;
  for (String part = cursor.scan_characters ([delimiter] (unichar uc) { return uc != delimiter && uc != '\\'; });
       !part.empty() || cursor.first() == '\\';
       part = cursor.scan_characters ([delimiter] (unichar uc) { return uc != delimiter && uc != '\\'; }))
    {
      string += part;
      if (!cursor.scan_character ('\\') || cursor.empty())
        continue;
      const unichar uc = cursor.pop_first();
      switch (uc)
        {
        case '0':       string += String (1, '\0');     break;
        case 't':       string += "\t";                 break;
        case 'n':       string += "\n";                 break;
        case 'r':       string += "\r";                 break;
        case 'u':
          if (cursor.scan_character ('{'))
            {
              const String hex = cursor.scan_characters (is_hex_digit);
              if (!cursor.scan_character ('}'))
                {
                  const String junk = cursor.scan_to_end_of_token();
                  if (junk.empty())
                    token = SubExpression::new_error (ExpressionError::missing_delimiter ("}"), string);
                  else
                    token = SubExpression::new_error (ExpressionError::unexpected_token (junk), string);
                  return true;
                }
              if (hex.empty())
                {
                  token = SubExpression::new_error (ExpressionError::unexpected_token ("}"), string);
                  return true;
                }
              const uint64 codepoint = hex.size() <= 8 ? string_to_uint (hex, 16) : 0xffffffff;
              if (!Unicode::isvalid (unichar (codepoint)))
                {
                  token = SubExpression::new_error (ExpressionError::unexpected_token (hex), string);
                  return true;
                }
              string += utf8_encode (unichar (codepoint));
              break;
            }
          string += "u";
          break;
        default:
          string += utf8_encode (uc);
          break;
        }
    }
  if (!cursor.scan_character (delimiter))
    {
      if (string == delimiter_string)
        token = SubExpression::new_error (ExpressionError::unexpected_token (string), string);
      else
        token = SubExpression::new_error (ExpressionError::missing_delimiter (delimiter_string), string);
      return true;
    }
  string += delimiter_string;
  token = SubExpression::new_symbol (Symbol::variable (string));
  return true;
}

/** Render a quoted identifier with escape sequences so it scans back to the same name.
 * Names that do not start with a quote character are returned unchanged.
 */
String
escape_identifier (const String &name)
{
  const vector<unichar> chars = utf8_decode (name);
  if (chars.empty() || !is_quote_char (chars[0]))
    return name;
  const unichar delimiter = chars[0];
  const size_t last = chars.size() - 1;
  String result = utf8_encode (delimiter);
  for (size_t i = 1; i < chars.size(); i++)
    {
      const unichar uc = chars[i];
      switch (uc)
        {
        case 0:         result += "\\0";        break;
        case '\t':      result += "\\t";        break;
        case '\n':      result += "\\n";        break;
        case '\r':      result += "\\r";        break;
        case '\\':      result += "\\\\";       break;
        default:
          if (uc == delimiter && i < last)
            result += "\\" + utf8_encode (uc);
          else if ((uc >= 0x20 && uc < 0x7F) || is_operator_char (uc) || is_identifier_char (uc))
            result += utf8_encode (uc);
          else
            result += string_format ("\\u{%X}", uc);
          break;
        }
    }
  return result;
}

/// Print integral values within 64 bit range as integers, everything else in shortest round-trip form.
String
format_number (double value)
{
  if (std::isfinite (value) && value == std::floor (value) &&
      value >= -9223372036854775808.0 && value < 9223372036854775808.0)
    return string_cprintf ("%lld", (long long) value);
  return string_from_double_short (value);
}

struct OperatorPrecedence {
  const char *op;
  int         precedence;
  bool        right_associative;
};

static const OperatorPrecedence operator_precedences[] = {
  { "[]", 100, false },
  { "<<", 2, false }, { ">>", 2, false }, { ">>>", 2, false },                  // bit shifts
  { "*", 1, false }, { "/", 1, false }, { "%", 1, false }, { "&", 1, false },   // multiplication
  // + - | ^ and unlisted operators: 0
  { "..", -1, false }, { "...", -1, false }, { "..<", -1, false },              // ranges
  { "is", -2, false }, { "as", -2, false }, { "isa", -2, false },               // casts
  { "??", -3, false }, { "?:", -3, false },                                     // coalescing
  { "<", -4, true }, { "<=", -4, true }, { ">=", -4, true }, { ">", -4, true }, // comparison
  { "==", -4, true }, { "!=", -4, true }, { "<>", -4, true }, { "===", -4, true }, { "!==", -4, true },
  { "lt", -4, true }, { "le", -4, true }, { "lte", -4, true }, { "gt", -4, true },
  { "ge", -4, true }, { "gte", -4, true }, { "eq", -4, true }, { "ne", -4, true },
  { "&&", -5, false }, { "and", -5, false },
  { "||", -6, false }, { "or", -6, false },
  { "?", -7, false }, { ":", -7, false },                                       // ternary
  { "=", -8, true }, { "*=", -8, true }, { "/=", -8, true }, { "%=", -8, true }, // assignment
  { "+=", -8, true }, { "-=", -8, true }, { "<<=", -8, true }, { ">>=", -8, true },
  { "&=", -8, true }, { "^=", -8, true }, { "|=", -8, true }, { ":=", -8, true },
  { ",", -100, false },
};

int
operator_precedence (const String &op, bool *right_associative)
{
  static const std::map<String, const OperatorPrecedence*> table = [] () {
    std::map<String, const OperatorPrecedence*> m;
    for (size_t i = 0; i < ARRAY_SIZE (operator_precedences); i++)
      m[operator_precedences[i].op] = &operator_precedences[i];
    return m;
  } ();
  auto it = table.find (op);
  if (right_associative)
    *right_associative = it != table.end() && it->second->right_associative;
  return it != table.end() ? it->second->precedence : 0;
}

/// Check if @a lhs binds tighter than a following @a rhs operator.
bool
operator_takes_precedence (const String &lhs, const String &rhs)
{
  bool right_associative = false;
  const int p1 = operator_precedence (lhs, &right_associative);
  const int p2 = operator_precedence (rhs);
  if (p1 == p2)
    return !right_associative;
  return p1 > p2;
}

} // Scanner
} // Evalkit
