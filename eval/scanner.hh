// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_SCANNER_HH__
#define __EVALKIT_SCANNER_HH__

#include <eval/cursor.hh>
#include <eval/subexpr.hh>

namespace Evalkit {

/// Token scanners and character classes of the expression syntax.
namespace Scanner {

bool    is_operator_char        (unichar uc) EVALKIT_CONST;
bool    is_identifier_head      (unichar uc) EVALKIT_CONST;
bool    is_identifier_char      (unichar uc) EVALKIT_CONST;
bool    is_quote_char           (unichar uc) EVALKIT_CONST;

bool    match_delimiter         (const Cursor &cursor, const StringVector &delimiters);
bool    scan_numeric_literal    (Cursor &cursor, SubExpressionP &token);
bool    scan_identifier         (Cursor &cursor, SubExpressionP &token);
bool    scan_operator           (Cursor &cursor, SubExpressionP &token);
bool    scan_quoted_identifier  (Cursor &cursor, SubExpressionP &token);

String  escape_identifier       (const String &name);
String  format_number           (double value);

int     operator_precedence     (const String &op, bool *right_associative = NULL);
bool    operator_takes_precedence (const String &lhs, const String &rhs);

} // Scanner

} // Evalkit

#endif /* __EVALKIT_SCANNER_HH__ */
