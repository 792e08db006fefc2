// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_PARSER_HH__
#define __EVALKIT_PARSER_HH__

#include <eval/scanner.hh>
#include <unordered_map>

namespace Evalkit {

/// Unbound expression tree as produced by the parser.
class ParsedExpression {
  SubExpressionP root_;
public:
  explicit               ParsedExpression (const SubExpressionP &root);
  const SubExpressionP&  root             () const      { return root_; }
  /// Pretty printed expression, or the source text of an invalid expression.
  String                 description      () const      { return root_->description(); }
  SymbolSet              symbols          () const      { return root_->symbols(); }
  /// The parse error if the expression is invalid, or NULL.
  const ExpressionError* error            () const      { return root_->is_error() ? &root_->error() : NULL; }
};

/** Operator precedence parser for expression text.
 * Tokens are pushed onto a stack and reduced by repeatedly collapsing the stack
 * from the left, which resolves prefix, infix, postfix and ternary operators
 * according to whitespace adjacency and the operator precedence table.
 * Nesting depth and token count are limited by the "parse-max-depth" and
 * "parse-max-tokens" debug config keys. The token limit also caps the
 * quadratic reduction cost of long right associative chains.
 */
class Parser {
  Cursor        &cursor_;
  const int64    max_depth_, max_tokens_;
  int64          depth_, n_tokens_;
  void           collapse_stack         (vector<SubExpressionP> &stack, size_t i);
  vector<SubExpressionP> scan_arguments (unichar delimiter);
  bool           scan_token             (SubExpressionP &token);
  EVALKIT_CLASS_NON_COPYABLE (Parser);
public:
  explicit       Parser                 (Cursor &cursor);
  SubExpressionP parse_sub_expression   (const StringVector &delimiters);
  static ParsedExpression parse         (Cursor &cursor, const StringVector &delimiters = StringVector());
  static ParsedExpression parse_strict  (Cursor &cursor, const StringVector &delimiters = StringVector());
};

/** Thread safe map of source text to parsed expression trees.
 * Parsing the same text twice yields the same tree, the shared() instance is used by Expression::parse().
 */
class ExpressionCache {
  Mutex                                          mutex_;
  std::unordered_map<String, SubExpressionP>     map_;
  uint64                                         parse_count_;
  EVALKIT_CLASS_NON_COPYABLE (ExpressionCache);
public:
  explicit              ExpressionCache ();
  ParsedExpression      parse           (const String &source);
  bool                  contains        (const String &source);
  void                  clear           ();
  void                  clear           (const String &source);
  size_t                size            ();
  uint64                parse_count     ();
  static ExpressionCache& shared        ();
};

} // Evalkit

#endif /* __EVALKIT_PARSER_HH__ */
