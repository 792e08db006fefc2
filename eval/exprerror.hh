// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_EXPRERROR_HH__
#define __EVALKIT_EXPRERROR_HH__

#include <eval/symbol.hh>
#include <exception>

namespace Evalkit {

/** Error raised while parsing, binding or evaluating an expression.
 * Parse failures are stored as values inside the expression tree and
 * binding failures are stored as throwing evaluators, so all errors
 * eventually surface as ExpressionError exceptions from evaluate().
 */
class ExpressionError : public std::exception {
public:
  enum Kind { MESSAGE, UNEXPECTED_TOKEN, MISSING_DELIMITER, UNDEFINED_SYMBOL, ARITY_MISMATCH, ARRAY_BOUNDS };
private:
  Kind   kind_;
  String text_;
  Symbol symbol_;
  double index_;
  String what_;
  explicit               ExpressionError   (Kind kind, const String &text, const Symbol &symbol, double index);
public:
  static ExpressionError message           (const String &text);
  static ExpressionError unexpected_token  (const String &token);
  static ExpressionError missing_delimiter (const String &delimiter);
  static ExpressionError undefined_symbol  (const Symbol &symbol);
  static ExpressionError arity_mismatch    (const Symbol &symbol);
  static ExpressionError array_bounds      (const Symbol &symbol, double index);
  /// An empty expression is reported as an unexpected empty token.
  static ExpressionError empty_expression  ()            { return unexpected_token (""); }
  Kind                   kind              () const      { return kind_; }
  /// Message text, unexpected token or missing delimiter.
  const String&          text              () const      { return text_; }
  const Symbol&          symbol            () const      { return symbol_; }
  double                 index             () const      { return index_; }
  bool                   is_empty_expression () const    { return kind_ == UNEXPECTED_TOKEN && text_.empty(); }
  String                 description       () const;
  virtual const char*    what              () const noexcept override;
  bool                   operator==        (const ExpressionError &other) const;
  bool                   operator!=        (const ExpressionError &other) const { return !operator== (other); }
};

} // Evalkit

#endif /* __EVALKIT_EXPRERROR_HH__ */
