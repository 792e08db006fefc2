// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_SUBEXPR_HH__
#define __EVALKIT_SUBEXPR_HH__

#include <eval/exprerror.hh>
#include <memory>

namespace Evalkit {

class SubExpression;
typedef std::shared_ptr<const SubExpression>                SubExpressionP;
typedef std::function<double (const vector<double> &args)> SymbolEvaluator;  ///< Computes a symbol value, may throw ExpressionError.
typedef std::function<SymbolEvaluator (const Symbol&)>      SymbolLookup;     ///< Yields an empty evaluator for unknown symbols.

/** Immutable node of an expression tree.
 * A node is either a numeric literal, a symbol applied to argument nodes,
 * or a parse error kept as a leaf value together with the text it was
 * parsed from. Symbol nodes get their evaluator bound by optimized().
 */
class SubExpression {
public:
  enum Type { LITERAL, SYMBOL, ERROR };
private:
  const Type                   type_;
  const double                 value_;
  const Symbol                 symbol_;
  const vector<SubExpressionP> args_;
  const SymbolEvaluator        evaluator_;
  const ExpressionError        error_;
  const String                 source_;
  explicit              SubExpression   (Type type, double value, const Symbol &symbol, const vector<SubExpressionP> &args,
                                         const SymbolEvaluator &evaluator, const ExpressionError &error, const String &source);
  EVALKIT_CLASS_NON_COPYABLE (SubExpression);
public:
  static SubExpressionP new_literal     (double value);
  static SubExpressionP new_symbol      (const Symbol &symbol, const vector<SubExpressionP> &args = vector<SubExpressionP>(),
                                         const SymbolEvaluator &evaluator = SymbolEvaluator());
  static SubExpressionP new_error       (const ExpressionError &error, const String &source);
  Type                  type            () const        { return type_; }
  bool                  is_literal      () const        { return type_ == LITERAL; }
  bool                  is_symbol       () const        { return type_ == SYMBOL; }
  bool                  is_error        () const        { return type_ == ERROR; }
  double                value           () const        { return value_; }
  const Symbol&         symbol          () const        { return symbol_; }
  const vector<SubExpressionP>& args    () const        { return args_; }
  const SymbolEvaluator& evaluator      () const        { return evaluator_; }
  const ExpressionError& error          () const        { return error_; }
  const String&         source          () const        { return source_; }
  bool                  is_operand      () const;
  bool                  is_bare_infix   () const;
  double                evaluate        () const;
  String                description     () const;
  SymbolSet             symbols         () const;
  void                  collect_symbols (SymbolSet &symbols) const;
  static SubExpressionP optimized       (const SubExpressionP &node, const SymbolLookup &impure, const SymbolLookup &pure);
};

} // Evalkit

#endif /* __EVALKIT_SUBEXPR_HH__ */
