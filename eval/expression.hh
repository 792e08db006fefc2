// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_EXPRESSION_HH__
#define __EVALKIT_EXPRESSION_HH__

#include <eval/parser.hh>

namespace Evalkit {

/** Bound, ready to evaluate expression.
 * An Expression binds every symbol of a parsed expression to an evaluator and
 * folds constant sub expressions. Binding never fails, unknown symbols and
 * wrong argument counts are bound to evaluators that throw, so all errors
 * surface from evaluate(). Expressions are immutable and can be evaluated
 * concurrently, provided the bound evaluators allow that.
 */
class Expression {
  SubExpressionP root_;
public:
  enum Options {
    NONE                = 0,
    NO_OPTIMIZE         = 1 << 1,       ///< Bind all symbols without constant folding.
    BOOL_SYMBOLS        = 1 << 2,       ///< Enable the boolean constants and operators.
    PURE_SYMBOLS        = 1 << 3,       ///< Treat user symbols as pure so they can be folded.
  };
  typedef std::map<String, double>                      ConstantMap;
  typedef std::map<String, vector<double>>              ArrayMap;
  typedef std::unordered_map<Symbol, SymbolEvaluator>   SymbolMap;
  explicit               Expression          (const String &source, uint options = NONE,
                                              const ConstantMap &constants = ConstantMap(),
                                              const ArrayMap &arrays = ArrayMap(),
                                              const SymbolMap &symbols = SymbolMap());
  explicit               Expression          (const ParsedExpression &parsed, uint options = NONE,
                                              const ConstantMap &constants = ConstantMap(),
                                              const ArrayMap &arrays = ArrayMap(),
                                              const SymbolMap &symbols = SymbolMap());
  explicit               Expression          (const ParsedExpression &parsed, const SymbolLookup &impure,
                                              const SymbolLookup &pure = SymbolLookup());
  static Expression      with_pure_symbols   (const ParsedExpression &parsed, const SymbolLookup &pure);
  double                 evaluate            () const;
  String                 description         () const    { return root_->description(); }
  SymbolSet              symbols             () const    { return root_->symbols(); }
  const SubExpressionP&  root                () const    { return root_; }
  // parsing
  static ParsedExpression parse              (const String &source, bool use_cache = true);
  static ParsedExpression parse_sub_expression (Cursor &cursor, const StringVector &delimiters);
  static ParsedExpression parse_strict       (const String &source);
  static void            clear_cache         ();
  static void            clear_cache         (const String &source);
  static bool            is_valid_identifier (const String &name);
  static bool            is_valid_operator   (const String &op);
  // symbol tables
  static const SymbolMap& math_symbols       ();
  static const SymbolMap& bool_symbols       ();
  static SymbolEvaluator error_evaluator     (const Symbol &symbol);
};

} // Evalkit

#endif /* __EVALKIT_EXPRESSION_HH__ */
