// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "expression.hh"
#include <cmath>

namespace Evalkit {

static FlipperOption no_parse_cache = EVALKIT_FLIPPER ("no-parse-cache", "Bypass the shared expression cache in Expression::parse().");

static SymbolEvaluator
lookup_symbol (const Expression::SymbolMap &map, const Symbol &symbol)
{
  auto it = map.find (symbol);
  return it != map.end() ? it->second : SymbolEvaluator();
}

static SymbolEvaluator
arity_mismatch_evaluator (const Symbol &declared)
{
  return [declared] (const vector<double>&) -> double {
    throw ExpressionError::arity_mismatch (declared);
  };
}

// Binds with a pure lookup that falls back to the builtin tables.
static SubExpressionP
bind_symbols (const ParsedExpression &parsed, const SymbolLookup &impure, const SymbolLookup &pure)
{
  auto pure_or_builtin = [&] (const Symbol &symbol) -> SymbolEvaluator {
    SymbolEvaluator evaluator = pure ? pure (symbol) : SymbolEvaluator();
    if (!evaluator)
      evaluator = lookup_symbol (Expression::math_symbols(), symbol);
    if (!evaluator)
      evaluator = lookup_symbol (Expression::bool_symbols(), symbol);
    if (evaluator)
      return evaluator;
    if (symbol.kind() == Symbol::FUNCTION)
      for (int i = 0; i <= 10; i++)
        {
          const Symbol candidate = Symbol::function (symbol.name(), Arity::exactly (i));
          if ((impure && impure (candidate)) || (pure && pure (candidate)))
            return arity_mismatch_evaluator (candidate);
        }
    return Expression::error_evaluator (symbol);
  };
  return SubExpression::optimized (parsed.root(), impure, pure_or_builtin);
}

// Binds against constant, array and symbol tables.
static SubExpressionP
bind_tables (const ParsedExpression &parsed, uint options, const Expression::ConstantMap &constants,
             const Expression::ArrayMap &arrays, const Expression::SymbolMap &symbols)
{
  const bool bool_symbols = options & Expression::BOOL_SYMBOLS;
  const bool optimize = !(options & Expression::NO_OPTIMIZE);
  const bool pure_symbols = options & Expression::PURE_SYMBOLS;
  auto user_evaluator = [&] (const Symbol &symbol) -> SymbolEvaluator {
    SymbolEvaluator evaluator = lookup_symbol (symbols, symbol);
    if (evaluator || bool_symbols || !symbol.is_infix ("?:"))
      return evaluator;
    // ternary made up from user defined binary operators
    const SymbolEvaluator lhs = lookup_symbol (symbols, Symbol::infix ("?"));
    const SymbolEvaluator rhs = lookup_symbol (symbols, Symbol::infix (":"));
    if (!lhs || !rhs)
      return evaluator;
    return [lhs, rhs] (const vector<double> &args) -> double {
      if (args.size() != 3)
        throw ExpressionError::arity_mismatch (Symbol::infix ("?:"));
      return rhs ({ lhs ({ args[0], args[1] }), args[2] });
    };
  };
  auto pure_evaluator = [&] (const Symbol &symbol) -> SymbolEvaluator {
    switch (symbol.kind())
      {
      case Symbol::VARIABLE:
        {
          auto it = constants.find (symbol.name());
          if (it != constants.end())
            {
              const double value = it->second;
              return [value] (const vector<double>&) { return value; };
            }
        }
        break;
      case Symbol::ARRAY:
        {
          auto it = arrays.find (symbol.name());
          if (it != arrays.end())
            {
              const vector<double> values = it->second;
              return [symbol, values] (const vector<double> &args) -> double {
                const double index = args[0];
                if (!(index == std::floor (index)) || index < 0 || index >= double (values.size()))
                  throw ExpressionError::array_bounds (symbol, index);
                return values[size_t (index)];
              };
            }
        }
        break;
      default:
        {
          SymbolEvaluator evaluator = user_evaluator (symbol);
          if (evaluator)
            return evaluator;
        }
        break;
      }
    SymbolEvaluator evaluator = lookup_symbol (Expression::math_symbols(), symbol);
    if (!evaluator && bool_symbols)
      evaluator = lookup_symbol (Expression::bool_symbols(), symbol);
    if (evaluator)
      return evaluator;
    if (symbol.kind() == Symbol::FUNCTION)
      for (const auto &entry : symbols)
        if (entry.first.kind() == Symbol::FUNCTION && entry.first.name() == symbol.name())
          return arity_mismatch_evaluator (entry.first);
    return Expression::error_evaluator (symbol);
  };
  auto impure_evaluator = [&] (const Symbol &symbol) -> SymbolEvaluator {
    SymbolEvaluator evaluator;
    switch (symbol.kind())
      {
      case Symbol::VARIABLE:
        if (constants.find (symbol.name()) == constants.end())
          evaluator = lookup_symbol (symbols, symbol);
        break;
      case Symbol::ARRAY:
        if (arrays.find (symbol.name()) == arrays.end())
          evaluator = lookup_symbol (symbols, symbol);
        break;
      default:
        if (!pure_symbols)
          evaluator = user_evaluator (symbol);
        break;
      }
    if (evaluator || optimize)
      return evaluator;
    return pure_evaluator (symbol);
  };
  return bind_symbols (parsed, impure_evaluator, pure_evaluator);
}

/// Parse @a source through the shared cache and bind it, see Expression (const ParsedExpression&, uint, ...).
Expression::Expression (const String &source, uint options, const ConstantMap &constants, const ArrayMap &arrays, const SymbolMap &symbols) :
  root_ (bind_tables (parse (source), options, constants, arrays, symbols))
{}

/** Bind @a parsed against constant, array and symbol tables.
 * Constants and arrays are pure and get folded. User @a symbols are impure unless
 * PURE_SYMBOLS is given, a constant or array of the same name takes precedence over them.
 * The math symbols are always available, the boolean symbols with BOOL_SYMBOLS.
 */
Expression::Expression (const ParsedExpression &parsed, uint options, const ConstantMap &constants, const ArrayMap &arrays, const SymbolMap &symbols) :
  root_ (bind_tables (parsed, options, constants, arrays, symbols))
{}

/** Bind @a parsed with symbol lookup functions.
 * Symbols resolved by @a impure are never folded. Symbols resolved by @a pure, or the
 * math and boolean symbols as fallback, are folded when all their arguments are constant.
 */
Expression::Expression (const ParsedExpression &parsed, const SymbolLookup &impure, const SymbolLookup &pure) :
  root_ (bind_symbols (parsed, impure, pure))
{}

Expression
Expression::with_pure_symbols (const ParsedExpression &parsed, const SymbolLookup &pure)
{
  return Expression (parsed, SymbolLookup(), pure);
}

/// Compute the expression value, throws ExpressionError for invalid expressions.
double
Expression::evaluate () const
{
  return root_->evaluate();
}

/// Parse @a source, which never throws, invalid input yields an expression that throws when evaluated.
ParsedExpression
Expression::parse (const String &source, bool use_cache)
{
  if (use_cache && !no_parse_cache)
    return ExpressionCache::shared().parse (source);
  Cursor cursor (source);
  return Parser::parse (cursor);
}

/** Parse an expression embedded in a larger text.
 * Parsing stops before the first of @a delimiters that is not nested in parentheses or brackets,
 * the @a cursor is left at that position.
 */
ParsedExpression
Expression::parse_sub_expression (Cursor &cursor, const StringVector &delimiters)
{
  return Parser::parse (cursor, delimiters);
}

/// Parse @a source without caching, throws ExpressionError for invalid input.
ParsedExpression
Expression::parse_strict (const String &source)
{
  Cursor cursor (source);
  return Parser::parse_strict (cursor);
}

void
Expression::clear_cache ()
{
  ExpressionCache::shared().clear();
}

void
Expression::clear_cache (const String &source)
{
  ExpressionCache::shared().clear (source);
}

bool
Expression::is_valid_identifier (const String &name)
{
  Cursor cursor (name);
  SubExpressionP token;
  if (!Scanner::scan_identifier (cursor, token) && !Scanner::scan_quoted_identifier (cursor, token))
    return false;
  return token->is_symbol() && token->symbol().kind() == Symbol::VARIABLE && cursor.empty();
}

bool
Expression::is_valid_operator (const String &op)
{
  Cursor cursor (op);
  SubExpressionP token;
  if (!Scanner::scan_operator (cursor, token))
    return false;
  return token->symbol().name() != "(" && token->symbol().name() != "[" && cursor.empty();
}

/** Yield an evaluator that throws the most helpful error for an unresolved @a symbol.
 * Structural operators report their token as unexpected, builtin function names
 * called with another arity report the expected arity, all else is undefined.
 */
SymbolEvaluator
Expression::error_evaluator (const Symbol &symbol)
{
  if (symbol.is_infix (",") || symbol.is_infix ("[]") || symbol.is_infix ("()") ||
      (symbol.kind() == Symbol::FUNCTION && symbol.name() == "[]"))
    {
      const String token = symbol.name().substr (0, 1);
      return [token] (const vector<double>&) -> double {
        throw ExpressionError::unexpected_token (token);
      };
    }
  if (symbol.kind() == Symbol::FUNCTION)
    for (const SymbolMap *table : { &math_symbols(), &bool_symbols() })
      for (const auto &entry : *table)
        if (entry.first.kind() == Symbol::FUNCTION && entry.first.name() == symbol.name() &&
            entry.first.arity() != symbol.arity())
          return arity_mismatch_evaluator (entry.first);
  return [symbol] (const vector<double>&) -> double {
    throw ExpressionError::undefined_symbol (symbol);
  };
}

/// Constant pi, arithmetic operators and common math functions.
const Expression::SymbolMap&
Expression::math_symbols ()
{
  static const SymbolMap symbols = [] () {
    typedef const vector<double> &Args;
    SymbolMap s;
    s[Symbol::variable ("pi")] = [] (Args) { return M_PI; };
    s[Symbol::infix ("+")] = [] (Args a) { return a[0] + a[1]; };
    s[Symbol::infix ("-")] = [] (Args a) { return a[0] - a[1]; };
    s[Symbol::infix ("*")] = [] (Args a) { return a[0] * a[1]; };
    s[Symbol::infix ("/")] = [] (Args a) { return a[0] / a[1]; };
    s[Symbol::infix ("%")] = [] (Args a) { return std::fmod (a[0], a[1]); };
    s[Symbol::prefix ("-")] = [] (Args a) { return -a[0]; };
    s[Symbol::function ("sqrt", 1)] = [] (Args a) { return std::sqrt (a[0]); };
    s[Symbol::function ("floor", 1)] = [] (Args a) { return std::floor (a[0]); };
    s[Symbol::function ("ceil", 1)] = [] (Args a) { return std::ceil (a[0]); };
    s[Symbol::function ("round", 1)] = [] (Args a) { return std::round (a[0]); };
    s[Symbol::function ("cos", 1)] = [] (Args a) { return std::cos (a[0]); };
    s[Symbol::function ("acos", 1)] = [] (Args a) { return std::acos (a[0]); };
    s[Symbol::function ("sin", 1)] = [] (Args a) { return std::sin (a[0]); };
    s[Symbol::function ("asin", 1)] = [] (Args a) { return std::asin (a[0]); };
    s[Symbol::function ("tan", 1)] = [] (Args a) { return std::tan (a[0]); };
    s[Symbol::function ("atan", 1)] = [] (Args a) { return std::atan (a[0]); };
    s[Symbol::function ("abs", 1)] = [] (Args a) { return std::fabs (a[0]); };
    s[Symbol::function ("pow", 2)] = [] (Args a) { return std::pow (a[0], a[1]); };
    s[Symbol::function ("atan2", 2)] = [] (Args a) { return std::atan2 (a[0], a[1]); };
    s[Symbol::function ("mod", 2)] = [] (Args a) { return std::fmod (a[0], a[1]); };
    s[Symbol::function ("max", Arity::at_least (2))] = [] (Args a) {
      double result = a[0];
      for (double v : a)
        result = MAX (result, v);
      return result;
    };
    s[Symbol::function ("min", Arity::at_least (2))] = [] (Args a) {
      double result = a[0];
      for (double v : a)
        result = MIN (result, v);
      return result;
    };
    return s;
  } ();
  return symbols;
}

/// Boolean constants and operators, 0 is false, everything else is true.
const Expression::SymbolMap&
Expression::bool_symbols ()
{
  static const SymbolMap symbols = [] () {
    typedef const vector<double> &Args;
    SymbolMap s;
    s[Symbol::variable ("true")] = [] (Args) { return 1.0; };
    s[Symbol::variable ("false")] = [] (Args) { return 0.0; };
    s[Symbol::infix ("==")] = [] (Args a) { return a[0] == a[1] ? 1.0 : 0.0; };
    s[Symbol::infix ("!=")] = [] (Args a) { return a[0] != a[1] ? 1.0 : 0.0; };
    s[Symbol::infix (">")] = [] (Args a) { return a[0] > a[1] ? 1.0 : 0.0; };
    s[Symbol::infix (">=")] = [] (Args a) { return a[0] >= a[1] ? 1.0 : 0.0; };
    s[Symbol::infix ("<")] = [] (Args a) { return a[0] < a[1] ? 1.0 : 0.0; };
    s[Symbol::infix ("<=")] = [] (Args a) { return a[0] <= a[1] ? 1.0 : 0.0; };
    s[Symbol::infix ("&&")] = [] (Args a) { return a[0] != 0 && a[1] != 0 ? 1.0 : 0.0; };
    s[Symbol::infix ("||")] = [] (Args a) { return a[0] != 0 || a[1] != 0 ? 1.0 : 0.0; };
    s[Symbol::prefix ("!")] = [] (Args a) { return a[0] == 0 ? 1.0 : 0.0; };
    s[Symbol::infix ("?:")] = [] (Args a) {
      if (a.size() == 3)
        return a[0] != 0 ? a[1] : a[2];
      return a[0] != 0 ? a[0] : a[1];
    };
    return s;
  } ();
  return symbols;
}

} // Evalkit
