// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "subexpr.hh"
#include "scanner.hh"

namespace Evalkit {

SubExpression::SubExpression (Type type, double value, const Symbol &symbol, const vector<SubExpressionP> &args,
                              const SymbolEvaluator &evaluator, const ExpressionError &error, const String &source) :
  type_ (type), value_ (value), symbol_ (symbol), args_ (args), evaluator_ (evaluator), error_ (error), source_ (source)
{}

SubExpressionP
SubExpression::new_literal (double value)
{
  return SubExpressionP (new SubExpression (LITERAL, value, Symbol(), vector<SubExpressionP>(), SymbolEvaluator(),
                                            ExpressionError::empty_expression(), ""));
}

SubExpressionP
SubExpression::new_symbol (const Symbol &symbol, const vector<SubExpressionP> &args, const SymbolEvaluator &evaluator)
{
  return SubExpressionP (new SubExpression (SYMBOL, 0, symbol, args, evaluator, ExpressionError::empty_expression(), ""));
}

SubExpressionP
SubExpression::new_error (const ExpressionError &error, const String &source)
{
  return SubExpressionP (new SubExpression (ERROR, 0, Symbol(), vector<SubExpressionP>(), SymbolEvaluator(), error, source));
}

/// Operands are literals, applied symbols and bare variable, function or array references.
bool
SubExpression::is_operand () const
{
  switch (type_)
    {
    case LITERAL:       return true;
    case SYMBOL:        return !args_.empty() || !symbol_.is_operator();
    case ERROR:         return false;
    }
  return false;
}

/// Check for an infix operator symbol that has no operands yet.
bool
SubExpression::is_bare_infix () const
{
  return type_ == SYMBOL && args_.empty() && symbol_.kind() == Symbol::INFIX;
}

double
SubExpression::evaluate () const
{
  switch (type_)
    {
    case LITERAL:
      return value_;
    case ERROR:
      throw error_;
    case SYMBOL:
      break;
    }
  if (!evaluator_)
    throw ExpressionError::undefined_symbol (symbol_);
  vector<double> values;
  values.reserve (args_.size());
  for (const SubExpressionP &arg : args_)
    values.push_back (arg->evaluate());
  return evaluator_ (values);
}

static bool
is_infix_node (const SubExpressionP &node, String *name = NULL)
{
  if (node->type() != SubExpression::SYMBOL || node->symbol().kind() != Symbol::INFIX)
    return false;
  if (name)
    *name = node->symbol().name();
  return true;
}

// Adjacent texts would scan as one token without a separator.
static bool
needs_separation (const String &lhs, const String &rhs)
{
  if (lhs.empty() || rhs.empty())
    return false;
  const vector<unichar> lchars = utf8_decode (lhs), rchars = utf8_decode (rhs);
  const unichar l = lchars.back(), r = rchars.front();
  return l == '.' || (Scanner::is_operator_char (l) || l == '-') == (Scanner::is_operator_char (r) || r == '-');
}

static String
argument_list (const vector<SubExpressionP> &args, size_t first = 0)
{
  String result;
  for (size_t i = first; i < args.size(); i++)
    {
      if (i > first)
        result += ", ";
      if (args[i]->type() == SubExpression::SYMBOL && args[i]->symbol().is_infix (","))
        result += "(" + args[i]->description() + ")";
      else
        result += args[i]->description();
    }
  return result;
}

// Operand of a trailing call or subscript, operator nodes bind weaker and need parentheses.
static String
subscript_target (const SubExpressionP &node)
{
  const String text = node->description();
  if (node->is_error())
    return "(" + text + ")";
  if (node->type() != SubExpression::SYMBOL)
    return text;
  const Symbol &symbol = node->symbol();
  switch (symbol.kind())
    {
    case Symbol::PREFIX:
    case Symbol::POSTFIX:
      return "(" + text + ")";
    case Symbol::INFIX:
      return symbol.name() == "()" || symbol.name() == "[]" ? text : "(" + text + ")";
    default:
      return text;
    }
}

/** Pretty print the expression.
 * Operators are parenthesized as needed according to operator precedence,
 * error leaves print the source text they were parsed from.
 */
String
SubExpression::description () const
{
  if (type_ == LITERAL)
    return Scanner::format_number (value_);
  if (type_ == ERROR)
    return source_;
  const String ename = symbol_.escaped_name();
  if (!is_operand())
    return ename;
  const String &name = symbol_.name();
  switch (symbol_.kind())
    {
    case Symbol::PREFIX:
      {
        const SubExpressionP &arg = args_[0];
        const String text = arg->description();
        const bool parens = arg->is_error() || needs_separation (name, text) ||
                            (arg->is_symbol() && (arg->symbol().kind() == Symbol::INFIX || arg->symbol().kind() == Symbol::POSTFIX));
        return parens ? ename + "(" + text + ")" : ename + text;
      }
    case Symbol::POSTFIX:
      {
        const SubExpressionP &arg = args_[0];
        const String text = arg->description();
        const bool parens = arg->is_error() || needs_separation (text, name) ||
                            (arg->is_symbol() && (arg->symbol().kind() == Symbol::INFIX || arg->symbol().kind() == Symbol::POSTFIX));
        return parens ? "(" + text + ")" + ename : text + ename;
      }
    case Symbol::INFIX:
      if (name == "()" && !args_.empty())
        return subscript_target (args_[0]) + "(" + argument_list (args_, 1) + ")";
      if (args_.size() < 2)
        return ename + "(" + argument_list (args_) + ")";
      if (name == ",")
        return args_[0]->description() + ", " + args_[1]->description();
      if (name == "?:" && args_.size() == 3)
        return args_[0]->description() + " ? " + args_[1]->description() + " : " + args_[2]->description();
      if (name == "[]")
        return subscript_target (args_[0]) + "[" + args_[1]->description() + "]";
      else
        {
          String op, lhs = args_[0]->description(), rhs = args_[1]->description();
          if (is_infix_node (args_[0], &op) && !Scanner::operator_takes_precedence (op, name))
            lhs = "(" + lhs + ")";
          if (is_infix_node (args_[1], &op) && Scanner::operator_takes_precedence (name, op))
            rhs = "(" + rhs + ")";
          return lhs + " " + ename + " " + rhs;
        }
    case Symbol::VARIABLE:
      return ename;
    case Symbol::FUNCTION:
      if (name == "[]")
        return "[" + argument_list (args_) + "]";
      return ename + "(" + argument_list (args_) + ")";
    case Symbol::ARRAY:
      return ename + "[" + argument_list (args_) + "]";
    }
  return ename;
}

void
SubExpression::collect_symbols (SymbolSet &symbols) const
{
  if (type_ != SYMBOL)
    return;
  symbols.insert (symbol_);
  for (const SubExpressionP &arg : args_)
    arg->collect_symbols (symbols);
}

/// The set of all symbols referenced by this node and its children.
SymbolSet
SubExpression::symbols () const
{
  SymbolSet set;
  collect_symbols (set);
  return set;
}

/** Bind evaluators bottom-up and fold constant sub trees.
 * A symbol resolved by @a impure is bound as is and never folded. Otherwise the evaluator
 * from @a pure is bound, and if all arguments are literals, it is called right away and
 * the node is replaced by the resulting literal. Failed calls leave the node unfolded,
 * so the failure is raised again at evaluation time.
 */
SubExpressionP
SubExpression::optimized (const SubExpressionP &node, const SymbolLookup &impure, const SymbolLookup &pure)
{
  if (node->type() != SYMBOL)
    return node;
  vector<SubExpressionP> args;
  args.reserve (node->args().size());
  bool all_literals = true;
  for (const SubExpressionP &arg : node->args())
    {
      args.push_back (optimized (arg, impure, pure));
      all_literals &= args.back()->is_literal();
    }
  SymbolEvaluator evaluator = impure ? impure (node->symbol()) : SymbolEvaluator();
  if (evaluator)
    return new_symbol (node->symbol(), args, evaluator);
  evaluator = pure ? pure (node->symbol()) : SymbolEvaluator();
  if (!evaluator || !all_literals)
    return new_symbol (node->symbol(), args, evaluator);
  vector<double> values;
  values.reserve (args.size());
  for (const SubExpressionP &arg : args)
    values.push_back (arg->value());
  try
    {
      const double result = evaluator (values);
      EVALKIT_KEY_DEBUG ("Fold", "%s -> %s", node->symbol().description(), Scanner::format_number (result));
      return new_literal (result);
    }
  catch (const std::exception &exc)
    {
      EVALKIT_KEY_DEBUG ("Fold", "%s deferred: %s", node->symbol().description(), exc.what());
      return new_symbol (node->symbol(), args, evaluator);
    }
}

} // Evalkit
