// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "evaluator.hh"

namespace Evalkit {

void
Evaluator::push_map (const VariableMap &vmap)
{
  env_maps_.push_back (&vmap);
}

void
Evaluator::pop_map (const VariableMap &vmap)
{
  if (env_maps_.size() && &vmap == env_maps_.back())
    env_maps_.pop_back();
  else
    critical ("%s: unable to pop map: %p != %p", __func__, &vmap, env_maps_.size() ? env_maps_.back() : NULL);
}

String
Evaluator::canonify_name (const String &key)
{
  String s = key;
  for (uint i = 0; i < s.size(); i++)
    if ((s[i] >= '0' && s[i] <= '9') ||
        (s[i] >= 'A' && s[i] <= 'Z') ||
        (s[i] >= 'a' && s[i] <= 'z') ||
        s[i] == '_')
      continue; // keep char
    else
      s[i] = '_';
  return s;
}

bool
Evaluator::split_argument (const String &argument, String &key, String &value)
{
  const String::size_type e = argument.find ('=');
  if (e == String::npos || e == 0)
    return false;
  key = canonify_name (string_strip (argument.substr (0, e)));
  value = string_strip (argument.substr (e + 1));
  return true;
}

void
Evaluator::populate_map (VariableMap &vmap, const ArgumentList &args)
{
  for (const String &arg : args)
    {
      String key, value;
      if (split_argument (arg, key, value))
        vmap[key] = value;
      else
        critical ("%s: invalid 'key=value' syntax: %s", __func__, arg.c_str());
    }
}

void
Evaluator::populate_map (VariableMap &vmap, const String &variable_name, const String &variable_value)
{
  vmap[canonify_name (variable_name)] = variable_value;
}

/* Find @a variable in the pushed maps, values are converted as C locale numbers,
 * including hexadecimal notation. Throws ExpressionError for values that are not numbers.
 */
bool
Evaluator::find_variable (const String &variable, double *value) const
{
  const String key = canonify_name (variable);
  for (auto it = env_maps_.rbegin(); it != env_maps_.rend(); it++)
    {
      auto cit = (*it)->find (key);
      if (cit == (*it)->end())
        continue;
      const String &v = cit->second;
      const char *end = NULL;
      *value = string_to_cdouble (v.c_str(), &end);
      if (v.empty() || !end || *end != 0)
        throw ExpressionError::message (string_format ("Invalid value for variable %s: %s", variable, string_to_cquote (v)));
      EVALKIT_KEY_DEBUG ("Evaluator", "%s = %s", variable, Scanner::format_number (*value));
      return true;
    }
  return false;
}

/// Resolve @a variable in the pushed maps, throws ExpressionError if it is unknown or not a number.
double
Evaluator::lookup (const String &variable) const
{
  double value = 0;
  if (!find_variable (variable, &value))
    throw ExpressionError::undefined_symbol (Symbol::variable (variable));
  return value;
}

/** Bind @a expression with variables resolved at evaluation time.
 * Variables shadow the builtin constants like pi or true, unknown variables throw when evaluated.
 */
Expression
Evaluator::parse_eval (const String &expression) const
{
  auto impure = [this] (const Symbol &symbol) -> SymbolEvaluator {
    if (symbol.kind() != Symbol::VARIABLE)
      return SymbolEvaluator();
    const String name = symbol.name();
    auto it = Expression::math_symbols().find (symbol);
    SymbolEvaluator builtin = it != Expression::math_symbols().end() ? it->second : SymbolEvaluator();
    it = Expression::bool_symbols().find (symbol);
    if (!builtin && it != Expression::bool_symbols().end())
      builtin = it->second;
    return [this, name, builtin] (const vector<double> &args) -> double {
      double value = 0;
      if (find_variable (name, &value))
        return value;
      if (builtin)
        return builtin (args);
      throw ExpressionError::undefined_symbol (Symbol::variable (name));
    };
  };
  return Expression (Expression::parse (expression), impure);
}

/// Parse, bind and evaluate @a expression, throws ExpressionError.
double
Evaluator::evaluate (const String &expression) const
{
  return parse_eval (expression).evaluate();
}

} // Evalkit
