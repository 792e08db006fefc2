// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "symbol.hh"
#include "scanner.hh"

namespace Evalkit {

String
Arity::description () const
{
  return string_format ("%s%d argument%s", at_least_ ? "at least " : "", count_, count_ == 1 ? "" : "s");
}

bool
Arity::operator== (const Arity &other) const
{
  if (at_least_ == other.at_least_)
    return count_ == other.count_;
  if (at_least_)
    return other.count_ >= count_;
  return count_ >= other.count_;
}

Symbol::Symbol () :
  kind_ (VARIABLE)
{}

Symbol::Symbol (Kind kind, const String &name, Arity arity) :
  kind_ (kind), name_ (name), arity_ (arity)
{}

/// The name in the notation accepted by the parser, quoted names get their escapes restored.
String
Symbol::escaped_name () const
{
  return Scanner::escape_identifier (name_);
}

String
Symbol::description () const
{
  const String ename = escaped_name();
  switch (kind_)
    {
    case VARIABLE:      return "variable " + ename;
    case INFIX:
      if (name_ == "?:")
        return "ternary operator " + ename;
      if (name_ == "[]")
        return "subscript operator " + ename;
      if (name_ == "()")
        return "function call operator " + ename;
      return "infix operator " + ename;
    case PREFIX:        return "prefix operator " + ename;
    case POSTFIX:       return "postfix operator " + ename;
    case FUNCTION:      return "function " + ename + "()";
    case ARRAY:         return "array " + ename + "[]";
    }
  return ename; // silence compiler
}

/// Symbols match by kind and name, function symbols also need matching arities.
bool
Symbol::operator== (const Symbol &other) const
{
  if (kind_ != other.kind_ || name_ != other.name_)
    return false;
  if (kind_ == FUNCTION)
    return arity_ == other.arity_;
  return true;
}

} // Evalkit
