// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "exprerror.hh"
#include "scanner.hh"
#include <cctype>

namespace Evalkit {

ExpressionError::ExpressionError (Kind kind, const String &text, const Symbol &symbol, double index) :
  kind_ (kind), text_ (text), symbol_ (symbol), index_ (index)
{
  what_ = description();
}

ExpressionError
ExpressionError::message (const String &text)
{
  return ExpressionError (MESSAGE, text, Symbol(), 0);
}

ExpressionError
ExpressionError::unexpected_token (const String &token)
{
  return ExpressionError (UNEXPECTED_TOKEN, token, Symbol(), 0);
}

ExpressionError
ExpressionError::missing_delimiter (const String &delimiter)
{
  return ExpressionError (MISSING_DELIMITER, delimiter, Symbol(), 0);
}

ExpressionError
ExpressionError::undefined_symbol (const Symbol &symbol)
{
  return ExpressionError (UNDEFINED_SYMBOL, "", symbol, 0);
}

ExpressionError
ExpressionError::arity_mismatch (const Symbol &symbol)
{
  return ExpressionError (ARITY_MISMATCH, "", symbol, 0);
}

ExpressionError
ExpressionError::array_bounds (const Symbol &symbol, double index)
{
  return ExpressionError (ARRAY_BOUNDS, "", symbol, index);
}

// Arity a symbol of the given kind expects when called with the wrong argument count.
static Arity
required_arity (const Symbol &symbol)
{
  switch (symbol.kind())
    {
    case Symbol::FUNCTION:      return symbol.arity();
    case Symbol::INFIX:
      if (symbol.name() == "()")
        return Arity::at_least (1);
      if (symbol.name() == "[]")
        return 1;
      if (symbol.name() == "?:")
        return 3;
      return 2;
    case Symbol::ARRAY:
    case Symbol::PREFIX:
    case Symbol::POSTFIX:       return 1;
    case Symbol::VARIABLE:      return 0;
    }
  return 0;
}

String
ExpressionError::description () const
{
  switch (kind_)
    {
    case MESSAGE:
      return text_;
    case UNEXPECTED_TOKEN:
      if (text_.empty())
        return "Empty expression";
      return "Unexpected token `" + text_ + "`";
    case MISSING_DELIMITER:
      return "Missing `" + text_ + "`";
    case UNDEFINED_SYMBOL:
      return "Undefined " + symbol_.description();
    case ARITY_MISMATCH:
      {
        String what = symbol_.description();
        what[0] = toupper (what[0]);
        return what + " expects " + required_arity (symbol_).description();
      }
    case ARRAY_BOUNDS:
      return "Index " + Scanner::format_number (index_) + " out of bounds for " + symbol_.description();
    }
  return text_;
}

const char*
ExpressionError::what () const noexcept
{
  return what_.c_str();
}

bool
ExpressionError::operator== (const ExpressionError &other) const
{
  if (kind_ != other.kind_)
    return false;
  switch (kind_)
    {
    case MESSAGE:
    case UNEXPECTED_TOKEN:
    case MISSING_DELIMITER:
      return text_ == other.text_;
    case UNDEFINED_SYMBOL:
    case ARITY_MISMATCH:
      return symbol_ == other.symbol_;
    case ARRAY_BOUNDS:
      return symbol_ == other.symbol_ && index_ == other.index_;
    }
  return false;
}

} // Evalkit
