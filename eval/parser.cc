// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "parser.hh"

namespace Evalkit {

ParsedExpression::ParsedExpression (const SubExpressionP &root) :
  root_ (root)
{
  assert_return (root_ != NULL);
}

Parser::Parser (Cursor &cursor) :
  cursor_ (cursor),
  max_depth_ (debug_config_int ("parse-max-depth", 256)),
  max_tokens_ (debug_config_int ("parse-max-tokens", 16384)),
  depth_ (0), n_tokens_ (0)
{}

bool
Parser::scan_token (SubExpressionP &token)
{
  if (!Scanner::scan_numeric_literal (cursor_, token) &&
      !Scanner::scan_identifier (cursor_, token) &&
      !Scanner::scan_operator (cursor_, token) &&
      !Scanner::scan_quoted_identifier (cursor_, token))
    return false;
  if (++n_tokens_ > max_tokens_)
    {
      EVALKIT_KEY_DEBUG ("Parser", "token limit exceeded: %lld", (long long) max_tokens_);
      throw ExpressionError::message (string_format ("Expression exceeds %lld tokens", (long long) max_tokens_));
    }
  return true;
}

/* Reduce the token stack from index i on. Each reduction restarts at the
 * stack bottom, so operators are combined in order of their precedence.
 * A chain of n right associative operators such as `a = b = c ...` thus
 * takes O(n^2) steps, parse-max-tokens bounds n.
 */
void
Parser::collapse_stack (vector<SubExpressionP> &stack, size_t i)
{
  for (;;)
    {
      if (stack.size() <= i + 1)
        return;
      const SubExpressionP lhs = stack[i], rhs = stack[i + 1];
      if (lhs->is_operand())
        {
          if (rhs->is_operand())
            {
              // two adjacent operands are only valid if the first one ends with a postfix operator
              if (!lhs->is_symbol() || lhs->symbol().kind() != Symbol::POSTFIX)
                throw ExpressionError::unexpected_token (rhs->description());
              stack[i] = lhs->args()[0];
              stack.insert (stack.begin() + i + 1, SubExpression::new_symbol (Symbol::infix (lhs->symbol().name())));
              continue;
            }
          if (rhs->is_error())
            throw rhs->error();
          const String &name = rhs->symbol().name();
          if (stack.size() <= i + 2 || rhs->symbol().kind() == Symbol::POSTFIX)
            {
              stack[i] = SubExpression::new_symbol (Symbol::postfix (name), { lhs });
              stack.erase (stack.begin() + i + 1);
              i = 0;
              continue;
            }
          const SubExpressionP rhs2 = stack[i + 2];
          if (rhs2->is_operand())
            {
              if (stack.size() > i + 3)
                {
                  const SubExpressionP &next = stack[i + 3];
                  if (!next->is_bare_infix() || !Scanner::operator_takes_precedence (name, next->symbol().name()))
                    {
                      i = i + 2;
                      continue;
                    }
                }
              SubExpressionP node;
              if (name == ":" && lhs->is_symbol() && lhs->symbol().is_infix ("?") && lhs->args().size() == 2)
                node = SubExpression::new_symbol (Symbol::infix ("?:"), { lhs->args()[0], lhs->args()[1], rhs2 });
              else
                node = SubExpression::new_symbol (Symbol::infix (name), { lhs, rhs2 });
              stack[i] = node;
              stack.erase (stack.begin() + i + 1, stack.begin() + i + 3);
              i = 0;
              continue;
            }
          if (rhs2->is_error())
            throw rhs2->error();
          if (rhs2->symbol().kind() == Symbol::PREFIX)
            i = i + 2;
          else if (name == "+" || name == "/" || name == "*")
            {
              // infix operator followed by a nested prefix operator
              stack[i + 2] = SubExpression::new_symbol (Symbol::prefix (rhs2->symbol().name()));
              i = i + 2;
            }
          else
            stack[i + 1] = SubExpression::new_symbol (Symbol::postfix (name));
          continue;
        }
      if (lhs->is_error())
        throw lhs->error();
      // lhs is an operator without operands, so it must be a prefix operator
      if (rhs->is_operand())
        {
          stack[i] = SubExpression::new_symbol (Symbol::prefix (lhs->symbol().name()), { rhs });
          stack.erase (stack.begin() + i + 1);
          i = 0;
        }
      else if (rhs->is_error())
        throw rhs->error();
      else
        i = i + 1;
    }
}

vector<SubExpressionP>
Parser::scan_arguments (unichar delimiter)
{
  vector<SubExpressionP> args;
  const String closing = utf8_encode (delimiter);
  if (cursor_.first() != delimiter)
    {
      const StringVector delimiters = { ",", closing };
      do
        {
          try
            {
              args.push_back (parse_sub_expression (delimiters));
            }
          catch (const ExpressionError &error)
            {
              if (!error.is_empty_expression())
                throw;
              if (!cursor_.empty()) // empty argument slot
                throw ExpressionError::unexpected_token (utf8_encode (cursor_.pop_first()));
            }
        }
      while (cursor_.scan_character (','));
    }
  if (!cursor_.scan_character (delimiter))
    throw ExpressionError::missing_delimiter (closing);
  return args;
}

/** Parse tokens up to one of @a delimiters or the end of input.
 * The delimiter is not consumed. Structural errors are thrown as ExpressionError.
 */
SubExpressionP
Parser::parse_sub_expression (const StringVector &delimiters)
{
  struct DepthScope {
    int64 &depth;
    ~DepthScope () { depth--; }
  } depth_scope = { ++depth_ };
  if (depth_ > max_depth_)
    {
      EVALKIT_KEY_DEBUG ("Parser", "nesting limit exceeded: %lld", (long long) max_depth_);
      throw ExpressionError::message (string_format ("Expression nesting exceeds %lld levels", (long long) max_depth_));
    }
  vector<SubExpressionP> stack;
  cursor_.skip_whitespace();
  bool operand_position = true, preceded_by_whitespace = true;
  SubExpressionP token;
  while (!Scanner::match_delimiter (cursor_, delimiters) && scan_token (token))
    {
      bool followed_by_whitespace = cursor_.skip_whitespace() || cursor_.empty();
      if (token->is_bare_infix())
        {
          const String &name = token->symbol().name();
          const SubExpressionP last = stack.empty() ? SubExpressionP() : stack.back();
          const bool after_variable = last && last->is_symbol() && last->symbol().kind() == Symbol::VARIABLE;
          if (name == "(")
            {
              if (after_variable)
                {
                  const vector<SubExpressionP> args = scan_arguments (')');
                  stack.back() = SubExpression::new_symbol (Symbol::function (last->symbol().name(), Arity::exactly (int (args.size()))), args);
                }
              else if (last && last->is_operand())
                {
                  vector<SubExpressionP> args = scan_arguments (')');
                  args.insert (args.begin(), last);
                  stack.back() = SubExpression::new_symbol (Symbol::infix ("()"), args);
                }
              else
                {
                  stack.push_back (parse_sub_expression ({ ")" }));
                  if (!cursor_.scan_character (')'))
                    throw ExpressionError::missing_delimiter (")");
                }
              operand_position = false;
              followed_by_whitespace = cursor_.skip_whitespace();
            }
          else if (name == ",")
            {
              if (last && last->is_bare_infix())
                stack.back() = SubExpression::new_symbol (Symbol::postfix (last->symbol().name()));
              stack.push_back (token);
              operand_position = true;
              followed_by_whitespace = cursor_.skip_whitespace();
            }
          else if (name == "[")
            {
              const vector<SubExpressionP> args = scan_arguments (']');
              if (after_variable)
                {
                  if (args.size() != 1)
                    throw ExpressionError::arity_mismatch (Symbol::array (last->symbol().name()));
                  stack.back() = SubExpression::new_symbol (Symbol::array (last->symbol().name()), args);
                }
              else if (last && last->is_operand())
                {
                  if (args.size() != 1)
                    throw ExpressionError::arity_mismatch (Symbol::infix ("[]"));
                  stack.back() = SubExpression::new_symbol (Symbol::infix ("[]"), { last, args[0] });
                }
              else
                stack.push_back (SubExpression::new_symbol (Symbol::function ("[]", Arity::exactly (int (args.size()))), args));
              operand_position = false;
              followed_by_whitespace = cursor_.skip_whitespace();
            }
          else
            {
              // classify by whitespace adjacency
              if (preceded_by_whitespace == followed_by_whitespace)
                stack.push_back (token);
              else if (preceded_by_whitespace)
                stack.push_back (SubExpression::new_symbol (Symbol::prefix (name)));
              else
                stack.push_back (SubExpression::new_symbol (Symbol::postfix (name)));
              operand_position = true;
            }
        }
      else if (token->is_symbol() && token->symbol().kind() == Symbol::VARIABLE && !operand_position)
        {
          // identifier used as operator, e.g. `a and b`
          stack.push_back (SubExpression::new_symbol (Symbol::infix (token->symbol().name())));
          operand_position = true;
        }
      else
        {
          stack.push_back (token);
          operand_position = false;
        }
      preceded_by_whitespace = followed_by_whitespace;
    }
  const size_t start = cursor_.start();
  if (!Scanner::match_delimiter (cursor_, delimiters))
    {
      const String junk = cursor_.scan_to_end_of_token();
      if (!junk.empty())
        {
          cursor_.reset (start);
          throw ExpressionError::unexpected_token (junk);
        }
    }
  collapse_stack (stack, 0);
  if (stack.empty())
    throw ExpressionError::empty_expression();
  const SubExpressionP result = stack[0];
  if (result->is_error())
    throw result->error();
  if (!result->is_operand())
    throw ExpressionError::unexpected_token (result->description());
  return result;
}

/// Parse from @a cursor, a structural error yields an error leaf holding the text consumed so far.
ParsedExpression
Parser::parse (Cursor &cursor, const StringVector &delimiters)
{
  const Cursor start = cursor;
  try
    {
      return parse_strict (cursor, delimiters);
    }
  catch (const ExpressionError &error)
    {
      const String source = start.prefix_up_to (cursor.start()).string();
      EVALKIT_KEY_DEBUG ("Parser", "%s: %s", string_to_cquote (source), error.description());
      return ParsedExpression (SubExpression::new_error (error, source));
    }
}

/// Parse from @a cursor and throw ExpressionError for invalid input.
ParsedExpression
Parser::parse_strict (Cursor &cursor, const StringVector &delimiters)
{
  Parser parser (cursor);
  return ParsedExpression (parser.parse_sub_expression (delimiters));
}

ExpressionCache::ExpressionCache () :
  parse_count_ (0)
{}

/// Yield the cached tree for @a source, parsing and storing it on a miss.
ParsedExpression
ExpressionCache::parse (const String &source)
{
  ScopedLock<Mutex> locker (mutex_);
  auto it = map_.find (source);
  if (it != map_.end())
    return ParsedExpression (it->second);
  locker.unlock(); // allow concurrent parsing, the last store wins
  Cursor cursor (source);
  const ParsedExpression parsed = Parser::parse (cursor);
  locker.lock();
  parse_count_++;
  map_[source] = parsed.root();
  EVALKIT_KEY_DEBUG ("Parser", "cached: %s", string_to_cquote (source));
  return parsed;
}

bool
ExpressionCache::contains (const String &source)
{
  ScopedLock<Mutex> locker (mutex_);
  return map_.find (source) != map_.end();
}

void
ExpressionCache::clear ()
{
  ScopedLock<Mutex> locker (mutex_);
  map_.clear();
}

void
ExpressionCache::clear (const String &source)
{
  ScopedLock<Mutex> locker (mutex_);
  map_.erase (source);
}

size_t
ExpressionCache::size ()
{
  ScopedLock<Mutex> locker (mutex_);
  return map_.size();
}

/// Number of parser runs performed for cache misses.
uint64
ExpressionCache::parse_count ()
{
  ScopedLock<Mutex> locker (mutex_);
  return parse_count_;
}

static DurableInstance<ExpressionCache> shared_expression_cache;

/// The process wide cache used by Expression::parse().
ExpressionCache&
ExpressionCache::shared ()
{
  return *shared_expression_cache;
}

} // Evalkit
