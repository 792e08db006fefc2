// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <evalkit.hh>
#include <iostream>
#include <algorithm>

#include <string.h>
#include <stdlib.h>

namespace {
using namespace Evalkit;

static void
help_usage (bool usage_error)
{
  const char *usage = "Usage: evalrun [OPTIONS] [EXPRESSION...]";
  if (usage_error)
    {
      printerr ("%s\n", usage);
      printerr ("Try 'evalrun --help' for more information.\n");
      exit (1);
    }
  printout ("%s\n", usage);
  /*         12345678901234567890123456789012345678901234567890123456789012345678901234567890 */
  printout ("Evaluate arithmetic expressions and print their values.\n");
  printout ("Expressions are taken from the command line, or read line by line\n");
  printout ("from standard input if none are given.\n");
  printout ("\n");
  printout ("Options:\n");
  printout ("  --bool                        Enable true, false and the boolean operators.\n");
  printout ("  --no-optimize                 Disable constant folding.\n");
  printout ("  --pure                        Treat definitions as constants that get folded.\n");
  printout ("  --describe                    Print the bound expression before its value.\n");
  printout ("  --symbols                     List the symbols an expression refers to.\n");
  printout ("  -D name=value                 Define a variable, value may be an expression.\n");
  printout ("  -h, --help                    Display this help and exit.\n");
  printout ("  -v, --version                 Display version and exit.\n");
}

static uint   expression_options = Expression::NONE;
static bool   pure_definitions = false;
static bool   describe_expressions = false;
static bool   list_symbols = false;
static Expression::ConstantMap definitions;

static void
define_variable (const char *argument)
{
  const char *equal = strchr (argument, '=');
  const String key = equal ? string_strip (String (argument, equal - argument)) : "";
  if (!Expression::is_valid_identifier (key))
    {
      printerr ("evalrun: invalid definition: %s\n", argument);
      help_usage (true);
    }
  try
    {
      definitions[key] = Expression (equal + 1, expression_options | Expression::BOOL_SYMBOLS, definitions).evaluate();
    }
  catch (const ExpressionError &error)
    {
      printerr ("evalrun: %s: %s\n", key, error.description());
      exit (1);
    }
}

static void
parse_args (int    *argc_p,
            char ***argv_p)
{
  char **argv = *argv_p;
  uint argc = *argc_p;
  StringVector defines;
  for (size_t i = 1; i < argc; i++)
    {
      const char *str = NULL;
      if (arg_parse_option (argc, argv, &i, "--bool"))
        expression_options |= Expression::BOOL_SYMBOLS;
      else if (arg_parse_option (argc, argv, &i, "--no-optimize"))
        expression_options |= Expression::NO_OPTIMIZE;
      else if (arg_parse_option (argc, argv, &i, "--pure"))
        pure_definitions = true;
      else if (arg_parse_option (argc, argv, &i, "--describe"))
        describe_expressions = true;
      else if (arg_parse_option (argc, argv, &i, "--symbols"))
        list_symbols = true;
      else if (strcmp (argv[i], "-D") == 0 && i + 1 >= argc)
        help_usage (true);
      else if (arg_parse_string_option (argc, argv, &i, "-D", &str))
        defines.push_back (str);
      else if (strcmp (argv[i], "--help") == 0 || strcmp (argv[i], "-h") == 0)
        {
          help_usage (false);
          exit (0);
        }
      else if (strcmp (argv[i], "--version") == 0 || strcmp (argv[i], "-v") == 0)
        {
          printout ("evalrun (Evalkit utilities) %s\n", evalkit_version());
          printout ("This is free software and comes with ABSOLUTELY NO WARRANTY; see\n");
          printout ("the source for copying conditions.\n");
          exit (0);
        }
      else if (argv[i][0] == '-' && argv[i][1] == '-' && argv[i][2])
        {
          printerr ("evalrun: unknown option: %s\n", argv[i]);
          help_usage (true);
        }
    }
  arg_parse_collapse (argc_p, argv);
  // definitions are evaluated once all options are known
  for (const String &d : defines)
    define_variable (d.c_str());
}

static bool
evaluate_line (const String &source)
{
  Expression::SymbolMap symbols;
  Expression::ConstantMap constants;
  if (pure_definitions)
    constants = definitions;
  else
    for (const auto &def : definitions)
      {
        const double value = def.second;
        symbols[Symbol::variable (def.first)] = [value] (const vector<double>&) { return value; };
      }
  const Expression expression (source, expression_options, constants, Expression::ArrayMap(), symbols);
  if (describe_expressions)
    printout ("%s\n", expression.description());
  if (list_symbols)
    {
      StringVector names;
      for (const Symbol &symbol : expression.symbols())
        names.push_back (symbol.description());
      std::sort (names.begin(), names.end());
      for (const String &name : names)
        printout ("  %s\n", name);
    }
  try
    {
      printout ("%s\n", Scanner::format_number (expression.evaluate()));
      return true;
    }
  catch (const ExpressionError &error)
    {
      printerr ("evalrun: %s: %s\n", string_strip (source), error.description());
      return false;
    }
}

} // Anon

int
main (int   argc,
      char *argv[])
{
  init_core ("evalrun", &argc, argv);
  parse_args (&argc, &argv);
  bool success = true;
  if (argc > 1)
    for (int i = 1; i < argc; i++)
      success &= evaluate_line (argv[i]);
  else
    {
      String line;
      while (std::getline (std::cin, line))
        if (!string_strip (line).empty())
          success &= evaluate_line (line);
    }
  return success ? 0 : 1;
}
