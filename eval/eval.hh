// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_EVAL_HH__
#define __EVALKIT_EVAL_HH__

#include <evalkit-core.hh>
#include <eval/cursor.hh>
#include <eval/symbol.hh>
#include <eval/exprerror.hh>
#include <eval/subexpr.hh>
#include <eval/scanner.hh>
#include <eval/parser.hh>
#include <eval/expression.hh>
#include <eval/evaluator.hh>

#endif /* __EVALKIT_EVAL_HH__ */
