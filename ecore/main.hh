// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_MAIN_HH__
#define __EVALKIT_MAIN_HH__

#include <ecore/utilities.hh>

#if !defined __EVALKIT_CORE_HH__ && !defined __EVALKIT_BUILD__
#error Only <evalkit-core.hh> can be included directly.
#endif

namespace Evalkit {

// == Initialization ==
void    init_core               (const String &app_ident, int *argcp, char **argv,
                                 const StringVector &args = StringVector());
bool    init_core_initialized   ();
uint64  init_test_flags         ();
String  program_alias           ();
String  evalkit_version         ();

// == Argument Parsing ==
bool    arg_parse_option        (uint         argc,
                                 char       **argv,
                                 size_t      *i,
                                 const char  *arg);
bool    arg_parse_string_option (uint         argc,
                                 char       **argv,
                                 size_t      *i,
                                 const char  *arg,
                                 const char **strp);
int     arg_parse_collapse      (int         *argcp,
                                 char       **argv);

} // Evalkit

#endif /* __EVALKIT_MAIN_HH__ */
