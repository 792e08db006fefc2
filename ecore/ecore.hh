// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_CORE_HH__
#define __EVALKIT_CORE_HH__

#include <ecore/cxxaux.hh>
#include <ecore/inout.hh>
#include <ecore/main.hh>
#include <ecore/thread.hh>
#include <ecore/unicode.hh>
#include <ecore/utilities.hh>
#include <ecore/strings.hh>

/**
 * @brief The Evalkit namespace encompasses core utilities and the expression engine.
 *
 * The core utilities are available via including <evalkit-core.hh> and
 * the expression engine can be included via <evalkit.hh>.
 */
namespace Evalkit {}

#endif /* __EVALKIT_CORE_HH__ */
