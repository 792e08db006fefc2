/**
 * @file evalkit-core.hh
 * @brief Header file to use the Evalkit core utilities.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <ecore/ecore.hh>
