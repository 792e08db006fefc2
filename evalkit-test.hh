/**
 * @file evalkit-test.hh
 * @brief Header file to include unit test parts of the Evalkit namespace.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <ecore/testutils.hh>
