/**
 * @file evalkit.hh
 * @brief Header file to use the Evalkit expression engine.
 *
 * Including this will include all parts of the Evalkit namespace, if
 * only the core parts are needed, see <evalkit-core.hh>.
 *
 * This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
 */
#include <eval/eval.hh>
