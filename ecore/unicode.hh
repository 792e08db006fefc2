// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_UNICODE_HH__
#define __EVALKIT_UNICODE_HH__

#include <ecore/utilities.hh>

namespace Evalkit {

namespace Unicode {
bool    isvalid         (unichar uc) EVALKIT_CONST;     ///< Scalar value check, excludes surrogates and values above U+10FFFF.
} // Unicode

vector<unichar> utf8_decode     (const String &string);
String          utf8_encode     (const unichar *chars, size_t n_chars);
String          utf8_encode     (unichar uc);

} // Evalkit

#endif /* __EVALKIT_UNICODE_HH__ */
