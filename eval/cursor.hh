// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_CURSOR_HH__
#define __EVALKIT_CURSOR_HH__

#include <evalkit-core.hh>
#include <functional>
#include <memory>

namespace Evalkit {

/** Sliceable read position over an immutable code point buffer.
 * A Cursor shares its decoded buffer with all copies and slices, so copying,
 * slicing and backtracking are O(1). The view covers the absolute buffer
 * offsets [start(), end()).
 */
class Cursor {
  typedef std::shared_ptr<const vector<unichar>> BufferP;
  BufferP buffer_;
  size_t  start_, end_;
  explicit          Cursor          (const BufferP &buffer, size_t start, size_t end);
public:
  explicit          Cursor          (const String &utf8 = "");
  bool              empty           () const            { return start_ >= end_; }
  size_t            size            () const            { return end_ - start_; }
  size_t            start           () const            { return start_; }
  size_t            end             () const            { return end_; }
  unichar           first           () const;
  unichar           at              (size_t index) const;
  unichar           pop_first       ();
  void              advance         (size_t n_chars);
  void              reset           (size_t index);
  Cursor            prefix_up_to    (size_t index) const;
  Cursor            suffix_from     (size_t index) const;
  String            string          () const;
  bool              has_prefix      (const String &utf8) const;
  String            scan_character  (const std::function<bool (unichar)> &predicate);
  bool              scan_character  (unichar uc);
  String            scan_characters (const std::function<bool (unichar)> &predicate);
  bool              skip_whitespace ();
  String            scan_to_end_of_token ();
};

} // Evalkit

#endif /* __EVALKIT_CURSOR_HH__ */
