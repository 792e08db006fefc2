// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "cursor.hh"

namespace Evalkit {

static inline bool
is_blank (unichar uc)
{
  return uc == ' ' || uc == '\t' || uc == '\n' || uc == '\r';
}

Cursor::Cursor (const String &utf8) :
  buffer_ (std::make_shared<const vector<unichar>> (utf8_decode (utf8))), start_ (0), end_ (buffer_->size())
{}

Cursor::Cursor (const BufferP &buffer, size_t start, size_t end) :
  buffer_ (buffer), start_ (start), end_ (end)
{}

/// Yields the first code point of the view or 0 if the view is empty.
unichar
Cursor::first () const
{
  return empty() ? 0 : (*buffer_)[start_];
}

/// Yields the code point at absolute buffer offset @a index or 0 outside of the view.
unichar
Cursor::at (size_t index) const
{
  return index >= start_ && index < end_ ? (*buffer_)[index] : 0;
}

unichar
Cursor::pop_first ()
{
  assert_return (!empty(), 0);
  return (*buffer_)[start_++];
}

void
Cursor::advance (size_t n_chars)
{
  start_ = MIN (start_ + n_chars, end_);
}

/// Move the read position back (or forth) to absolute offset @a index.
void
Cursor::reset (size_t index)
{
  assert_return (index <= end_);
  start_ = index;
}

/// A view of the text from start() up to absolute offset @a index.
Cursor
Cursor::prefix_up_to (size_t index) const
{
  return Cursor (buffer_, start_, CLAMP (index, start_, end_));
}

/// A view of the remaining text from absolute offset @a index on.
Cursor
Cursor::suffix_from (size_t index) const
{
  return Cursor (buffer_, MIN (index, end_), end_);
}

String
Cursor::string () const
{
  if (empty())
    return "";
  return utf8_encode (buffer_->data() + start_, end_ - start_);
}

bool
Cursor::has_prefix (const String &utf8) const
{
  const vector<unichar> chars = utf8_decode (utf8);
  if (chars.size() > size())
    return false;
  for (size_t i = 0; i < chars.size(); i++)
    if ((*buffer_)[start_ + i] != chars[i])
      return false;
  return true;
}

/// Consume a single code point matching @a predicate, returns "" if none matched.
String
Cursor::scan_character (const std::function<bool (unichar)> &predicate)
{
  if (empty() || !predicate (first()))
    return "";
  return utf8_encode (pop_first());
}

bool
Cursor::scan_character (unichar uc)
{
  if (empty() || first() != uc)
    return false;
  start_++;
  return true;
}

/// Consume the longest prefix matching @a predicate, returns "" and leaves the cursor unmoved if none matched.
String
Cursor::scan_characters (const std::function<bool (unichar)> &predicate)
{
  size_t i = start_;
  while (i < end_ && predicate ((*buffer_)[i]))
    i++;
  const String result = utf8_encode (buffer_->data() + start_, i - start_);
  start_ = i;
  return result;
}

/// Skips blanks, tabs and line breaks, returns true if any were skipped.
bool
Cursor::skip_whitespace ()
{
  const size_t old = start_;
  while (start_ < end_ && is_blank ((*buffer_)[start_]))
    start_++;
  return start_ > old;
}

/// Consume all text up to the next whitespace, returns "" at the end of input.
String
Cursor::scan_to_end_of_token ()
{
  return scan_characters ([] (unichar uc) { return !is_blank (uc); });
}

} // Evalkit
