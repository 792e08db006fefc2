// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_SYMBOL_HH__
#define __EVALKIT_SYMBOL_HH__

#include <evalkit-core.hh>
#include <functional>
#include <unordered_set>

namespace Evalkit {

/** Number of arguments accepted by a function symbol.
 * An Arity is either an exact count or a minimum count. Comparing an exact
 * arity with a minimum yields true if the exact count satisfies the minimum,
 * so a variadic declaration matches every call site with enough arguments.
 */
class Arity {
  int  count_;
  bool at_least_;
  constexpr Arity (int count, bool at_least) : count_ (count), at_least_ (at_least) {}
public:
  /*implicit*/ constexpr Arity (int count = 0) : count_ (count), at_least_ (false) {}
  static constexpr Arity exactly  (int count)     { return Arity (count, false); }
  static constexpr Arity at_least (int count)     { return Arity (count, true); }
  static constexpr Arity any      ()              { return Arity (0, true); }
  int                    count    () const        { return count_; }
  bool                   is_exact () const        { return !at_least_; }
  String                 description () const;
  bool                   operator== (const Arity &other) const;
  bool                   operator!= (const Arity &other) const { return !operator== (other); }
};

/// Named element of an expression: variable, operator, function or array.
class Symbol {
public:
  enum Kind { VARIABLE, INFIX, PREFIX, POSTFIX, FUNCTION, ARRAY };
private:
  Kind   kind_;
  String name_;
  Arity  arity_;
  explicit      Symbol          (Kind kind, const String &name, Arity arity = Arity());
public:
  explicit      Symbol          ();
  static Symbol variable        (const String &name)    { return Symbol (VARIABLE, name); }
  static Symbol infix           (const String &name)    { return Symbol (INFIX, name); }
  static Symbol prefix          (const String &name)    { return Symbol (PREFIX, name); }
  static Symbol postfix         (const String &name)    { return Symbol (POSTFIX, name); }
  static Symbol function        (const String &name, Arity arity = Arity::any()) { return Symbol (FUNCTION, name, arity); }
  static Symbol array           (const String &name)    { return Symbol (ARRAY, name); }
  Kind          kind            () const                { return kind_; }
  const String& name            () const                { return name_; }
  Arity         arity           () const                { return arity_; }
  /// Operator kinds are infix, prefix and postfix.
  bool          is_operator     () const                { return kind_ == INFIX || kind_ == PREFIX || kind_ == POSTFIX; }
  bool          is_infix        (const String &name) const { return kind_ == INFIX && name_ == name; }
  String        escaped_name    () const;
  String        description     () const;
  bool          operator==      (const Symbol &other) const;
  bool          operator!=      (const Symbol &other) const { return !operator== (other); }
};

} // Evalkit

namespace std {
template<>
struct hash<::Evalkit::Symbol> {
  size_t
  operator() (const ::Evalkit::Symbol &symbol) const
  {
    return hash<::Evalkit::String>() (symbol.name());
  }
};
} // std

namespace Evalkit {
typedef std::unordered_set<Symbol> SymbolSet;
} // Evalkit

#endif /* __EVALKIT_SYMBOL_HH__ */
