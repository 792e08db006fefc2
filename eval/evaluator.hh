// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_EVALUATOR_HH__
#define __EVALKIT_EVALUATOR_HH__

#include <eval/expression.hh>
#include <list>

namespace Evalkit {

/** Expression evaluation against a stack of variable maps.
 * Variables are resolved when an expression is evaluated, so changes to the
 * pushed maps are picked up by expressions that were bound earlier. The most
 * recently pushed map takes precedence. Expressions returned by parse_eval()
 * refer to the Evaluator and must not outlive it.
 */
class Evaluator {
public:
  typedef std::vector<String>           ArgumentList; /* elements: key=value */
  typedef std::map<String,String>       VariableMap;
  typedef std::list<const VariableMap*> VariableMapList;
  static String     canonify_name   (const String       &key); /* chars => [A-Za-z0-9_] */
  static bool       split_argument  (const String       &argument,
                                     String             &key,
                                     String             &value);
  static void       populate_map    (VariableMap        &vmap,
                                     const ArgumentList &args);
  static void       populate_map    (VariableMap &vmap, const String &variable_name, const String &variable_value);
  void              push_map        (const VariableMap  &vmap);
  void              pop_map         (const VariableMap  &vmap);
  size_t            n_maps          () const    { return env_maps_.size(); }
  double            lookup          (const String       &variable) const;
  Expression        parse_eval      (const String       &expression) const;
  double            evaluate        (const String       &expression) const;
private:
  bool              find_variable   (const String &variable, double *value) const;
  VariableMapList   env_maps_;
};

} // Evalkit

#endif /* __EVALKIT_EVALUATOR_HH__ */
