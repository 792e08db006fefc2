// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __EVALKIT_CXXAUX_HH__
#define __EVALKIT_CXXAUX_HH__

#include <sys/types.h>                  // uint
#include <stddef.h>
#include <stdint.h>
#include <float.h>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <type_traits>
#include <vector>
#include <map>

// == Arithmetic Macros ==
#define EVALKIT_ABS(a)                  ((a) < 0 ? -(a) : (a))
#define EVALKIT_MIN(a,b)                ((a) <= (b) ? (a) : (b))
#define EVALKIT_MAX(a,b)                ((a) >= (b) ? (a) : (b))
#define EVALKIT_CLAMP(v,mi,ma)          ((v) < (mi) ? (mi) : ((v) > (ma) ? (ma) : (v)))
#define EVALKIT_ARRAY_SIZE(array)       (sizeof (array) / sizeof ((array)[0]))

// == Branch Prediction ==
#define EVALKIT_LIKELY(expr)            __builtin_expect (bool (expr), 1)
#define EVALKIT_UNLIKELY(expr)          __builtin_expect (bool (expr), 0)

// == Preprocessor Helpers ==
#define EVALKIT_CPP_STRINGIFY_(s)       #s
#define EVALKIT_CPP_STRINGIFY(s)        EVALKIT_CPP_STRINGIFY_ (s)      ///< Stringify @a s after macro expansion.
#define EVALKIT_CPP_PASTE2_(a,b)        a ## b
#define EVALKIT_CPP_PASTE2(a,b)         EVALKIT_CPP_PASTE2_ (a,b)       ///< Paste @a a and @a b after macro expansion.
#define EVALKIT_STATIC_ASSERT(expr)     static_assert (expr, #expr)

// == Source Locations ==
#define EVALKIT_PRETTY_FILE             (__FILE__)
#define EVALKIT_STRLOC()                ((::Evalkit::String (EVALKIT_PRETTY_FILE) + ":" EVALKIT_CPP_STRINGIFY (__LINE__)).c_str()) ///< "FILE:LINE"
#define EVALKIT_STRFUNC()               (__FUNCTION__)

// == GCC Attributes ==
#define EVALKIT_PRINTF(fmt_idx, arg_idx)  __attribute__ ((__format__ (__printf__, fmt_idx, arg_idx)))
#define EVALKIT_NORETURN                __attribute__ ((__noreturn__))
#define EVALKIT_CONST                   __attribute__ ((__const__))
#define EVALKIT_NOINLINE                __attribute__ ((noinline))

#ifdef  EVALKIT_CONVENIENCE
#undef  MIN
#undef  MAX
#undef  CLAMP
#undef  ARRAY_SIZE
#define MIN                             EVALKIT_MIN
#define MAX                             EVALKIT_MAX
#define CLAMP                           EVALKIT_CLAMP
#define ARRAY_SIZE                      EVALKIT_ARRAY_SIZE
#define STRLOC                          EVALKIT_STRLOC
#endif // EVALKIT_CONVENIENCE

/**
 * @def EVALKIT_CONVENIENCE
 * Defining EVALKIT_CONVENIENCE before including an Evalkit header provides the
 * unprefixed macro variants, such as MIN(), critical() and assert_return().
 */

namespace Evalkit {

// == Integer Types ==
typedef uint8_t         uint8;
typedef uint16_t        uint16;
typedef uint32_t        uint32;
typedef uint64_t        uint64;         ///< A 64-bit unsigned integer.
typedef int8_t          int8;
typedef int16_t         int16;
typedef int32_t         int32;
typedef int64_t         int64;          ///< A 64-bit signed integer.
typedef uint32_t        unichar;        ///< A Unicode code point.
EVALKIT_STATIC_ASSERT (sizeof (uint) == 4 && sizeof (uint64) == 8 && sizeof (int64) == 8);

// == String Types ==
using   std::map;
using   std::vector;
typedef std::string    String;
typedef vector<String> StringVector;

#define EVALKIT_CLASS_NON_COPYABLE(ClassName)                           \
  /*copy-ctor*/ ClassName  (const ClassName&) = delete;                 \
  ClassName&    operator=  (const ClassName&) = delete

/** Lazily constructed singleton storage that is never destructed.
 * The @a Class instance is placement constructed on first access, so a
 * static DurableInstance can be used from any static constructor or
 * destructor, e.g. for process wide caches and configuration tables.
 */
template<class Class>
class DurableInstance final {
  static_assert (std::is_class<Class>::value, "DurableInstance<> needs a class type");
  Class *instance_;
  alignas (Class) unsigned char storage_[sizeof (Class)];
  Class*
  create () EVALKIT_NOINLINE
  {
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> guard (creation_mutex);
    if (!instance_)
      instance_ = new (storage_) Class();
    return instance_;
  }
public:
  constexpr    DurableInstance () : instance_ (NULL), storage_ {} {}
  Class*       operator->      ()       { return EVALKIT_LIKELY (instance_) ? instance_ : create(); }
  Class&       operator*       ()       { return *operator->(); }
  const Class* operator->      () const { return const_cast<DurableInstance*> (this)->operator->(); }
  const Class& operator*       () const { return *operator->(); }
  explicit     operator bool   () const { return instance_ != NULL; }
};

} // Evalkit

#endif // __EVALKIT_CXXAUX_HH__
