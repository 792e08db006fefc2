// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <evalkit-test.hh>
#include <thread>
using namespace Evalkit;

namespace {

static void
test_mutex ()
{
  static Mutex static_mutex;    // usable without dynamic initialization
  TASSERT (static_mutex.try_lock());
  TASSERT (!static_mutex.try_lock());
  static_mutex.unlock();
  Mutex mutex;
  {
    ScopedLock<Mutex> locker (mutex);
    TASSERT (!mutex.try_lock());
    locker.unlock();
    TASSERT (mutex.try_lock());         // released while unlocked
    mutex.unlock();
    locker.lock();
    TASSERT (!mutex.try_lock());
  }
  TASSERT (mutex.try_lock());           // released by the destructor
  mutex.unlock();
  {
    ScopedLock<Mutex> locker (mutex);
    locker.unlock();                    // left unlocked at scope exit
  }
  TASSERT (mutex.try_lock());
  mutex.unlock();
}
REGISTER_TEST ("Threads/Mutex", test_mutex);

struct Tally {
  Mutex  mutex;
  uint64 count = 0;
};

static void
add_to_tally (Tally *tally, int rounds)
{
  for (int i = 0; i < rounds; i++)
    {
      ScopedLock<Mutex> locker (tally->mutex);
      locker.unlock();
      locker.lock();
      tally->count++;
    }
}

static void
test_concurrent_locking ()
{
  Tally tally;
  const int n_threads = 4, rounds = 20000;
  vector<std::thread> threads;
  for (int i = 0; i < n_threads; i++)
    threads.push_back (std::thread (add_to_tally, &tally, rounds));
  for (std::thread &thread : threads)
    thread.join();
  TCMP (tally.count, ==, uint64 (n_threads * rounds));
}
REGISTER_TEST ("Threads/Concurrent Locking", test_concurrent_locking);

struct Registry {
  static int constructions;
  vector<String> names;
  Registry () { constructions++; }
};
int Registry::constructions = 0;

static DurableInstance<Registry> durable_registry;
static const bool registered_early = (durable_registry->names.push_back ("early"), true);

static void
test_durable_instance ()
{
  TASSERT (registered_early);
  TASSERT (durable_registry);
  TCMP (durable_registry->names.size(), ==, 1u);
  TCMP ((*durable_registry).names[0], ==, "early");
  static DurableInstance<Registry> lazy_registry;
  TASSERT (!lazy_registry);
  vector<std::thread> threads;
  for (int i = 0; i < 4; i++)
    threads.push_back (std::thread ([] () { (void) lazy_registry->names.empty(); }));
  for (std::thread &thread : threads)
    thread.join();
  TASSERT (lazy_registry);
  TCMP (Registry::constructions, ==, 2);
}
REGISTER_TEST ("Threads/Durable Instance", test_durable_instance);

static void
test_concurrent_debug_config ()
{
  vector<std::thread> threads;
  for (int t = 0; t < 4; t++)
    threads.push_back (std::thread ([t] () {
          const String key = string_format ("evalkit-thread-key-%d", t);
          for (int i = 0; i < 500; i++)
            {
              debug_config_add (key + "=" + string_from_int (i));
              if (debug_config_int (key, -1) != i)
                fatal ("%s: lost update %d", key, i);
            }
          debug_config_del (key);
        }));
  for (std::thread &thread : threads)
    thread.join();
  for (int t = 0; t < 4; t++)
    TCMP (debug_config_get (string_format ("evalkit-thread-key-%d", t), "gone"), ==, "gone");
}
REGISTER_TEST ("Threads/Concurrent Debug Configuration", test_concurrent_debug_config);

} // Anon
