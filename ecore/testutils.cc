// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "testutils.hh"
#include <algorithm>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#define TDEBUG(...)     EVALKIT_KEY_DEBUG ("Test", __VA_ARGS__)

namespace Evalkit {

/** Initialize the Evalkit core for a test program.
 * Same as init_core() with the "testing=1" setting, which makes criticals fatal
 * and enables the --test-verbose and --test-slow options and $EVALKIT_TEST.
 */
void
init_core_test (const String &app_ident, int *argcp, char **argv, const StringVector &args)
{
  StringVector settings = { "testing=1" };
  settings.insert (settings.end(), args.begin(), args.end());
  init_core (app_ident, argcp, argv, settings);
}

/// Utilities for unit tests, available through <evalkit-test.hh>.
namespace Test {

bool
verbose ()
{
  return init_test_flags() & MODE_VERBOSE;
}

bool
slow ()
{
  return init_test_flags() & MODE_SLOW;
}

// == Output ==
static String pending_start;    // TSTART() line, completed by TDONE()

void
test_output (OutputKind kind, const String &message)
{
  String out;
  switch (kind)
    {
    case OUTPUT_START:
      if (verbose())
        out = "# Test:  " + message + " ...\n";
      else
        pending_start = "  TEST   " + message + ":" + String (63 - MIN (size_t (63), message.size()), ' ');
      break;
    case OUTPUT_DONE:
      out = pending_start + "OK\n";
      pending_start.clear();
      break;
    case OUTPUT_INFO:
      if (verbose())
        out = message + (message.empty() || message.back() != '\n' ? "\n" : "");
      break;
    }
  if (!out.empty())
    Lib::printerr_string (out);
}

void
assertion_failed (const char *file, int line, const char *message)
{
  const String where = file ? string_format ("%s:%d:", file, line) : program_alias() + ":";
  if (!pending_start.empty())
    Lib::printerr_string (pending_start + "FAIL\n");
  Lib::printerr_string (string_format ("%s assertion failed: %s\n", where, message));
  breakpoint();
}

// == Timer ==
Timer::Timer (double deadline_in_secs) :
  deadline_ (deadline_in_secs > 0 ? deadline_in_secs : 0.005), elapsed_ (0), batch_ (0), calls_ (0)
{}

int64
Timer::next_batch ()
{
  if (elapsed_ >= deadline_ && (samples_.size() >= 7 || elapsed_ >= deadline_ * 4))
    return 0;
  if (samples_.size() < 7 || elapsed_ >= deadline_ * 0.1)
    batch_ += 1;
  else
    batch_ *= 2;        // grow quickly while far below the deadline
  return batch_;
}

double
Timer::min_elapsed () const
{
  if (samples_.empty())
    return calls_ ? elapsed_ / calls_ : 0;
  return *std::min_element (samples_.begin(), samples_.end());
}

// == Registry ==
struct TestEntry {
  String  name;
  char    kind;
  void  (*func) ();
};
static DurableInstance<vector<TestEntry>> test_entries;

RegisterTest::RegisterTest (char kind, const char *testname, void (*test_func) ())
{
  test_entries->push_back (TestEntry { testname, kind, test_func });
}

/// Run the regular tests, or the slow tests if slow mode is enabled, in name order.
int
run ()
{
  vector<TestEntry> entries = *test_entries;
  std::stable_sort (entries.begin(), entries.end(), [] (const TestEntry &a, const TestEntry &b) {
      return strverscmp (a.name.c_str(), b.name.c_str()) < 0;
    });
  const char kind = slow() ? 's' : 't';
  size_t n_run = 0;
  for (const TestEntry &entry : entries)
    if (entry.kind == kind)
      {
        TSTART ("%s", entry.name);
        entry.func();
        TDONE();
        n_run++;
      }
  TDEBUG ("ran %zu of %zu tests", n_run, entries.size());
  return 0;
}

// == Test Traps ==
static pid_t  trap_pid = 0;
static int    trap_status = 0;
static bool   trap_timeout = false;
static String trap_out, trap_err;

static void
child_redirect (int pipefd, int target)
{
  while (dup2 (pipefd, target) < 0)
    if (errno != EINTR)
      fatal ("failed to redirect test child output: %s", strerror (errno));
  close (pipefd);
}

bool
trap_fork (uint64 usec_timeout, bool silent)
{
  int outpipe[2], errpipe[2];
  if (pipe (outpipe) < 0 || pipe (errpipe) < 0)
    fatal ("failed to create pipes for test child: %s", strerror (errno));
  fflush (stdout);
  fflush (stderr);
  trap_pid = fork();
  if (trap_pid < 0)
    fatal ("failed to fork test child: %s", strerror (errno));
  if (trap_pid == 0)
    {
      close (outpipe[0]);
      close (errpipe[0]);
      child_redirect (outpipe[1], 1);
      child_redirect (errpipe[1], 2);
      const int devnull = open ("/dev/null", O_RDONLY);
      if (devnull >= 0)
        child_redirect (devnull, 0);
      return true;
    }
  close (outpipe[1]);
  close (errpipe[1]);
  trap_out.clear();
  trap_err.clear();
  trap_timeout = false;
  struct pollfd fds[2] = { { outpipe[0], POLLIN, 0 }, { errpipe[0], POLLIN, 0 } };
  String *sinks[2] = { &trap_out, &trap_err };
  const uint64 deadline = timestamp_realtime() + usec_timeout;
  int n_open = 2;
  while (n_open && !trap_timeout)
    {
      const int ret = poll (fds, 2, 100);
      if (ret < 0 && errno != EINTR)
        fatal ("failed to poll test child output: %s", strerror (errno));
      for (size_t i = 0; ret > 0 && i < 2; i++)
        if (fds[i].fd >= 0 && fds[i].revents)
          {
            char buffer[4096];
            const ssize_t n = read (fds[i].fd, buffer, sizeof (buffer));
            if (n > 0)
              sinks[i]->append (buffer, n);
            else if (n == 0 || errno != EINTR)
              {
                close (fds[i].fd);
                fds[i].fd = -1;     // ignored by poll()
                n_open--;
              }
          }
      trap_timeout = usec_timeout && timestamp_realtime() > deadline;
    }
  for (size_t i = 0; i < 2; i++)
    if (fds[i].fd >= 0)
      close (fds[i].fd);
  if (trap_timeout)
    kill (trap_pid, SIGKILL);
  while (waitpid (trap_pid, &trap_status, 0) < 0 && errno == EINTR)
    ;
  if (!silent)
    {
      Lib::printout_string (trap_out);
      Lib::printerr_string (trap_err);
    }
  return false;
}

bool
trap_fork_silent ()
{
  return trap_fork (30 * 1000000, true);
}

bool
trap_timed_out ()
{
  assert_return (trap_pid != 0, false);
  return trap_timeout;
}

bool
trap_passed ()
{
  assert_return (trap_pid != 0, false);
  return !trap_timeout && WIFEXITED (trap_status) && WEXITSTATUS (trap_status) == 0;
}

bool
trap_aborted ()
{
  assert_return (trap_pid != 0, false);
  return !trap_timeout && WIFSIGNALED (trap_status) && WTERMSIG (trap_status) == SIGABRT;
}

bool
trap_sigtrap ()
{
  assert_return (trap_pid != 0, false);
  return WIFSIGNALED (trap_status) && WTERMSIG (trap_status) == SIGTRAP;
}

String
trap_stdout ()
{
  assert_return (trap_pid != 0, "");
  return trap_out;
}

String
trap_stderr ()
{
  assert_return (trap_pid != 0, "");
  return trap_err;
}

} // Test
} // Evalkit
