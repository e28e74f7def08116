/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_TEST_SUPPORT_H
#define NUMLIT_TEST_SUPPORT_H

#include <cassert>
#include <csignal>
#include <cstdio>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/* Run ACTION in a child process and return true if it was killed by
   SIGABRT, as reportFatalError does.  The child's stderr goes to
   /dev/null so the expected diagnostics stay out of the log.  */
template <typename Action>
bool
dies (Action action)
{
  pid_t pid;
  int status;

  fflush (0);
  pid = fork ();
  assert (pid >= 0);

  if (pid == 0)
    {
      if (!freopen ("/dev/null", "w", stderr))
        _exit (2);
      action ();
      _exit (0);
    }

  if (waitpid (pid, &status, 0) != pid)
    return false;

  return WIFSIGNALED (status) && WTERMSIG (status) == SIGABRT;
}

#endif /* NUMLIT_TEST_SUPPORT_H */
