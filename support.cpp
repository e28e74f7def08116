/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cstdio>
#include <cstdlib>
#include "numlit.h"

using namespace numlit;

conversionOutcome
numlit::outcomeOf (opStatus status)
{
  if (status & (opInvalidOp | opSyntaxError | opEncodingError))
    return coFailure;
  if (status & opOverflow)
    return coOverflow;
  if (status & opUnderflow)
    return coUnderflow;
  if (status & opInexact)
    return coInexact;

  return coExact;
}

bool
numlit::checkedArithmeticEnabled ()
{
  return NUMLIT_CHECKED_ARITHMETIC != 0;
}

void
numlit::reportFatalError (const char *message)
{
  fprintf (stderr, "numlit: fatal error: %s\n", message);
  fflush (stderr);
  abort ();
}
