/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_NUMLIT_H
#define NUMLIT_NUMLIT_H

#define NUMLIT_HOST_CHAR_BIT 8
#define NUMLIT_COMPILE_TIME_ASSERT(cond) extern int CTAssert[(cond) ? 1 : -1]

/* The unchecked integer operations trap on overflow in checked builds
   and wrap otherwise.  Unless the build says otherwise, checked
   builds are those without NDEBUG.  */
#ifndef NUMLIT_CHECKED_ARITHMETIC
# ifdef NDEBUG
#  define NUMLIT_CHECKED_ARITHMETIC 0
# else
#  define NUMLIT_CHECKED_ARITHMETIC 1
# endif
#endif

namespace numlit {

  /* The most convenient unsigned host type.  */
  __extension__ typedef unsigned long long integerPart;

  const unsigned int integerPartWidth
    = NUMLIT_HOST_CHAR_BIT * sizeof (integerPart);

  /* Exponents are stored as signed numbers.  */
  typedef int exponent_t;

  /* The fraction of the last place lost when truncating a bignum.
     Every conversion rounds on it to nearest, ties to even; there is
     no rounding mode state and no way to change it.  */
  enum lostFraction {
    lfExactlyZero,
    lfLessThanHalf,
    lfExactlyHalf,
    lfMoreThanHalf
  };

  /* Operation status.  opUnderflow or opOverflow are always returned
     or-ed with opInexact.  The last two are not IEEE conditions; they
     report malformed text and unencodable NaN payloads.  */
  enum opStatus {
    opOK            = 0x00,
    opInvalidOp     = 0x01,
    opOverflow      = 0x02,
    opUnderflow     = 0x04,
    opInexact       = 0x08,
    opSyntaxError   = 0x10,
    opEncodingError = 0x20
  };

  /* How a conversion treats a value the target cannot represent
     exactly.  cpExact traps on unrepresentable integers and rounds
     floats; cpExactly fails instead of losing anything; cpClamping
     saturates; cpTruncating keeps the low bits; cpBitPattern
     reinterprets an integer of the same width and opposite
     signedness.  */
  enum conversionPolicy {
    cpExact,
    cpExactly,
    cpClamping,
    cpTruncating,
    cpBitPattern
  };

  /* The tagged view of a conversion's status.  */
  enum conversionOutcome {
    coExact,
    coInexact,
    coOverflow,
    coUnderflow,
    coFailure
  };

  conversionOutcome outcomeOf (opStatus);

  /* True if the library was built with checked unchecked arithmetic.  */
  bool checkedArithmeticEnabled ();

  /* Print MESSAGE to stderr and abort.  Used for the trapping
     operations; never returns.  */
  void reportFatalError (const char *message) __attribute__ ((noreturn));

}

#endif /* NUMLIT_NUMLIT_H */
