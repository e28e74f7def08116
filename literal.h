/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_LITERAL_H
#define NUMLIT_LITERAL_H

#include "exact.h"

namespace numlit {

  enum literalKind {
    lkInvalid,
    lkInteger,
    lkFloat
  };

  /* The value of C as a digit in RADIX, at most 16, or -1U.  */
  unsigned int digitValue (unsigned int c, unsigned int radix);

  /* Parse an integer literal: an optional '-', an optional 0b, 0o or
     0x prefix, then digits of that radix.  The first digit must be a
     digit; '_' separators may follow anywhere and are ignored.
     Returns opOK or opSyntaxError; RESULT is only written on
     success.  */
  opStatus parseIntegerLiteral (const char *, ExactInteger &result);

  /* Parse a floating literal.  Decimal literals are
       digits ['.' digits] [('e'|'E') ['+'|'-'] digits]
     and hexadecimal ones are
       0x hexdigits ['.' hexdigits] ('p'|'P') ['+'|'-'] digits
     with the binary exponent mandatory.  Every digit run starts with
     a digit.  Returns opOK or opSyntaxError; RESULT is only written
     on success.  */
  opStatus parseFloatLiteral (const char *, ExactFloat &result);

  /* Which of the two grammars, if any, the text satisfies.  Text
     valid as both, such as "12", is an integer literal.  */
  literalKind classifyLiteral (const char *);

}

#endif /* NUMLIT_LITERAL_H */
