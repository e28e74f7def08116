/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#ifndef NUMLIT_BIGNUM_H
#define NUMLIT_BIGNUM_H

#include "numlit.h"

namespace numlit {

/* Building-block operations on a representation of arbitrary
   precision, two's-complement, bignum integer values.  Inputs are
   generally a pointer to the base of an array of integer parts,
   least significant part first, and a count of how many parts there
   are.

   Bits are numbered from one; bit number zero means "no bit".  */
class Bignum {
 public:
  /* The number of parts needed to hold BITS bits.  */
  static unsigned int partCountForBits (unsigned int bits)
  {
    return (bits + integerPartWidth - 1) / integerPartWidth;
  }

  /* Sets the least significant part of a bignum to the input value,
     and zeroes out higher parts.  */
  static void tcSet (integerPart *, integerPart, unsigned int);

  /* Assign one bignum to another.  */
  static void tcAssign (integerPart *, const integerPart *, unsigned int);

  /* Returns true if a bignum is zero, false otherwise.  */
  static bool tcIsZero (const integerPart *, unsigned int);

  /* Extract the given bit of a bignum; returns 0 or 1.  BIT cannot be
     zero.  */
  static int tcExtractBit (const integerPart *, unsigned int bit);

  /* Set or clear the given bit of a bignum.  BIT cannot be zero.  */
  static void tcSetBit (integerPart *, unsigned int bit);
  static void tcClearBit (integerPart *, unsigned int bit);

  /* Returns the bit number of the least or most significant set bit
     of a number.  If the input number has no bits set zero is
     returned.  */
  static unsigned int tcLSB (const integerPart *, unsigned int);
  static unsigned int tcMSB (const integerPart *, unsigned int);

  /* Negate a bignum in-place.  */
  static void tcNegate (integerPart *, unsigned int);

  /* DST += RHS + CARRY where CARRY is zero or one.  Returns the carry
     flag.  */
  static integerPart tcAdd (integerPart *, const integerPart *,
                            integerPart carry, unsigned int);

  /* DST -= RHS + CARRY where CARRY is zero or one.  Returns the carry
     flag.  */
  static integerPart tcSubtract (integerPart *, const integerPart *,
                                 integerPart carry, unsigned int);

  /*  DST += SRC * MULTIPLIER + CARRY   if add is true
      DST  = SRC * MULTIPLIER + CARRY   if add is false

      Requires 0 <= DSTPARTS <= SRCPARTS + 1.  If DST overlaps SRC
      they must start at the same point, i.e. DST == SRC.

      If DSTPARTS == SRCPARTS + 1 no overflow occurs and zero is
      returned.  Otherwise DST is filled with the least significant
      DSTPARTS parts of the result, and if all of the omitted higher
      parts were zero return zero, otherwise overflow occurred and
      return one.  */
  static int tcMultiplyPart (integerPart *dst, const integerPart *src,
                             integerPart multiplier, integerPart carry,
                             unsigned int srcParts, unsigned int dstParts,
                             bool add);

  /* DST = LHS * RHS, where DST has twice the width of the operands.
     No overflow occurs.  DST must be disjoint from both operands.  */
  static void tcFullMultiply (integerPart *, const integerPart *,
                              const integerPart *, unsigned int);

  /* If RHS is zero LHS and REMAINDER are left unchanged, return one.
     Otherwise set LHS to LHS / RHS with the fractional part
     discarded, set REMAINDER to the remainder, return zero.  i.e.

       OLD_LHS = RHS * LHS + REMAINDER

     SCRATCH is a bignum of the same size as the operands and result
     for use by the routine; its contents need not be initialized and
     are destroyed.  LHS, REMAINDER and SCRATCH must be distinct.  */
  static int tcDivide (integerPart *lhs, const integerPart *rhs,
                       integerPart *remainder, integerPart *scratch,
                       unsigned int parts);

  /* DST /= DIVISOR, returning the remainder.  DIVISOR must be
     non-zero and fit in half a part.  */
  static integerPart tcDivideByHalfPart (integerPart *dst,
                                         integerPart divisor,
                                         unsigned int parts);

  /* Shift a bignum left or right COUNT bits.  Shifted in bits are
     zero.  There are no restrictions on COUNT.  */
  static void tcShiftLeft (integerPart *, unsigned int parts,
                           unsigned int count);
  static void tcShiftRight (integerPart *, unsigned int parts,
                            unsigned int count);

  static void tcComplement (integerPart *, unsigned int);

  /* Comparison (unsigned) of two bignums.  */
  static int tcCompare (const integerPart *, const integerPart *,
                        unsigned int);

  /* Increment or decrement a bignum in-place.  Return the carry or
     borrow flag.  */
  static integerPart tcIncrement (integerPart *, unsigned int);
  static integerPart tcDecrement (integerPart *, unsigned int);

  /* Set the least significant BITS and clear the rest.  */
  static void tcSetLeastSignificantBits (integerPart *, unsigned int,
                                         unsigned int bits);

  /* Clear every bit above the least significant BITS.  */
  static void tcTruncate (integerPart *, unsigned int, unsigned int bits);
};

}

#endif /* NUMLIT_BIGNUM_H */
