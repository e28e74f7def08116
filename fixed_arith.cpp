/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "bignum.h"
#include "fixed_int.h"

using namespace numlit;

/* Arithmetic on fixed-width integers.  Results are computed exactly
   in wider two's-complement bignums and then narrowed, so overflow
   is simply a result that does not fit.  */

namespace {

  /* Parts of an exact sum or difference of two 128-bit values.  */
  const unsigned int sumParts = 3;

  /* Parts of an exact product, or of a double-width dividend.  */
  const unsigned int productParts = 4;

  /* Whether the two's-complement bignum V of N parts is representable
     in WIDTH bits.  */
  bool
  twosComplementFits (const integerPart *v, unsigned int n,
                      unsigned int width, bool isSigned)
  {
    integerPart complement[productParts];

    assert (n <= productParts);

    if (!Bignum::tcExtractBit (v, n * integerPartWidth))
      return Bignum::tcMSB (v, n) <= width - isSigned;

    if (!isSigned)
      return false;

    /* V >= -2^(WIDTH-1) iff ~V = -V-1 < 2^(WIDTH-1).  */
    Bignum::tcAssign (complement, v, n);
    Bignum::tcComplement (complement, n);

    return Bignum::tcMSB (complement, n) < width;
  }

  /* Set every bit of the N-part bignum DST above bit number BIT.  */
  void
  setBitsAbove (integerPart *dst, unsigned int n, unsigned int bit)
  {
    unsigned int i, bits;

    i = bit / integerPartWidth;
    bits = bit % integerPartWidth;
    if (i >= n)
      return;
    if (bits)
      dst[i++] |= ~(integerPart) 0 << bits;
    for (; i < n; i++)
      dst[i] = ~(integerPart) 0;
  }

  /* Whether VALUE is -1 in a signed format.  */
  bool
  isMinusOne (const FixedInt &value)
  {
    return value.isSigned () && value == FixedInt (value.getFormat (), -1);
  }

  /* The signed product of LHS and RHS as a PRODUCTPARTS-part
     two's-complement bignum.  Magnitudes are at most 2^128 - 1, and
     when the product is negative at most 2^254, so nothing is
     lost.  */
  void
  signedProduct (integerPart *dst, const FixedInt &lhs, const FixedInt &rhs)
  {
    FixedInt lhsMagnitude (lhs.magnitude ()), rhsMagnitude (rhs.magnitude ());

    Bignum::tcFullMultiply (dst, lhsMagnitude.getRawParts (),
                            rhsMagnitude.getRawParts (), 2);
    if (lhs.isNegative () != rhs.isNegative ())
      Bignum::tcNegate (dst, productParts);
  }
}

bool
FixedInt::addReportingOverflow (const FixedInt &rhs)
{
  integerPart lhsParts[sumParts], rhsParts[sumParts];

  checkFormat (rhs);

  signExtend (lhsParts, sumParts);
  rhs.signExtend (rhsParts, sumParts);
  Bignum::tcAdd (lhsParts, rhsParts, 0, sumParts);
  storeTruncated (lhsParts, sumParts);

  return !twosComplementFits (lhsParts, sumParts, format.bitWidth,
                              format.isSigned);
}

bool
FixedInt::subtractReportingOverflow (const FixedInt &rhs)
{
  integerPart lhsParts[sumParts], rhsParts[sumParts];

  checkFormat (rhs);

  signExtend (lhsParts, sumParts);
  rhs.signExtend (rhsParts, sumParts);
  Bignum::tcSubtract (lhsParts, rhsParts, 0, sumParts);
  storeTruncated (lhsParts, sumParts);

  return !twosComplementFits (lhsParts, sumParts, format.bitWidth,
                              format.isSigned);
}

bool
FixedInt::multiplyReportingOverflow (const FixedInt &rhs)
{
  integerPart product[productParts];

  checkFormat (rhs);

  signedProduct (product, *this, rhs);
  storeTruncated (product, productParts);

  /* An unsigned product with its top bit set is far too big, and
     the check below treats it so.  */
  return !twosComplementFits (product, productParts, format.bitWidth,
                              format.isSigned);
}

/* The shared part of division and remainder, truncating toward zero.
   Returns true on overflow, leaving the dividend for a zero divisor,
   the most negative value for min / -1, and zero for a remainder by
   -1.  */
bool
FixedInt::divideOrRemainder (const FixedInt &rhs, bool wantRemainder)
{
  integerPart quotient[maxParts], divisor[maxParts];
  integerPart remainder[maxParts], scratch[maxParts];
  bool negative;
  int status;

  checkFormat (rhs);

  if (rhs.isZero ())
    return true;

  if (isMinusOne (rhs))
    {
      if (wantRemainder)
        {
          Bignum::tcSet (parts, 0, maxParts);
          return true;
        }

      if (*this == minValue (format))
        return true;

      wrappingNegate ();
      return false;
    }

  negative = signBit ();
  magnitudeParts (quotient);
  rhs.magnitudeParts (divisor);

  status = Bignum::tcDivide (quotient, divisor, remainder, scratch, maxParts);
  assert (status == 0);
  (void) status;

  if (wantRemainder)
    {
      /* The remainder takes the sign of the dividend.  */
      if (negative)
        Bignum::tcNegate (remainder, maxParts);
      storeTruncated (remainder, maxParts);
    }
  else
    {
      if (negative != rhs.signBit ())
        Bignum::tcNegate (quotient, maxParts);
      storeTruncated (quotient, maxParts);
    }

  return false;
}

bool
FixedInt::divideReportingOverflow (const FixedInt &rhs)
{
  return divideOrRemainder (rhs, false);
}

bool
FixedInt::remainderReportingOverflow (const FixedInt &rhs)
{
  return divideOrRemainder (rhs, true);
}

void
FixedInt::add (const FixedInt &rhs)
{
  if (addReportingOverflow (rhs))
    reportFatalError ("integer overflow in addition");
}

void
FixedInt::subtract (const FixedInt &rhs)
{
  if (subtractReportingOverflow (rhs))
    reportFatalError ("integer overflow in subtraction");
}

void
FixedInt::multiply (const FixedInt &rhs)
{
  if (multiplyReportingOverflow (rhs))
    reportFatalError ("integer overflow in multiplication");
}

void
FixedInt::divide (const FixedInt &rhs)
{
  checkFormat (rhs);
  if (rhs.isZero ())
    reportFatalError ("division by zero");
  if (divideOrRemainder (rhs, false))
    reportFatalError ("integer overflow in division");
}

/* Unlike the reporting variant, only min % -1 traps; any other
   remainder by -1 is simply zero.  */
void
FixedInt::remainder (const FixedInt &rhs)
{
  bool overflow;

  checkFormat (rhs);
  if (rhs.isZero ())
    reportFatalError ("division by zero");

  if (isMinusOne (rhs))
    {
      if (*this == minValue (format))
        reportFatalError ("integer overflow in remainder");
      Bignum::tcSet (parts, 0, maxParts);
      return;
    }

  overflow = divideOrRemainder (rhs, true);
  assert (!overflow);
  (void) overflow;
}

void
FixedInt::negate ()
{
  if (isZero ())
    return;

  if (!format.isSigned || *this == minValue (format))
    reportFatalError ("integer overflow in negation");

  wrappingNegate ();
}

void
FixedInt::abs ()
{
  if (isNegative ())
    negate ();
}

void
FixedInt::wrappingAdd (const FixedInt &rhs)
{
  checkFormat (rhs);
  Bignum::tcAdd (parts, rhs.parts, 0, maxParts);
  Bignum::tcTruncate (parts, maxParts, format.bitWidth);
}

void
FixedInt::wrappingSubtract (const FixedInt &rhs)
{
  checkFormat (rhs);
  Bignum::tcSubtract (parts, rhs.parts, 0, maxParts);
  Bignum::tcTruncate (parts, maxParts, format.bitWidth);
}

void
FixedInt::wrappingMultiply (const FixedInt &rhs)
{
  integerPart product[productParts];

  checkFormat (rhs);

  /* The low bits of a product depend only on the low bits of the
     operands.  */
  Bignum::tcFullMultiply (product, parts, rhs.parts, maxParts);
  storeTruncated (product, productParts);
}

void
FixedInt::wrappingNegate ()
{
  Bignum::tcNegate (parts, maxParts);
  Bignum::tcTruncate (parts, maxParts, format.bitWidth);
}

void
FixedInt::uncheckedAdd (const FixedInt &rhs)
{
#if NUMLIT_CHECKED_ARITHMETIC
  add (rhs);
#else
  wrappingAdd (rhs);
#endif
}

void
FixedInt::uncheckedSubtract (const FixedInt &rhs)
{
#if NUMLIT_CHECKED_ARITHMETIC
  subtract (rhs);
#else
  wrappingSubtract (rhs);
#endif
}

void
FixedInt::uncheckedMultiply (const FixedInt &rhs)
{
#if NUMLIT_CHECKED_ARITHMETIC
  multiply (rhs);
#else
  wrappingMultiply (rhs);
#endif
}

void
FixedInt::uncheckedDivide (const FixedInt &rhs)
{
#if NUMLIT_CHECKED_ARITHMETIC
  divide (rhs);
#else
  /* There is nothing to wrap to for a zero divisor.  min / -1 wraps
     to min, which divideOrRemainder leaves in place.  */
  checkFormat (rhs);
  if (rhs.isZero ())
    reportFatalError ("division by zero");
  (void) divideOrRemainder (rhs, false);
#endif
}

FixedInt
FixedInt::magnitude () const
{
  IntFormat unsignedFormat = { format.bitWidth, false };
  integerPart bits[maxParts];

  magnitudeParts (bits);

  return fromBits (unsignedFormat, bits[0], bits[1]);
}

void
FixedInt::multiplyFullWidth (const FixedInt &lhs, const FixedInt &rhs,
                             FixedInt &high, FixedInt &low)
{
  IntFormat lowFormat = { lhs.format.bitWidth, false };
  integerPart product[productParts];

  lhs.checkFormat (rhs);

  signedProduct (product, lhs, rhs);

  low = fromBits (lowFormat, product[0], product[1]);
  Bignum::tcShiftRight (product, productParts, lhs.format.bitWidth);
  high = fromBits (lhs.format, product[0], product[1]);
}

bool
FixedInt::divideFullWidthReportingOverflow (const FixedInt &divisor,
                                            const FixedInt &high,
                                            const FixedInt &low,
                                            FixedInt &quotient,
                                            FixedInt &remainder)
{
  const IntFormat &format = divisor.format;
  integerPart dividend[productParts], upper[productParts];
  integerPart divisorParts[productParts], remainderParts[productParts];
  integerPart scratch[productParts];
  bool negative, overflow;
  int status;

  divisor.checkFormat (high);
  if (low.format.bitWidth != format.bitWidth || low.format.isSigned)
    reportFatalError ("the low half of a dividend must be unsigned and "
                      "as wide as the divisor");

  if (divisor.isZero ())
    {
      quotient = low;
      quotient.format = format;
      remainder = FixedInt (format, 0);
      return true;
    }

  /* Assemble HIGH:LOW as a two's-complement number of twice the
     width.  */
  Bignum::tcSet (dividend, 0, productParts);
  Bignum::tcAssign (dividend, low.parts, maxParts);
  Bignum::tcSet (upper, 0, productParts);
  Bignum::tcAssign (upper, high.parts, maxParts);
  Bignum::tcShiftLeft (upper, productParts, format.bitWidth);
  Bignum::tcAdd (dividend, upper, 0, productParts);

  negative = high.signBit ();
  if (negative)
    {
      setBitsAbove (dividend, productParts, 2 * format.bitWidth);
      Bignum::tcNegate (dividend, productParts);
    }

  Bignum::tcSet (divisorParts, 0, productParts);
  divisor.magnitudeParts (divisorParts);

  status = Bignum::tcDivide (dividend, divisorParts, remainderParts, scratch,
                             productParts);
  assert (status == 0);
  (void) status;

  if (negative != divisor.signBit ())
    Bignum::tcNegate (dividend, productParts);
  if (negative)
    Bignum::tcNegate (remainderParts, productParts);

  overflow = !twosComplementFits (dividend, productParts, format.bitWidth,
                                  format.isSigned);

  quotient = FixedInt (format, 0);
  quotient.storeTruncated (dividend, productParts);
  remainder = FixedInt (format, 0);
  remainder.storeTruncated (remainderParts, productParts);

  return overflow;
}

void
FixedInt::divideFullWidth (const FixedInt &divisor, const FixedInt &high,
                           const FixedInt &low, FixedInt &quotient,
                           FixedInt &remainder)
{
  if (divisor.isZero ())
    reportFatalError ("division by zero");
  if (divideFullWidthReportingOverflow (divisor, high, low, quotient,
                                        remainder))
    reportFatalError ("integer overflow in full-width division");
}
