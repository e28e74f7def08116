/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <algorithm>
#include <cassert>
#include "bignum.h"
#include "exact.h"

using namespace numlit;

namespace {

  /* 10^19 is the largest power of ten in a part.  */
  const unsigned int maxPowerOfTenInPart = 19;

  integerPart
  powerOfTen (unsigned int n)
  {
    integerPart result;

    assert (n <= maxPowerOfTenInPart);

    result = 1;
    while (n--)
      result *= 10;

    return result;
  }
}

ExactInteger::ExactInteger () : count (1), sign (false)
{
  parts = new integerPart[1];
  parts[0] = 0;
}

ExactInteger::ExactInteger (integerPart magnitude, bool negative)
  : count (1), sign (negative && magnitude != 0)
{
  parts = new integerPart[1];
  parts[0] = magnitude;
}

ExactInteger::ExactInteger (const integerPart *magnitude, unsigned int n,
                            bool negative)
{
  count = n ? n: 1;
  parts = new integerPart[count];
  Bignum::tcSet (parts, 0, count);
  Bignum::tcAssign (parts, magnitude, n);
  sign = negative && !isZero ();
}

ExactInteger::ExactInteger (const ExactInteger &rhs)
  : count (rhs.count), sign (rhs.sign)
{
  parts = new integerPart[count];
  Bignum::tcAssign (parts, rhs.parts, count);
}

ExactInteger::~ExactInteger ()
{
  delete [] parts;
}

ExactInteger &
ExactInteger::operator= (const ExactInteger &rhs)
{
  if (this != &rhs)
    {
      if (count != rhs.count)
        {
          delete [] parts;
          count = rhs.count;
          parts = new integerPart[count];
        }
      Bignum::tcAssign (parts, rhs.parts, count);
      sign = rhs.sign;
    }

  return *this;
}

/* Grow the magnitude to NEWCOUNT parts, zero-filling the new high
   parts.  Never shrinks.  */
void
ExactInteger::resize (unsigned int newCount)
{
  integerPart *newParts;

  if (newCount <= count)
    return;

  newParts = new integerPart[newCount];
  Bignum::tcSet (newParts, 0, newCount);
  Bignum::tcAssign (newParts, parts, count);
  delete [] parts;
  parts = newParts;
  count = newCount;
}

bool
ExactInteger::isZero () const
{
  return Bignum::tcIsZero (parts, count);
}

void
ExactInteger::negate ()
{
  if (!isZero ())
    sign = !sign;
}

unsigned int
ExactInteger::significantBits () const
{
  return Bignum::tcMSB (parts, count);
}

void
ExactInteger::multiplyAndAdd (integerPart multiplier, integerPart addend)
{
  int overflow;

  /* Keep a zero part on top so the product cannot overflow.  */
  if (parts[count - 1] != 0)
    resize (count + 1);

  overflow = Bignum::tcMultiplyPart (parts, parts, multiplier, addend,
                                     count, count, false);
  assert (!overflow);
  (void) overflow;
}

void
ExactInteger::multiplyByPowerOfTen (unsigned int n)
{
  while (n > maxPowerOfTenInPart)
    {
      multiplyAndAdd (powerOfTen (maxPowerOfTenInPart), 0);
      n -= maxPowerOfTenInPart;
    }

  multiplyAndAdd (powerOfTen (n), 0);
}

void
ExactInteger::shiftLeft (unsigned int bits)
{
  unsigned int needed;

  needed = Bignum::partCountForBits (significantBits () + bits);
  if (needed > count)
    resize (needed);

  Bignum::tcShiftLeft (parts, count, bits);
}

int
ExactInteger::compareMagnitude (const ExactInteger &rhs) const
{
  unsigned int n;

  n = std::max (count, rhs.count);
  while (n)
    {
      integerPart l, r;

      n--;
      l = n < count ? parts[n]: 0;
      r = n < rhs.count ? rhs.parts[n]: 0;
      if (l != r)
        return l > r ? 1: -1;
    }

  return 0;
}

int
ExactInteger::compare (const ExactInteger &rhs) const
{
  int result;

  if (sign != rhs.sign)
    return sign ? -1: 1;

  result = compareMagnitude (rhs);

  return sign ? -result: result;
}

bool
ExactInteger::fitsIn (unsigned int width, bool isSigned) const
{
  unsigned int msb;

  assert (width > 0);

  msb = significantBits ();
  if (msb == 0)
    return true;

  if (!isSigned)
    return !sign && msb <= width;

  if (msb < width)
    return true;

  /* Only the most negative value needs all WIDTH bits.  */
  return sign && msb == width && Bignum::tcLSB (parts, count) == width;
}

void
ExactInteger::truncate (integerPart *dst, unsigned int dstParts,
                        unsigned int width) const
{
  assert (width <= dstParts * integerPartWidth);

  Bignum::tcSet (dst, 0, dstParts);
  Bignum::tcAssign (dst, parts, std::min (count, dstParts));
  if (sign)
    Bignum::tcNegate (dst, dstParts);
  Bignum::tcTruncate (dst, dstParts, width);
}

std::string
ExactInteger::toString (unsigned int radix) const
{
  static const char digits[] = "0123456789abcdef";
  std::string result;
  ExactInteger tmp (*this);

  assert (radix >= 2 && radix <= 16);

  do
    result += digits[Bignum::tcDivideByHalfPart (tmp.parts, radix,
                                                 tmp.count)];
  while (!tmp.isZero ());

  if (sign)
    result += '-';

  std::reverse (result.begin (), result.end ());

  return result;
}

const exponent_t ExactFloat::exponentLimit;

ExactFloat::ExactFloat () : exponent (0), base (10), sign (false)
{
}

ExactFloat::ExactFloat (bool negative, const ExactInteger &our_significand,
                        exponent_t our_exponent, unsigned int our_base)
  : significand (our_significand), exponent (our_exponent), base (our_base),
    sign (negative)
{
  assert (base == 2 || base == 10);
  assert (!significand.isNegative ());
}

exponent_t
ExactFloat::saturateExponent (long long value)
{
  if (value > exponentLimit)
    return exponentLimit;
  if (value < -exponentLimit)
    return -exponentLimit;

  return (exponent_t) value;
}
