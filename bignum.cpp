/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.

   Part-array arithmetic under ExactInteger, FixedInt and the
   BinaryFloat significand.  Parts are unsigned, so none of this
   depends on how the host represents signed integers.
*/

#include <cassert>
#include "bignum.h"

using namespace numlit;

/* Assumed by lowHalf, highHalf, partMSB and partLSB.  */
NUMLIT_COMPILE_TIME_ASSERT (integerPartWidth % 2 == 0);

namespace {

  const unsigned int halfPartWidth = integerPartWidth / 2;

  /* Returns the integer part with the least significant BITS set.
     BITS cannot be zero.  */
  inline integerPart
  lowBitMask (unsigned int bits)
  {
    assert (bits != 0 && bits <= integerPartWidth);

    return ~(integerPart) 0 >> (integerPartWidth - bits);
  }

  inline integerPart
  lowHalf (integerPart part)
  {
    return part & lowBitMask (halfPartWidth);
  }

  inline integerPart
  highHalf (integerPart part)
  {
    return part >> halfPartWidth;
  }

  /* Returns the bit number of the most significant set bit of a
     part, or zero if no bits are set.  */
  unsigned int
  partMSB (integerPart value)
  {
    unsigned int n, msb;

    if (value == 0)
      return 0;

    n = halfPartWidth;
    msb = 1;
    do
      {
        if (value >> n)
          {
            value >>= n;
            msb += n;
          }

        n >>= 1;
      }
    while (n);

    return msb;
  }

  /* Returns the bit number of the least significant set bit of a
     part, or zero if no bits are set.  */
  unsigned int
  partLSB (integerPart value)
  {
    unsigned int n, lsb;

    if (value == 0)
      return 0;

    lsb = integerPartWidth;
    n = halfPartWidth;
    do
      {
        if (value << n)
          {
            value <<= n;
            lsb -= n;
          }

        n >>= 1;
      }
    while (n);

    return lsb;
  }
}

void
Bignum::tcSet (integerPart *dst, integerPart part, unsigned int parts)
{
  unsigned int i;

  assert (parts > 0);

  dst[0] = part;
  for (i = 1; i < parts; i++)
    dst[i] = 0;
}

void
Bignum::tcAssign (integerPart *dst, const integerPart *src,
                  unsigned int parts)
{
  unsigned int i;

  for (i = 0; i < parts; i++)
    dst[i] = src[i];
}

bool
Bignum::tcIsZero (const integerPart *src, unsigned int parts)
{
  unsigned int i;

  for (i = 0; i < parts; i++)
    if (src[i])
      return false;

  return true;
}

int
Bignum::tcExtractBit (const integerPart *parts, unsigned int bit)
{
  assert (bit != 0);

  bit--;

  return (parts[bit / integerPartWidth]
          & ((integerPart) 1 << bit % integerPartWidth)) != 0;
}

void
Bignum::tcSetBit (integerPart *parts, unsigned int bit)
{
  assert (bit != 0);

  bit--;

  parts[bit / integerPartWidth] |= (integerPart) 1 << (bit % integerPartWidth);
}

void
Bignum::tcClearBit (integerPart *parts, unsigned int bit)
{
  assert (bit != 0);

  bit--;

  parts[bit / integerPartWidth]
    &= ~((integerPart) 1 << (bit % integerPartWidth));
}

unsigned int
Bignum::tcLSB (const integerPart *parts, unsigned int n)
{
  unsigned int i;

  for (i = 0; i < n; i++)
    if (parts[i] != 0)
      return partLSB (parts[i]) + i * integerPartWidth;

  return 0;
}

unsigned int
Bignum::tcMSB (const integerPart *parts, unsigned int n)
{
  while (n)
    {
      --n;

      if (parts[n] != 0)
        return partMSB (parts[n]) + n * integerPartWidth;
    }

  return 0;
}

integerPart
Bignum::tcAdd (integerPart *dst, const integerPart *rhs,
               integerPart c, unsigned int parts)
{
  unsigned int i;

  assert (c <= 1);

  for (i = 0; i < parts; i++)
    {
      integerPart l;

      l = dst[i];
      if (c)
        {
          dst[i] += rhs[i] + 1;
          c = (dst[i] <= l);
        }
      else
        {
          dst[i] += rhs[i];
          c = (dst[i] < l);
        }
    }

  return c;
}

integerPart
Bignum::tcSubtract (integerPart *dst, const integerPart *rhs,
                    integerPart c, unsigned int parts)
{
  unsigned int i;

  assert (c <= 1);

  for (i = 0; i < parts; i++)
    {
      integerPart l;

      l = dst[i];
      if (c)
        {
          dst[i] -= rhs[i] + 1;
          c = (dst[i] >= l);
        }
      else
        {
          dst[i] -= rhs[i];
          c = (dst[i] > l);
        }
    }

  return c;
}

void
Bignum::tcNegate (integerPart *dst, unsigned int parts)
{
  tcComplement (dst, parts);
  tcIncrement (dst, parts);
}

int
Bignum::tcMultiplyPart (integerPart *dst, const integerPart *src,
                        integerPart multiplier, integerPart carry,
                        unsigned int srcParts, unsigned int dstParts,
                        bool add)
{
  unsigned int i, n;

  /* Otherwise our writes of DST kill our later reads of SRC.  */
  assert (dst <= src || dst >= src + srcParts);
  assert (dstParts <= srcParts + 1);

  /* N loops; minimum of dstParts and srcParts.  */
  n = dstParts < srcParts ? dstParts: srcParts;

  for (i = 0; i < n; i++)
    {
      integerPart low, mid, high, srcPart;

      /* [ LOW, HIGH ] = MULTIPLIER * SRC[i] + DST[i] + CARRY.

         This cannot overflow, because

            (n - 1) * (n - 1) + 2 (n - 1) = (n - 1) * (n + 1)

         which is less than n^2.  */
      srcPart = src[i];

      if (multiplier == 0 || srcPart == 0)
        {
          low = carry;
          high = 0;
        }
      else
        {
          low = lowHalf (srcPart) * lowHalf (multiplier);
          high = highHalf (srcPart) * highHalf (multiplier);

          mid = lowHalf (srcPart) * highHalf (multiplier);
          high += highHalf (mid);
          mid <<= halfPartWidth;
          if (low + mid < low)
            high++;
          low += mid;

          mid = highHalf (srcPart) * lowHalf (multiplier);
          high += highHalf (mid);
          mid <<= halfPartWidth;
          if (low + mid < low)
            high++;
          low += mid;

          if (low + carry < low)
            high++;
          low += carry;
        }

      if (add)
        {
          if (low + dst[i] < low)
            high++;
          dst[i] += low;
        }
      else
        dst[i] = low;

      carry = high;
    }

  if (i < dstParts)
    {
      /* Full multiplication, there is no overflow.  */
      assert (i + 1 == dstParts);
      dst[i] = carry;
      return 0;
    }

  /* We overflowed if there is carry.  */
  if (carry)
    return 1;

  /* We would overflow if any significant unwritten parts would be
     non-zero.  */
  if (multiplier)
    for (; i < srcParts; i++)
      if (src[i])
        return 1;

  return 0;
}

void
Bignum::tcFullMultiply (integerPart *dst, const integerPart *lhs,
                        const integerPart *rhs, unsigned int parts)
{
  unsigned int i;

  assert (dst != lhs && dst != rhs);

  tcSet (dst, 0, parts * 2);

  for (i = 0; i < parts; i++)
    tcMultiplyPart (&dst[i], lhs, rhs[i], 0, parts, parts + 1, true);
}

int
Bignum::tcDivide (integerPart *lhs, const integerPart *rhs,
                  integerPart *remainder, integerPart *srhs,
                  unsigned int parts)
{
  unsigned int n, shiftCount;
  integerPart mask;

  assert (lhs != remainder && lhs != srhs && remainder != srhs);

  shiftCount = tcMSB (rhs, parts);
  if (shiftCount == 0)
    return 1;

  /* Line the divisor up with the top of the dividend, then walk it
     back down one bit at a time.  */
  shiftCount = parts * integerPartWidth - shiftCount;
  n = shiftCount / integerPartWidth;
  mask = (integerPart) 1 << (shiftCount % integerPartWidth);

  tcAssign (srhs, rhs, parts);
  tcShiftLeft (srhs, parts, shiftCount);
  tcAssign (remainder, lhs, parts);
  tcSet (lhs, 0, parts);

  for (;;)
    {
      if (tcCompare (remainder, srhs, parts) >= 0)
        {
          tcSubtract (remainder, srhs, 0, parts);
          lhs[n] |= mask;
        }

      if (shiftCount == 0)
        break;
      shiftCount--;
      tcShiftRight (srhs, parts, 1);
      if ((mask >>= 1) == 0)
        {
          mask = (integerPart) 1 << (integerPartWidth - 1);
          n--;
        }
    }

  return 0;
}

integerPart
Bignum::tcDivideByHalfPart (integerPart *dst, integerPart divisor,
                            unsigned int parts)
{
  integerPart remainder;

  assert (divisor != 0 && highHalf (divisor) == 0);

  /* Schoolbook division with half-part digits.  REMAINDER is below
     DIVISOR, so REMAINDER:DIGIT always fits in a part.  */
  remainder = 0;
  while (parts)
    {
      integerPart high, low, part;

      part = dst[--parts];

      high = (remainder << halfPartWidth) | highHalf (part);
      remainder = high % divisor;
      high /= divisor;

      low = (remainder << halfPartWidth) | lowHalf (part);
      remainder = low % divisor;
      low /= divisor;

      dst[parts] = (high << halfPartWidth) | low;
    }

  return remainder;
}

void
Bignum::tcShiftLeft (integerPart *dst, unsigned int parts, unsigned int count)
{
  unsigned int jump, shift;

  /* Jump is the inter-part jump; shift is the intra-part shift.  */
  jump = count / integerPartWidth;
  shift = count % integerPartWidth;

  while (parts > jump)
    {
      integerPart part;

      parts--;

      /* dst[i] comes from the two parts src[i - jump] and, if we have
         an intra-part shift, src[i - jump - 1].  */
      part = dst[parts - jump];
      if (shift)
        {
          part <<= shift;
          if (parts >= jump + 1)
            part |= dst[parts - jump - 1] >> (integerPartWidth - shift);
        }

      dst[parts] = part;
    }

  while (parts > 0)
    dst[--parts] = 0;
}

void
Bignum::tcShiftRight (integerPart *dst, unsigned int parts, unsigned int count)
{
  unsigned int i, jump, shift;

  jump = count / integerPartWidth;
  shift = count % integerPartWidth;

  /* Perform the shift.  This leaves the most significant COUNT bits
     of the result at zero.  */
  for (i = 0; i < parts; i++)
    {
      integerPart part;

      if (i + jump >= parts)
        part = 0;
      else
        {
          part = dst[i + jump];
          if (shift)
            {
              part >>= shift;
              if (i + jump + 1 < parts)
                part |= dst[i + jump + 1] << (integerPartWidth - shift);
            }
        }

      dst[i] = part;
    }
}

void
Bignum::tcComplement (integerPart *dst, unsigned int parts)
{
  unsigned int i;

  for (i = 0; i < parts; i++)
    dst[i] = ~dst[i];
}

int
Bignum::tcCompare (const integerPart *lhs, const integerPart *rhs,
                   unsigned int parts)
{
  while (parts)
    {
      parts--;
      if (lhs[parts] == rhs[parts])
        continue;

      if (lhs[parts] > rhs[parts])
        return 1;
      else
        return -1;
    }

  return 0;
}

integerPart
Bignum::tcIncrement (integerPart *dst, unsigned int parts)
{
  unsigned int i;

  for (i = 0; i < parts; i++)
    if (++dst[i] != 0)
      break;

  return i == parts;
}

integerPart
Bignum::tcDecrement (integerPart *dst, unsigned int parts)
{
  unsigned int i;

  /* A zero part borrows from the next and becomes all ones.  */
  for (i = 0; i < parts; i++)
    if (dst[i]-- != 0)
      break;

  return i == parts;
}

void
Bignum::tcSetLeastSignificantBits (integerPart *dst, unsigned int parts,
                                   unsigned int bits)
{
  unsigned int i;

  i = 0;
  while (bits > integerPartWidth)
    {
      dst[i++] = ~(integerPart) 0;
      bits -= integerPartWidth;
    }

  if (bits)
    dst[i++] = lowBitMask (bits);

  while (i < parts)
    dst[i++] = 0;
}

void
Bignum::tcTruncate (integerPart *dst, unsigned int parts, unsigned int bits)
{
  unsigned int i;

  /* I is the part holding bit BITS + 1.  */
  i = bits / integerPartWidth;
  if (i >= parts)
    return;

  if (bits % integerPartWidth)
    dst[i++] &= lowBitMask (bits % integerPartWidth);

  while (i < parts)
    dst[i++] = 0;
}
