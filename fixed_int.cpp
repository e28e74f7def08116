/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "bignum.h"
#include "binary_float.h"
#include "fixed_int.h"

using namespace numlit;

/* Two parts hold the widest format.  */
NUMLIT_COMPILE_TIME_ASSERT (FixedInt::maxBitWidth == 2 * integerPartWidth);

namespace numlit {

  const IntFormat FixedInt::int8 = { 8, true };
  const IntFormat FixedInt::int16 = { 16, true };
  const IntFormat FixedInt::int32 = { 32, true };
  const IntFormat FixedInt::int64 = { 64, true };
  const IntFormat FixedInt::int128 = { 128, true };
  const IntFormat FixedInt::uint8 = { 8, false };
  const IntFormat FixedInt::uint16 = { 16, false };
  const IntFormat FixedInt::uint32 = { 32, false };
  const IntFormat FixedInt::uint64 = { 64, false };
  const IntFormat FixedInt::uint128 = { 128, false };
}

namespace {

  void
  validateFormat (const IntFormat &format)
  {
    if (format.bitWidth == 0 || format.bitWidth > FixedInt::maxBitWidth)
      reportFatalError ("integer width out of range");
  }
}

FixedInt::FixedInt (const IntFormat &our_format, long long value)
  : format (our_format)
{
  integerPart bits[maxParts];

  validateFormat (format);

  bits[0] = (integerPart) value;
  bits[1] = value < 0 ? ~(integerPart) 0: 0;
  storeTruncated (bits, maxParts);
}

FixedInt
FixedInt::fromBits (const IntFormat &format, integerPart low,
                    integerPart high)
{
  FixedInt result (format, 0);
  integerPart bits[maxParts];

  bits[0] = low;
  bits[1] = high;
  result.storeTruncated (bits, maxParts);

  return result;
}

FixedInt
FixedInt::minValue (const IntFormat &format)
{
  FixedInt result (format, 0);

  if (format.isSigned)
    Bignum::tcSetBit (result.parts, format.bitWidth);

  return result;
}

FixedInt
FixedInt::maxValue (const IntFormat &format)
{
  FixedInt result (format, 0);

  Bignum::tcSetLeastSignificantBits (result.parts, maxParts,
                                     format.bitWidth - format.isSigned);

  return result;
}

/* Replace the value with the low bits of the SRCPARTS-part bignum
   SRC.  */
void
FixedInt::storeTruncated (const integerPart *src, unsigned int srcParts)
{
  Bignum::tcSet (parts, 0, maxParts);
  Bignum::tcAssign (parts, src, srcParts < maxParts ? srcParts: maxParts);
  Bignum::tcTruncate (parts, maxParts, format.bitWidth);
}

void
FixedInt::checkFormat (const FixedInt &rhs) const
{
  if (format != rhs.format)
    reportFatalError ("operands have different integer formats");
}

bool
FixedInt::signBit () const
{
  return format.isSigned && Bignum::tcExtractBit (parts, format.bitWidth);
}

/* Write the value to the DSTPARTS-part bignum DST, sign-extended for
   signed formats and zero-extended otherwise.  */
void
FixedInt::signExtend (integerPart *dst, unsigned int dstParts) const
{
  unsigned int i, bits;

  assert (dstParts >= maxParts);

  Bignum::tcSet (dst, 0, dstParts);
  Bignum::tcAssign (dst, parts, maxParts);

  if (!signBit ())
    return;

  i = format.bitWidth / integerPartWidth;
  bits = format.bitWidth % integerPartWidth;
  if (bits)
    dst[i++] |= ~(integerPart) 0 << bits;
  for (; i < dstParts; i++)
    dst[i] = ~(integerPart) 0;
}

/* The absolute value, to two parts.  Even the most negative signed
   value fits.  */
void
FixedInt::magnitudeParts (integerPart *dst) const
{
  signExtend (dst, maxParts);
  if (signBit ())
    Bignum::tcNegate (dst, maxParts);
}

bool
FixedInt::isNegative () const
{
  return signBit ();
}

bool
FixedInt::isZero () const
{
  return Bignum::tcIsZero (parts, maxParts);
}

long long
FixedInt::getSExtValue () const
{
  integerPart extended[maxParts];

  signExtend (extended, maxParts);

  return (long long) extended[0];
}

unsigned long long
FixedInt::getZExtValue () const
{
  return parts[0];
}

ExactInteger
FixedInt::toExact () const
{
  integerPart magnitude[maxParts];

  magnitudeParts (magnitude);

  return ExactInteger (magnitude, maxParts, signBit ());
}

std::string
FixedInt::toString (unsigned int radix) const
{
  return toExact ().toString (radix);
}

int
FixedInt::compare (const FixedInt &rhs) const
{
  bool negative;

  checkFormat (rhs);

  negative = signBit ();
  if (negative != rhs.signBit ())
    return negative ? -1: 1;

  /* Same signs compare as their bit patterns.  */
  return Bignum::tcCompare (parts, rhs.parts, maxParts);
}

bool
FixedInt::operator== (const FixedInt &rhs) const
{
  return compare (rhs) == 0;
}

void
FixedInt::assignExact (const ExactInteger &value, const IntFormat &to_format)
{
  format = to_format;
  value.truncate (parts, maxParts, format.bitWidth);
}

opStatus
FixedInt::convertFromExactInteger (const ExactInteger &value,
                                   const IntFormat &to_format,
                                   conversionPolicy policy)
{
  bool fits;

  validateFormat (to_format);
  fits = value.fitsIn (to_format.bitWidth, to_format.isSigned);

  switch (policy)
    {
    case cpExact:
      if (!fits)
        reportFatalError ("integer conversion overflow");
      assignExact (value, to_format);
      return opOK;

    case cpExactly:
      if (!fits)
        return opInvalidOp;
      assignExact (value, to_format);
      return opOK;

    case cpClamping:
      if (fits)
        {
          assignExact (value, to_format);
          return opOK;
        }
      if (value.isNegative ())
        *this = minValue (to_format);
      else
        *this = maxValue (to_format);
      return opInexact;

    case cpTruncating:
      /* The two's-complement residue modulo 2^width.  For a negative
         value and a wide unsigned format that is
         (max + 1) - truncate (-value).  */
      assignExact (value, to_format);
      return fits ? opOK: opInexact;

    case cpBitPattern:
      break;
    }

  reportFatalError ("a bit pattern conversion needs a fixed-width source");
}

opStatus
FixedInt::convert (const IntFormat &to_format, conversionPolicy policy)
{
  if (policy == cpBitPattern)
    {
      if (to_format.bitWidth != format.bitWidth
          || to_format.isSigned == format.isSigned)
        reportFatalError ("a bit pattern conversion needs the same width "
                          "and opposite signedness");

      /* The stored bits are already the pattern.  */
      format = to_format;
      return opOK;
    }

  return convertFromExactInteger (toExact (), to_format, policy);
}

opStatus
FixedInt::convertFromFloat (const BinaryFloat &value,
                            const IntFormat &to_format,
                            conversionPolicy policy)
{
  FixedInt result (to_format, 0);
  opStatus status;

  status = value.convertToInteger (result, to_format);

  switch (policy)
    {
    case cpExact:
      if (status & opInvalidOp)
        reportFatalError ("floating value out of integer range");
      *this = result;
      return status;

    case cpExactly:
      if (status != opOK)
        return opInvalidOp;
      *this = result;
      return opOK;

    default:
      break;
    }

  reportFatalError ("conversion policy not defined for floating sources");
}
