/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <cstring>
#include "bignum.h"
#include "binary_float.h"
#include "literal.h"

using namespace numlit;

#define convolve(lhs, rhs) ((lhs) * 4 + (rhs))

/* Host bridging copies these types' bytes straight into a part.  */
NUMLIT_COMPILE_TIME_ASSERT (sizeof (double) == sizeof (integerPart));
NUMLIT_COMPILE_TIME_ASSERT (sizeof (float) == sizeof (unsigned int));

namespace numlit {

  const FloatFormat BinaryFloat::ieeeHalf = { 5, 11, false };
  const FloatFormat BinaryFloat::ieeeSingle = { 8, 24, false };
  const FloatFormat BinaryFloat::ieeeDouble = { 11, 53, false };
  const FloatFormat BinaryFloat::x87DoubleExtended = { 15, 64, true };
  const FloatFormat BinaryFloat::ieeeQuad = { 15, 113, false };
}

/* Put a bunch of private, handy routines in an anonymous namespace.  */
namespace {

  /* Encodings are at most 128 bits wide, so two parts hold any
     significand or bit pattern.  */
  const unsigned int maxEncodingParts = 2;

  /* Parts used to truncate a value to an integer of up to 128 bits
     without losing its high bits.  */
  const unsigned int integerConversionParts = 3;

  /* Return the fraction lost were a bignum truncated.  */
  lostFraction
  lostFractionThroughTruncation (const integerPart *parts,
                                 unsigned int partCount,
                                 unsigned int bits)
  {
    unsigned int lsb;

    /* Fast-path two cases that would fail the generic logic.  */
    if (bits == 0 || (lsb = Bignum::tcLSB (parts, partCount)) == 0)
      return lfExactlyZero;

    if (bits < lsb)
      return lfExactlyZero;
    if (bits == lsb)
      return lfExactlyHalf;
    if (bits <= partCount * integerPartWidth
        && Bignum::tcExtractBit (parts, bits))
      return lfMoreThanHalf;

    return lfLessThanHalf;
  }

  /* Shift DST right BITS bits noting lost fraction.  */
  lostFraction
  shiftRight (integerPart *dst, unsigned int parts, unsigned int bits)
  {
    lostFraction lost_fraction;

    lost_fraction = lostFractionThroughTruncation (dst, parts, bits);

    Bignum::tcShiftRight (dst, parts, bits);

    return lost_fraction;
  }

  integerPart
  allExponentBits (const FloatFormat &format)
  {
    return ((integerPart) 1 << format.exponentBits) - 1;
  }
}

/* Constructors.  */
void
BinaryFloat::initialize (const FloatFormat *our_format)
{
  unsigned int count;

  format = our_format;
  assert (format->bitWidth () <= maxEncodingParts * integerPartWidth);

  count = partCount ();
  if (count > 1)
    significand.parts = new integerPart[count];
}

void
BinaryFloat::freeSignificand ()
{
  if (partCount () > 1)
    delete [] significand.parts;
}

void
BinaryFloat::assign (const BinaryFloat &rhs)
{
  assert (format == rhs.format);

  sign = rhs.sign;
  category = rhs.category;
  exponent = rhs.exponent;
  if (category == fcNormal || category == fcNaN)
    copySignificand (rhs);
}

void
BinaryFloat::copySignificand (const BinaryFloat &rhs)
{
  assert (category == fcNormal || category == fcNaN);
  assert (rhs.partCount () >= partCount ());

  Bignum::tcAssign (significandParts (), rhs.significandParts (),
                    partCount ());
}

BinaryFloat &
BinaryFloat::operator= (const BinaryFloat &rhs)
{
  if (this != &rhs)
    {
      if (format != rhs.format)
        {
          freeSignificand ();
          initialize (rhs.format);
        }
      assign (rhs);
    }

  return *this;
}

BinaryFloat::BinaryFloat (const FloatFormat &our_format,
                          fltCategory our_category, bool negative)
{
  initialize (&our_format);
  category = our_category;
  sign = negative;
  exponent = 0;
  if (category == fcNormal)
    category = fcZero;
  else if (category == fcNaN)
    makeNaN (false, 0, 0);
}

BinaryFloat::BinaryFloat (const FloatFormat &our_format, const char *text)
{
  opStatus status;

  initialize (&our_format);
  category = fcZero;
  sign = 0;
  exponent = 0;

  status = convertFromString (text);
  if (status != opOK && status != opInexact)
    reportFatalError ("string does not denote a floating point value");
}

BinaryFloat::BinaryFloat (const FloatFormat &our_format, const FixedInt &bits)
{
  initialize (&our_format);
  if (bits.getBitWidth () != our_format.bitWidth ())
    reportFatalError ("bit pattern width does not match the format");

  decodeBits (bits.getRawParts ());
}

BinaryFloat::BinaryFloat (double value)
{
  integerPart bits[maxEncodingParts];

  initialize (&ieeeDouble);
  memcpy (&bits[0], &value, sizeof (value));
  bits[1] = 0;
  decodeBits (bits);
}

BinaryFloat::BinaryFloat (float value)
{
  integerPart bits[maxEncodingParts];
  unsigned int word;

  initialize (&ieeeSingle);
  memcpy (&word, &value, sizeof (value));
  bits[0] = word;
  bits[1] = 0;
  decodeBits (bits);
}

BinaryFloat::BinaryFloat (const BinaryFloat &rhs)
{
  initialize (rhs.format);
  assign (rhs);
}

BinaryFloat::~BinaryFloat ()
{
  freeSignificand ();
}

unsigned int
BinaryFloat::partCount () const
{
  return Bignum::partCountForBits (format->precision + 1);
}

const integerPart *
BinaryFloat::significandParts () const
{
  return const_cast<BinaryFloat *>(this)->significandParts ();
}

integerPart *
BinaryFloat::significandParts ()
{
  assert (category == fcNormal || category == fcNaN);

  if (partCount () > 1)
    return significand.parts;
  else
    return &significand.part;
}

/* Combine the effect of two lost fractions.  */
lostFraction
BinaryFloat::combineLostFractions (lostFraction moreSignificant,
                                   lostFraction lessSignificant)
{
  if (lessSignificant != lfExactlyZero)
    {
      if (moreSignificant == lfExactlyZero)
        moreSignificant = lfLessThanHalf;
      else if (moreSignificant == lfExactlyHalf)
        moreSignificant = lfMoreThanHalf;
    }

  return moreSignificant;
}

void
BinaryFloat::zeroSignificand ()
{
  category = fcNormal;
  Bignum::tcSet (significandParts (), 0, partCount ());
}

/* Increment an fcNormal floating point number's significand.  */
void
BinaryFloat::incrementSignificand ()
{
  integerPart carry;

  carry = Bignum::tcIncrement (significandParts (), partCount ());

  /* Our callers should never cause us to overflow.  */
  assert (carry == 0);
  (void) carry;
}

unsigned int
BinaryFloat::significandMSB () const
{
  return Bignum::tcMSB (significandParts (), partCount ());
}

unsigned int
BinaryFloat::significandLSB () const
{
  return Bignum::tcLSB (significandParts (), partCount ());
}

/* Note that a zero result is NOT normalized to fcZero.  */
lostFraction
BinaryFloat::shiftSignificandRight (unsigned int bits)
{
  /* Our exponent should not overflow.  */
  assert ((exponent_t) (exponent + bits) >= exponent);

  exponent += bits;

  return shiftRight (significandParts (), partCount (), bits);
}

/* Shift the significand left BITS bits, subtract BITS from its exponent.  */
void
BinaryFloat::shiftSignificandLeft (unsigned int bits)
{
  assert (bits < format->precision);

  if (bits)
    {
      unsigned int partsCount = partCount ();

      Bignum::tcShiftLeft (significandParts (), partsCount, bits);
      exponent -= bits;

      assert (!Bignum::tcIsZero (significandParts (), partsCount));
    }
}

BinaryFloat::cmpResult
BinaryFloat::compareAbsoluteValue (const BinaryFloat &rhs) const
{
  int compare;

  assert (format == rhs.format);
  assert (category == fcNormal);
  assert (rhs.category == fcNormal);

  compare = exponent - rhs.exponent;

  /* If exponents are equal, do an unsigned bignum comparison of the
     significands.  */
  if (compare == 0)
    compare = Bignum::tcCompare (significandParts (),
                                 rhs.significandParts (), partCount ());

  if (compare > 0)
    return cmpGreaterThan;
  else if (compare < 0)
    return cmpLessThan;
  else
    return cmpEqual;
}

/* Rounding to nearest overflows to an infinity of the same sign.  */
opStatus
BinaryFloat::handleOverflow ()
{
  category = fcInfinity;

  return (opStatus) (opOverflow | opInexact);
}

/* This routine must work for fcZero of both signs, and fcNormal
   numbers.  */
bool
BinaryFloat::roundAwayFromZero (lostFraction lost_fraction)
{
  /* NaNs and infinities should not have lost fractions.  */
  assert (category == fcNormal || category == fcZero);

  /* Our caller has already handled this case.  */
  assert (lost_fraction != lfExactlyZero);

  if (lost_fraction == lfMoreThanHalf)
    return true;

  /* Ties go to even.  Our zeroes don't have a significand to test.  */
  if (lost_fraction == lfExactlyHalf && category != fcZero)
    return significandParts ()[0] & 1;

  return false;
}

opStatus
BinaryFloat::normalize (lostFraction lost_fraction)
{
  unsigned int msb;
  int exponentChange;

  if (category != fcNormal)
    return opOK;

  /* Before rounding normalize the exponent of fcNormal numbers.  */
  msb = significandMSB ();

  if (msb)
    {
      /* The MSB is numbered from 1.  We want to place it in the integer
         bit numbered PRECISION if possible, with a compensating change in
         the exponent.  */
      exponentChange = (int) msb - (int) format->precision;

      /* If the resulting exponent is too high, overflow.  */
      if (exponent + exponentChange > format->maxExponent ())
        return handleOverflow ();

      /* Subnormal numbers have exponent minExponent, and their MSB
         is forced based on that.  */
      if (exponent + exponentChange < format->minExponent ())
        exponentChange = format->minExponent () - exponent;

      /* Shifting left is easy as we don't lose precision.  */
      if (exponentChange < 0)
        {
          assert (lost_fraction == lfExactlyZero);

          shiftSignificandLeft (-exponentChange);

          return opOK;
        }

      if (exponentChange > 0)
        {
          lostFraction lf;

          /* Shift right and capture any new lost fraction.  */
          lf = shiftSignificandRight (exponentChange);

          lost_fraction = combineLostFractions (lf, lost_fraction);

          /* Keep MSB up-to-date.  */
          if (msb > (unsigned int) exponentChange)
            msb -= exponentChange;
          else
            msb = 0;
        }
    }

  /* Now round the number to nearest given the lost fraction.  */

  /* As specified in IEEE 754, since we do not trap we do not report
     underflow for exact results.  */
  if (lost_fraction == lfExactlyZero)
    {
      /* Canonicalize zeroes.  */
      if (msb == 0)
        category = fcZero;

      return opOK;
    }

  /* Increment the significand if we're rounding away from zero.  */
  if (roundAwayFromZero (lost_fraction))
    {
      if (msb == 0)
        exponent = format->minExponent ();

      incrementSignificand ();
      msb = significandMSB ();

      /* Did the significand increment overflow?  */
      if (msb == format->precision + 1)
        {
          /* Renormalize by incrementing the exponent and shifting our
             significand right one.  However if we already have the
             maximum exponent we overflow to infinity.  */
          if (exponent == format->maxExponent ())
            {
              category = fcInfinity;

              return (opStatus) (opOverflow | opInexact);
            }

          shiftSignificandRight (1);

          return opInexact;
        }
    }

  /* The normal case - we were and are not denormal, and any
     significand increment above didn't overflow.  */
  if (msb == format->precision)
    return opInexact;

  /* We have a non-zero denormal.  */
  assert (msb < format->precision);
  assert (exponent == format->minExponent ());

  /* Canonicalize zeroes.  */
  if (msb == 0)
    category = fcZero;

  /* The fcZero case is a denormal that underflowed to zero.  */
  return (opStatus) (opUnderflow | opInexact);
}

void
BinaryFloat::makeLargest (bool negative)
{
  category = fcNormal;
  sign = negative;
  exponent = format->maxExponent ();
  Bignum::tcSetLeastSignificantBits (significandParts (), partCount (),
                                     format->precision);
}

BinaryFloat
BinaryFloat::largest (const FloatFormat &our_format, bool negative)
{
  BinaryFloat result (our_format, fcZero, negative);

  result.makeLargest (negative);

  return result;
}

BinaryFloat
BinaryFloat::smallest (const FloatFormat &our_format, bool negative)
{
  BinaryFloat result (our_format, fcZero, negative);

  result.zeroSignificand ();
  result.exponent = our_format.minExponent ();
  result.significandParts ()[0] = 1;

  return result;
}

BinaryFloat
BinaryFloat::smallestNormalized (const FloatFormat &our_format, bool negative)
{
  BinaryFloat result (our_format, fcZero, negative);

  result.zeroSignificand ();
  result.exponent = our_format.minExponent ();
  Bignum::tcSetBit (result.significandParts (), our_format.precision);

  return result;
}

/* Change sign.  */
void
BinaryFloat::changeSign ()
{
  sign = !sign;
}

bool
BinaryFloat::isNormal () const
{
  return category == fcNormal && significandMSB () == format->precision;
}

bool
BinaryFloat::isSubnormal () const
{
  return category == fcNormal && significandMSB () < format->precision;
}

BinaryFloat::fltClass
BinaryFloat::classify () const
{
  switch (category)
    {
    default:
      assert (0);

    case fcNaN:
      return isSignalingNaN () ? fcSignalingNaN: fcQuietNaN;

    case fcInfinity:
      return sign ? fcNegativeInfinity: fcPositiveInfinity;

    case fcZero:
      return sign ? fcNegativeZero: fcPositiveZero;

    case fcNormal:
      if (isSubnormal ())
        return sign ? fcNegativeSubnormal: fcPositiveSubnormal;
      return sign ? fcNegativeNormal: fcPositiveNormal;
    }
}

/* Comparison requires normalized numbers.  */
BinaryFloat::cmpResult
BinaryFloat::compare (const BinaryFloat &rhs) const
{
  cmpResult result;

  assert (format == rhs.format);

  switch (convolve (category, rhs.category))
    {
    default:
      assert (0);

    case convolve (fcNaN, fcZero):
    case convolve (fcNaN, fcNormal):
    case convolve (fcNaN, fcInfinity):
    case convolve (fcNaN, fcNaN):
    case convolve (fcZero, fcNaN):
    case convolve (fcNormal, fcNaN):
    case convolve (fcInfinity, fcNaN):
      return cmpUnordered;

    case convolve (fcInfinity, fcNormal):
    case convolve (fcInfinity, fcZero):
    case convolve (fcNormal, fcZero):
      if (sign)
        return cmpLessThan;
      else
        return cmpGreaterThan;

    case convolve (fcNormal, fcInfinity):
    case convolve (fcZero, fcInfinity):
    case convolve (fcZero, fcNormal):
      if (rhs.sign)
        return cmpGreaterThan;
      else
        return cmpLessThan;

    case convolve (fcInfinity, fcInfinity):
      if (sign == rhs.sign)
        return cmpEqual;
      else if (sign)
        return cmpLessThan;
      else
        return cmpGreaterThan;

    case convolve (fcZero, fcZero):
      return cmpEqual;

    case convolve (fcNormal, fcNormal):
      break;
    }

  /* Two normal numbers.  Do they have the same sign?  */
  if (sign != rhs.sign)
    {
      if (sign)
        result = cmpLessThan;
      else
        result = cmpGreaterThan;
    }
  else
    {
      /* Compare absolute values; invert result if negative.  */
      result = compareAbsoluteValue (rhs);

      if (sign)
        {
          if (result == cmpLessThan)
            result = cmpGreaterThan;
          else if (result == cmpGreaterThan)
            result = cmpLessThan;
        }
    }

  return result;
}

/* Set the value to the unsigned bignum SRC of COUNT parts times
   2^SCALE, rounded once.  LOST_FRACTION is the fraction of SRC's
   least significant bit already lost by the caller.  The sign is
   left alone.  */
opStatus
BinaryFloat::convertFromUnsignedParts (const integerPart *src,
                                       unsigned int count, int scale,
                                       lostFraction lost_fraction)
{
  unsigned int msb, precision;
  integerPart *copy;

  precision = format->precision;
  zeroSignificand ();

  msb = Bignum::tcMSB (src, count);
  if (msb == 0)
    {
      /* Only a lost fraction remains; this rounds to zero or the
         smallest subnormal.  */
      exponent = format->minExponent ();
      return normalize (lost_fraction);
    }

  copy = new integerPart[count];
  Bignum::tcAssign (copy, src, count);

  if (msb > precision)
    {
      lostFraction lf;

      lf = shiftRight (copy, count, msb - precision);
      lost_fraction = combineLostFractions (lf, lost_fraction);
      scale += msb - precision;
      msb = precision;
    }

  exponent = scale + (int) precision - 1;
  Bignum::tcAssign (significandParts (), copy,
                    Bignum::partCountForBits (msb));
  delete [] copy;

  return normalize (lost_fraction);
}

/* Set the value to DIGITS * 10^POWER rounded once.  Scaling by a
   power of ten is done exactly; a negative power becomes a long
   division carried far enough past the precision that its remainder
   only decides the lost fraction.  */
opStatus
BinaryFloat::convertFromDecimal (const ExactInteger &digits,
                                 exponent_t power)
{
  long long mbits, dbits, shift;
  unsigned int count;
  integerPart *block, *quotient, *divisor, *remainder, *scratch;
  lostFraction lost_fraction;
  opStatus status;
  int precision;

  mbits = digits.significantBits ();
  precision = format->precision;

  if (power >= 0)
    {
      /* 10^POWER >= 2^(3 * POWER), so this is at least
         2^(maxExponent + 1).  */
      if (mbits - 1 + 3LL * power > format->maxExponent ())
        {
          zeroSignificand ();
          return handleOverflow ();
        }

      ExactInteger scaled (digits);
      scaled.multiplyByPowerOfTen (power);

      return convertFromUnsignedParts (scaled.magnitudeParts (),
                                       scaled.partCount (), 0,
                                       lfExactlyZero);
    }

  /* 10^POWER < 2^(3 * POWER), so this is below a quarter of the
     smallest subnormal.  */
  if (mbits + 3LL * power < (long long) format->minExponent () - precision - 1)
    {
      integerPart zero = 0;

      return convertFromUnsignedParts (&zero, 1, 0, lfLessThanHalf);
    }

  ExactInteger numerator (digits), denominator (1);
  denominator.multiplyByPowerOfTen (-power);
  dbits = denominator.significantBits ();

  /* Make the quotient at least PRECISION + 2 bits long.  */
  shift = dbits - mbits + precision + 2;
  if (shift < 0)
    shift = 0;
  numerator.shiftLeft ((unsigned int) shift);

  count = numerator.partCount ();
  if (denominator.partCount () > count)
    count = denominator.partCount ();
  /* Room to double the remainder.  */
  count++;

  block = new integerPart[count * 4];
  quotient = block;
  divisor = block + count;
  remainder = block + count * 2;
  scratch = block + count * 3;

  Bignum::tcSet (quotient, 0, count);
  Bignum::tcAssign (quotient, numerator.magnitudeParts (),
                    numerator.partCount ());
  Bignum::tcSet (divisor, 0, count);
  Bignum::tcAssign (divisor, denominator.magnitudeParts (),
                    denominator.partCount ());

  Bignum::tcDivide (quotient, divisor, remainder, scratch, count);

  /* Compare twice the remainder with the divisor.  */
  if (Bignum::tcIsZero (remainder, count))
    lost_fraction = lfExactlyZero;
  else
    {
      int cmp;

      Bignum::tcShiftLeft (remainder, count, 1);
      cmp = Bignum::tcCompare (remainder, divisor, count);
      if (cmp < 0)
        lost_fraction = lfLessThanHalf;
      else if (cmp == 0)
        lost_fraction = lfExactlyHalf;
      else
        lost_fraction = lfMoreThanHalf;
    }

  status = convertFromUnsignedParts (quotient, count, (int) -shift,
                                     lost_fraction);
  delete [] block;

  return status;
}

opStatus
BinaryFloat::convertFromExactFloat (const ExactFloat &value)
{
  const ExactInteger &digits = value.getSignificand ();

  sign = value.isNegative ();
  if (value.isZero ())
    {
      category = fcZero;
      return opOK;
    }

  if (value.getExponentBase () == 2)
    return convertFromUnsignedParts (digits.magnitudeParts (),
                                     digits.partCount (),
                                     value.getExponent (), lfExactlyZero);

  return convertFromDecimal (digits, value.getExponent ());
}

opStatus
BinaryFloat::convertFromExactInteger (const ExactInteger &value,
                                      conversionPolicy policy)
{
  BinaryFloat result (*format, fcZero, false);
  opStatus status;

  result.sign = value.isNegative ();
  status = result.convertFromUnsignedParts (value.magnitudeParts (),
                                            value.partCount (), 0,
                                            lfExactlyZero);

  switch (policy)
    {
    case cpExact:
      break;

    case cpExactly:
      if (status != opOK)
        return opInvalidOp;
      break;

    default:
      reportFatalError ("conversion policy not defined for integer "
                        "to floating conversions");
    }

  *this = result;

  return status;
}

opStatus
BinaryFloat::convertFromInteger (const FixedInt &value,
                                 conversionPolicy policy)
{
  return convertFromExactInteger (value.toExact (), policy);
}

opStatus
BinaryFloat::convertFromLiteral (const char *text)
{
  ExactInteger integer;
  ExactFloat real;

  if (parseIntegerLiteral (text, integer) == opOK)
    return convertFromExactInteger (integer, cpExact);

  if (parseFloatLiteral (text, real) != opOK)
    return opSyntaxError;

  return convertFromExactFloat (real);
}

/* Set the value to SRC rounded to our format.  */
opStatus
BinaryFloat::roundFrom (const BinaryFloat &src)
{
  sign = src.sign;

  switch (src.category)
    {
    default:
      assert (0);

    case fcZero:
    case fcInfinity:
      category = src.category;
      return opOK;

    case fcNaN:
      {
        integerPart payload[maxEncodingParts];

        Bignum::tcSet (payload, 0, maxEncodingParts);
        Bignum::tcAssign (payload, src.significandParts (), src.partCount ());
        Bignum::tcTruncate (payload, maxEncodingParts,
                            src.format->payloadBits ());
        makeNaN (src.isSignalingNaN (), payload, maxEncodingParts);
        return opOK;
      }

    case fcNormal:
      return convertFromUnsignedParts (src.significandParts (),
                                       src.partCount (),
                                       src.exponent
                                       - ((int) src.format->precision - 1),
                                       lfExactlyZero);
    }
}

opStatus
BinaryFloat::convert (const FloatFormat &to_format, conversionPolicy policy)
{
  BinaryFloat result (to_format, fcZero, false);
  opStatus status;

  status = result.roundFrom (*this);

  switch (policy)
    {
    case cpExact:
      break;

    case cpExactly:
      /* A NaN never compares equal to its conversion.  */
      if (status != opOK || category == fcNaN)
        return opInvalidOp;
      break;

    case cpClamping:
      if (result.category == fcInfinity)
        {
          result.makeLargest (sign);
          status = opInexact;
        }
      break;

    default:
      reportFatalError ("conversion policy not defined for floating "
                        "conversions");
    }

  *this = result;

  return status;
}

/* Convert a floating point number to an integer, rounding toward
   zero as the C standard requires.  If the truncated value is out of
   range this returns an invalid operation exception.  If it is in
   range but the floating point number is not the exact integer we
   return inexact, as IEEE 854 requires.  */
opStatus
BinaryFloat::convertToInteger (FixedInt &result,
                               const IntFormat &intFormat) const
{
  integerPart parts[integerConversionParts];
  lostFraction lost_fraction;
  int bits;

  FixedInt converted (intFormat, 0);

  /* Handle the three special cases first.  */
  if (category == fcInfinity || category == fcNaN)
    return opInvalidOp;

  if (category == fcZero)
    {
      result = converted;
      return opOK;
    }

  /* The magnitude is at least 2^exponent.  */
  if (exponent >= (int) intFormat.bitWidth)
    return opInvalidOp;

  /* Shift the bit pattern so the fraction is lost.  */
  Bignum::tcSet (parts, 0, integerConversionParts);
  Bignum::tcAssign (parts, significandParts (), partCount ());

  bits = (int) format->precision - 1 - exponent;
  if (bits > 0)
    lost_fraction = shiftRight (parts, integerConversionParts, bits);
  else
    {
      Bignum::tcShiftLeft (parts, integerConversionParts, -bits);
      lost_fraction = lfExactlyZero;
    }

  /* A negative value truncated to zero fits an unsigned format.  */
  if (converted.convertFromExactInteger
      (ExactInteger (parts, integerConversionParts, sign), intFormat,
       cpExactly) != opOK)
    return opInvalidOp;

  result = converted;

  if (lost_fraction == lfExactlyZero)
    return opOK;
  else
    return opInexact;
}

/* Set the value from the encoding RAW of our format.  */
void
BinaryFloat::decodeBits (const integerPart *raw)
{
  integerPart field[maxEncodingParts], biasedField[maxEncodingParts];
  unsigned int fieldBits;
  integerPart biased;

  fieldBits = format->significandFieldBits ();

  sign = Bignum::tcExtractBit (raw, format->bitWidth ());

  Bignum::tcAssign (field, raw, maxEncodingParts);
  Bignum::tcTruncate (field, maxEncodingParts, fieldBits);

  Bignum::tcAssign (biasedField, raw, maxEncodingParts);
  Bignum::tcShiftRight (biasedField, maxEncodingParts, fieldBits);
  Bignum::tcTruncate (biasedField, maxEncodingParts, format->exponentBits);
  biased = biasedField[0];

  exponent = 0;

  if (biased == allExponentBits (*format))
    {
      /* Infinities and NaNs; an explicit integer bit is ignored.  */
      Bignum::tcTruncate (field, maxEncodingParts, format->precision - 1);
      if (Bignum::tcIsZero (field, maxEncodingParts))
        category = fcInfinity;
      else
        {
          category = fcNaN;
          Bignum::tcAssign (significandParts (), field, partCount ());
        }
      return;
    }

  zeroSignificand ();
  Bignum::tcAssign (significandParts (), field, partCount ());

  if (biased == 0)
    {
      exponent = format->minExponent ();
      if (Bignum::tcIsZero (field, maxEncodingParts))
        category = fcZero;
      return;
    }

  exponent = (exponent_t) biased - format->maxExponent ();

  if (!format->explicitIntegerBit)
    Bignum::tcSetBit (significandParts (), format->precision);
  else if (significandMSB () < format->precision)
    {
      /* An unnormal; renormalize it, which is exact.  */
      if (Bignum::tcIsZero (field, maxEncodingParts))
        category = fcZero;
      else
        normalize (lfExactlyZero);
    }
}

FixedInt
BinaryFloat::bitcastToInteger () const
{
  integerPart bits[maxEncodingParts], exponentField[maxEncodingParts];
  IntFormat intFormat = { format->bitWidth (), false };
  integerPart biased;

  Bignum::tcSet (bits, 0, maxEncodingParts);
  biased = 0;

  switch (category)
    {
    default:
      assert (0);

    case fcZero:
      break;

    case fcInfinity:
    case fcNaN:
      biased = allExponentBits (*format);
      if (category == fcNaN)
        Bignum::tcAssign (bits, significandParts (), partCount ());
      if (format->explicitIntegerBit)
        Bignum::tcSetBit (bits, format->precision);
      break;

    case fcNormal:
      Bignum::tcAssign (bits, significandParts (), partCount ());
      if (significandMSB () == format->precision)
        {
          biased = exponent + format->maxExponent ();
          if (!format->explicitIntegerBit)
            Bignum::tcClearBit (bits, format->precision);
        }
      break;
    }

  Bignum::tcSet (exponentField, biased, maxEncodingParts);
  Bignum::tcShiftLeft (exponentField, maxEncodingParts,
                       format->significandFieldBits ());
  bits[0] |= exponentField[0];
  bits[1] |= exponentField[1];

  if (sign)
    Bignum::tcSetBit (bits, format->bitWidth ());

  return FixedInt::fromBits (intFormat, bits[0], bits[1]);
}

double
BinaryFloat::convertToDouble () const
{
  integerPart bits;
  double result;

  if (format != &ieeeDouble)
    reportFatalError ("value is not of the double format");

  bits = bitcastToInteger ().getZExtValue ();
  memcpy (&result, &bits, sizeof (result));

  return result;
}

float
BinaryFloat::convertToFloat () const
{
  unsigned int word;
  float result;

  if (format != &ieeeSingle)
    reportFatalError ("value is not of the single format");

  word = (unsigned int) bitcastToInteger ().getZExtValue ();
  memcpy (&result, &word, sizeof (result));

  return result;
}
