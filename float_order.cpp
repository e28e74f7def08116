/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "bignum.h"
#include "binary_float.h"

using namespace numlit;

/* NaN payloads, the total order, minimum and maximum, and the
   neighbours of a value.  */

namespace {

  /* The encoding of VALUE without its sign bit, in two parts.  */
  void
  encodedMagnitude (const BinaryFloat &value, integerPart *dst)
  {
    FixedInt bits (value.bitcastToInteger ());

    Bignum::tcAssign (dst, bits.getRawParts (), 2);
    Bignum::tcClearBit (dst, value.getFormat ().bitWidth ());
  }

  BinaryFloat
  absoluteValue (const BinaryFloat &value)
  {
    BinaryFloat result (value);

    if (result.isNegative ())
      result.changeSign ();

    return result;
  }
}

void
BinaryFloat::makeNaN (bool signaling, const integerPart *payload,
                      unsigned int payloadParts)
{
  integerPart *parts;
  unsigned int count;

  category = fcNaN;
  parts = significandParts ();
  count = partCount ();

  Bignum::tcSet (parts, 0, count);
  if (payloadParts)
    Bignum::tcAssign (parts, payload,
                      payloadParts < count ? payloadParts: count);
  Bignum::tcTruncate (parts, count, format->payloadBits ());

  if (signaling)
    Bignum::tcSetBit (parts, format->precision - 2);
  else
    Bignum::tcSetBit (parts, format->precision - 1);
}

void
BinaryFloat::makeQuiet ()
{
  assert (category == fcNaN);

  Bignum::tcClearBit (significandParts (), format->precision - 2);
  Bignum::tcSetBit (significandParts (), format->precision - 1);
}

BinaryFloat
BinaryFloat::quietCopy (const BinaryFloat &value)
{
  BinaryFloat result (value);

  result.makeQuiet ();

  return result;
}

bool
BinaryFloat::isSignalingNaN () const
{
  return (category == fcNaN
          && !Bignum::tcExtractBit (significandParts (),
                                    format->precision - 1));
}

opStatus
BinaryFloat::setNaN (bool signaling, const ExactInteger &payload)
{
  if (payload.isNegative ()
      || payload.significantBits () > format->payloadBits ())
    return opEncodingError;

  makeNaN (signaling, payload.magnitudeParts (), payload.partCount ());

  return opOK;
}

ExactInteger
BinaryFloat::getNaNPayload () const
{
  integerPart payload[2];

  assert (category == fcNaN);

  Bignum::tcSet (payload, 0, 2);
  Bignum::tcAssign (payload, significandParts (), partCount ());
  Bignum::tcTruncate (payload, 2, format->payloadBits ());

  return ExactInteger (payload, 2, false);
}

bool
BinaryFloat::bitwiseIsEqual (const BinaryFloat &rhs) const
{
  if (format != rhs.format)
    return false;

  return bitcastToInteger () == rhs.bitcastToInteger ();
}

/* Ordering the encodings as sign-magnitude integers gives the total
   order: the exponent field dominates, all-ones orders infinities
   below NaNs, and the quiet flag is the top trailing significand
   bit.  */
bool
BinaryFloat::totalOrder (const BinaryFloat &rhs) const
{
  integerPart lhsMagnitude[2], rhsMagnitude[2];
  int cmp;

  if (format != rhs.format)
    reportFatalError ("operands have different floating formats");

  if (sign != rhs.sign)
    return sign;

  encodedMagnitude (*this, lhsMagnitude);
  encodedMagnitude (rhs, rhsMagnitude);
  cmp = Bignum::tcCompare (lhsMagnitude, rhsMagnitude, 2);

  return sign ? cmp >= 0: cmp <= 0;
}

BinaryFloat
BinaryFloat::minimum (const BinaryFloat &lhs, const BinaryFloat &rhs)
{
  if (lhs.isSignalingNaN ())
    return quietCopy (lhs);
  if (rhs.isSignalingNaN ())
    return quietCopy (rhs);

  if (lhs.isNaN ())
    return rhs;
  if (rhs.isNaN ())
    return lhs;

  return rhs.compare (lhs) == cmpLessThan ? rhs: lhs;
}

BinaryFloat
BinaryFloat::maximum (const BinaryFloat &lhs, const BinaryFloat &rhs)
{
  if (lhs.isSignalingNaN ())
    return quietCopy (lhs);
  if (rhs.isSignalingNaN ())
    return quietCopy (rhs);

  if (lhs.isNaN ())
    return rhs;
  if (rhs.isNaN ())
    return lhs;

  return rhs.compare (lhs) == cmpGreaterThan ? rhs: lhs;
}

BinaryFloat
BinaryFloat::minimumMagnitude (const BinaryFloat &lhs, const BinaryFloat &rhs)
{
  cmpResult cmp;

  if (lhs.isNaN () || rhs.isNaN ())
    return minimum (lhs, rhs);

  cmp = absoluteValue (rhs).compare (absoluteValue (lhs));
  if (cmp == cmpLessThan)
    return rhs;
  if (cmp == cmpGreaterThan)
    return lhs;

  return minimum (lhs, rhs);
}

BinaryFloat
BinaryFloat::maximumMagnitude (const BinaryFloat &lhs, const BinaryFloat &rhs)
{
  cmpResult cmp;

  if (lhs.isNaN () || rhs.isNaN ())
    return maximum (lhs, rhs);

  cmp = absoluteValue (rhs).compare (absoluteValue (lhs));
  if (cmp == cmpGreaterThan)
    return rhs;
  if (cmp == cmpLessThan)
    return lhs;

  return maximum (lhs, rhs);
}

bool
BinaryFloat::isLargestMagnitude () const
{
  integerPart ones[2];

  if (category != fcNormal || exponent != format->maxExponent ())
    return false;

  Bignum::tcSetLeastSignificantBits (ones, partCount (), format->precision);

  return Bignum::tcCompare (significandParts (), ones, partCount ()) == 0;
}

opStatus
BinaryFloat::nextUp ()
{
  switch (category)
    {
    default:
      assert (0);

    case fcNaN:
      if (isSignalingNaN ())
        {
          makeQuiet ();
          return opInvalidOp;
        }
      return opOK;

    case fcInfinity:
      if (sign)
        makeLargest (true);
      return opOK;

    case fcZero:
      *this = smallest (*format);
      return opOK;

    case fcNormal:
      break;
    }

  if (!sign)
    {
      if (isLargestMagnitude ())
        {
          category = fcInfinity;
          return opOK;
        }

      /* A carry out of the precision moves up a binade; a subnormal
         that reaches the integer bit is already normal.  */
      incrementSignificand ();
      if (significandMSB () == format->precision + 1)
        shiftSignificandRight (1);

      return opOK;
    }

  /* Toward zero.  */
  Bignum::tcDecrement (significandParts (), partCount ());

  if (significandMSB () == 0)
    category = fcZero;
  else if (exponent > format->minExponent ()
           && significandMSB () < format->precision)
    {
      /* We left a power of two; the binade below has twice the
         resolution.  */
      shiftSignificandLeft (1);
      Bignum::tcSetBit (significandParts (), 1);
    }

  return opOK;
}

opStatus
BinaryFloat::nextDown ()
{
  opStatus status;

  changeSign ();
  status = nextUp ();
  changeSign ();

  return status;
}

BinaryFloat
BinaryFloat::ulp () const
{
  BinaryFloat result (*format, fcNaN, false);
  integerPart one;
  opStatus status;

  switch (category)
    {
    default:
      assert (0);

    case fcNaN:
      result = *this;
      if (result.isSignalingNaN ())
        result.makeQuiet ();
      return result;

    case fcInfinity:
      return result;

    case fcZero:
      return smallest (*format);

    case fcNormal:
      break;
    }

  one = 1;
  status = result.convertFromUnsignedParts (&one, 1,
                                            exponent
                                            - ((int) format->precision - 1),
                                            lfExactlyZero);
  assert (status == opOK);
  (void) status;

  return result;
}
