/*
   Copyright 2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <cstdio>
#include "bignum.h"
#include "binary_float.h"

using namespace numlit;

namespace {

  const char hexDigitChars[] = "0123456789abcdef";
}

/* Write the value as [-]0x1.hhhp[+-]d with trailing zero digits
   omitted.  Subnormals are written normalized, so their exponent is
   below the format's minimum.  */
std::string
BinaryFloat::toHexString () const
{
  integerPart fraction[2];
  unsigned int msb, fractionBits, digits;
  std::string result;
  char exponentText[16];
  int printedExponent;

  if (sign)
    result += '-';

  switch (category)
    {
    default:
      assert (0);

    case fcInfinity:
      return result + "inf";

    case fcZero:
      return result + "0x0p+0";

    case fcNaN:
      {
        ExactInteger payload (getNaNPayload ());

        result += isSignalingNaN () ? "snan": "nan";
        if (!payload.isZero ())
          result += "(0x" + payload.toString (16) + ")";
        return result;
      }

    case fcNormal:
      break;
    }

  Bignum::tcSet (fraction, 0, 2);
  Bignum::tcAssign (fraction, significandParts (), partCount ());

  /* Bring a subnormal's leading bit up to the integer bit.  */
  msb = significandMSB ();
  printedExponent = exponent - (int) (format->precision - msb);
  Bignum::tcShiftLeft (fraction, 2, format->precision - msb);

  /* Drop the integer bit and pad the fraction to whole digits.  */
  fractionBits = format->precision - 1;
  Bignum::tcClearBit (fraction, format->precision);
  digits = (fractionBits + 3) / 4;
  Bignum::tcShiftLeft (fraction, 2, digits * 4 - fractionBits);

  result += "0x1";
  if (!Bignum::tcIsZero (fraction, 2))
    {
      std::string hexDigits;

      while (digits--)
        {
          unsigned int digit;

          digit = (unsigned int) (fraction[0] & 0xf);
          Bignum::tcShiftRight (fraction, 2, 4);
          hexDigits += hexDigitChars[digit];
        }

      /* The digits came out least significant first.  */
      hexDigits = std::string (hexDigits.rbegin (), hexDigits.rend ());
      hexDigits.erase (hexDigits.find_last_not_of ('0') + 1);
      result += '.' + hexDigits;
    }

  sprintf (exponentText, "p%+d", printedExponent);
  result += exponentText;

  return result;
}
