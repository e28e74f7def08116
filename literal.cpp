/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include "literal.h"

using namespace numlit;

namespace {

  /* Exponent digits stop accumulating here; the saturated value is
     far outside every format.  */
  const long long exponentDigitsLimit = 1LL << 40;

  /* Skip a 0b, 0o or 0x prefix, setting *RADIX.  */
  const char *
  skipRadixPrefix (const char *p, unsigned int *radix)
  {
    *radix = 10;
    if (p[0] != '0')
      return p;

    switch (p[1])
      {
      case 'b':
        *radix = 2;
        return p + 2;
      case 'o':
        *radix = 8;
        return p + 2;
      case 'x':
        *radix = 16;
        return p + 2;
      default:
        return p;
      }
  }

  /* Scan a run of digits in RADIX starting at P.  The run must begin
     with a digit; after that '_' separators are skipped.  Each digit
     is accumulated into VALUE and counted in *DIGITS.  Returns the
     first character after the run, or zero if there is no run.  */
  const char *
  scanDigitRun (const char *p, unsigned int radix, ExactInteger &value,
                unsigned int *digits)
  {
    if (digitValue (*p, radix) == -1U)
      return 0;

    *digits = 0;
    for (;; p++)
      {
        unsigned int digit;

        if (*p == '_')
          continue;

        digit = digitValue (*p, radix);
        if (digit == -1U)
          break;

        value.multiplyAndAdd (radix, digit);
        ++*digits;
      }

    return p;
  }

  /* Scan an optionally signed decimal exponent whose digits may
     contain separators.  P points after the exponent letter.  */
  const char *
  scanExponent (const char *p, long long *exponent)
  {
    bool negative;
    long long value;

    negative = *p == '-';
    if (*p == '-' || *p == '+')
      p++;

    if (digitValue (*p, 10) == -1U)
      return 0;

    value = 0;
    for (;; p++)
      {
        unsigned int digit;

        if (*p == '_')
          continue;

        digit = digitValue (*p, 10);
        if (digit == -1U)
          break;

        if (value < exponentDigitsLimit)
          value = value * 10 + digit;
      }

    *exponent = negative ? -value: value;

    return p;
  }
}

unsigned int
numlit::digitValue (unsigned int c, unsigned int radix)
{
  unsigned int r;

  r = c - '0';
  if (r > 9)
    {
      r = c - 'a';
      if (r > 5)
        {
          r = c - 'A';
          if (r > 5)
            return -1U;
        }
      r += 10;
    }

  return r < radix ? r: -1U;
}

opStatus
numlit::parseIntegerLiteral (const char *p, ExactInteger &result)
{
  ExactInteger value;
  unsigned int radix, digits;
  bool negative;

  /* The sign is part of the token, so the most negative value of a
     type is writable without a negation that would overflow.  */
  negative = *p == '-';
  if (negative)
    p++;

  p = skipRadixPrefix (p, &radix);
  p = scanDigitRun (p, radix, value, &digits);
  if (!p || *p)
    return opSyntaxError;

  if (negative)
    value.negate ();
  result = value;

  return opOK;
}

opStatus
numlit::parseFloatLiteral (const char *p, ExactFloat &result)
{
  ExactInteger significand;
  unsigned int radix, wholeDigits, fractionDigits;
  long long exponent, scale;
  bool negative, hexadecimal;

  negative = *p == '-';
  if (negative)
    p++;

  hexadecimal = p[0] == '0' && p[1] == 'x';
  if (hexadecimal)
    {
      radix = 16;
      p += 2;
    }
  else
    radix = 10;

  p = scanDigitRun (p, radix, significand, &wholeDigits);
  if (!p)
    return opSyntaxError;

  fractionDigits = 0;
  if (*p == '.')
    {
      p = scanDigitRun (p + 1, radix, significand, &fractionDigits);
      if (!p)
        return opSyntaxError;
    }

  exponent = 0;
  if (hexadecimal)
    {
      if (*p != 'p' && *p != 'P')
        return opSyntaxError;
      p = scanExponent (p + 1, &exponent);
    }
  else if (*p == 'e' || *p == 'E')
    p = scanExponent (p + 1, &exponent);

  if (!p || *p)
    return opSyntaxError;

  /* Each hexadecimal fraction digit is four binary places.  */
  scale = hexadecimal ? 4LL * fractionDigits: (long long) fractionDigits;

  result = ExactFloat (negative, significand,
                       ExactFloat::saturateExponent (exponent - scale),
                       hexadecimal ? 2: 10);

  return opOK;
}

literalKind
numlit::classifyLiteral (const char *p)
{
  ExactInteger integer;
  ExactFloat real;

  if (parseIntegerLiteral (p, integer) == opOK)
    return lkInteger;
  if (parseFloatLiteral (p, real) == opOK)
    return lkFloat;

  return lkInvalid;
}
