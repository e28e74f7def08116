/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include "binary_float.h"
#include "literal.h"

using namespace numlit;

/* Runtime strings.  These are more permissive than literals: digits
   on either side of the point are optional, the binary exponent of a
   hexadecimal number is optional, a '+' sign is allowed, and
   infinities and NaNs have names.  Separators and whitespace are
   not allowed anywhere.  */

namespace {

  /* Exponent digits stop accumulating here.  */
  const long long exponentDigitsLimit = 1LL << 40;

  enum scanState {
    ssWhole,
    ssFraction,
    ssExponentSign,
    ssExponentFirst,
    ssExponent,
    ssEnd
  };

  /* If P starts with the lower-case WORD, ignoring case, return the
     text after it, otherwise zero.  */
  const char *
  skipKeyword (const char *p, const char *word)
  {
    for (; *word; p++, word++)
      if ((*p | 0x20) != *word)
        return 0;

    return p;
  }

  bool
  isKeyword (const char *p, const char *word)
  {
    p = skipKeyword (p, word);

    return p && *p == 0;
  }

  /* Scan a NaN payload and its closing parenthesis, which must end
     the string.  A 0x prefix means hexadecimal and a leading zero
     octal; otherwise the payload is decimal.  An empty payload is
     zero.  */
  opStatus
  scanPayload (const char *p, ExactInteger &payload)
  {
    unsigned int radix, digits;

    if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X'))
      {
        radix = 16;
        p += 2;
      }
    else if (p[0] == '0')
      radix = 8;
    else
      radix = 10;

    for (digits = 0; *p != ')'; p++, digits++)
      {
        unsigned int digit;

        digit = digitValue (*p, radix);
        if (digit == -1U)
          return opSyntaxError;

        payload.multiplyAndAdd (radix, digit);
      }

    if ((radix == 16 && digits == 0) || p[1] != 0)
      return opSyntaxError;

    return opOK;
  }

  /* Scan a decimal or hexadecimal number following any sign.  */
  opStatus
  scanNumber (const char *p, bool negative, ExactFloat &result)
  {
    ExactInteger significand;
    unsigned int radix, digitCount, fractionDigits;
    long long exponent, scale;
    bool exponentNegative;
    unsigned int exponentLetter;
    scanState state;

    radix = 10;
    exponentLetter = 'e';
    if (p[0] == '0' && (p[1] == 'x' || p[1] == 'X'))
      {
        radix = 16;
        exponentLetter = 'p';
        p += 2;
      }

    digitCount = 0;
    fractionDigits = 0;
    exponent = 0;
    exponentNegative = false;

    for (state = ssWhole; state != ssEnd; p++)
      {
        unsigned int c, digit;

        c = *p;
        switch (state)
          {
          case ssWhole:
          case ssFraction:
            digit = digitValue (c, radix);
            if (digit != -1U)
              {
                significand.multiplyAndAdd (radix, digit);
                digitCount++;
                if (state == ssFraction)
                  fractionDigits++;
              }
            else if (c == '.' && state == ssWhole)
              state = ssFraction;
            else if (digitCount == 0)
              return opSyntaxError;
            else if ((c | 0x20) == exponentLetter)
              state = ssExponentSign;
            else if (c == 0)
              state = ssEnd;
            else
              return opSyntaxError;
            break;

          case ssExponentSign:
            if (c == '+' || c == '-')
              {
                exponentNegative = c == '-';
                state = ssExponentFirst;
                break;
              }
            /* Fall through.  */

          case ssExponentFirst:
            if (digitValue (c, 10) == -1U)
              return opSyntaxError;
            state = ssExponent;
            /* Fall through.  */

          case ssExponent:
            if (c == 0)
              {
                state = ssEnd;
                break;
              }

            digit = digitValue (c, 10);
            if (digit == -1U)
              return opSyntaxError;
            if (exponent < exponentDigitsLimit)
              exponent = exponent * 10 + digit;
            break;

          case ssEnd:
            break;
          }
      }

    if (exponentNegative)
      exponent = -exponent;

    /* Each hexadecimal fraction digit is four binary places.  */
    scale = radix == 16 ? 4LL * fractionDigits: (long long) fractionDigits;

    result = ExactFloat (negative, significand,
                         ExactFloat::saturateExponent (exponent - scale),
                         radix == 16 ? 2: 10);

    return opOK;
  }
}

opStatus
BinaryFloat::convertFromString (const char *p)
{
  BinaryFloat result (*format, fcZero, false);
  ExactFloat value;
  const char *rest;
  bool negative;
  opStatus status;

  negative = *p == '-';
  if (*p == '-' || *p == '+')
    p++;

  if (isKeyword (p, "inf") || isKeyword (p, "infinity"))
    {
      result.category = fcInfinity;
      result.sign = negative;
      *this = result;
      return opOK;
    }

  rest = skipKeyword (p, "snan");
  if (rest || (rest = skipKeyword (p, "nan")) != 0)
    {
      ExactInteger payload;
      bool signaling;

      signaling = (*p | 0x20) == 's';
      if (*rest == '(')
        {
          if (scanPayload (rest + 1, payload) != opOK)
            return opSyntaxError;
        }
      else if (*rest)
        return opSyntaxError;

      /* Payloads too wide for the format keep their low bits.  */
      result.sign = negative;
      result.makeNaN (signaling, payload.magnitudeParts (),
                      payload.partCount ());
      *this = result;
      return opOK;
    }

  if (scanNumber (p, negative, value) != opOK)
    return opSyntaxError;

  /* Unlike a literal conversion, a value that does not survive
     rounding is a failure.  */
  status = result.convertFromExactFloat (value);
  if (status & opOverflow)
    return (opStatus) (opInvalidOp | opOverflow | opInexact);
  if (result.category == fcZero && !value.isZero ())
    return (opStatus) (opInvalidOp | opUnderflow | opInexact);

  *this = result;

  return (status & opInexact) ? opInexact: opOK;
}
