/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "fixed_int.h"
#include "test-support.h"

using namespace numlit;

enum arithOp {
  aoAdd,
  aoSubtract,
  aoMultiply,
  aoDivide,
  aoRemainder
};

static bool
reporting (const IntFormat &format, long long lhs, arithOp op, long long rhs,
           long long result, bool overflow)
{
  FixedInt tmp (format, lhs), operand (format, rhs);
  bool flag;

  switch (op)
    {
    default:
      assert (0);
    case aoAdd:
      flag = tmp.addReportingOverflow (operand);
      break;
    case aoSubtract:
      flag = tmp.subtractReportingOverflow (operand);
      break;
    case aoMultiply:
      flag = tmp.multiplyReportingOverflow (operand);
      break;
    case aoDivide:
      flag = tmp.divideReportingOverflow (operand);
      break;
    case aoRemainder:
      flag = tmp.remainderReportingOverflow (operand);
      break;
    }

  return flag == overflow && tmp == FixedInt (format, result);
}

static void
add_overflow (void)
{
  FixedInt value (FixedInt::int8, 100);

  value.add (FixedInt (FixedInt::int8, 28));
}

static void
subtract_overflow (void)
{
  FixedInt value (FixedInt::uint32, 0);

  value.subtract (FixedInt (FixedInt::uint32, 1));
}

static void
multiply_overflow (void)
{
  FixedInt value (FixedInt::int64, 1LL << 32);

  value.multiply (FixedInt (FixedInt::int64, 1LL << 31));
}

static void
divide_by_zero (void)
{
  FixedInt value (FixedInt::int32, 7);

  value.divide (FixedInt (FixedInt::int32, 0));
}

static void
divide_overflow (void)
{
  FixedInt value (FixedInt::minValue (FixedInt::int16));

  value.divide (FixedInt (FixedInt::int16, -1));
}

static void
remainder_by_zero (void)
{
  FixedInt value (FixedInt::uint8, 7);

  value.remainder (FixedInt (FixedInt::uint8, 0));
}

static void
remainder_overflow (void)
{
  FixedInt value (FixedInt::minValue (FixedInt::int32));

  value.remainder (FixedInt (FixedInt::int32, -1));
}

static void
negate_minimum (void)
{
  FixedInt value (FixedInt::minValue (FixedInt::int8));

  value.negate ();
}

static void
negate_unsigned (void)
{
  FixedInt value (FixedInt::uint8, 1);

  value.negate ();
}

static void
abs_minimum (void)
{
  FixedInt value (FixedInt::minValue (FixedInt::int128));

  value.abs ();
}

static void
mixed_formats (void)
{
  FixedInt value (FixedInt::int8, 1);

  value.wrappingAdd (FixedInt (FixedInt::uint8, 1));
}

static void
unchecked_overflow (void)
{
  FixedInt value (FixedInt::maxValue (FixedInt::int32));

  value.uncheckedAdd (FixedInt (FixedInt::int32, 1));
}

static void
unchecked_divide_by_zero (void)
{
  FixedInt value (FixedInt::int32, 1);

  value.uncheckedDivide (FixedInt (FixedInt::int32, 0));
}

static void
full_width_divide_by_zero (void)
{
  FixedInt quotient (FixedInt::int8, 0), remainder (FixedInt::int8, 0);

  FixedInt::divideFullWidth (FixedInt (FixedInt::int8, 0),
                             FixedInt (FixedInt::int8, 0),
                             FixedInt (FixedInt::uint8, 1),
                             quotient, remainder);
}

static void
full_width_divide_overflow (void)
{
  FixedInt quotient (FixedInt::uint8, 0), remainder (FixedInt::uint8, 0);

  FixedInt::divideFullWidth (FixedInt (FixedInt::uint8, 2),
                             FixedInt (FixedInt::uint8, 2),
                             FixedInt (FixedInt::uint8, 0),
                             quotient, remainder);
}

static void
full_width_signed_low (void)
{
  FixedInt quotient (FixedInt::int8, 0), remainder (FixedInt::int8, 0);

  FixedInt::divideFullWidth (FixedInt (FixedInt::int8, 3),
                             FixedInt (FixedInt::int8, 0),
                             FixedInt (FixedInt::int8, 1),
                             quotient, remainder);
}

static void
test_reporting (void)
{
  const IntFormat &i8 = FixedInt::int8;
  const IntFormat &u8 = FixedInt::uint8;
  const IntFormat &i64 = FixedInt::int64;

  assert (reporting (i8, 100, aoAdd, 27, 127, false));
  assert (reporting (i8, 100, aoAdd, 28, -128, true));
  assert (reporting (i8, -100, aoAdd, -29, 127, true));
  assert (reporting (u8, 200, aoAdd, 100, 44, true));
  assert (reporting (u8, 5, aoSubtract, 6, 255, true));
  assert (reporting (i8, -128, aoSubtract, 1, 127, true));
  assert (reporting (i8, 0, aoSubtract, -128, -128, true));
  assert (reporting (i8, -1, aoSubtract, -128, 127, false));
  assert (reporting (i8, 16, aoMultiply, 8, -128, true));
  assert (reporting (i8, -16, aoMultiply, 8, -128, false));
  assert (reporting (i8, -128, aoMultiply, -1, -128, true));
  assert (reporting (u8, 16, aoMultiply, 16, 0, true));
  assert (reporting (u8, 15, aoMultiply, 17, 255, false));
  assert (reporting (i64, 3037000500LL, aoMultiply, 3037000500LL,
                     -9223372036709301616LL, true));
  assert (reporting (i64, -3037000499LL, aoMultiply, 3037000499LL,
                     -9223372030926249001LL, false));

  assert (reporting (i8, 7, aoDivide, 2, 3, false));
  assert (reporting (i8, -7, aoDivide, 2, -3, false));
  assert (reporting (i8, 7, aoRemainder, -2, 1, false));
  assert (reporting (i8, -7, aoRemainder, 2, -1, false));
  assert (reporting (i8, -128, aoDivide, -1, -128, true));
  assert (reporting (i8, 5, aoDivide, -1, -5, false));
  assert (reporting (u8, 255, aoDivide, 255, 1, false));

  /* Division and remainder by zero keep the dividend; remainder by
     -1 is zero but reported.  */
  {
    const long long dividends[] = { 0, 1, -1, 42, -128, 127 };
    unsigned int i;

    for (i = 0; i < sizeof dividends / sizeof dividends[0]; i++)
      {
        long long x = dividends[i];

        assert (reporting (i8, x, aoDivide, 0, x, true));
        assert (reporting (i8, x, aoRemainder, 0, x, true));
        assert (reporting (i8, x, aoRemainder, -1, 0, true));
      }
  }
  assert (reporting (u8, 200, aoDivide, 0, 200, true));

  /* 128-bit carries.  */
  {
    FixedInt value (FixedInt::maxValue (FixedInt::int128));

    assert (value.addReportingOverflow (FixedInt (FixedInt::int128, 1)));
    assert (value == FixedInt::minValue (FixedInt::int128));
    assert (value.subtractReportingOverflow (FixedInt (FixedInt::int128, 1)));
    assert (value == FixedInt::maxValue (FixedInt::int128));

    value = FixedInt::fromBits (FixedInt::uint128, 0, 1);
    assert (value.multiplyReportingOverflow
            (FixedInt::fromBits (FixedInt::uint128, 0, 1)));
    assert (value.isZero ());
  }
}

static void
test_trapping (void)
{
  FixedInt value (FixedInt::int32, -7);

  value.add (FixedInt (FixedInt::int32, 10));
  assert (value == FixedInt (FixedInt::int32, 3));
  value.multiply (FixedInt (FixedInt::int32, -5));
  assert (value == FixedInt (FixedInt::int32, -15));
  value.divide (FixedInt (FixedInt::int32, 4));
  assert (value == FixedInt (FixedInt::int32, -3));
  value.subtract (FixedInt (FixedInt::int32, 10));
  value.remainder (FixedInt (FixedInt::int32, 5));
  assert (value == FixedInt (FixedInt::int32, -3));
  value.remainder (FixedInt (FixedInt::int32, -1));
  assert (value.isZero ());

  value = FixedInt (FixedInt::int32, -9);
  value.abs ();
  assert (value == FixedInt (FixedInt::int32, 9));
  value.negate ();
  assert (value == FixedInt (FixedInt::int32, -9));

  value = FixedInt (FixedInt::uint8, 0);
  value.negate ();
  assert (value.isZero ());

  assert (dies (add_overflow));
  assert (dies (subtract_overflow));
  assert (dies (multiply_overflow));
  assert (dies (divide_by_zero));
  assert (dies (divide_overflow));
  assert (dies (remainder_by_zero));
  assert (dies (remainder_overflow));
  assert (dies (negate_minimum));
  assert (dies (negate_unsigned));
  assert (dies (abs_minimum));
  assert (dies (mixed_formats));
}

static void
test_wrapping (void)
{
  FixedInt value (FixedInt::maxValue (FixedInt::int16));

  value.wrappingAdd (FixedInt (FixedInt::int16, 1));
  assert (value == FixedInt::minValue (FixedInt::int16));
  value.wrappingSubtract (FixedInt (FixedInt::int16, 1));
  assert (value == FixedInt::maxValue (FixedInt::int16));
  value.wrappingMultiply (FixedInt (FixedInt::int16, 2));
  assert (value == FixedInt (FixedInt::int16, -2));

  value = FixedInt::minValue (FixedInt::int16);
  value.wrappingNegate ();
  assert (value == FixedInt::minValue (FixedInt::int16));

  value = FixedInt (FixedInt::uint8, 1);
  value.wrappingNegate ();
  assert (value == FixedInt (FixedInt::uint8, 255));
  value.wrappingMultiply (FixedInt (FixedInt::uint8, 255));
  assert (value == FixedInt (FixedInt::uint8, 1));

  value = FixedInt::maxValue (FixedInt::uint128);
  value.wrappingMultiply (FixedInt::maxValue (FixedInt::uint128));
  assert (value == FixedInt (FixedInt::uint128, 1));
}

static void
test_unchecked (void)
{
  FixedInt value (FixedInt::int32, 40);

  value.uncheckedAdd (FixedInt (FixedInt::int32, 2));
  value.uncheckedSubtract (FixedInt (FixedInt::int32, 12));
  value.uncheckedMultiply (FixedInt (FixedInt::int32, 3));
  value.uncheckedDivide (FixedInt (FixedInt::int32, 9));
  assert (value == FixedInt (FixedInt::int32, 10));

  if (checkedArithmeticEnabled ())
    assert (dies (unchecked_overflow));
  else
    {
      value = FixedInt::maxValue (FixedInt::int32);
      value.uncheckedAdd (FixedInt (FixedInt::int32, 1));
      assert (value == FixedInt::minValue (FixedInt::int32));
    }

  assert (dies (unchecked_divide_by_zero));
}

static void
test_full_width (void)
{
  FixedInt high (FixedInt::int8, 0), low (FixedInt::uint8, 0);
  FixedInt quotient (FixedInt::int8, 0), remainder (FixedInt::int8, 0);

  /* -100 * 100 = -10000 = 0xd8f0.  */
  FixedInt::multiplyFullWidth (FixedInt (FixedInt::int8, -100),
                               FixedInt (FixedInt::int8, 100), high, low);
  assert (high == FixedInt (FixedInt::int8, -40));
  assert (low == FixedInt (FixedInt::uint8, 0xf0));

  /* And back again.  */
  FixedInt::divideFullWidth (FixedInt (FixedInt::int8, 100), high, low,
                             quotient, remainder);
  assert (quotient == FixedInt (FixedInt::int8, -100));
  assert (remainder.isZero ());

  /* -10001 / 7 = -1428 remainder -5: the quotient does not fit, the
     remainder is still exact and the quotient keeps its low bits.  */
  low = FixedInt (FixedInt::uint8, 0xef);
  assert (FixedInt::divideFullWidthReportingOverflow
          (FixedInt (FixedInt::int8, 7), high, low, quotient, remainder));
  assert (quotient == FixedInt (FixedInt::int8, 108));
  assert (remainder == FixedInt (FixedInt::int8, -5));

  /* -10001 / -100 = 100 remainder -1.  */
  assert (!FixedInt::divideFullWidthReportingOverflow
          (FixedInt (FixedInt::int8, -100), high, low, quotient, remainder));
  assert (quotient == FixedInt (FixedInt::int8, 100));
  assert (remainder == FixedInt (FixedInt::int8, -1));

  /* A zero divisor gives the low half and reports.  */
  assert (FixedInt::divideFullWidthReportingOverflow
          (FixedInt (FixedInt::int8, 0), high, low, quotient, remainder));
  assert (quotient == FixedInt (FixedInt::int8, -17));
  assert (remainder.isZero ());

  /* Unsigned 64-bit: (2^64 - 1)^2 / (2^64 - 1).  */
  {
    FixedInt max (FixedInt::maxValue (FixedInt::uint64));
    FixedInt uhigh (FixedInt::uint64, 0), ulow (FixedInt::uint64, 0);
    FixedInt uquotient (FixedInt::uint64, 0), uremainder (FixedInt::uint64, 0);

    FixedInt::multiplyFullWidth (max, max, uhigh, ulow);
    assert (uhigh.getZExtValue () == 0xfffffffffffffffeULL);
    assert (ulow.getZExtValue () == 1);

    FixedInt::divideFullWidth (max, uhigh, ulow, uquotient, uremainder);
    assert (uquotient == max);
    assert (uremainder.isZero ());
  }

  /* Full width 128-bit products.  */
  {
    FixedInt min (FixedInt::minValue (FixedInt::int128));
    FixedInt whigh (FixedInt::int128, 0), wlow (FixedInt::uint128, 0);

    FixedInt::multiplyFullWidth (min, min, whigh, wlow);
    assert (whigh.toString (16) == "40000000000000000000000000000000");
    assert (wlow.isZero ());
  }

  assert (FixedInt (FixedInt::int8, -128).magnitude ()
          == FixedInt (FixedInt::uint8, 128));
  assert (FixedInt (FixedInt::int8, 5).magnitude ()
          == FixedInt (FixedInt::uint8, 5));

  assert (dies (full_width_divide_by_zero));
  assert (dies (full_width_divide_overflow));
  assert (dies (full_width_signed_low));
}

int main (void)
{
  test_reporting ();
  test_trapping ();
  test_wrapping ();
  test_unchecked ();
  test_full_width ();

  return 0;
}
