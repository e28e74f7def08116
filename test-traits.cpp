/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <cfloat>
#include "numeric_traits.h"

using namespace numlit;

static void
test_capabilities (void)
{
  assert (FixedWidthIntegerLike<int8_t>::bitWidth == 8);
  assert (FixedWidthIntegerLike<int16_t>::bitWidth == 16);
  assert (FixedWidthIntegerLike<uint64_t>::bitWidth == 64);
  assert (FixedWidthIntegerLike<uint32_t>::format () == FixedInt::uint32);
  assert (IntegerLike<int32_t>::isSigned);
  assert (!IntegerLike<uint32_t>::isSigned);
  assert (&BinaryFloatLike<float>::format () == &BinaryFloat::ieeeSingle);
  assert (&BinaryFloatLike<double>::format () == &BinaryFloat::ieeeDouble);

  assert (IntegerLike<int64_t>::toExact (-5).toString () == "-5");
  assert (IntegerLike<uint64_t>::toExact (~(uint64_t) 0).toString ()
          == "18446744073709551615");
  assert (FixedWidthIntegerLike<int16_t>::toFixed (-2).toString () == "-2");
  assert (FixedWidthIntegerLike<uint8_t>::fromFixed
          (FixedInt (FixedInt::uint8, 200)) == 200);
  assert (BinaryFloatLike<double>::fromBinary
          (BinaryFloatLike<double>::toBinary (2.5)) == 2.5);
}

static void
test_integer_literals (void)
{
  int64_t wide = 1;
  int8_t narrow = 1;
  uint16_t unsignedValue = 1;

  assert (integerLiteralValue ("-9223372036854775808", wide) == opOK);
  assert (wide == INT64_MIN);
  assert (integerLiteralValue ("0x7f", narrow) == opOK);
  assert (narrow == 127);
  assert (integerLiteralValue ("128", narrow) == opInvalidOp);
  assert (narrow == 127);
  assert (integerLiteralValue ("-1", unsignedValue) == opInvalidOp);
  assert (integerLiteralValue ("0b1111111111111111", unsignedValue) == opOK);
  assert (unsignedValue == 0xffff);
  assert (integerLiteralValue ("bad", unsignedValue) == opSyntaxError);
  assert (integerLiteralValue ("1.0", unsignedValue) == opSyntaxError);
  assert (unsignedValue == 0xffff);
}

static void
test_float_text (void)
{
  double d = 3.0;
  float f = 3.0f;

  assert (floatLiteralValue ("0.1", d) == opInexact);
  assert (d == 0.1);
  assert (floatLiteralValue ("0x1.8p1", f) == opOK);
  assert (f == 3.0f);
  assert (floatLiteralValue ("0x1p-150", f)
          == (opStatus) (opUnderflow | opInexact));
  assert (f == 0.0f);
  assert (floatLiteralValue ("1e", f) == opSyntaxError);
  assert (f == 0.0f);

  assert (floatStringValue ("-.25", d) == opOK);
  assert (d == -0.25);
  assert (floatStringValue ("1e400", d)
          == (opStatus) (opInvalidOp | opOverflow | opInexact));
  assert (d == -0.25);
  assert (floatStringValue ("x", d) == opSyntaxError);
  assert (d == -0.25);
  assert (floatStringValue ("inf", f) == opOK);
  assert (f > FLT_MAX);
}

static void
test_conversions (void)
{
  int8_t narrow = 0;
  uint8_t byte = 0;
  int16_t half = 0;
  uint64_t wide = 0;
  float f = 0.0f;
  double d = 0.0;

  assert (convertInteger ((int32_t) 300, cpClamping, narrow) == opInexact);
  assert (narrow == 127);
  assert (convertInteger ((int32_t) -300, cpClamping, narrow) == opInexact);
  assert (narrow == -128);
  assert (convertInteger ((int32_t) 300, cpTruncating, narrow) == opInexact);
  assert (narrow == 44);
  assert (convertInteger ((int32_t) 300, cpExactly, narrow) == opInvalidOp);
  assert (narrow == 44);
  assert (convertInteger ((int8_t) -5, cpExact, half) == opOK);
  assert (half == -5);
  assert (convertInteger ((int8_t) -1, cpBitPattern, byte) == opOK);
  assert (byte == 255);
  assert (convertInteger ((int32_t) -1, cpTruncating, wide) == opInexact);
  assert (wide == ~(uint64_t) 0);

  assert (convertFloat (0.1, cpExact, f) == opInexact);
  assert (f == (float) 0.1);
  assert (convertFloat (0.1, cpExactly, f) == opInvalidOp);
  assert (f == (float) 0.1);
  assert (convertFloat (1e300, cpClamping, f) == opInexact);
  assert (f == FLT_MAX);
  assert (convertFloat (1e300, cpExact, f)
          == (opStatus) (opOverflow | opInexact));
  assert (f > FLT_MAX);
  assert (convertFloat (0.1f, cpExactly, d) == opOK);
  assert (d == (double) 0.1f);
}

static void
test_arithmetic (void)
{
  uint8_t byte;
  int8_t narrow;
  int16_t half;
  uint64_t wide;

  assert (addReportingOverflow ((uint8_t) 200, (uint8_t) 100, byte));
  assert (byte == 44);
  assert (!addReportingOverflow ((int8_t) 100, (int8_t) 27, narrow));
  assert (narrow == 127);
  assert (addReportingOverflow ((int8_t) -100, (int8_t) -29, narrow));
  assert (narrow == 127);

  assert (!multiplyReportingOverflow ((int16_t) -256, (int16_t) 128, half));
  assert (half == -32768);
  assert (multiplyReportingOverflow ((int16_t) 256, (int16_t) 128, half));
  assert (half == -32768);
  assert (multiplyReportingOverflow ((uint64_t) 1 << 32, (uint64_t) 1 << 32,
                                     wide));
  assert (wide == 0);
}

int main (void)
{
  test_capabilities ();
  test_integer_literals ();
  test_float_text ();
  test_conversions ();
  test_arithmetic ();

  return 0;
}
