/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "binary_float.h"
#include "fixed_int.h"
#include "literal.h"
#include "test-support.h"

using namespace numlit;

static const IntFormat int7 = { 7, true };
static const IntFormat uint80 = { 80, false };
static const IntFormat x87Bits = { 80, false };

static bool
int_convert (const IntFormat &from, long long value, const IntFormat &to,
             conversionPolicy policy, long long result, opStatus status)
{
  FixedInt tmp (from, value);

  if (tmp.convert (to, policy) != status)
    return false;

  return tmp == FixedInt (to, result);
}

static bool
literal_is (const FloatFormat &format, const char *text,
            const char *expected, opStatus status)
{
  BinaryFloat value (format, BinaryFloat::fcZero, false);

  if (value.convertFromLiteral (text) != status)
    return false;

  return value.bitwiseIsEqual (BinaryFloat (format, expected));
}

static bool
float_convert (const BinaryFloat &from, const FloatFormat &to,
               conversionPolicy policy, const BinaryFloat &result,
               opStatus status)
{
  BinaryFloat tmp (from);

  if (tmp.convert (to, policy) != status)
    return false;

  return tmp.bitwiseIsEqual (result);
}

static bool
to_integer (double value, const IntFormat &format, long long result,
            opStatus status)
{
  FixedInt tmp (format, 99);

  if (BinaryFloat (value).convertToInteger (tmp, format) != status)
    return false;

  if (status == opInvalidOp)
    return tmp == FixedInt (format, 99);

  return tmp == FixedInt (format, result);
}

static void
exact_overflow (void)
{
  FixedInt value (FixedInt::int16, 300);

  (void) value.convert (FixedInt::int8, cpExact);
}

static void
bit_pattern_wider (void)
{
  FixedInt value (FixedInt::int8, -1);

  (void) value.convert (FixedInt::uint16, cpBitPattern);
}

static void
bit_pattern_same_signedness (void)
{
  FixedInt value (FixedInt::uint8, 1);

  (void) value.convert (FixedInt::uint8, cpBitPattern);
}

static void
bit_pattern_from_exact (void)
{
  FixedInt value (FixedInt::uint8, 1);

  (void) value.convertFromExactInteger (ExactInteger (1), FixedInt::int8,
                                        cpBitPattern);
}

static void
zero_width (void)
{
  IntFormat empty = { 0, false };
  FixedInt value (empty, 0);
}

static void
nan_to_integer (void)
{
  FixedInt value (FixedInt::int32, 0);
  BinaryFloat nan (BinaryFloat::ieeeDouble, BinaryFloat::fcNaN, false);

  (void) value.convertFromFloat (nan, FixedInt::int32, cpExact);
}

static void
float_truncating (void)
{
  BinaryFloat value (1.5);

  (void) value.convert (BinaryFloat::ieeeSingle, cpTruncating);
}

static void
clamping_from_integer (void)
{
  BinaryFloat value (1.5);

  (void) value.convertFromInteger (FixedInt (FixedInt::int32, 3),
                                   cpClamping);
}

static void
rejected_string (void)
{
  BinaryFloat value (BinaryFloat::ieeeDouble, "1e999");
}

static void
test_integer_policies (void)
{
  /* Clamping saturates.  */
  assert (int_convert (FixedInt::int16, 300, FixedInt::int8, cpClamping,
                       127, opInexact));
  assert (int_convert (FixedInt::int16, -300, FixedInt::int8, cpClamping,
                       -128, opInexact));
  assert (int_convert (FixedInt::int16, -5, FixedInt::uint64, cpClamping,
                       0, opInexact));
  assert (int_convert (FixedInt::int16, 100, FixedInt::int8, cpClamping,
                       100, opOK));

  /* Exactly fails and leaves the value alone.  */
  assert (int_convert (FixedInt::int16, 100, FixedInt::int8, cpExactly,
                       100, opOK));
  {
    FixedInt value (FixedInt::int16, 300);

    assert (value.convert (FixedInt::int8, cpExactly) == opInvalidOp);
    assert (value == FixedInt (FixedInt::int16, 300));
    assert (value.convert (FixedInt::uint8, cpExactly) == opInvalidOp);
  }
  assert (int_convert (FixedInt::int8, -1, FixedInt::int64, cpExact,
                       -1, opOK));
  assert (int_convert (FixedInt::int8, 63, int7, cpExact, 63, opOK));

  /* Truncating keeps the low bits.  */
  assert (int_convert (FixedInt::int16, 300, FixedInt::int8, cpTruncating,
                       44, opInexact));
  assert (int_convert (FixedInt::int16, 200, FixedInt::int8, cpTruncating,
                       -56, opInexact));
  assert (int_convert (FixedInt::int8, -1, FixedInt::uint16, cpTruncating,
                       65535, opInexact));
  assert (int_convert (FixedInt::int8, 5, FixedInt::uint16, cpTruncating,
                       5, opOK));
  assert (int_convert (FixedInt::int16, 64, int7, cpTruncating,
                       -64, opInexact));

  /* Bit patterns.  */
  assert (int_convert (FixedInt::int8, -1, FixedInt::uint8, cpBitPattern,
                       255, opOK));
  assert (int_convert (FixedInt::uint8, 200, FixedInt::int8, cpBitPattern,
                       -56, opOK));
  {
    FixedInt value (FixedInt::int128, -1);

    assert (value.convert (FixedInt::uint128, cpBitPattern) == opOK);
    assert (value == FixedInt::maxValue (FixedInt::uint128));
  }

  assert (dies (exact_overflow));
  assert (dies (bit_pattern_wider));
  assert (dies (bit_pattern_same_signedness));
  assert (dies (bit_pattern_from_exact));
  assert (dies (zero_width));
}

/* Truncating a negative value into a wider unsigned type is
   (max + 1) - truncating (-value).  */
static void
test_wide_unsigned_identity (void)
{
  const long long values[] = { -1, -2, -100, -127, -128 };
  const IntFormat *targets[] = {
    &FixedInt::uint16, &FixedInt::uint32, &FixedInt::uint64,
    &FixedInt::uint128, &uint80
  };
  unsigned int i, j;

  for (i = 0; i < sizeof values / sizeof values[0]; i++)
    for (j = 0; j < sizeof targets / sizeof targets[0]; j++)
      {
        const IntFormat &target = *targets[j];
        FixedInt direct (FixedInt::int8, values[i]);
        FixedInt negated (FixedInt::int16, -values[i]);
        FixedInt identity (FixedInt::maxValue (target));

        assert (direct.convert (target, cpTruncating) == opInexact);
        assert (negated.convert (target, cpTruncating) == opOK);

        identity.wrappingSubtract (negated);
        identity.wrappingAdd (FixedInt (target, 1));
        assert (direct == identity);
      }
}

/* Whatever converts exactly converts exactly back.  */
static void
test_integer_round_trip (void)
{
  const long long values[] = {
    0, 1, -1, 127, -128, 128, 255, 256, 32767, -32768, 65535,
    2147483647LL, -2147483647LL - 1, 4294967295LL,
    9223372036854775807LL, -9223372036854775807LL - 1
  };
  const IntFormat *formats[] = {
    &FixedInt::int8, &FixedInt::uint8, &FixedInt::int16, &FixedInt::uint16,
    &FixedInt::int32, &FixedInt::uint32, &FixedInt::int64, &FixedInt::uint64,
    &FixedInt::int128, &int7
  };
  unsigned int i, j, k;

  for (i = 0; i < sizeof values / sizeof values[0]; i++)
    for (j = 0; j < sizeof formats / sizeof formats[0]; j++)
      for (k = 0; k < sizeof formats / sizeof formats[0]; k++)
        {
          FixedInt x (FixedInt::int64, values[i]);
          FixedInt y (*formats[j], 0);

          if (y.convertFromExactInteger (x.toExact (), *formats[j], cpExactly)
              != opOK)
            continue;
          if (y.convert (*formats[k], cpExactly) != opOK)
            continue;

          assert (y.convert (FixedInt::int64, cpExactly) == opOK);
          assert (y == x);
        }
}

static void
test_extremes (void)
{
  ExactInteger parsed;
  FixedInt value (FixedInt::int64, 0);

  assert (FixedInt::maxValue (FixedInt::int128).toString ()
          == "170141183460469231731687303715884105727");
  assert (FixedInt::minValue (FixedInt::int128).toString ()
          == "-170141183460469231731687303715884105728");
  assert (FixedInt::maxValue (FixedInt::uint128).toString ()
          == "340282366920938463463374607431768211455");
  assert (FixedInt::maxValue (FixedInt::uint128).toString (16)
          == "ffffffffffffffffffffffffffffffff");
  assert (FixedInt::minValue (int7).getSExtValue () == -64);
  assert (FixedInt::maxValue (uint80).toString (16)
          == "ffffffffffffffffffff");

  /* The sign belongs to the literal, so the minimum is writable.  */
  assert (parseIntegerLiteral ("-9223372036854775808", parsed) == opOK);
  assert (value.convertFromExactInteger (parsed, FixedInt::int64, cpExactly)
          == opOK);
  assert (value == FixedInt::minValue (FixedInt::int64));
  assert (parseIntegerLiteral ("9223372036854775808", parsed) == opOK);
  assert (value.convertFromExactInteger (parsed, FixedInt::int64, cpExactly)
          == opInvalidOp);
  assert (value.convertFromExactInteger (parsed, FixedInt::uint64, cpExactly)
          == opOK);
  assert (value.getZExtValue () == 9223372036854775808ULL);

  assert (FixedInt::fromBits (FixedInt::int8, 0x1ff).getSExtValue () == -1);
  assert (FixedInt (FixedInt::uint8, -1).getZExtValue () == 255);
}

static void
test_float_conversions (void)
{
  const FloatFormat &single = BinaryFloat::ieeeSingle;
  BinaryFloat value (0.1);

  /* One rounding.  */
  assert (value.convert (single, cpExact) == opInexact);
  assert (value.convertToFloat () == 0.1f);

  value = BinaryFloat (0.1);
  assert (value.convert (single, cpExactly) == opInvalidOp);
  assert (&value.getFormat () == &BinaryFloat::ieeeDouble);
  assert (value.convertToDouble () == 0.1);

  assert (float_convert (BinaryFloat (0.5), single, cpExactly,
                         BinaryFloat (0.5f), opOK));
  assert (float_convert (BinaryFloat (0.1f), BinaryFloat::ieeeDouble,
                         cpExactly, BinaryFloat ((double) 0.1f), opOK));

  /* Overflow and underflow.  */
  assert (float_convert (BinaryFloat (1e300), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcInfinity, false),
                         (opStatus) (opOverflow | opInexact)));
  assert (float_convert (BinaryFloat (-1e300), single, cpClamping,
                         BinaryFloat::largest (single, true), opInexact));
  assert (float_convert (BinaryFloat (single, BinaryFloat::fcInfinity, false),
                         BinaryFloat::ieeeHalf, cpClamping,
                         BinaryFloat::largest (BinaryFloat::ieeeHalf),
                         opInexact));
  assert (float_convert (BinaryFloat (1e-300), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcZero, false),
                         (opStatus) (opUnderflow | opInexact)));
  assert (float_convert (BinaryFloat (-1e-300), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcZero, true),
                         (opStatus) (opUnderflow | opInexact)));
  assert (float_convert (BinaryFloat (1e-40), single, cpExact,
                         BinaryFloat ((float) 1e-40),
                         (opStatus) (opUnderflow | opInexact)));
  assert (float_convert (BinaryFloat (1e300), single, cpExactly,
                         BinaryFloat (1e300), opInvalidOp));
  assert (float_convert (BinaryFloat (1e-300), single, cpExactly,
                         BinaryFloat (1e-300), opInvalidOp));
  assert (float_convert (BinaryFloat (-0.0), single, cpExactly,
                         BinaryFloat (-0.0f), opOK));

  /* NaNs keep their flag and never convert exactly.  */
  {
    BinaryFloat nan (BinaryFloat::ieeeDouble, BinaryFloat::fcNaN, true);

    assert (nan.setNaN (true, ExactInteger (0x1234)) == opOK);
    assert (nan.convert (single, cpExact) == opOK);
    assert (nan.isNaN () && nan.isSignalingNaN () && nan.isNegative ());
    assert (nan.getNaNPayload () == ExactInteger (0x1234));
    assert (nan.convert (BinaryFloat::ieeeDouble, cpExactly) == opInvalidOp);
    assert (&nan.getFormat () == &single);
  }

  /* Round trip where the first conversion is exact.  */
  {
    const double values[] = { 0.0, -0.0, 1.0, 0.5, 1e30, -3.25, 1e-40,
                              3.4028234663852886e38, 0.1 };
    unsigned int i;

    for (i = 0; i < sizeof values / sizeof values[0]; i++)
      {
        BinaryFloat x (values[i]), y (values[i]);

        if (y.convert (single, cpExactly) != opOK)
          continue;
        assert (y.convert (BinaryFloat::ieeeDouble, cpExactly) == opOK);
        assert (y.bitwiseIsEqual (x));
      }
  }

  assert (dies (float_truncating));
}

/* A value just above a single-precision tie rounds up when rounded
   once, but rounding through double first lands on the tie and then
   rounds to even.  */
static void
test_double_rounding (void)
{
  const char *text = "0x1.000001000000001p0";
  BinaryFloat once (BinaryFloat::ieeeSingle, BinaryFloat::fcZero, false);
  BinaryFloat twice (BinaryFloat::ieeeDouble, BinaryFloat::fcZero, false);

  assert (once.convertFromLiteral (text) == opInexact);
  assert (once.bitwiseIsEqual (BinaryFloat (BinaryFloat::ieeeSingle,
                                            "0x1.000002p0")));

  assert (twice.convertFromLiteral (text) == opInexact);
  assert (twice.convert (BinaryFloat::ieeeSingle, cpExact) == opInexact);
  assert (twice.bitwiseIsEqual (BinaryFloat (1.0f)));

  /* Likewise for a decimal literal a little above the tie
     1 + 2^-24.  */
  assert (literal_is (BinaryFloat::ieeeSingle, "1.00000005960464478",
                      "0x1.000002p0", opInexact));
  assert (literal_is (BinaryFloat::ieeeDouble, "1.00000005960464478",
                      "0x1.000001p0", opInexact));
}

/* Ties round to even; overflow goes to infinity of either sign.  */
static void
test_nearest_even (void)
{
  const FloatFormat &single = BinaryFloat::ieeeSingle;
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;

  assert (float_convert (BinaryFloat (dbl, "0x1.000001p0"), single, cpExact,
                         BinaryFloat (1.0f), opInexact));
  assert (float_convert (BinaryFloat (dbl, "-0x1.000001p0"), single, cpExact,
                         BinaryFloat (-1.0f), opInexact));
  assert (float_convert (BinaryFloat (dbl, "0x1.000003p0"), single, cpExact,
                         BinaryFloat (single, "0x1.000004p0"), opInexact));
  assert (float_convert (BinaryFloat (dbl, "0x1.0000030000001p0"), single,
                         cpExact, BinaryFloat (single, "0x1.000004p0"),
                         opInexact));
  assert (float_convert (BinaryFloat (dbl, "0x1.0000010000001p0"), single,
                         cpExact, BinaryFloat (single, "0x1.000002p0"),
                         opInexact));

  /* Subnormal ties.  */
  assert (float_convert (BinaryFloat (dbl, "0x1p-150"), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcZero, false),
                         (opStatus) (opUnderflow | opInexact)));
  assert (float_convert (BinaryFloat (dbl, "0x3p-150"), single, cpExact,
                         BinaryFloat (single, "0x1p-148"),
                         (opStatus) (opUnderflow | opInexact)));

  /* A carry out of the largest binade overflows.  */
  assert (float_convert (BinaryFloat (dbl, "0x1.ffffffp127"), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcInfinity, false),
                         (opStatus) (opOverflow | opInexact)));
  assert (float_convert (BinaryFloat (dbl, "-0x1.fffffe8p127"), single,
                         cpExact, BinaryFloat::largest (single, true),
                         opInexact));
  assert (float_convert (BinaryFloat (-1e300), single, cpExact,
                         BinaryFloat (single, BinaryFloat::fcInfinity, true),
                         (opStatus) (opOverflow | opInexact)));
}

static void
test_literals (void)
{
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;

  assert (literal_is (dbl, "0x1.8p-1", "0.75", opOK));
  assert (literal_is (dbl, "0xf.fffp-3", "1.999969482421875", opOK));
  assert (literal_is (dbl, "0x1p-1074", "0x0.0000000000001p-1022", opOK));
  assert (literal_is (dbl, "0x1p-1075", "0",
                      (opStatus) (opUnderflow | opInexact)));
  assert (literal_is (dbl, "1e-400", "0",
                      (opStatus) (opUnderflow | opInexact)));
  assert (literal_is (dbl, "1e400", "inf",
                      (opStatus) (opOverflow | opInexact)));
  assert (literal_is (dbl, "1_000.5", "1000.5", opOK));
  assert (literal_is (dbl, "-0.0", "-0", opOK));
  assert (literal_is (dbl, "-0", "0", opOK));
  assert (literal_is (dbl, "9007199254740993", "9007199254740992",
                      opInexact));
  assert (literal_is (dbl, "0b101", "5", opOK));
  assert (literal_is (dbl, "1.7976931348623157e308",
                      "0x1.fffffffffffffp1023", opInexact));
  assert (literal_is (dbl, "2.2250738585072014e-308", "0x1p-1022",
                      opInexact));
  assert (literal_is (BinaryFloat::ieeeHalf, "65504", "0x1.ffcp15", opOK));
  assert (literal_is (BinaryFloat::ieeeHalf, "65520", "inf",
                      (opStatus) (opOverflow | opInexact)));

  {
    BinaryFloat value (dbl, BinaryFloat::fcZero, false);

    assert (value.convertFromLiteral (".5") == opSyntaxError);
    assert (value.convertFromLiteral ("5.") == opSyntaxError);
    assert (value.convertFromLiteral ("0x1.") == opSyntaxError);
    assert (value.convertFromLiteral ("0x1.8") == opSyntaxError);
    assert (value.convertFromLiteral ("inf") == opSyntaxError);
  }

  assert (BinaryFloat (dbl, "0.1").convertToDouble () == 0.1);
  assert (BinaryFloat (dbl, "2.5e-3").convertToDouble () == 2.5e-3);
  assert (BinaryFloat (dbl, "123456789012345678901234567890")
          .convertToDouble () == 123456789012345678901234567890.0);
}

static void
test_encodings (void)
{
  FixedInt bits (BinaryFloat (BinaryFloat::ieeeQuad, "1").bitcastToInteger ());

  assert (bits.getBitWidth () == 128);
  assert (bits.getRawParts ()[0] == 0);
  assert (bits.getRawParts ()[1] == 0x3fff000000000000ULL);

  bits = BinaryFloat (BinaryFloat::x87DoubleExtended, "1").bitcastToInteger ();
  assert (bits.getBitWidth () == 80);
  assert (bits.getRawParts ()[0] == 0x8000000000000000ULL);
  assert (bits.getRawParts ()[1] == 0x3fff);

  bits = BinaryFloat (BinaryFloat::ieeeHalf, "-2").bitcastToInteger ();
  assert (bits.getZExtValue () == 0xc000);

  assert (BinaryFloat (-2.5).bitcastToInteger ().getZExtValue ()
          == 0xc004000000000000ULL);

  /* An x87 unnormal decodes to its value.  */
  {
    BinaryFloat unnormal (BinaryFloat::x87DoubleExtended,
                          FixedInt::fromBits (x87Bits,
                                              0x4000000000000000ULL,
                                              0x3fff));

    assert (unnormal.compare (BinaryFloat (BinaryFloat::x87DoubleExtended,
                                           "0.5"))
            == BinaryFloat::cmpEqual);
  }

  /* Encodings survive a decode and re-encode.  */
  {
    const integerPart patterns[] = {
      0, 1, 0x7ff0000000000000ULL, 0xfff0000000000000ULL,
      0x7ff8000000000001ULL, 0x7ff4000000000000ULL, 0x000fffffffffffffULL,
      0x8010000000000000ULL, 0x7fefffffffffffffULL
    };
    unsigned int i;

    for (i = 0; i < sizeof patterns / sizeof patterns[0]; i++)
      {
        FixedInt pattern (FixedInt::fromBits (FixedInt::uint64, patterns[i]));
        BinaryFloat value (BinaryFloat::ieeeDouble, pattern);

        assert (value.bitcastToInteger () == pattern);
      }
  }
}

static void
test_integer_float_crossings (void)
{
  BinaryFloat value (BinaryFloat::ieeeDouble, BinaryFloat::fcZero, true);

  assert (value.convertFromInteger (FixedInt (FixedInt::int64, 0), cpExact)
          == opOK);
  assert (value.isZero () && !value.isNegative ());

  assert (value.convertFromInteger
          (FixedInt (FixedInt::int64, (1LL << 53) + 1), cpExact)
          == opInexact);
  assert (value.convertToDouble () == 9007199254740992.0);
  assert (value.convertFromInteger
          (FixedInt (FixedInt::int64, (1LL << 53) + 3), cpExactly)
          == opInvalidOp);
  assert (value.convertToDouble () == 9007199254740992.0);
  assert (value.convertFromInteger
          (FixedInt::maxValue (FixedInt::uint64), cpExact) == opInexact);
  assert (value.convertToDouble () == 18446744073709551616.0);
  assert (value.convertFromInteger
          (FixedInt::minValue (FixedInt::int64), cpExactly) == opOK);
  assert (value.convertToDouble () == -9223372036854775808.0);

  assert (to_integer (3.75, FixedInt::int8, 3, opInexact));
  assert (to_integer (-3.75, FixedInt::int8, -3, opInexact));
  assert (to_integer (127.9, FixedInt::int8, 127, opInexact));
  assert (to_integer (128.0, FixedInt::int8, 0, opInvalidOp));
  assert (to_integer (-128.0, FixedInt::int8, -128, opOK));
  assert (to_integer (-129.0, FixedInt::int8, 0, opInvalidOp));
  assert (to_integer (-0.5, FixedInt::uint8, 0, opInexact));
  assert (to_integer (-1.0, FixedInt::uint8, 0, opInvalidOp));
  assert (to_integer (1e-300, FixedInt::int32, 0, opInexact));
  assert (to_integer (-0.0, FixedInt::int32, 0, opOK));
  assert (to_integer (1e300, FixedInt::uint128, 0, opInvalidOp));
  assert (to_integer (4294967295.0, FixedInt::uint32, 4294967295LL, opOK));
  assert (to_integer (2147483648.0, FixedInt::int32, 0, opInvalidOp));

  {
    FixedInt big (FixedInt::uint128, 0);
    BinaryFloat twoTo127 (BinaryFloat::ieeeDouble, "0x1p127");

    assert (twoTo127.convertToInteger (big, FixedInt::int128) == opInvalidOp);
    assert (twoTo127.convertToInteger (big, FixedInt::uint128) == opOK);
    assert (big.toString (16) == "80000000000000000000000000000000");
  }

  {
    BinaryFloat nan (BinaryFloat::ieeeDouble, BinaryFloat::fcNaN, false);
    BinaryFloat inf (BinaryFloat::ieeeDouble, BinaryFloat::fcInfinity, true);
    FixedInt result (FixedInt::int32, 7);

    assert (nan.convertToInteger (result, FixedInt::int32) == opInvalidOp);
    assert (inf.convertToInteger (result, FixedInt::int32) == opInvalidOp);
    assert (result == FixedInt (FixedInt::int32, 7));

    assert (result.convertFromFloat (BinaryFloat (3.5), FixedInt::int32,
                                     cpExactly) == opInvalidOp);
    assert (result == FixedInt (FixedInt::int32, 7));
    assert (result.convertFromFloat (BinaryFloat (3.5), FixedInt::int16,
                                     cpExact) == opInexact);
    assert (result == FixedInt (FixedInt::int16, 3));
    assert (result.convertFromFloat (BinaryFloat (-42.0), FixedInt::int8,
                                     cpExactly) == opOK);
    assert (result == FixedInt (FixedInt::int8, -42));
  }

  assert (dies (nan_to_integer));
  assert (dies (clamping_from_integer));
  assert (dies (rejected_string));
}

int main (void)
{
  test_integer_policies ();
  test_wide_unsigned_identity ();
  test_integer_round_trip ();
  test_extremes ();
  test_float_conversions ();
  test_double_rounding ();
  test_nearest_even ();
  test_literals ();
  test_encodings ();
  test_integer_float_crossings ();

  return 0;
}
