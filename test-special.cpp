/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <math.h>
#include "binary_float.h"

using namespace numlit;

static BinaryFloat
make_nan (bool negative, bool signaling, integerPart payload,
          const FloatFormat &format = BinaryFloat::ieeeDouble)
{
  BinaryFloat result (format, BinaryFloat::fcNaN, negative);
  opStatus status;

  status = result.setNaN (signaling, ExactInteger (payload));
  assert (status == opOK);

  return result;
}

static bool
same (const BinaryFloat &lhs, double rhs)
{
  return lhs.bitwiseIsEqual (BinaryFloat (rhs));
}

static bool
is_quiet_nan (const BinaryFloat &value)
{
  return value.isNaN () && !value.isSignalingNaN ();
}

static void
test_classify (void)
{
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;

  assert (make_nan (false, true, 1).classify () == BinaryFloat::fcSignalingNaN);
  assert (make_nan (true, false, 0).classify () == BinaryFloat::fcQuietNaN);
  assert (BinaryFloat (dbl, BinaryFloat::fcInfinity, true).classify ()
          == BinaryFloat::fcNegativeInfinity);
  assert (BinaryFloat (-1.5).classify () == BinaryFloat::fcNegativeNormal);
  assert (BinaryFloat (-1e-310).classify ()
          == BinaryFloat::fcNegativeSubnormal);
  assert (BinaryFloat (-0.0).classify () == BinaryFloat::fcNegativeZero);
  assert (BinaryFloat (0.0).classify () == BinaryFloat::fcPositiveZero);
  assert (BinaryFloat (1e-310).classify ()
          == BinaryFloat::fcPositiveSubnormal);
  assert (BinaryFloat (1e10).classify () == BinaryFloat::fcPositiveNormal);
  assert (BinaryFloat (dbl, BinaryFloat::fcInfinity, false).classify ()
          == BinaryFloat::fcPositiveInfinity);

  assert (BinaryFloat::smallestNormalized (dbl).isNormal ());
  assert (!BinaryFloat::smallestNormalized (dbl).isSubnormal ());
  assert (BinaryFloat::smallest (dbl).isSubnormal ());
  assert (!BinaryFloat (0.0).isNormal () && !BinaryFloat (0.0).isSubnormal ());
  assert (BinaryFloat (0.0).isFinite () && BinaryFloat (3.0).isFinite ());
  assert (!make_nan (false, false, 0).isFinite ());

  assert (BinaryFloat::largest (dbl).bitcastToInteger ().getZExtValue ()
          == 0x7fefffffffffffffULL);
  assert (BinaryFloat::smallest (dbl, true).bitcastToInteger ().getZExtValue ()
          == 0x8000000000000001ULL);
  assert (BinaryFloat::smallestNormalized (dbl).bitcastToInteger ()
          .getZExtValue () == 0x0010000000000000ULL);
  assert (BinaryFloat::largest (BinaryFloat::ieeeHalf).bitcastToInteger ()
          .getZExtValue () == 0x7bff);
  {
    FixedInt bits (BinaryFloat::largest (BinaryFloat::x87DoubleExtended)
                   .bitcastToInteger ());

    assert (bits.getRawParts ()[0] == ~(integerPart) 0);
    assert (bits.getRawParts ()[1] == 0x7ffe);
  }

  assert (BinaryFloat (1.0).compare (make_nan (false, false, 0))
          == BinaryFloat::cmpUnordered);
  assert (BinaryFloat (-0.0).compare (BinaryFloat (0.0))
          == BinaryFloat::cmpEqual);
}

static void
test_payloads (void)
{
  BinaryFloat value (BinaryFloat::ieeeDouble, BinaryFloat::fcNaN, true);
  ExactInteger widest;

  assert (!value.isSignalingNaN ());
  assert (value.getNaNPayload ().isZero ());

  /* A double has 50 payload bits.  */
  widest.multiplyAndAdd (1, 1);
  widest.shiftLeft (50);
  assert (value.setNaN (true, widest) == opEncodingError);
  assert (!value.isSignalingNaN () && value.getNaNPayload ().isZero ());

  widest = ExactInteger (((integerPart) 1 << 50) - 1);
  assert (value.setNaN (true, widest) == opOK);
  assert (value.isSignalingNaN () && value.isNegative ());
  assert (value.getNaNPayload () == widest);

  assert (value.setNaN (false, ExactInteger (1, true)) == opEncodingError);
  assert (value.setNaN (false, ExactInteger (0x55)) == opOK);
  assert (!value.isSignalingNaN ());
  assert (value.getNaNPayload () == ExactInteger (0x55));

  /* The flags sit at the top of the trailing significand.  */
  assert (make_nan (false, false, 0).bitcastToInteger ().getZExtValue ()
          == 0x7ff8000000000000ULL);
  assert (make_nan (false, true, 0).bitcastToInteger ().getZExtValue ()
          == 0x7ff4000000000000ULL);
  assert (make_nan (true, true, 3).bitcastToInteger ().getZExtValue ()
          == 0xfff4000000000003ULL);
  assert (make_nan (false, true, 1, BinaryFloat::ieeeSingle)
          .bitcastToInteger ().getZExtValue () == 0x7fa00001);

  /* Quad payloads span both parts.  */
  {
    BinaryFloat quad (BinaryFloat::ieeeQuad, BinaryFloat::fcNaN, false);
    ExactInteger big;

    big.multiplyAndAdd (1, 1);
    big.shiftLeft (109);
    assert (quad.setNaN (false, big) == opOK);
    assert (quad.getNaNPayload () == big);
    big.shiftLeft (1);
    assert (quad.setNaN (false, big) == opEncodingError);
  }
}

static void
test_total_order (void)
{
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;
  const BinaryFloat values[] = {
    make_nan (true, false, 7),
    make_nan (true, false, 0),
    make_nan (true, true, 5),
    make_nan (true, true, 1),
    BinaryFloat (dbl, BinaryFloat::fcInfinity, true),
    BinaryFloat::largest (dbl, true),
    BinaryFloat (-1.0),
    BinaryFloat::smallestNormalized (dbl, true),
    BinaryFloat::smallest (dbl, true),
    BinaryFloat (-0.0),
    BinaryFloat (0.0),
    BinaryFloat::smallest (dbl),
    BinaryFloat::smallestNormalized (dbl),
    BinaryFloat (1.0),
    BinaryFloat::largest (dbl),
    BinaryFloat (dbl, BinaryFloat::fcInfinity, false),
    make_nan (false, true, 1),
    make_nan (false, true, 5),
    make_nan (false, false, 0),
    make_nan (false, false, 7)
  };
  const unsigned int count = sizeof values / sizeof values[0];
  unsigned int i, j;

  for (i = 0; i < count; i++)
    for (j = 0; j < count; j++)
      assert (values[i].totalOrder (values[j]) == (i <= j));

  assert (BinaryFloat (-0.0).totalOrder (BinaryFloat (0.0)));
  assert (!BinaryFloat (0.0).totalOrder (BinaryFloat (-0.0)));
}

static void
test_minimum_maximum (void)
{
  BinaryFloat quiet (make_nan (false, false, 3));
  BinaryFloat signaling (make_nan (false, true, 3));
  BinaryFloat zero (0.0), negativeZero (-0.0);

  assert (same (BinaryFloat::minimum (quiet, zero), 0.0));
  assert (same (BinaryFloat::minimum (zero, quiet), 0.0));
  assert (same (BinaryFloat::maximum (quiet, BinaryFloat (-2.0)), -2.0));
  assert (is_quiet_nan (BinaryFloat::minimum (signaling, zero)));
  assert (is_quiet_nan (BinaryFloat::minimum (zero, signaling)));
  assert (is_quiet_nan (BinaryFloat::maximum (signaling, zero)));
  assert (is_quiet_nan (BinaryFloat::minimum (quiet, quiet)));
  assert (BinaryFloat::minimum (signaling, zero).getNaNPayload ()
          == ExactInteger (3));

  assert (same (BinaryFloat::minimum (BinaryFloat (1.0), BinaryFloat (2.0)),
                1.0));
  assert (same (BinaryFloat::maximum (BinaryFloat (1.0), BinaryFloat (2.0)),
                2.0));
  assert (same (BinaryFloat::minimum (BinaryFloat (-HUGE_VAL),
                                      BinaryFloat (5.0)), -HUGE_VAL));
  assert (BinaryFloat::minimum (negativeZero, zero).isZero ());
  assert (BinaryFloat::maximum (negativeZero, zero).isZero ());

  assert (same (BinaryFloat::minimumMagnitude (BinaryFloat (-3.0),
                                               BinaryFloat (2.0)), 2.0));
  assert (same (BinaryFloat::maximumMagnitude (BinaryFloat (-3.0),
                                               BinaryFloat (2.0)), -3.0));
  assert (same (BinaryFloat::minimumMagnitude (BinaryFloat (-2.0),
                                               BinaryFloat (2.0)), -2.0));
  assert (same (BinaryFloat::maximumMagnitude (BinaryFloat (-2.0),
                                               BinaryFloat (2.0)), 2.0));
  assert (same (BinaryFloat::minimumMagnitude (quiet, BinaryFloat (5.0)),
                5.0));
  assert (is_quiet_nan (BinaryFloat::maximumMagnitude (BinaryFloat (5.0),
                                                       signaling)));
}

static void
test_neighbours (void)
{
  const double values[] = {
    0.0, -0.0, 4.9406564584124654e-324, -4.9406564584124654e-324,
    2.2250738585072009e-308, 2.2250738585072014e-308,
    -2.2250738585072014e-308, 1.0, -1.0, 2.0, -2.0, 0.1, -1e300,
    1.7976931348623157e308, -1.7976931348623157e308, HUGE_VAL, -HUGE_VAL
  };
  unsigned int i;

  for (i = 0; i < sizeof values / sizeof values[0]; i++)
    {
      BinaryFloat up (values[i]), down (values[i]);

      assert (up.nextUp () == opOK);
      assert (same (up, nextafter (values[i], HUGE_VAL)));
      assert (down.nextDown () == opOK);
      assert (same (down, nextafter (values[i], -HUGE_VAL)));

      if (values[i] != 0.0 && values[i] != HUGE_VAL
          && values[i] != -HUGE_VAL)
        {
          assert (down.nextUp () == opOK);
          assert (same (down, values[i]));
        }
    }

  /* Single precision agrees too.  */
  {
    BinaryFloat value (1.0f);

    assert (value.nextDown () == opOK);
    assert (value.bitwiseIsEqual (BinaryFloat (nextafterf (1.0f, 0.0f))));
  }

  /* The x87 format moves by its 64-bit precision.  */
  {
    BinaryFloat value (BinaryFloat::x87DoubleExtended, "1");

    assert (value.nextUp () == opOK);
    assert (value.bitwiseIsEqual (BinaryFloat (BinaryFloat::x87DoubleExtended,
                                               "0x1.0000000000000002p0")));
  }

  /* NaNs stay NaNs; signalling ones are quieted.  */
  {
    BinaryFloat quiet (make_nan (true, false, 9));
    BinaryFloat signaling (make_nan (false, true, 9));

    assert (quiet.nextUp () == opOK);
    assert (is_quiet_nan (quiet) && quiet.isNegative ());
    assert (signaling.nextDown () == opInvalidOp);
    assert (is_quiet_nan (signaling) && !signaling.isNegative ());
    assert (signaling.getNaNPayload () == ExactInteger (9));
  }
}

static void
test_ulp (void)
{
  const FloatFormat &dbl = BinaryFloat::ieeeDouble;

  assert (same (BinaryFloat (1.0).ulp (), ldexp (1.0, -52)));
  assert (same (BinaryFloat (-1.0).ulp (), ldexp (1.0, -52)));
  assert (same (BinaryFloat (1.5).ulp (), ldexp (1.0, -52)));
  assert (same (BinaryFloat (1024.0).ulp (), ldexp (1.0, -42)));
  assert (same (BinaryFloat::largest (dbl).ulp (), ldexp (1.0, 971)));
  assert (same (BinaryFloat (0.0).ulp (), 4.9406564584124654e-324));
  assert (same (BinaryFloat (-0.0).ulp (), 4.9406564584124654e-324));
  assert (same (BinaryFloat (1e-310).ulp (), 4.9406564584124654e-324));
  assert (same (BinaryFloat::smallestNormalized (dbl).ulp (),
                4.9406564584124654e-324));
  assert (is_quiet_nan (BinaryFloat (HUGE_VAL).ulp ()));
  assert (is_quiet_nan (make_nan (false, true, 4).ulp ()));
  assert (make_nan (false, true, 4).ulp ().getNaNPayload ()
          == ExactInteger (4));
}

static void
test_outcomes (void)
{
  assert (outcomeOf (opOK) == coExact);
  assert (outcomeOf (opInexact) == coInexact);
  assert (outcomeOf ((opStatus) (opOverflow | opInexact)) == coOverflow);
  assert (outcomeOf ((opStatus) (opUnderflow | opInexact)) == coUnderflow);
  assert (outcomeOf ((opStatus) (opInvalidOp | opOverflow | opInexact))
          == coFailure);
  assert (outcomeOf (opInvalidOp) == coFailure);
  assert (outcomeOf (opSyntaxError) == coFailure);
  assert (outcomeOf (opEncodingError) == coFailure);
}

int main (void)
{
  test_classify ();
  test_payloads ();
  test_total_order ();
  test_minimum_maximum ();
  test_neighbours ();
  test_ulp ();
  test_outcomes ();

  return 0;
}
