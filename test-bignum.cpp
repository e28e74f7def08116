/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include "bignum.h"
#include "exact.h"

using namespace numlit;

static const integerPart allOnes = ~(integerPart) 0;

static void
test_bits (void)
{
  integerPart n[2];

  Bignum::tcSet (n, 0, 2);
  assert (Bignum::tcIsZero (n, 2));
  assert (Bignum::tcMSB (n, 2) == 0);
  assert (Bignum::tcLSB (n, 2) == 0);

  Bignum::tcSetBit (n, 1);
  Bignum::tcSetBit (n, 100);
  assert (Bignum::tcLSB (n, 2) == 1);
  assert (Bignum::tcMSB (n, 2) == 100);
  assert (Bignum::tcExtractBit (n, 100) == 1);
  assert (Bignum::tcExtractBit (n, 99) == 0);
  assert (n[1] == (integerPart) 1 << 35);

  Bignum::tcClearBit (n, 1);
  assert (Bignum::tcLSB (n, 2) == 100);

  Bignum::tcSetLeastSignificantBits (n, 2, 70);
  assert (n[0] == allOnes && n[1] == 0x3f);
  Bignum::tcTruncate (n, 2, 65);
  assert (n[0] == allOnes && n[1] == 1);
  Bignum::tcTruncate (n, 2, 128);
  assert (n[1] == 1);
}

static void
test_add_subtract (void)
{
  integerPart a[2], b[2];

  a[0] = allOnes;
  a[1] = 0;
  Bignum::tcSet (b, 1, 2);
  assert (Bignum::tcAdd (a, b, 0, 2) == 0);
  assert (a[0] == 0 && a[1] == 1);

  assert (Bignum::tcSubtract (a, b, 0, 2) == 0);
  assert (a[0] == allOnes && a[1] == 0);

  /* Carry and borrow out of the top.  */
  a[0] = a[1] = allOnes;
  assert (Bignum::tcAdd (a, b, 0, 2) == 1);
  assert (Bignum::tcIsZero (a, 2));
  assert (Bignum::tcSubtract (a, b, 0, 2) == 1);
  assert (a[0] == allOnes && a[1] == allOnes);

  Bignum::tcSet (a, 5, 2);
  Bignum::tcNegate (a, 2);
  assert (a[0] == (integerPart) -5 && a[1] == allOnes);

  Bignum::tcSet (a, 0, 2);
  assert (Bignum::tcDecrement (a, 2) == 1);
  assert (Bignum::tcIncrement (a, 2) == 1);
  assert (Bignum::tcIsZero (a, 2));
}

static void
test_multiply_divide (void)
{
  integerPart lhs[2], rhs[2], product[4], remainder[2], scratch[2];

  /* (2^64 + 3) * (2^64 - 1).  */
  lhs[0] = 3;
  lhs[1] = 1;
  rhs[0] = allOnes;
  rhs[1] = 0;
  Bignum::tcFullMultiply (product, lhs, rhs, 2);
  assert (product[0] == (integerPart) -3);
  assert (product[1] == 1);
  assert (product[2] == 1);
  assert (product[3] == 0);

  /* (2^64 + 3) / 7 = 2635249153387078802 remainder 5.  */
  Bignum::tcSet (rhs, 7, 2);
  assert (Bignum::tcDivide (lhs, rhs, remainder, scratch, 2) == 0);
  assert (lhs[0] == 2635249153387078802ULL && lhs[1] == 0);
  assert (remainder[0] == 5 && remainder[1] == 0);

  Bignum::tcSet (rhs, 0, 2);
  assert (Bignum::tcDivide (lhs, rhs, remainder, scratch, 2) == 1);

  lhs[0] = 1000;
  lhs[1] = 0;
  assert (Bignum::tcDivideByHalfPart (lhs, 16, 2) == 8);
  assert (lhs[0] == 62);

  Bignum::tcSet (lhs, 0, 2);
  assert (Bignum::tcMultiplyPart (lhs, rhs, 10, 7, 2, 2, false) == 0);
  assert (lhs[0] == 7);
}

static void
test_shifts (void)
{
  integerPart n[2];

  Bignum::tcSet (n, 0x81, 2);
  Bignum::tcShiftLeft (n, 2, 60);
  assert (n[0] == (integerPart) 1 << 60 && n[1] == 8);
  Bignum::tcShiftRight (n, 2, 61);
  assert (n[0] == 0x40 && n[1] == 0);

  Bignum::tcSet (n, 1, 2);
  Bignum::tcShiftLeft (n, 2, 127);
  assert (n[0] == 0 && n[1] == (integerPart) 1 << 63);
  Bignum::tcShiftLeft (n, 2, 1);
  assert (Bignum::tcIsZero (n, 2));

  n[0] = n[1] = allOnes;
  Bignum::tcShiftRight (n, 2, 200);
  assert (Bignum::tcIsZero (n, 2));
}

static void
test_exact_integer (void)
{
  ExactInteger value, other;

  assert (value.isZero () && !value.isNegative ());
  value.negate ();
  assert (!value.isNegative ());

  /* 10^30 needs two parts.  */
  value.multiplyAndAdd (10, 1);
  value.multiplyByPowerOfTen (30);
  assert (value.toString () == "1000000000000000000000000000000");
  assert (value.significantBits () == 100);
  assert (value.partCount () >= 2);

  other = ExactInteger (255);
  assert (other.toString (16) == "ff");
  assert (other.toString (2) == "11111111");
  other.negate ();
  assert (other.toString () == "-255");
  assert (other.compare (ExactInteger (0)) < 0);
  assert (other.compare (ExactInteger (255, true)) == 0);
  assert (other != value);

  other = ExactInteger (3);
  other.shiftLeft (126);
  assert (other.significantBits () == 128);
  assert (other.compare (value) > 0);
}

static void
test_fits_and_truncate (void)
{
  integerPart parts[2];

  assert (ExactInteger (127).fitsIn (8, true));
  assert (!ExactInteger (128).fitsIn (8, true));
  assert (ExactInteger (128, true).fitsIn (8, true));
  assert (!ExactInteger (129, true).fitsIn (8, true));
  assert (ExactInteger (255).fitsIn (8, false));
  assert (!ExactInteger (256).fitsIn (8, false));
  assert (!ExactInteger (1, true).fitsIn (64, false));
  assert (ExactInteger (0).fitsIn (1, false));
  assert (ExactInteger (1, true).fitsIn (1, true));
  assert (!ExactInteger (1).fitsIn (1, true));

  ExactInteger (1, true).truncate (parts, 2, 8);
  assert (parts[0] == 0xff && parts[1] == 0);

  ExactInteger (1, true).truncate (parts, 2, 128);
  assert (parts[0] == allOnes && parts[1] == allOnes);

  ExactInteger (0x1234).truncate (parts, 2, 8);
  assert (parts[0] == 0x34);
}

static void
test_exact_float (void)
{
  assert (ExactFloat::saturateExponent (1LL << 40)
          == ExactFloat::exponentLimit);
  assert (ExactFloat::saturateExponent (-(1LL << 40))
          == -ExactFloat::exponentLimit);
  assert (ExactFloat::saturateExponent (-17) == -17);

  ExactFloat negativeZero (true, ExactInteger (), 0, 10);
  assert (negativeZero.isZero () && negativeZero.isNegative ());
}

int main (void)
{
  test_bits ();
  test_add_subtract ();
  test_multiply_divide ();
  test_shifts ();
  test_exact_integer ();
  test_fits_and_truncate ();
  test_exact_float ();

  return 0;
}
