/*
   Copyright 2005-2007 Neil Booth.

   See the file "COPYING" for information about the copyright
   and warranty status of this software.
*/

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include "binary_float.h"

using namespace numlit;

static const opStatus overflowFailure
  = (opStatus) (opInvalidOp | opOverflow | opInexact);
static const opStatus underflowFailure
  = (opStatus) (opInvalidOp | opUnderflow | opInexact);

/* TEXT parses as a double with the bits of VALUE.  */
static bool
parses (const char *text, double value, opStatus status)
{
  BinaryFloat tmp (BinaryFloat::ieeeDouble, BinaryFloat::fcZero, false);

  if (tmp.convertFromString (text) != status)
    return false;

  return tmp.bitwiseIsEqual (BinaryFloat (value));
}

/* TEXT is rejected with STATUS and the value is left alone.  */
static bool
rejected (const FloatFormat &format, const char *text, opStatus status)
{
  BinaryFloat tmp (format, BinaryFloat::fcInfinity, true);

  if (tmp.convertFromString (text) != status)
    return false;

  return tmp.isInfinity () && tmp.isNegative ();
}

static bool
syntax_error (const char *text)
{
  return rejected (BinaryFloat::ieeeDouble, text, opSyntaxError);
}

static bool
nan_parses (const FloatFormat &format, const char *text, bool negative,
            bool signaling, integerPart payload)
{
  BinaryFloat tmp (format, BinaryFloat::fcZero, false);

  if (tmp.convertFromString (text) != opOK)
    return false;

  return (tmp.isNaN ()
          && tmp.isNegative () == negative
          && tmp.isSignalingNaN () == signaling
          && tmp.getNaNPayload () == ExactInteger (payload));
}

static void
test_permissive_numbers (void)
{
  assert (parses (".5", 0.5, opOK));
  assert (parses ("5.", 5.0, opOK));
  assert (parses ("0x1.", 1.0, opOK));
  assert (parses ("0x.1p2", 0.25, opOK));
  assert (parses ("0x1.8", 1.5, opOK));
  assert (parses ("0X10", 16.0, opOK));
  assert (parses ("0x1P-2", 0.25, opOK));
  assert (parses ("+1.5", 1.5, opOK));
  assert (parses ("1E3", 1000.0, opOK));
  assert (parses ("1e+3", 1000.0, opOK));
  assert (parses ("25e-1", 2.5, opOK));
  assert (parses ("000123.4500", 123.45, opInexact));
  assert (parses ("0", 0.0, opOK));
  assert (parses ("-0", -0.0, opOK));
  assert (parses ("-0x0p0", -0.0, opOK));
  assert (parses ("0e999999999", 0.0, opOK));
  assert (parses ("0.1", 0.1, opInexact));
  assert (parses ("9007199254740993", 9007199254740992.0, opInexact));
}

static void
test_specials (void)
{
  BinaryFloat value (BinaryFloat::ieeeDouble, BinaryFloat::fcZero, false);

  assert (value.convertFromString ("inf") == opOK);
  assert (value.isInfinity () && !value.isNegative ());
  assert (value.convertFromString ("-Infinity") == opOK);
  assert (value.isInfinity () && value.isNegative ());
  assert (value.convertFromString ("+INF") == opOK);
  assert (value.isInfinity () && !value.isNegative ());

  assert (nan_parses (BinaryFloat::ieeeDouble, "nan", false, false, 0));
  assert (nan_parses (BinaryFloat::ieeeDouble, "-NaN", true, false, 0));
  assert (nan_parses (BinaryFloat::ieeeDouble, "nan()", false, false, 0));
  assert (nan_parses (BinaryFloat::ieeeDouble, "nan(123)", false, false,
                      123));
  assert (nan_parses (BinaryFloat::ieeeDouble, "nan(0123)", false, false,
                      83));
  assert (nan_parses (BinaryFloat::ieeeDouble, "nan(0x1F)", false, false,
                      31));
  assert (nan_parses (BinaryFloat::ieeeDouble, "nan(0)", false, false, 0));
  assert (nan_parses (BinaryFloat::ieeeDouble, "SNaN(5)", false, true, 5));
  assert (nan_parses (BinaryFloat::ieeeDouble, "-snan", true, true, 0));

  /* Payloads too wide for the format keep their low bits.  */
  assert (nan_parses (BinaryFloat::ieeeSingle, "nan(0xffffffff)", false,
                      false, 0x1fffff));
  assert (nan_parses (BinaryFloat::ieeeHalf, "snan(0x1ff)", false, true,
                      0xff));

  assert (syntax_error ("in"));
  assert (syntax_error ("infin"));
  assert (syntax_error ("infinityx"));
  assert (syntax_error ("nan("));
  assert (syntax_error ("nan(12"));
  assert (syntax_error ("nan(12)x"));
  assert (syntax_error ("nan(0x)"));
  assert (syntax_error ("nan(09)"));
  assert (syntax_error ("nan(1a)"));
  assert (syntax_error ("nan (1)"));
  assert (syntax_error ("nanx"));
  assert (syntax_error ("qnan"));
}

static void
test_malformed (void)
{
  assert (syntax_error (""));
  assert (syntax_error ("-"));
  assert (syntax_error ("+"));
  assert (syntax_error ("."));
  assert (syntax_error ("-."));
  assert (syntax_error ("e5"));
  assert (syntax_error (".e5"));
  assert (syntax_error ("1e"));
  assert (syntax_error ("1e+"));
  assert (syntax_error ("1e5.0"));
  assert (syntax_error (" 1"));
  assert (syntax_error ("1 "));
  assert (syntax_error ("1_000"));
  assert (syntax_error ("0x"));
  assert (syntax_error ("0xp1"));
  assert (syntax_error ("0x1g"));
  assert (syntax_error ("0x1p1.5"));
  assert (syntax_error ("1.2.3"));
  assert (syntax_error ("++1"));
  assert (syntax_error ("1f"));
  assert (syntax_error ("0b101"));
}

/* Overflow and underflow are failures, not infinity and zero.  */
static void
test_range_failures (void)
{
  assert (rejected (BinaryFloat::ieeeDouble, "1e400", overflowFailure));
  assert (rejected (BinaryFloat::ieeeDouble, "-0x1p1024", overflowFailure));
  assert (rejected (BinaryFloat::ieeeDouble, "1.7976931348623159e308",
                    overflowFailure));
  assert (rejected (BinaryFloat::ieeeSingle, "3.5e38", overflowFailure));
  assert (rejected (BinaryFloat::ieeeDouble, "1e-400", underflowFailure));
  assert (rejected (BinaryFloat::ieeeDouble, "0x1p-1075", underflowFailure));
  assert (rejected (BinaryFloat::ieeeDouble, "-2e-324", underflowFailure));

  /* Subnormals that survive rounding are fine.  */
  assert (parses ("0x1p-1074", 4.9406564584124654e-324, opOK));
  assert (parses ("4.9e-324", 4.9406564584124654e-324, opInexact));
  assert (parses ("3e-324", 4.9406564584124654e-324, opInexact));
  assert (parses ("1.7976931348623157e308", 1.7976931348623157e308,
                  opInexact));
}

/* Decimal text agrees with the host's correctly rounded strtod.  */
static void
test_against_host (void)
{
  const char *tests[] = {
    "3.14159",
    "1e23",
    "8.98846567431158e307",
    "2.2250738585072011e-308",
    "2.2250738585072012e-308",
    "0.1e-5",
    "123456789012345678901234567890e-40",
    "7.038531e-26",
    "9007199254740993",
    "4.4501477170144023e-308",
    0
  };
  const char **text;

  for (text = tests; *text; text++)
    {
      BinaryFloat value (BinaryFloat::ieeeDouble, *text);

      assert (value.convertToDouble () == strtod (*text, 0));
    }
}

/* What printf writes, we read back exactly.  */
static void
test_printf_round_trip (void)
{
  const double values[] = {
    0.1, -2.5, 1.0 / 3.0, 6.02214076e23, 1e-310, -4.9406564584124654e-324,
    1.7976931348623157e308, 2.2250738585072014e-308, 12345.678
  };
  unsigned int i;

  for (i = 0; i < sizeof values / sizeof values[0]; i++)
    {
      char text[64];

      sprintf (text, "%.17g", values[i]);
      assert (parses (text, values[i], opOK)
              || parses (text, values[i], opInexact));

      sprintf (text, "%a", values[i]);
      assert (parses (text, values[i], opOK));
    }
}

int main (void)
{
  test_permissive_numbers ();
  test_specials ();
  test_malformed ();
  test_range_failures ();
  test_against_host ();
  test_printf_round_trip ();

  return 0;
}
